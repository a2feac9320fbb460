#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/engine_types.h"
#include "core/generation_engine.h"
#include "core/lifecycle_state.h"
#include "core/model_handle.h"
#include "core/model_loader.h"
#include "core/persistence_record.h"
#include "system/device_memory_probe.h"

namespace advisor {

/// 推論モデルのロード/差し替え/アンロード/生成を直列化する中核コンポーネント
///
/// ロック階層（取得順は generation_mutex_ → state_mutex_ のみ）:
/// - state_mutex_: 状態フィールドとハンドルポインタだけを守る。I/Oや推論の間は保持しない
/// - generation_mutex_: ハンドルを推論に使う区間、およびアンロード〜差し替えの区間全体
///
/// 全メソッドはどのスレッドからでも呼び出せる。load() は呼び出し側の
/// バックグラウンドスレッドで実行する想定。
class ModelLifecycleManager {
public:
    ModelLifecycleManager(std::unique_ptr<ModelLoader> loader,
                          PersistenceRecord record,
                          GenerationEngine engine = GenerationEngine(),
                          std::shared_ptr<DeviceMemoryProbe> memory_probe = nullptr);
    ~ModelLifecycleManager();

    ModelLifecycleManager(const ModelLifecycleManager&) = delete;
    ModelLifecycleManager& operator=(const ModelLifecycleManager&) = delete;

    /// ブロックしない。短いクリティカルセクションで取った一貫したコピー
    StatusSnapshot status() const;

    bool isAvailable() const;
    bool isLoading() const;

    /// ロード中なら何もせず false。それ以外は Ready か Failed で必ず終わり true
    bool load(const ModelIdentifier& model_id, const LoadProgressCallback& progress = {});

    /// 推論中ならその完了を待ってからハンドルを解放する。ロード中は何もしない
    bool unload();

    /// Ready でなければ即座に空文字列。生成中は generation_mutex_ を保持する
    std::string generate(const GenerationRequest& request);

    /// Ready でなければ即座に空。累積テキストを増分ごとに返す
    std::vector<std::string> streamGenerate(const GenerationRequest& request,
                                            const SnapshotCallback& on_snapshot = {});

    // 会話/単発プロンプト用のショートカット（system は空なら付けない）
    std::string chat(const std::vector<ChatMessage>& messages,
                     const std::string& system = {},
                     float temperature = kDefaultTemperature);
    std::vector<std::string> streamChat(const std::vector<ChatMessage>& messages,
                                        const std::string& system = {},
                                        float temperature = kDefaultTemperature,
                                        const SnapshotCallback& on_snapshot = {});
    std::string generatePrompt(const std::string& prompt,
                               const std::string& system = {},
                               float temperature = kDefaultTemperature);
    std::vector<std::string> streamPrompt(const std::string& prompt,
                                          const std::string& system = {},
                                          float temperature = kDefaultTemperature,
                                          const SnapshotCallback& on_snapshot = {});

    /// 永続化レコードの読み取りのみ（起動時の自動ロード用）
    std::optional<ModelIdentifier> lastPersistedModel() const;

    /// chat 系ショートカットが使う既定の推論パラメータ（max_tokens など）
    void setDefaultParams(const InferenceParams& params);
    InferenceParams defaultParams() const;

private:
    void setProgress(const std::string& milestone, const LoadProgressCallback& progress);
    std::shared_ptr<ModelHandle> readyHandle() const;

    std::unique_ptr<ModelLoader> loader_;
    PersistenceRecord record_;
    GenerationEngine engine_;
    std::shared_ptr<DeviceMemoryProbe> memory_probe_;

    mutable std::mutex state_mutex_;
    LifecycleState state_;
    std::shared_ptr<ModelHandle> handle_;
    std::string last_progress_;
    InferenceParams default_params_;

    std::mutex generation_mutex_;
    bool loading_{false};
};

/// system プロンプト（空なら省略）を先頭に付けたリクエストを組み立てる
GenerationRequest buildChatRequest(const std::vector<ChatMessage>& messages,
                                   const std::string& system,
                                   const InferenceParams& params);

}  // namespace advisor
