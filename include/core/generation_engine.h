#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/engine_types.h"
#include "core/model_handle.h"

namespace advisor {

struct GenerationEngineOptions {
    size_t channel_capacity{64};
    /// 次の増分を待つ上限。超えたらストリームを放棄する
    std::chrono::milliseconds abandon_timeout{std::chrono::seconds(120)};
    /// 前の生成（放棄済みを含む）がハンドルを占有している時に待つ上限
    std::chrono::milliseconds busy_timeout{std::chrono::seconds(120)};
};

/// ロード済みハンドルと会話からテキストを生成する。
/// どちらのモードもエンジン例外を警告ログにして空の結果へ変換する。
class GenerationEngine {
public:
    explicit GenerationEngine(GenerationEngineOptions options = {});

    std::string generate(ModelHandle& handle, const GenerationRequest& request) const;

    /// 累積テキストを増分ごとに on_snapshot へ渡し、渡したものを全て返す。
    /// 途中のスナップショットは書きかけの UTF-8 文字とタグ断片を保留した暫定値。
    /// 正常終了時の最後の要素は generate() と同じ後処理を施した全文で、これが優先される。
    std::vector<std::string> streamGenerate(const std::shared_ptr<ModelHandle>& handle,
                                            const GenerationRequest& request,
                                            const SnapshotCallback& on_snapshot = {}) const;

    const GenerationEngineOptions& options() const { return options_; }

private:
    GenerationEngineOptions options_;
};

/// 不正な UTF-8 を置換し、制御トークンと <think> ブロックを除去してトリムする
std::string postProcessGeneratedText(const std::string& raw);

}  // namespace advisor
