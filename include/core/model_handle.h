#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "core/engine_types.h"

namespace advisor {

/// ロード済みモデル1つ分（トークナイザ + 重み + デバイス配置）
/// ライフサイクルマネージャが排他的に所有し、最後の参照が外れた時点で破棄される。
class ModelHandle {
public:
    ModelHandle() = default;
    virtual ~ModelHandle() = default;

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    virtual const ModelIdentifier& modelId() const = 0;

    /// デバイス（GPU）上に確保している推定バイト数。CPU のみなら 0
    virtual uint64_t deviceMemoryBytes() const = 0;

    /// 会話を推論し、デコード済みの増分ごとに on_piece を呼ぶ。
    /// on_piece が false を返したら次の増分の前に停止する。
    /// エンジン障害は GenerationError を送出する。
    virtual void generate(const std::vector<ChatMessage>& messages,
                          const InferenceParams& params,
                          const PieceCallback& on_piece) = 0;

    /// 推論の占有ロック。generate() は常にこれを保持した状態で呼ばれる。
    /// 放棄されてデタッチされた生成スレッドも generate() から戻るまで保持し続ける。
    std::timed_mutex& usageMutex() const { return usage_mutex_; }

private:
    mutable std::timed_mutex usage_mutex_;
};

}  // namespace advisor
