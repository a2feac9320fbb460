#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "core/engine_error.h"

namespace advisor {

constexpr size_t kDefaultMaxTokens = 1024;
constexpr float kDefaultTemperature = 0.3f;

using ModelIdentifier = std::string;

struct ChatMessage {
    std::string role;
    std::string content;
};

struct InferenceParams {
    size_t max_tokens{kDefaultMaxTokens};
    /// 0 = greedy（決定的）、> 0 = 確率的サンプリング
    float temperature{kDefaultTemperature};
    float top_p{0.9f};
    int top_k{40};
    float repeat_penalty{1.0f};
    uint32_t seed{0};
    /// Qwen3 系の <think> ブロックを抑止する
    bool disable_thinking{true};
};

struct GenerationRequest {
    std::vector<ChatMessage> messages;
    InferenceParams params;
};

/// ロード進捗（人間向けのマイルストーン文字列）。正しさには関与しない
using LoadProgressCallback = std::function<void(const std::string& milestone)>;

/// デコード済みの増分。false を返すと生成を打ち切る
using PieceCallback = std::function<bool(const std::string& piece)>;

/// ストリーミングの累積テキスト。false を返すと消費側が放棄する
using SnapshotCallback = std::function<bool(const std::string& snapshot)>;

inline size_t resolve_effective_max_tokens(size_t requested,
                                           size_t prompt_tokens,
                                           size_t max_context) {
    if (max_context == 0) {
        return requested == 0 ? kDefaultMaxTokens : requested;
    }
    if (prompt_tokens >= max_context) {
        return 0;
    }
    const size_t available = max_context - prompt_tokens;
    if (requested == 0) return available;
    return requested < available ? requested : available;
}

}  // namespace advisor
