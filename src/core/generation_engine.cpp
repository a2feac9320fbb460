#include "core/generation_engine.h"
#include "core/generation_session.h"
#include "utils/utf8.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <utility>

namespace advisor {

namespace {

constexpr const char* kThinkOpen = "<think>";
constexpr const char* kThinkClose = "</think>";

constexpr const char* kControlTokens[] = {
    "<|im_start|>", "<|im_end|>", "<s>", "</s>", "<|endoftext|>", "<|eot_id|>",
    "<|start_header_id|>", "<|end_header_id|>",
};

// <think>...</think> を除去。閉じていないブロックは末尾まで隠す
std::string stripThinking(std::string text) {
    const std::string open_tag(kThinkOpen);
    const std::string close_tag(kThinkClose);

    // 開始タグなしで閉じタグだけ現れた場合（プロンプト側で開始済み）
    auto close_pos = text.find(close_tag);
    auto open_pos = text.find(open_tag);
    if (close_pos != std::string::npos && (open_pos == std::string::npos || close_pos < open_pos)) {
        text.erase(0, close_pos + close_tag.size());
    }

    while ((open_pos = text.find(open_tag)) != std::string::npos) {
        close_pos = text.find(close_tag, open_pos + open_tag.size());
        if (close_pos == std::string::npos) {
            text.erase(open_pos);
            break;
        }
        text.erase(open_pos, close_pos + close_tag.size() - open_pos);
    }
    return text;
}

std::string stripControlTokens(std::string text) {
    for (const char* t : kControlTokens) {
        const std::string token(t);
        size_t pos = 0;
        while ((pos = text.find(token, pos)) != std::string::npos) {
            text.erase(pos, token.size());
        }
    }
    return text;
}

std::string trim(const std::string& text) {
    auto l = text.find_first_not_of(" \t\n\r");
    if (l == std::string::npos) return "";
    auto r = text.find_last_not_of(" \t\n\r");
    return text.substr(l, r - l + 1);
}

// 末尾がタグの途中（"<thi" など）ならその長さ
size_t pendingTagLength(const std::string& text) {
    size_t pending = 0;
    auto check = [&](const std::string& tag) {
        const size_t longest = std::min(tag.size() - 1, text.size());
        for (size_t k = longest; k > pending; --k) {
            if (text.compare(text.size() - k, k, tag, 0, k) == 0) {
                pending = k;
                break;
            }
        }
    };
    check(kThinkOpen);
    check(kThinkClose);
    for (const char* t : kControlTokens) {
        check(t);
    }
    return pending;
}

// 確定済みの部分だけを後処理した暫定スナップショット
std::string visibleSnapshot(const std::string& raw) {
    std::string stable = raw.substr(0, utf8_complete_prefix_length(raw));
    stable.resize(stable.size() - pendingTagLength(stable));
    return postProcessGeneratedText(stable);
}

}  // namespace

std::string postProcessGeneratedText(const std::string& raw) {
    return trim(stripControlTokens(stripThinking(sanitize_utf8_lossy(raw))));
}

GenerationEngine::GenerationEngine(GenerationEngineOptions options)
    : options_(std::move(options)) {
    if (options_.channel_capacity == 0) {
        options_.channel_capacity = 1;
    }
    if (options_.abandon_timeout.count() <= 0) {
        options_.abandon_timeout = std::chrono::seconds(120);
    }
    if (options_.busy_timeout.count() <= 0) {
        options_.busy_timeout = std::chrono::seconds(120);
    }
}

std::string GenerationEngine::generate(ModelHandle& handle, const GenerationRequest& request) const {
    const auto start = std::chrono::steady_clock::now();
    std::unique_lock<std::timed_mutex> usage(handle.usageMutex(), std::defer_lock);
    if (!usage.try_lock_for(options_.busy_timeout)) {
        spdlog::warn("Generation skipped: model {} is still busy after {}ms",
                     handle.modelId(), options_.busy_timeout.count());
        return "";
    }

    std::string raw;
    size_t pieces = 0;
    try {
        handle.generate(request.messages, request.params, [&](const std::string& piece) {
            raw += piece;
            ++pieces;
            return true;
        });
    } catch (const std::exception& e) {
        spdlog::warn("Generation failed for model {}: {}", handle.modelId(), e.what());
        return "";
    }

    std::string result = postProcessGeneratedText(raw);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Generated {} pieces ({} bytes) with model {} in {}ms",
                 pieces, result.size(), handle.modelId(), elapsed.count());
    return result;
}

std::vector<std::string> GenerationEngine::streamGenerate(
    const std::shared_ptr<ModelHandle>& handle,
    const GenerationRequest& request,
    const SnapshotCallback& on_snapshot) const {

    std::vector<std::string> snapshots;
    if (!handle) {
        return snapshots;
    }

    GenerationSession session(handle, request, options_.channel_capacity,
                              options_.abandon_timeout, options_.busy_timeout);
    session.start();

    // 戻り値 false で消費側が放棄する
    auto emit = [&](const std::string& snapshot) {
        snapshots.push_back(snapshot);
        if (on_snapshot && !on_snapshot(snapshot)) {
            return false;
        }
        return true;
    };

    std::string raw;
    std::string piece;
    while (true) {
        auto next = session.next(piece);
        if (next == GenerationSession::Next::Piece) {
            raw += piece;
            std::string current = visibleSnapshot(raw);
            // 長さが伸びた時だけ流す
            const size_t last_size = snapshots.empty() ? 0 : snapshots.back().size();
            if (current.size() > last_size) {
                if (!emit(current)) {
                    spdlog::info("Stream consumer stopped early for model {}", handle->modelId());
                    session.abandon();
                    break;
                }
            }
            continue;
        }

        if (next == GenerationSession::Next::Done) {
            // 全文は保留分も含めて確定させる。途中の暫定値より短くなることがある
            std::string final_text = postProcessGeneratedText(raw);
            if (!final_text.empty() && (snapshots.empty() || snapshots.back() != final_text)) {
                emit(final_text);
            }
            spdlog::info("Stream completed for model {} ({} snapshots, {} bytes)",
                         handle->modelId(), snapshots.size(), final_text.size());
        } else if (next == GenerationSession::Next::Failed) {
            spdlog::warn("Stream generation failed for model {}: {}", handle->modelId(), session.error());
        }
        break;
    }
    return snapshots;
}

}  // namespace advisor
