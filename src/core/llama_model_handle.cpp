#include "core/llama_model_handle.h"
#include "core/engine_error.h"

#include <llama.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <sstream>
#include <utility>

namespace advisor {

namespace {

// Qwen3 テンプレートの enable_thinking=false と同じ空の思考ブロック
constexpr const char* kEmptyThinkBlock = "<think>\n\n</think>\n\n";

void reset_kv_cache(llama_context* ctx) {
    if (!ctx) return;
    llama_memory_t mem = llama_get_memory(ctx);
    if (mem) {
        llama_memory_clear(mem, false);
    }
}

// リクエスト前後で KV キャッシュを空にする
struct KvCacheScope {
    explicit KvCacheScope(llama_context* ctx) : ctx_(ctx) { reset_kv_cache(ctx_); }
    ~KvCacheScope() { reset_kv_cache(ctx_); }

    KvCacheScope(const KvCacheScope&) = delete;
    KvCacheScope& operator=(const KvCacheScope&) = delete;

private:
    llama_context* ctx_{nullptr};
};

struct SamplerDeleter {
    void operator()(llama_sampler* sampler) const {
        if (sampler) llama_sampler_free(sampler);
    }
};
using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

// temperature 0 は greedy（同じ入力なら同じ出力）
SamplerPtr make_sampler(const InferenceParams& params) {
    llama_sampler_chain_params sparams = llama_sampler_chain_default_params();
    SamplerPtr sampler(llama_sampler_chain_init(sparams));
    if (!sampler) {
        throw GenerationError("failed to initialize sampler chain");
    }

    if (params.repeat_penalty != 1.0f) {
        llama_sampler_chain_add(sampler.get(),
                                llama_sampler_init_penalties(64, params.repeat_penalty, 0.0f, 0.0f));
    }

    if (params.temperature <= 0.0f) {
        llama_sampler_chain_add(sampler.get(), llama_sampler_init_greedy());
        return sampler;
    }

    llama_sampler_chain_add(sampler.get(), llama_sampler_init_top_k(params.top_k));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_top_p(params.top_p, 1));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_temp(params.temperature));

    uint32_t seed = params.seed;
    if (seed == 0) {
        seed = static_cast<uint32_t>(
            std::chrono::steady_clock::now().time_since_epoch().count() & 0xFFFFFFFF);
    }
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_dist(seed));
    return sampler;
}

std::vector<llama_token> tokenize(const llama_vocab* vocab, const std::string& prompt) {
    std::vector<llama_token> tokens(prompt.size() + 128);
    int32_t n_tokens = llama_tokenize(vocab,
                                      prompt.c_str(),
                                      static_cast<int32_t>(prompt.size()),
                                      tokens.data(),
                                      static_cast<int32_t>(tokens.size()),
                                      true,   // add_special
                                      true);  // parse_special
    if (n_tokens < 0) {
        // バッファ不足なら必要サイズで再試行
        tokens.resize(static_cast<size_t>(-n_tokens));
        n_tokens = llama_tokenize(vocab,
                                  prompt.c_str(),
                                  static_cast<int32_t>(prompt.size()),
                                  tokens.data(),
                                  static_cast<int32_t>(tokens.size()),
                                  true,
                                  true);
    }
    if (n_tokens < 0) {
        throw GenerationError("failed to tokenize prompt");
    }
    tokens.resize(static_cast<size_t>(n_tokens));
    return tokens;
}

}  // namespace

std::string buildChatMLPrompt(const std::vector<ChatMessage>& messages, bool disable_thinking) {
    std::ostringstream oss;
    for (const auto& msg : messages) {
        oss << "<|im_start|>" << msg.role << "\n" << msg.content << "<|im_end|>\n";
    }
    oss << "<|im_start|>assistant\n";
    if (disable_thinking) {
        oss << kEmptyThinkBlock;
    }
    return oss.str();
}

LlamaModelHandle::LlamaModelHandle(ModelIdentifier model_id,
                                   std::string model_path,
                                   llama_model* model,
                                   llama_context* ctx,
                                   int gpu_layers,
                                   int gpu_id)
    : model_id_(std::move(model_id))
    , model_path_(std::move(model_path))
    , model_(model)
    , ctx_(ctx)
    , gpu_layers_(gpu_layers)
    , gpu_id_(gpu_id) {
    if (model_ && gpu_layers_ > 0 && gpu_id_ >= 0) {
        device_bytes_ = llama_model_size(model_);
    }
}

LlamaModelHandle::~LlamaModelHandle() {
    if (ctx_) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
    if (model_) {
        llama_model_free(model_);
        model_ = nullptr;
    }
    spdlog::info("Released model {} ({})", model_id_, model_path_);
}

std::string LlamaModelHandle::buildPrompt(const std::vector<ChatMessage>& messages,
                                          bool disable_thinking) const {
    const char* tmpl = llama_model_chat_template(model_, nullptr);
    if (tmpl == nullptr || tmpl[0] == '\0') {
        spdlog::info("Model has no chat template, using ChatML format");
        return buildChatMLPrompt(messages, disable_thinking);
    }

    std::vector<llama_chat_message> llama_messages;
    llama_messages.reserve(messages.size());
    for (const auto& msg : messages) {
        llama_messages.push_back({msg.role.c_str(), msg.content.c_str()});
    }

    int32_t required_size = llama_chat_apply_template(
        tmpl, llama_messages.data(), llama_messages.size(), true, nullptr, 0);
    if (required_size < 0) {
        spdlog::warn("llama_chat_apply_template failed (size={}), using ChatML fallback", required_size);
        return buildChatMLPrompt(messages, disable_thinking);
    }

    std::vector<char> buf(static_cast<size_t>(required_size) + 1);
    int32_t actual_size = llama_chat_apply_template(
        tmpl, llama_messages.data(), llama_messages.size(), true,
        buf.data(), static_cast<int32_t>(buf.size()));
    if (actual_size < 0 || actual_size > static_cast<int32_t>(buf.size())) {
        spdlog::error("llama_chat_apply_template failed on second call");
        return buildChatMLPrompt(messages, disable_thinking);
    }

    std::string prompt(buf.data(), static_cast<size_t>(actual_size));
    // 思考モードを持つテンプレートだけ空ブロックを埋める
    if (disable_thinking && std::string(tmpl).find("<think>") != std::string::npos) {
        prompt += kEmptyThinkBlock;
    }
    return prompt;
}

void LlamaModelHandle::generate(const std::vector<ChatMessage>& messages,
                                const InferenceParams& params,
                                const PieceCallback& on_piece) {
    if (!ctx_ || !model_) {
        throw GenerationError("model context is not initialized: " + model_id_);
    }
    KvCacheScope kv_scope(ctx_);

    const std::string prompt = buildPrompt(messages, params.disable_thinking);
    spdlog::debug("Prompt: {} chars", prompt.size());

    const llama_vocab* vocab = llama_model_get_vocab(model_);
    if (!vocab) {
        throw GenerationError("failed to get vocab from model");
    }

    std::vector<llama_token> tokens = tokenize(vocab, prompt);
    const int32_t n_tokens = static_cast<int32_t>(tokens.size());
    const uint32_t n_ctx = llama_n_ctx(ctx_);
    if (n_ctx > 0 && static_cast<uint32_t>(n_tokens) >= n_ctx) {
        throw GenerationError("prompt too long: " + std::to_string(n_tokens) +
                              " tokens (context " + std::to_string(n_ctx) + ")");
    }

    // プロンプトはバッチ分割してデコード
    const int32_t batch_size = static_cast<int32_t>(llama_n_batch(ctx_));
    for (int32_t i = 0; i < n_tokens; i += batch_size) {
        int32_t current = std::min(batch_size, n_tokens - i);
        llama_batch batch = llama_batch_get_one(tokens.data() + i, current);
        int32_t rc = llama_decode(ctx_, batch);
        if (rc != 0) {
            spdlog::error("llama_decode failed at batch {}/{}: n_tokens={}, error={}",
                          i / batch_size + 1, (n_tokens + batch_size - 1) / batch_size, n_tokens, rc);
            throw GenerationError("llama_decode failed");
        }
    }

    SamplerPtr sampler = make_sampler(params);
    const size_t max_tokens = resolve_effective_max_tokens(
        params.max_tokens, static_cast<size_t>(n_tokens), static_cast<size_t>(n_ctx));

    for (size_t i = 0; i < max_tokens; ++i) {
        llama_token token = llama_sampler_sample(sampler.get(), ctx_, -1);
        if (llama_vocab_is_eog(vocab, token)) {
            spdlog::debug("EOG token received at position {}", i);
            break;
        }

        char buf[256];
        int32_t len = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, false);
        if (len > 0 && on_piece && !on_piece(std::string(buf, static_cast<size_t>(len)))) {
            spdlog::debug("Generation stopped by consumer at token {}", i);
            break;
        }

        // llama_sampler_sample が accept 済み
        llama_batch next = llama_batch_get_one(&token, 1);
        int32_t rc = llama_decode(ctx_, next);
        if (rc != 0) {
            throw GenerationError("llama_decode failed during generation: " + std::to_string(rc));
        }
    }
}

}  // namespace advisor
