#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/model_handle.h"

// llama.cpp forward declarations
struct llama_model;
struct llama_context;

namespace advisor {

/// llama.cpp のモデルとコンテキストを所有するハンドル
///
/// コンテキストへの排他は ModelHandle::usageMutex() に任せる。
class LlamaModelHandle : public ModelHandle {
public:
    LlamaModelHandle(ModelIdentifier model_id,
                     std::string model_path,
                     llama_model* model,
                     llama_context* ctx,
                     int gpu_layers,
                     int gpu_id);
    ~LlamaModelHandle() override;

    const ModelIdentifier& modelId() const override { return model_id_; }
    uint64_t deviceMemoryBytes() const override { return device_bytes_; }

    void generate(const std::vector<ChatMessage>& messages,
                  const InferenceParams& params,
                  const PieceCallback& on_piece) override;

    const std::string& modelPath() const { return model_path_; }
    int gpuId() const { return gpu_id_; }

    /// 会話にチャットテンプレートを適用したプロンプト（テンプレートがなければ ChatML）
    std::string buildPrompt(const std::vector<ChatMessage>& messages, bool disable_thinking) const;

private:
    ModelIdentifier model_id_;
    std::string model_path_;
    llama_model* model_{nullptr};
    llama_context* ctx_{nullptr};
    int gpu_layers_{0};
    int gpu_id_{-1};
    uint64_t device_bytes_{0};
};

/// ChatML 形式のプロンプト。disable_thinking なら空の思考ブロックを先に埋める
std::string buildChatMLPrompt(const std::vector<ChatMessage>& messages, bool disable_thinking);

}  // namespace advisor
