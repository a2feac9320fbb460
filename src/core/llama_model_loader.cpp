#include "core/llama_model_loader.h"
#include "core/engine_error.h"
#include "core/llama_model_handle.h"
#include "system/gpu_detector.h"

#include <llama.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

namespace advisor {

namespace {

void report(const LoadProgressCallback& progress, const std::string& milestone) {
    if (progress) progress(milestone);
}

// ハンドルへ所有権を移すまでの仮置き
struct ModelDeleter {
    void operator()(llama_model* model) const {
        if (model) llama_model_free(model);
    }
};
struct ContextDeleter {
    void operator()(llama_context* ctx) const {
        if (ctx) llama_free(ctx);
    }
};

}  // namespace

LlamaModelLoader::LlamaModelLoader(ModelCatalog catalog,
                                   WeightStore store,
                                   std::unique_ptr<ModelDownloader> downloader,
                                   LlamaLoaderOptions options)
    : catalog_(std::move(catalog))
    , store_(std::move(store))
    , downloader_(std::move(downloader))
    , options_(options) {}

void LlamaModelLoader::initBackend() {
    spdlog::info("Initializing llama.cpp backend");
    llama_backend_init();
}

void LlamaModelLoader::freeBackend() {
    spdlog::info("Freeing llama.cpp backend");
    llama_backend_free();
}

std::string LlamaModelLoader::ensureWeights(const CatalogEntry& entry,
                                            const LoadProgressCallback& progress) {
    if (auto cached = store_.resolveWeights(entry)) {
        spdlog::info("Using cached weights: {}", cached->string());
        return cached->string();
    }

    if (!options_.allow_download || !downloader_) {
        throw ModelLoadError(EngineErrorCode::kNotFound,
                             "weights for " + entry.name + " are not cached and downloads are disabled");
    }

    report(progress, "Downloading weights: " + entry.repo + "/" + entry.file);
    int last_percent = -1;
    const std::string path = downloader_->download(entry, [&](uint64_t downloaded, uint64_t total) {
        if (total == 0) return;
        int percent = static_cast<int>(downloaded * 100 / total);
        // 10% 刻みで通知
        if (percent / 10 != last_percent / 10) {
            last_percent = percent;
            report(progress, "Downloading weights: " + std::to_string(percent) + "%");
        }
    });
    if (path.empty()) {
        throw ModelLoadError(EngineErrorCode::kDownloadFailed, downloader_->lastError());
    }
    return path;
}

std::unique_ptr<ModelHandle> LlamaModelLoader::load(const ModelIdentifier& model_id,
                                                    const LoadProgressCallback& progress) {
    auto entry = catalog_.resolve(model_id);
    if (!entry) {
        throw ModelLoadError(EngineErrorCode::kNotFound, "unknown model: " + model_id);
    }
    report(progress, "Resolving " + model_id + " -> " + entry->repo);
    const std::string gguf_path = ensureWeights(*entry, progress);
    return loadFile(model_id, gguf_path, progress);
}

std::unique_ptr<ModelHandle> LlamaModelLoader::loadFile(const ModelIdentifier& model_id,
                                                        const std::string& gguf_path,
                                                        const LoadProgressCallback& progress) {
    std::error_code ec;
    if (!fs::is_regular_file(gguf_path, ec)) {
        throw ModelLoadError(EngineErrorCode::kNotFound, "model file not found: " + gguf_path);
    }

    report(progress, "Loading weights: " + fs::path(gguf_path).filename().string());

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = static_cast<int32_t>(options_.n_gpu_layers);

    GpuDetector detector;
    detector.detect();
    std::optional<int> selected_gpu = detector.selectGpu(std::nullopt);
    if (selected_gpu.has_value()) {
        model_params.split_mode = LLAMA_SPLIT_MODE_NONE;
        model_params.main_gpu = selected_gpu.value();
        spdlog::info("Selected GPU {} for model {}", selected_gpu.value(), model_id);
    }

    spdlog::info("Loading model: {} (gpu_layers={})", gguf_path, options_.n_gpu_layers);
    std::unique_ptr<llama_model, ModelDeleter> model(
        llama_model_load_from_file(gguf_path.c_str(), model_params));
    if (!model) {
        throw ModelLoadError(EngineErrorCode::kModelCorrupt, "failed to load model file: " + gguf_path);
    }

    report(progress, "Creating context (n_ctx=" + std::to_string(options_.ctx_size) + ")");
    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(options_.ctx_size);
    ctx_params.n_batch = static_cast<uint32_t>(options_.batch_size);
    if (options_.n_threads > 0) {
        ctx_params.n_threads = options_.n_threads;
        ctx_params.n_threads_batch = options_.n_threads;
    }

    std::unique_ptr<llama_context, ContextDeleter> ctx(llama_init_from_model(model.get(), ctx_params));
    if (!ctx) {
        const EngineErrorCode code = selected_gpu.has_value() ? EngineErrorCode::kOomVram
                                                              : EngineErrorCode::kOomRam;
        throw ModelLoadError(code, "failed to create context for " + model_id);
    }

    auto handle = std::make_unique<LlamaModelHandle>(
        model_id, gguf_path, model.get(), ctx.get(),
        selected_gpu.has_value() ? options_.n_gpu_layers : 0,
        selected_gpu.value_or(-1));
    // 以降はハンドルが解放する
    const uint64_t model_bytes = llama_model_size(model.get());
    ctx.release();
    model.release();
    spdlog::info("Model loaded successfully: {} ({} bytes)", model_id, model_bytes);
    return handle;
}

}  // namespace advisor
