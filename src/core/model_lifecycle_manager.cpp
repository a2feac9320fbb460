#include "core/model_lifecycle_manager.h"
#include "core/engine_error.h"

#include <spdlog/spdlog.h>
#include <utility>

namespace advisor {

GenerationRequest buildChatRequest(const std::vector<ChatMessage>& messages,
                                   const std::string& system,
                                   const InferenceParams& params) {
    GenerationRequest request;
    request.params = params;
    request.messages.reserve(messages.size() + 1);
    if (!system.empty()) {
        request.messages.push_back({"system", system});
    }
    request.messages.insert(request.messages.end(), messages.begin(), messages.end());
    return request;
}

ModelLifecycleManager::ModelLifecycleManager(std::unique_ptr<ModelLoader> loader,
                                             PersistenceRecord record,
                                             GenerationEngine engine,
                                             std::shared_ptr<DeviceMemoryProbe> memory_probe)
    : loader_(std::move(loader))
    , record_(std::move(record))
    , engine_(std::move(engine))
    , memory_probe_(std::move(memory_probe)) {}

// ロード用スレッドは呼び出し側が所有し、破棄前に join しておくこと
ModelLifecycleManager::~ModelLifecycleManager() {
    std::lock_guard<std::mutex> gen_lock(generation_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    handle_.reset();
}

StatusSnapshot ModelLifecycleManager::status() const {
    // GPU計測は状態ロックの外で行う
    DeviceMemorySample memory;
    if (memory_probe_) {
        memory = memory_probe_->sample();
    }

    StatusSnapshot snapshot;
    uint64_t handle_bytes = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snapshot.phase = state_.phase;
        snapshot.available = state_.isReady();
        snapshot.loading = loading_;
        snapshot.current_model = state_.model_id;
        snapshot.last_error = state_.error;
        snapshot.last_progress = last_progress_;
        if (handle_) {
            handle_bytes = handle_->deviceMemoryBytes();
        }
    }

    snapshot.device_memory_total = memory.total_bytes;
    snapshot.device_memory_used = memory.total_bytes > 0 ? memory.used_bytes : handle_bytes;
    return snapshot;
}

bool ModelLifecycleManager::isAvailable() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.isReady();
}

bool ModelLifecycleManager::isLoading() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return loading_;
}

void ModelLifecycleManager::setProgress(const std::string& milestone,
                                        const LoadProgressCallback& progress) {
    spdlog::info("Model load: {}", milestone);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_progress_ = milestone;
    }
    if (!progress) {
        return;
    }
    // 進捗通知は助言的なもの。オブザーバの失敗でロードを失敗させない
    try {
        progress(milestone);
    } catch (const std::exception& e) {
        spdlog::warn("Load progress observer threw: {}", e.what());
    }
}

bool ModelLifecycleManager::load(const ModelIdentifier& model_id,
                                 const LoadProgressCallback& progress) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (loading_) {
            spdlog::info("Load request for {} ignored: a load is already in progress ({})",
                         model_id, state_.model_id);
            return false;
        }
        loading_ = true;
        state_ = LifecycleState::loading(model_id);
        last_progress_.clear();
    }

    std::string error_message;
    try {
        // 1. 旧モデルを先に解放（推論中ならその完了を待つ）
        {
            std::lock_guard<std::mutex> gen_lock(generation_mutex_);
            std::shared_ptr<ModelHandle> previous;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                previous = std::move(handle_);
                handle_.reset();
            }
            if (previous) {
                setProgress("Unloading previous model: " + previous->modelId(), progress);
                previous.reset();
            }
        }

        // 2. ダウンロード/読み込み（ロックは保持しない）
        std::unique_ptr<ModelHandle> loaded = loader_->load(
            model_id, [this, &progress](const std::string& milestone) {
                setProgress(milestone, progress);
            });
        if (!loaded) {
            throw ModelLoadError(EngineErrorCode::kLoadFailed, "loader returned no model handle");
        }
        std::shared_ptr<ModelHandle> handle(std::move(loaded));

        // 3. 差し替えと Ready への遷移を一度に行う
        {
            std::lock_guard<std::mutex> gen_lock(generation_mutex_);
            std::lock_guard<std::mutex> lock(state_mutex_);
            handle_ = std::move(handle);
            state_ = LifecycleState::ready(model_id);
            loading_ = false;
        }

        record_.write(model_id);
        setProgress("Loaded: " + model_id, progress);
        return true;
    } catch (const ModelLoadError& e) {
        error_message = std::string(to_string(e.code())) + ": " + e.what();
    } catch (const std::exception& e) {
        error_message = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle_.reset();
        state_ = LifecycleState::failed(model_id, error_message);
        loading_ = false;
    }
    spdlog::error("Model load failed: {} ({})", model_id, error_message);
    setProgress("Error: " + error_message, progress);
    return true;
}

bool ModelLifecycleManager::unload() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (loading_) {
            spdlog::warn("Unload ignored: model {} is still loading", state_.model_id);
            return false;
        }
    }

    std::string unloaded_id;
    bool changed = false;
    {
        std::lock_guard<std::mutex> gen_lock(generation_mutex_);
        std::shared_ptr<ModelHandle> previous;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            // 推論完了を待つ間にロードが始まった場合
            if (loading_) {
                spdlog::warn("Unload ignored: model {} started loading", state_.model_id);
                return false;
            }
            changed = handle_ != nullptr || state_.phase != LifecyclePhase::Unloaded;
            unloaded_id = state_.model_id;
            previous = std::move(handle_);
            handle_.reset();
            state_ = LifecycleState::unloaded();
            last_progress_ = "Model unloaded.";
        }
        previous.reset();
    }

    if (changed) {
        spdlog::info("Model unloaded: {}", unloaded_id.empty() ? "(none)" : unloaded_id);
    }
    return changed;
}

std::shared_ptr<ModelHandle> ModelLifecycleManager::readyHandle() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.isReady()) {
        return nullptr;
    }
    return handle_;
}

std::string ModelLifecycleManager::generate(const GenerationRequest& request) {
    if (!isAvailable()) {
        return "";
    }
    std::lock_guard<std::mutex> gen_lock(generation_mutex_);
    // ロック待ちの間にアンロード/差し替えが入った可能性がある
    auto handle = readyHandle();
    if (!handle) {
        return "";
    }
    return engine_.generate(*handle, request);
}

std::vector<std::string> ModelLifecycleManager::streamGenerate(const GenerationRequest& request,
                                                               const SnapshotCallback& on_snapshot) {
    if (!isAvailable()) {
        return {};
    }
    std::lock_guard<std::mutex> gen_lock(generation_mutex_);
    auto handle = readyHandle();
    if (!handle) {
        return {};
    }
    // 放棄された生産者との排他はハンドルの占有ロックが受け持つ
    try {
        return engine_.streamGenerate(handle, request, on_snapshot);
    } catch (const std::exception& e) {
        spdlog::warn("Stream consumer failed for model {}: {}", handle->modelId(), e.what());
        return {};
    }
}

std::string ModelLifecycleManager::chat(const std::vector<ChatMessage>& messages,
                                        const std::string& system,
                                        float temperature) {
    InferenceParams params = defaultParams();
    params.temperature = temperature;
    return generate(buildChatRequest(messages, system, params));
}

std::vector<std::string> ModelLifecycleManager::streamChat(const std::vector<ChatMessage>& messages,
                                                           const std::string& system,
                                                           float temperature,
                                                           const SnapshotCallback& on_snapshot) {
    InferenceParams params = defaultParams();
    params.temperature = temperature;
    return streamGenerate(buildChatRequest(messages, system, params), on_snapshot);
}

std::string ModelLifecycleManager::generatePrompt(const std::string& prompt,
                                                  const std::string& system,
                                                  float temperature) {
    return chat({{"user", prompt}}, system, temperature);
}

std::vector<std::string> ModelLifecycleManager::streamPrompt(const std::string& prompt,
                                                             const std::string& system,
                                                             float temperature,
                                                             const SnapshotCallback& on_snapshot) {
    return streamChat({{"user", prompt}}, system, temperature, on_snapshot);
}

std::optional<ModelIdentifier> ModelLifecycleManager::lastPersistedModel() const {
    return record_.read();
}

void ModelLifecycleManager::setDefaultParams(const InferenceParams& params) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    default_params_ = params;
}

InferenceParams ModelLifecycleManager::defaultParams() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return default_params_;
}

}  // namespace advisor
