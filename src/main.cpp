#include <atomic>
#include <cstdint>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/llama_model_loader.h"
#include "core/model_lifecycle_manager.h"
#include "models/model_catalog.h"
#include "models/model_downloader.h"
#include "models/weight_store.h"
#include "system/device_memory_probe.h"
#include "utils/background_threads.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted.store(true);
}

std::string formatGiB(uint64_t bytes) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f GiB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
    return buf;
}

void printProgress(const std::string& milestone) {
    std::cerr << "[load] " << milestone << std::endl;
}

/// 前回の出力の続きだけを書き出す。後処理で先頭が変わった場合は全文を出し直す
class SnapshotPrinter {
public:
    bool operator()(const std::string& snapshot) {
        if (snapshot.compare(0, printed_.size(), printed_) == 0) {
            std::cout << snapshot.substr(printed_.size()) << std::flush;
        } else {
            std::cout << "\n" << snapshot << std::flush;
        }
        printed_ = snapshot;
        return !g_interrupted.load();
    }

    const std::string& text() const { return printed_; }

private:
    std::string printed_;
};

}  // namespace

namespace advisor {
namespace {

ModelCatalog buildCatalog(const AdvisorConfig& cfg) {
    ModelCatalog catalog;
    if (!cfg.catalog_file.empty()) {
        catalog.loadOverrides(cfg.catalog_file);
    }
    return catalog;
}

std::unique_ptr<ModelLifecycleManager> buildManager(const AdvisorConfig& cfg, const ModelCatalog& catalog) {
    WeightStore store(cfg.cache_dir);
    std::unique_ptr<ModelDownloader> downloader;
    if (cfg.download.enabled) {
        downloader = std::make_unique<ModelDownloader>(store, cfg.download);
    }

    LlamaLoaderOptions loader_options;
    loader_options.n_gpu_layers = cfg.n_gpu_layers;
    loader_options.ctx_size = cfg.ctx_size;
    loader_options.batch_size = cfg.batch_size;
    loader_options.n_threads = cfg.n_threads;
    loader_options.allow_download = cfg.download.enabled;

    GenerationEngineOptions engine_options;
    engine_options.channel_capacity = cfg.stream_channel_capacity;
    engine_options.abandon_timeout = cfg.stream_timeout;

    auto manager = std::make_unique<ModelLifecycleManager>(
        std::make_unique<LlamaModelLoader>(catalog, store, std::move(downloader), loader_options),
        PersistenceRecord(cfg.persist_file),
        GenerationEngine(engine_options),
        std::make_shared<GpuMemoryProbe>());

    InferenceParams params;
    params.max_tokens = cfg.max_tokens;
    params.temperature = cfg.temperature;
    manager->setDefaultParams(params);
    return manager;
}

void printModels(const AdvisorConfig& cfg, const ModelCatalog& catalog) {
    WeightStore store(cfg.cache_dir);
    std::cout << "| Model | Repository | Local Size (Measured) | Official Weights Size |\n";
    std::cout << "|-------|------------|-----------------------|-----------------------|\n";
    for (const auto& entry : catalog.entries()) {
        const uint64_t local = store.cachedSizeBytes(entry.repo);
        std::cout << "| " << entry.name << " | " << entry.repo << (entry.file.empty() ? "" : "/" + entry.file)
                  << " | " << (local == 0 ? std::string("Not downloaded") : formatGiB(local))
                  << " | " << (entry.official_bytes == 0 ? std::string("-") : formatGiB(entry.official_bytes))
                  << " |\n";
    }
}

void printStatus(const ModelLifecycleManager& manager) {
    auto json = manager.status().toJson();
    auto last = manager.lastPersistedModel();
    json["last_model"] = last ? nlohmann::json(*last) : nlohmann::json(nullptr);
    std::cout << json.dump(2) << std::endl;
}

ModelIdentifier pickModel(const ModelLifecycleManager& manager,
                          const AdvisorConfig& cfg,
                          const std::string& requested) {
    if (!requested.empty()) return requested;
    if (auto last = manager.lastPersistedModel()) return *last;
    return cfg.default_model;
}

int runAsk(const AdvisorConfig& cfg, const CommandOptions& options) {
    auto manager = buildManager(cfg, buildCatalog(cfg));
    const ModelIdentifier model_id = pickModel(*manager, cfg, options.model);

    manager->load(model_id, printProgress);
    if (!manager->isAvailable()) {
        std::cerr << "Error: " << manager->status().last_error << std::endl;
        return 1;
    }

    const float temperature = options.temperature.value_or(cfg.temperature);
    if (options.stream) {
        SnapshotPrinter printer;
        auto snapshots = manager->streamPrompt(options.prompt, options.system, temperature,
                                               [&printer](const std::string& s) { return printer(s); });
        std::cout << std::endl;
        return snapshots.empty() ? 1 : 0;
    }

    const std::string answer = manager->generatePrompt(options.prompt, options.system, temperature);
    if (answer.empty()) {
        std::cerr << "Error: no response generated" << std::endl;
        return 1;
    }
    std::cout << answer << std::endl;
    return 0;
}

int runInteractive(const AdvisorConfig& cfg, const CommandOptions& options, const ModelIdentifier& initial) {
    const ModelCatalog catalog = buildCatalog(cfg);
    auto manager = buildManager(cfg, catalog);
    // バックグラウンドのロードは終了前に必ず join する（manager より先に破棄される）
    BackgroundThreads load_threads;

    auto startLoad = [&](const ModelIdentifier& model_id) {
        if (manager->isLoading()) {
            std::cout << "A model is already loading; try again when it finishes." << std::endl;
            return;
        }
        load_threads.start([&manager, model_id]() { manager->load(model_id, printProgress); });
    };

    if (!initial.empty()) {
        startLoad(initial);
    } else if (!options.no_resume && cfg.auto_resume) {
        // 前回のモデルをバックグラウンドで復元する
        if (auto last = manager->lastPersistedModel()) {
            spdlog::info("Resuming last model: {}", *last);
            startLoad(*last);
        }
    }

    std::cout << "advisor " << ADVISOR_VERSION << " - type /quit to exit, /load <model> to load a model"
              << std::endl;

    const float temperature = options.temperature.value_or(cfg.temperature);
    std::vector<ChatMessage> history;
    std::string line;
    while (!g_interrupted.load()) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") break;
        if (line == "/status") {
            printStatus(*manager);
            continue;
        }
        if (line == "/models") {
            printModels(cfg, catalog);
            continue;
        }
        if (line == "/unload") {
            std::cout << (manager->unload() ? "Model unloaded." : "Nothing to unload.") << std::endl;
            history.clear();
            continue;
        }
        if (line.rfind("/load", 0) == 0) {
            std::string model_id = line.size() > 5 ? line.substr(5) : std::string();
            model_id.erase(0, model_id.find_first_not_of(' '));
            if (model_id.empty()) {
                std::cout << "Usage: /load <model>" << std::endl;
            } else {
                history.clear();
                startLoad(model_id);
            }
            continue;
        }

        if (!manager->isAvailable()) {
            auto status = manager->status();
            std::cout << "Model is not ready (" << to_string(status.phase) << ")"
                      << (status.last_error.empty() ? "" : ": " + status.last_error) << std::endl;
            continue;
        }

        history.push_back({"user", line});
        SnapshotPrinter printer;
        auto snapshots = manager->streamChat(history, options.system, temperature,
                                             [&printer](const std::string& s) { return printer(s); });
        std::cout << std::endl;
        if (snapshots.empty()) {
            std::cout << "(no response)" << std::endl;
            history.pop_back();
        } else {
            history.push_back({"assistant", snapshots.back()});
        }
        g_interrupted.store(false);
    }

    return 0;
}

}  // namespace
}  // namespace advisor

int main(int argc, char* argv[]) {
    auto cli_result = advisor::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const bool interactive = cli_result.subcommand == advisor::Subcommand::None ||
                             cli_result.subcommand == advisor::Subcommand::Run;
    advisor::logger::init_from_env(/*quiet_stdout=*/interactive || cli_result.options.stream);

    auto [cfg, config_log] = advisor::loadAdvisorConfigWithLog();
    spdlog::info("advisor {} config: {}", ADVISOR_VERSION, config_log);

    int rc = 0;
    advisor::LlamaModelLoader::initBackend();
    try {
        switch (cli_result.subcommand) {
            case advisor::Subcommand::Status: {
                auto manager = advisor::buildManager(cfg, advisor::buildCatalog(cfg));
                advisor::printStatus(*manager);
                break;
            }
            case advisor::Subcommand::Models:
                advisor::printModels(cfg, advisor::buildCatalog(cfg));
                break;
            case advisor::Subcommand::Ask:
                rc = advisor::runAsk(cfg, cli_result.options);
                break;
            case advisor::Subcommand::Run:
                rc = advisor::runInteractive(cfg, cli_result.options, cli_result.options.model);
                break;
            case advisor::Subcommand::None:
            default:
                rc = advisor::runInteractive(cfg, cli_result.options, {});
                break;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 1;
    }
    advisor::LlamaModelLoader::freeBackend();
    spdlog::shutdown();
    return rc;
}
