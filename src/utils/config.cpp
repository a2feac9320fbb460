#include "utils/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>
#include "utils/file_lock.h"

namespace advisor {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<bool> parseBool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return std::nullopt;
}

std::filesystem::path defaultDataDir() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) {
        return std::filesystem::path(".stock-advisor");
    }
    return home / ".stock-advisor";
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    FileLock lock(path, FileLock::Mode::Shared);
    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config file {}: {}", path.string(), e.what());
        return false;
    }
}

}  // namespace

std::pair<AdvisorConfig, std::string> loadAdvisorConfigWithLog() {
    AdvisorConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    const auto data_dir = defaultDataDir();
    cfg.data_dir = data_dir.string();
    cfg.cache_dir = (data_dir / "models").string();
    cfg.persist_file = (data_dir / "last_model.json").string();

    auto apply_json = [&](const nlohmann::json& j) {
        if (j.contains("cache_dir") && j["cache_dir"].is_string()) {
            cfg.cache_dir = j["cache_dir"].get<std::string>();
        }
        if (j.contains("persist_file") && j["persist_file"].is_string()) {
            cfg.persist_file = j["persist_file"].get<std::string>();
        }
        if (j.contains("catalog_file") && j["catalog_file"].is_string()) {
            cfg.catalog_file = j["catalog_file"].get<std::string>();
        }
        if (j.contains("default_model") && j["default_model"].is_string()) {
            cfg.default_model = j["default_model"].get<std::string>();
        }
        cfg.auto_resume = j.value("auto_resume", cfg.auto_resume);
        cfg.n_gpu_layers = j.value("gpu_layers", cfg.n_gpu_layers);
        cfg.ctx_size = j.value("ctx_size", cfg.ctx_size);
        cfg.batch_size = j.value("batch_size", cfg.batch_size);
        cfg.n_threads = j.value("threads", cfg.n_threads);
        cfg.max_tokens = j.value("max_tokens", cfg.max_tokens);
        cfg.temperature = j.value("temperature", cfg.temperature);
        cfg.stream_channel_capacity = j.value("stream_channel_capacity", cfg.stream_channel_capacity);
        if (j.contains("stream_timeout_ms") && j["stream_timeout_ms"].is_number_integer()) {
            cfg.stream_timeout = std::chrono::milliseconds(j["stream_timeout_ms"].get<long long>());
        }
        if (j.contains("download") && j["download"].is_object()) {
            const auto& d = j["download"];
            cfg.download.enabled = d.value("enabled", cfg.download.enabled);
            cfg.download.hf_base_url = d.value("hf_base_url", cfg.download.hf_base_url);
            cfg.download.max_retries = d.value("max_retries", cfg.download.max_retries);
            if (d.contains("backoff_ms")) {
                cfg.download.backoff = std::chrono::milliseconds(d.value("backoff_ms", 200));
            }
            if (d.contains("timeout_ms")) {
                cfg.download.timeout = std::chrono::milliseconds(d.value("timeout_ms", 30000));
            }
            cfg.download.max_bytes_per_sec = d.value("max_bps", cfg.download.max_bytes_per_sec);
        }
    };

    std::filesystem::path cfg_path = data_dir / "config.json";
    if (auto env = getEnvValue("ADVISOR_CONFIG")) {
        cfg_path = *env;
    }

    nlohmann::json j;
    if (readJsonWithLock(cfg_path, j)) {
        try {
            apply_json(j);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Config file {} has invalid values: {}", cfg_path.string(), e.what());
        }
    }

    if (auto v = getEnvValue("ADVISOR_CACHE_DIR")) {
        cfg.cache_dir = *v;
        log << "env:CACHE_DIR=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("ADVISOR_PERSIST_FILE")) {
        cfg.persist_file = *v;
        log << "env:PERSIST_FILE=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("ADVISOR_CATALOG_FILE")) {
        cfg.catalog_file = *v;
        log << "env:CATALOG_FILE=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("ADVISOR_DEFAULT_MODEL")) {
        cfg.default_model = *v;
        log << "env:DEFAULT_MODEL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("ADVISOR_GPU_LAYERS")) {
        try {
            int layers = std::stoi(*v);
            if (layers >= 0) cfg.n_gpu_layers = layers;
            log << "env:GPU_LAYERS=" << layers << " ";
            used_env = true;
        } catch (const std::exception&) {}
    }
    if (auto v = getEnvValue("ADVISOR_CTX_SIZE")) {
        try {
            int ctx = std::stoi(*v);
            if (ctx > 0) cfg.ctx_size = ctx;
            log << "env:CTX_SIZE=" << ctx << " ";
            used_env = true;
        } catch (const std::exception&) {}
    }
    if (auto v = getEnvValue("ADVISOR_MAX_TOKENS")) {
        try {
            long long tokens = std::stoll(*v);
            if (tokens > 0) cfg.max_tokens = static_cast<size_t>(tokens);
            log << "env:MAX_TOKENS=" << tokens << " ";
            used_env = true;
        } catch (const std::exception&) {}
    }
    if (auto v = getEnvValue("ADVISOR_STREAM_TIMEOUT_MS")) {
        try {
            long long ms = std::stoll(*v);
            if (ms > 0) cfg.stream_timeout = std::chrono::milliseconds(ms);
            log << "env:STREAM_TIMEOUT_MS=" << ms << " ";
            used_env = true;
        } catch (const std::exception&) {}
    }
    if (auto v = getEnvValue("ADVISOR_ALLOW_DOWNLOAD")) {
        if (auto b = parseBool(*v)) {
            cfg.download.enabled = *b;
            log << "env:ALLOW_DOWNLOAD=" << (*b ? "true" : "false") << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("HF_BASE_URL")) {
        cfg.download.hf_base_url = *v;
        log << "env:HF_BASE_URL=" << *v << " ";
        used_env = true;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

AdvisorConfig loadAdvisorConfig() {
    auto info = loadAdvisorConfigWithLog();
    return info.first;
}

}  // namespace advisor
