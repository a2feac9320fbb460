#include "models/model_catalog.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/file_lock.h"

namespace advisor {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool looksLikeRepo(const std::string& value) {
    auto slash = value.find('/');
    return slash != std::string::npos && slash > 0 && slash + 1 < value.size() &&
           value.find('/', slash + 1) == std::string::npos;
}

}  // namespace

ModelCatalog::ModelCatalog() {
    entries_ = {
        {"Qwen3-4B", "Qwen/Qwen3-4B-GGUF", "Qwen3-4B-Q4_K_M.gguf", "Qwen/Qwen3-4B", 8044936192ULL},
        {"Qwen3-8B", "Qwen/Qwen3-8B-GGUF", "Qwen3-8B-Q4_K_M.gguf", "Qwen/Qwen3-8B", 16381470720ULL},
        {"Qwen3-14B", "Qwen/Qwen3-14B-GGUF", "Qwen3-14B-Q4_K_M.gguf", "Qwen/Qwen3-14B", 29536614400ULL},
        {"Qwen3-32B", "Qwen/Qwen3-32B-GGUF", "Qwen3-32B-Q4_K_M.gguf", "Qwen/Qwen3-32B", 65524246528ULL},
    };
}

void ModelCatalog::upsert(CatalogEntry entry) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const CatalogEntry& e) { return e.name == entry.name; });
    if (it != entries_.end()) {
        *it = std::move(entry);
    } else {
        entries_.push_back(std::move(entry));
    }
}

bool ModelCatalog::loadOverrides(const std::filesystem::path& path) {
    if (path.empty()) return false;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::warn("Catalog file not found: {}", path.string());
        return false;
    }

    nlohmann::json doc;
    {
        FileLock lock(path, FileLock::Mode::Shared);
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            spdlog::warn("Failed to open catalog file: {}", path.string());
            return false;
        }
        doc = nlohmann::json::parse(ifs, nullptr, false);
    }
    if (doc.is_discarded()) {
        spdlog::warn("Ignoring malformed catalog file: {}", path.string());
        return false;
    }

    const nlohmann::json* models = &doc;
    if (doc.is_object() && doc.contains("models")) {
        models = &doc["models"];
    }
    if (!models->is_array()) {
        spdlog::warn("Catalog file has no model list: {}", path.string());
        return false;
    }

    size_t added = 0;
    for (const auto& item : *models) {
        if (!item.is_object()) continue;
        CatalogEntry entry;
        entry.name = item.value("name", "");
        entry.repo = item.value("repo", "");
        if (entry.name.empty() || !looksLikeRepo(entry.repo)) {
            spdlog::warn("Skipping catalog entry without name/repo in {}", path.string());
            continue;
        }
        entry.file = item.value("file", "");
        entry.base_repo = item.value("base_repo", entry.repo);
        entry.official_bytes = item.value("official_bytes", static_cast<uint64_t>(0));
        upsert(std::move(entry));
        ++added;
    }
    spdlog::info("Loaded {} catalog entries from {}", added, path.string());
    return true;
}

std::optional<CatalogEntry> ModelCatalog::resolve(const std::string& model_id) const {
    if (model_id.empty()) return std::nullopt;

    const std::string lower = toLower(model_id);
    for (const auto& e : entries_) {
        if (toLower(e.name) == lower || toLower(e.repo) == lower || toLower(e.base_repo) == lower) {
            return e;
        }
    }

    // 直接参照: org/repo:file.gguf または org/repo
    std::string repo = model_id;
    std::string file;
    auto colon = model_id.find(':');
    if (colon != std::string::npos) {
        repo = model_id.substr(0, colon);
        file = model_id.substr(colon + 1);
        if (file.empty()) return std::nullopt;
    }
    if (!looksLikeRepo(repo)) {
        return std::nullopt;
    }

    CatalogEntry entry;
    entry.name = model_id;
    entry.repo = repo;
    entry.file = file;
    entry.base_repo = repo;
    return entry;
}

}  // namespace advisor
