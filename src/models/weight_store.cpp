#include "models/weight_store.h"

#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace advisor {

namespace {

constexpr const char* kRepoPrefix = "models--";

bool isCompleteGguf(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) return false;
    if (entry.path().extension() != ".gguf") return false;
    return entry.file_size(ec) > 0 && !ec;
}

}  // namespace

WeightStore::WeightStore(fs::path root) : root_(std::move(root)) {}

std::string WeightStore::cacheDirName(const std::string& repo) {
    std::string name = kRepoPrefix;
    for (char c : repo) {
        if (c == '/') {
            name += "--";
        } else {
            name.push_back(c);
        }
    }
    return name;
}

fs::path WeightStore::modelDir(const std::string& repo) const {
    return root_ / cacheDirName(repo);
}

fs::path WeightStore::snapshotDir(const std::string& repo) const {
    return modelDir(repo) / "snapshots" / "main";
}

std::optional<fs::path> WeightStore::resolveWeights(const CatalogEntry& entry) const {
    const fs::path dir = modelDir(entry.repo);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    std::vector<fs::path> candidates;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (isCompleteGguf(*it)) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::warn("Failed to scan weight store {}: {}", dir.string(), ec.message());
    }
    std::sort(candidates.begin(), candidates.end());

    if (!entry.file.empty()) {
        for (const auto& p : candidates) {
            if (p.filename() == entry.file) return p;
        }
    }
    if (!candidates.empty()) {
        return candidates.front();
    }
    return std::nullopt;
}

uint64_t WeightStore::cachedSizeBytes(const std::string& repo) const {
    const fs::path dir = modelDir(repo);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    uint64_t total = 0;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            auto size = it->file_size(size_ec);
            if (!size_ec) total += size;
        }
    }
    return total;
}

std::vector<std::string> WeightStore::listCached() const {
    std::vector<std::string> repos;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return repos;

    const std::string prefix(kRepoPrefix);
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code dir_ec;
        if (!it->is_directory(dir_ec)) continue;
        const std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;

        std::string rest = name.substr(prefix.size());
        auto sep = rest.find("--");
        if (sep == std::string::npos || sep == 0) continue;
        repos.push_back(rest.substr(0, sep) + "/" + rest.substr(sep + 2));
    }
    std::sort(repos.begin(), repos.end());
    return repos;
}

}  // namespace advisor
