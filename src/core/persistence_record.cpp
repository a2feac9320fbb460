#include "core/persistence_record.h"
#include "utils/file_lock.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace advisor {

PersistenceRecord::PersistenceRecord(fs::path path)
    : path_(std::move(path))
    , write_mutex_(std::make_shared<std::mutex>()) {}

std::optional<ModelIdentifier> PersistenceRecord::read() const {
    if (path_.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return std::nullopt;
    }

    FileLock lock(path_, FileLock::Mode::Shared);
    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        spdlog::debug("Persistence record unreadable: {}", path_.string());
        return std::nullopt;
    }

    // 破損は記録なしとして扱う
    nlohmann::json j = nlohmann::json::parse(ifs, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Ignoring corrupt persistence record: {}", path_.string());
        return std::nullopt;
    }
    auto it = j.find("model_id");
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string model_id = it->get<std::string>();
    if (model_id.empty()) {
        return std::nullopt;
    }
    return model_id;
}

void PersistenceRecord::write(const ModelIdentifier& model_id) {
    if (path_.empty()) {
        return;
    }
    std::lock_guard<std::mutex> guard(*write_mutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::warn("Failed to create directory for persistence record {}: {}",
                         path_.string(), ec.message());
            return;
        }
    }

    FileLock lock(path_, FileLock::Mode::Exclusive);
    if (!lock.locked()) {
        spdlog::warn("Persistence record lock not acquired, writing anyway: {}", path_.string());
    }

    // 一時ファイルに書いてから rename（読み手に途中状態を見せない）
    fs::path tmp = path_;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            spdlog::warn("Failed to save persistence record: cannot open {}", tmp.string());
            return;
        }
        nlohmann::json j = {{"model_id", model_id}};
        ofs << j.dump();
        ofs.flush();
        if (!ofs) {
            spdlog::warn("Failed to save persistence record: write error on {}", tmp.string());
            ofs.close();
            fs::remove(tmp, ec);
            return;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        spdlog::warn("Failed to save persistence record {}: {}", path_.string(), ec.message());
        std::error_code remove_ec;
        fs::remove(tmp, remove_ec);
        return;
    }
    spdlog::debug("Persisted last model: {}", model_id);
}

}  // namespace advisor
