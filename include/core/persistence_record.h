#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/engine_types.h"

namespace advisor {

/// 最後にロードが成功したモデルIDを再起動をまたいで記録する（{"model_id": "..."}）
/// 読み込みの失敗・破損は「記録なし」、書き込みの失敗はログのみ。
class PersistenceRecord {
public:
    /// path が空なら永続化を行わない
    explicit PersistenceRecord(std::filesystem::path path);

    std::optional<ModelIdentifier> read() const;
    void write(const ModelIdentifier& model_id);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    // コピー間で同じ mutex を共有する
    std::shared_ptr<std::mutex> write_mutex_;
};

}  // namespace advisor
