#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "models/model_catalog.h"
#include "models/weight_store.h"
#include "utils/config.h"

namespace advisor {

using DownloadProgressCallback = std::function<void(uint64_t downloaded, uint64_t total)>;

/// <hf_base_url>/<repo>/resolve/main/<file> を WeightStore に取得する
///
/// 途中のファイルは "<file>.part" に書き、Range で再開する。完了後にリネームするので
/// WeightStore から見えるのは完全なファイルだけ。
class ModelDownloader {
public:
    ModelDownloader(WeightStore store, DownloadConfig config);

    /// 成功時はローカルパス、失敗時は空文字列（lastError() に理由）
    std::string download(const CatalogEntry& entry, DownloadProgressCallback cb = nullptr);

    std::string lastError() const {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return last_error_;
    }

    const WeightStore& store() const { return store_; }
    const DownloadConfig& config() const { return config_; }

    static std::string buildResolveUrl(const std::string& base_url,
                                       const std::string& repo,
                                       const std::string& file);

private:
    void setError(std::string message);

    WeightStore store_;
    DownloadConfig config_;
    std::string last_error_;
    mutable std::mutex error_mutex_;
};

}  // namespace advisor
