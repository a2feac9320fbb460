#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "models/model_catalog.h"

namespace advisor {

/// ダウンロード済み重みのキャッシュ（Hugging Face キャッシュと同じ models--<org>--<name> 命名）
/// 推論側からは読み取り専用。書き込むのは ModelDownloader のみ。
class WeightStore {
public:
    explicit WeightStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    /// "Qwen/Qwen3-8B-GGUF" -> "models--Qwen--Qwen3-8B-GGUF"
    static std::string cacheDirName(const std::string& repo);

    std::filesystem::path modelDir(const std::string& repo) const;
    /// ダウンロード先（modelDir/snapshots/main）
    std::filesystem::path snapshotDir(const std::string& repo) const;

    /// entry.file と一致するファイル、file が空なら最初の *.gguf
    std::optional<std::filesystem::path> resolveWeights(const CatalogEntry& entry) const;

    /// リポジトリ配下の実測サイズ（未ダウンロードなら 0）
    uint64_t cachedSizeBytes(const std::string& repo) const;

    /// キャッシュに存在するリポジトリID一覧（名前順）
    std::vector<std::string> listCached() const;

private:
    std::filesystem::path root_;
};

}  // namespace advisor
