#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace advisor {

/// 選択可能なモデル1件（GGUF 配布元と公式重みサイズ）
struct CatalogEntry {
    std::string name;         // 表示名/キー（例: Qwen3-8B）
    std::string repo;         // GGUF リポジトリ（例: Qwen/Qwen3-8B-GGUF）
    std::string file;         // リポジトリ内の GGUF ファイル名（空なら最初の *.gguf）
    std::string base_repo;    // 元モデルのリポジトリ（例: Qwen/Qwen3-8B）
    uint64_t official_bytes{0};
};

class ModelCatalog {
public:
    /// Qwen3 4B/8B/14B/32B のビルトインカタログ
    ModelCatalog();

    /// JSON ファイルで追加/上書きする。{"models": [{"name", "repo", "file", ...}]}
    /// 読めない/壊れているファイルは警告して無視し、false を返す
    bool loadOverrides(const std::filesystem::path& path);

    const std::vector<CatalogEntry>& entries() const { return entries_; }

    /// キー、repo/base_repo、または "org/repo:file.gguf" 形式の直接参照を解決する
    std::optional<CatalogEntry> resolve(const std::string& model_id) const;

    void upsert(CatalogEntry entry);

private:
    std::vector<CatalogEntry> entries_;
};

}  // namespace advisor
