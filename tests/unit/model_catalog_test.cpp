#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#include "models/model_catalog.h"

using namespace advisor;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / "catalog-XXXXXX";
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path();
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};

}  // namespace

TEST(ModelCatalogTest, BuiltinsCoverQwen3Sizes) {
    ModelCatalog catalog;
    ASSERT_EQ(catalog.entries().size(), 4u);

    auto entry = catalog.resolve("Qwen3-8B");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->repo, "Qwen/Qwen3-8B-GGUF");
    EXPECT_EQ(entry->file, "Qwen3-8B-Q4_K_M.gguf");
    EXPECT_EQ(entry->base_repo, "Qwen/Qwen3-8B");
    EXPECT_EQ(entry->official_bytes, 16381470720ULL);
}

TEST(ModelCatalogTest, ResolvesByRepoAndBaseRepoCaseInsensitive) {
    ModelCatalog catalog;

    auto by_repo = catalog.resolve("qwen/qwen3-14b-gguf");
    ASSERT_TRUE(by_repo.has_value());
    EXPECT_EQ(by_repo->name, "Qwen3-14B");

    auto by_base = catalog.resolve("Qwen/Qwen3-32B");
    ASSERT_TRUE(by_base.has_value());
    EXPECT_EQ(by_base->name, "Qwen3-32B");
}

TEST(ModelCatalogTest, ResolvesRawRepoReference) {
    ModelCatalog catalog;

    auto with_file = catalog.resolve("acme/tiny-GGUF:tiny-q8.gguf");
    ASSERT_TRUE(with_file.has_value());
    EXPECT_EQ(with_file->repo, "acme/tiny-GGUF");
    EXPECT_EQ(with_file->file, "tiny-q8.gguf");

    auto bare = catalog.resolve("acme/tiny-GGUF");
    ASSERT_TRUE(bare.has_value());
    EXPECT_TRUE(bare->file.empty());
}

TEST(ModelCatalogTest, RejectsUnknownIdentifiers) {
    ModelCatalog catalog;
    EXPECT_FALSE(catalog.resolve("").has_value());
    EXPECT_FALSE(catalog.resolve("gpt-oss").has_value());
    EXPECT_FALSE(catalog.resolve("a/b/c").has_value());
    EXPECT_FALSE(catalog.resolve("acme/tiny:").has_value());
}

TEST(ModelCatalogTest, OverridesFileAddsAndReplacesEntries) {
    TempDir tmp;
    fs::path file = tmp.path / "catalog.json";
    std::ofstream(file) << R"({"models": [
        {"name": "Qwen3-8B", "repo": "unsloth/Qwen3-8B-GGUF", "file": "Qwen3-8B-Q8_0.gguf"},
        {"name": "Tiny", "repo": "acme/tiny-GGUF", "official_bytes": 1024},
        {"name": "", "repo": "broken/entry"}
    ]})";

    ModelCatalog catalog;
    EXPECT_TRUE(catalog.loadOverrides(file));
    EXPECT_EQ(catalog.entries().size(), 5u);

    auto replaced = catalog.resolve("Qwen3-8B");
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(replaced->repo, "unsloth/Qwen3-8B-GGUF");
    EXPECT_EQ(replaced->base_repo, "unsloth/Qwen3-8B-GGUF");

    auto tiny = catalog.resolve("tiny");
    ASSERT_TRUE(tiny.has_value());
    EXPECT_EQ(tiny->official_bytes, 1024u);
}

TEST(ModelCatalogTest, MalformedOrMissingFileKeepsBuiltins) {
    TempDir tmp;
    fs::path file = tmp.path / "catalog.json";
    std::ofstream(file) << "[{ nope";

    ModelCatalog catalog;
    EXPECT_FALSE(catalog.loadOverrides(file));
    EXPECT_FALSE(catalog.loadOverrides(tmp.path / "missing.json"));
    EXPECT_EQ(catalog.entries().size(), 4u);
}
