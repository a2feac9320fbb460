#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#include "core/engine_error.h"
#include "core/llama_model_handle.h"
#include "core/llama_model_loader.h"
#include "core/model_lifecycle_manager.h"

using namespace advisor;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / "llama-loader-XXXXXX";
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

// GGUF マジックだけの不正なファイル
void writeInvalidGguf(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << "GGUF" << std::string(60, '\0');
}

std::unique_ptr<LlamaModelLoader> makeLoader(const fs::path& cache, bool allow_download) {
    WeightStore store(cache);
    DownloadConfig dl;
    dl.hf_base_url = "http://127.0.0.1:1";
    dl.max_retries = 0;
    LlamaLoaderOptions options;
    options.n_gpu_layers = 0;
    options.ctx_size = 512;
    options.allow_download = allow_download;
    return std::make_unique<LlamaModelLoader>(ModelCatalog(), store,
                                              std::make_unique<ModelDownloader>(store, dl), options);
}

EngineErrorCode loadErrorCode(LlamaModelLoader& loader, const std::string& model_id) {
    try {
        loader.load(model_id, nullptr);
    } catch (const ModelLoadError& e) {
        return e.code();
    }
    return EngineErrorCode::kOk;
}

}  // namespace

TEST(LlamaModelLoaderTest, UnknownModelIsNotFound) {
    TempDir tmp;
    auto loader = makeLoader(tmp.path, false);
    EXPECT_EQ(loadErrorCode(*loader, "gpt-oss"), EngineErrorCode::kNotFound);
}

TEST(LlamaModelLoaderTest, MissingWeightsWithDownloadsDisabledIsNotFound) {
    TempDir tmp;
    auto loader = makeLoader(tmp.path, false);
    EXPECT_EQ(loadErrorCode(*loader, "Qwen3-8B"), EngineErrorCode::kNotFound);
}

TEST(LlamaModelLoaderTest, UnreachableHubIsDownloadFailure) {
    TempDir tmp;
    auto loader = makeLoader(tmp.path, true);
    EXPECT_EQ(loadErrorCode(*loader, "Qwen3-4B"), EngineErrorCode::kDownloadFailed);
}

TEST(LlamaModelLoaderTest, InvalidGgufIsCorrupt) {
    TempDir tmp;
    auto loader = makeLoader(tmp.path, false);
    fs::path model = tmp.path / "broken.gguf";
    writeInvalidGguf(model);

    try {
        loader->loadFile("broken", model.string(), nullptr);
        FAIL() << "expected ModelLoadError";
    } catch (const ModelLoadError& e) {
        EXPECT_EQ(e.code(), EngineErrorCode::kModelCorrupt);
    }
}

TEST(LlamaModelLoaderTest, CachedInvalidWeightsReportProgressThenFail) {
    TempDir tmp;
    auto loader = makeLoader(tmp.path, false);
    WeightStore store(tmp.path);
    writeInvalidGguf(store.snapshotDir("Qwen/Qwen3-8B-GGUF") / "Qwen3-8B-Q4_K_M.gguf");

    std::vector<std::string> milestones;
    EXPECT_THROW(loader->load("Qwen3-8B", [&](const std::string& m) { milestones.push_back(m); }),
                 ModelLoadError);
    ASSERT_GE(milestones.size(), 2u);
    EXPECT_EQ(milestones.front(), "Resolving Qwen3-8B -> Qwen/Qwen3-8B-GGUF");
    EXPECT_EQ(milestones.back(), "Loading weights: Qwen3-8B-Q4_K_M.gguf");
}

TEST(LlamaModelLoaderTest, ManagerEndsFailedWithCodedMessage) {
    TempDir tmp;
    ModelLifecycleManager manager(makeLoader(tmp.path, false),
                                  PersistenceRecord(tmp.path / "last_model.json"));

    EXPECT_TRUE(manager.load("Qwen3-8B"));
    auto status = manager.status();
    EXPECT_EQ(status.phase, LifecyclePhase::Failed);
    EXPECT_FALSE(status.available);
    EXPECT_EQ(status.last_error.rfind("NOT_FOUND: ", 0), 0u);
    EXPECT_FALSE(manager.lastPersistedModel().has_value());
    EXPECT_EQ(manager.generatePrompt("hello", "", 0.0f), "");
}

TEST(ChatMLPromptTest, AppendsEmptyThinkBlockWhenDisabled) {
    std::vector<ChatMessage> messages = {{"system", "S"}, {"user", "U"}};

    EXPECT_EQ(buildChatMLPrompt(messages, false),
              "<|im_start|>system\nS<|im_end|>\n<|im_start|>user\nU<|im_end|>\n<|im_start|>assistant\n");
    EXPECT_EQ(buildChatMLPrompt(messages, true),
              "<|im_start|>system\nS<|im_end|>\n<|im_start|>user\nU<|im_end|>\n<|im_start|>assistant\n"
              "<think>\n\n</think>\n\n");
}
