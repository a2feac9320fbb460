#pragma once

#include <memory>
#include <string>

#include "core/model_loader.h"
#include "models/model_catalog.h"
#include "models/model_downloader.h"
#include "models/weight_store.h"

namespace advisor {

struct LlamaLoaderOptions {
    int n_gpu_layers{999};
    int ctx_size{8192};
    int batch_size{512};
    int n_threads{0};
    bool allow_download{true};
};

/// カタログ解決 → WeightStore 参照（なければダウンロード） → llama.cpp で読み込み
class LlamaModelLoader : public ModelLoader {
public:
    LlamaModelLoader(ModelCatalog catalog,
                     WeightStore store,
                     std::unique_ptr<ModelDownloader> downloader,
                     LlamaLoaderOptions options = {});

    // llama.cpp バックエンド初期化/終了（main.cpp で1回呼び出し）
    static void initBackend();
    static void freeBackend();

    std::unique_ptr<ModelHandle> load(const ModelIdentifier& model_id,
                                      const LoadProgressCallback& progress) override;

    /// GGUF ファイルを直接読み込む（カタログ/ダウンロードを経由しない）
    std::unique_ptr<ModelHandle> loadFile(const ModelIdentifier& model_id,
                                          const std::string& gguf_path,
                                          const LoadProgressCallback& progress);

    const ModelCatalog& catalog() const { return catalog_; }
    const WeightStore& store() const { return store_; }

private:
    std::string ensureWeights(const CatalogEntry& entry, const LoadProgressCallback& progress);

    ModelCatalog catalog_;
    WeightStore store_;
    std::unique_ptr<ModelDownloader> downloader_;
    LlamaLoaderOptions options_;
};

}  // namespace advisor
