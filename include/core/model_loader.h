#pragma once

#include <memory>
#include <string>

#include "core/engine_types.h"
#include "core/model_handle.h"

namespace advisor {

/// モデルIDからハンドルを取得する（ダウンロード + 重みの読み込み）
/// 失敗は ModelLoadError を送出する。呼び出し側のバックグラウンドスレッドで実行される。
class ModelLoader {
public:
    virtual ~ModelLoader() = default;

    virtual std::unique_ptr<ModelHandle> load(const ModelIdentifier& model_id,
                                              const LoadProgressCallback& progress) = 0;
};

}  // namespace advisor
