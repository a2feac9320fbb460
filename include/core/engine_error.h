#pragma once

#include <stdexcept>
#include <string>

namespace advisor {

enum class EngineErrorCode : int {
    kOk = 0,
    kOomVram = 1,
    kOomRam = 2,
    kModelCorrupt = 3,
    kTimeout = 4,
    kCancelled = 5,
    kUnsupported = 6,
    kInternal = 7,
    kLoadFailed = 8,
    kDownloadFailed = 9,
    kNotFound = 10,
};

inline const char* to_string(EngineErrorCode code) {
    switch (code) {
        case EngineErrorCode::kOk:
            return "OK";
        case EngineErrorCode::kOomVram:
            return "OOM_VRAM";
        case EngineErrorCode::kOomRam:
            return "OOM_RAM";
        case EngineErrorCode::kModelCorrupt:
            return "MODEL_CORRUPT";
        case EngineErrorCode::kTimeout:
            return "TIMEOUT";
        case EngineErrorCode::kCancelled:
            return "CANCELLED";
        case EngineErrorCode::kUnsupported:
            return "UNSUPPORTED";
        case EngineErrorCode::kInternal:
            return "INTERNAL";
        case EngineErrorCode::kLoadFailed:
            return "LOAD_FAILED";
        case EngineErrorCode::kDownloadFailed:
            return "DOWNLOAD_FAILED";
        case EngineErrorCode::kNotFound:
            return "NOT_FOUND";
    }
    return "UNKNOWN";
}

/// ロード失敗（ModelLoader が送出し、ライフサイクルマネージャが Failed 状態へ変換する）
class ModelLoadError : public std::runtime_error {
public:
    ModelLoadError(EngineErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    EngineErrorCode code() const { return code_; }

private:
    EngineErrorCode code_;
};

/// 推論失敗（トークナイズ/デコードエラー）。状態は変えず、空の結果に変換される
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace advisor
