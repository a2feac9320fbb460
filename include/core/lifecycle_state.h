#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

#include "core/engine_types.h"

namespace advisor {

enum class LifecyclePhase {
    Unloaded,
    Loading,
    Ready,
    Failed,
};

inline const char* to_string(LifecyclePhase phase) {
    switch (phase) {
        case LifecyclePhase::Unloaded:
            return "unloaded";
        case LifecyclePhase::Loading:
            return "loading";
        case LifecyclePhase::Ready:
            return "ready";
        case LifecyclePhase::Failed:
            return "failed";
    }
    return "unknown";
}

/// Unloaded / Loading(id) / Ready(id) / Failed(id, error) のいずれか1つ
struct LifecycleState {
    LifecyclePhase phase{LifecyclePhase::Unloaded};
    ModelIdentifier model_id;
    std::string error;

    bool isReady() const { return phase == LifecyclePhase::Ready; }

    static LifecycleState unloaded() { return {}; }
    static LifecycleState loading(ModelIdentifier id) {
        return {LifecyclePhase::Loading, std::move(id), {}};
    }
    static LifecycleState ready(ModelIdentifier id) {
        return {LifecyclePhase::Ready, std::move(id), {}};
    }
    static LifecycleState failed(ModelIdentifier id, std::string message) {
        return {LifecyclePhase::Failed, std::move(id), std::move(message)};
    }
};

/// status() が返す読み取り専用コピー。ライブ状態とエイリアスしない
struct StatusSnapshot {
    LifecyclePhase phase{LifecyclePhase::Unloaded};
    bool available{false};
    bool loading{false};
    ModelIdentifier current_model;
    std::string last_error;
    std::string last_progress;
    uint64_t device_memory_used{0};
    uint64_t device_memory_total{0};

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["state"] = to_string(phase);
        j["available"] = available;
        j["loading"] = loading;
        j["current_model"] = current_model.empty() ? nlohmann::json(nullptr)
                                                   : nlohmann::json(current_model);
        j["last_error"] = last_error;
        j["last_progress"] = last_progress;
        j["device_memory_used"] = device_memory_used;
        j["device_memory_total"] = device_memory_total;
        return j;
    }
};

}  // namespace advisor
