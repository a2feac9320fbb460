#include "system/device_memory_probe.h"

#include <spdlog/spdlog.h>

namespace advisor {

GpuMemoryProbe::GpuMemoryProbe(std::chrono::milliseconds min_interval)
    : min_interval_(min_interval) {}

DeviceMemorySample GpuMemoryProbe::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (sampled_ && now - last_sample_at_ < min_interval_) {
        return last_;
    }

    detector_.detect();
    last_.used_bytes = detector_.getUsedMemory();
    last_.total_bytes = detector_.getTotalMemory();
    if (!sampled_) {
        if (detector_.hasGpu()) {
            spdlog::info("Detected {} GPU(s), total memory {} bytes",
                         detector_.devices().size(), last_.total_bytes);
        } else {
            spdlog::info("No GPU detected; device memory telemetry reports zero");
        }
    }
    sampled_ = true;
    last_sample_at_ = now;
    return last_;
}

}  // namespace advisor
