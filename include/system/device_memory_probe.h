#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "system/gpu_detector.h"

namespace advisor {

struct DeviceMemorySample {
    uint64_t used_bytes{0};
    uint64_t total_bytes{0};
};

/// StatusSnapshot 用のデバイスメモリ計測。アクセラレータがなければ 0/0
class DeviceMemoryProbe {
public:
    virtual ~DeviceMemoryProbe() = default;
    virtual DeviceMemorySample sample() = 0;
};

/// GpuDetector による計測。ポーリング負荷を抑えるため min_interval の間は前回値を返す
class GpuMemoryProbe : public DeviceMemoryProbe {
public:
    explicit GpuMemoryProbe(std::chrono::milliseconds min_interval = std::chrono::seconds(1));

    DeviceMemorySample sample() override;

private:
    std::mutex mutex_;
    GpuDetector detector_;
    std::chrono::milliseconds min_interval_;
    std::chrono::steady_clock::time_point last_sample_at_{};
    bool sampled_{false};
    DeviceMemorySample last_;
};

}  // namespace advisor
