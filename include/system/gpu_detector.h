#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace advisor {

struct GpuDevice {
    int id;
    std::string name;
    size_t memory_bytes;
    size_t free_memory_bytes;
    std::string compute_capability;
    std::string vendor;  // "nvidia"
    bool is_available;
};

/// CUDA デバイスの検出（ADVISOR_USE_CUDA なしのビルドでは常に空）
/// 結果は detect() 時点のもの。メモリ量を更新するには再度 detect() を呼ぶ。
class GpuDetector {
public:
    GpuDetector() = default;

    std::vector<GpuDevice> detect();

    bool hasGpu() const;

    // 利用可能なデバイスの合計/使用中メモリ（なければ 0）
    size_t getTotalMemory() const;
    size_t getUsedMemory() const;

    /// ロード先: prefer_loaded_gpu が使えればそれ、なければ空きメモリ最大のデバイス
    std::optional<int> selectGpu(std::optional<int> prefer_loaded_gpu = std::nullopt) const;

    const std::vector<GpuDevice>& devices() const { return detected_devices_; }

private:
    std::vector<GpuDevice> detected_devices_;

    std::vector<GpuDevice> detectCuda();

#ifdef ADVISOR_TESTING
public:
    void setDetectedDevicesForTest(std::vector<GpuDevice> devices);
#endif
};

}  // namespace advisor
