#include "system/gpu_detector.h"

#include <numeric>
#include <string>
#include <utility>

#ifdef ADVISOR_USE_CUDA
#include <cuda_runtime.h>
#endif

namespace advisor {

namespace {

#ifdef ADVISOR_USE_CUDA
// cudaMemGetInfo のためにカレントデバイスを切り替え、スコープ終了で戻す
class CudaDeviceScope {
public:
    CudaDeviceScope() { restore_ = cudaGetDevice(&previous_) == cudaSuccess; }
    ~CudaDeviceScope() {
        if (restore_) cudaSetDevice(previous_);
    }

    CudaDeviceScope(const CudaDeviceScope&) = delete;
    CudaDeviceScope& operator=(const CudaDeviceScope&) = delete;

private:
    int previous_{0};
    bool restore_{false};
};

bool queryCudaDevice(int index, GpuDevice& out) {
    cudaDeviceProp prop;
    if (cudaGetDeviceProperties(&prop, index) != cudaSuccess) {
        return false;
    }
    out.id = index;
    out.name = prop.name;
    out.memory_bytes = prop.totalGlobalMem;
    out.free_memory_bytes = 0;
    out.compute_capability = std::to_string(prop.major) + "." + std::to_string(prop.minor);
    out.vendor = "nvidia";
    out.is_available = true;

    size_t free_bytes = 0;
    size_t total_bytes = 0;
    if (cudaSetDevice(index) == cudaSuccess && cudaMemGetInfo(&free_bytes, &total_bytes) == cudaSuccess) {
        out.free_memory_bytes = free_bytes;
        if (total_bytes > 0) out.memory_bytes = total_bytes;
    }
    return true;
}
#endif

// 空き容量が取れなかったデバイスは総容量で比較する
size_t effectiveFree(const GpuDevice& dev) {
    return dev.free_memory_bytes > 0 ? dev.free_memory_bytes : dev.memory_bytes;
}

}  // namespace

std::vector<GpuDevice> GpuDetector::detect() {
    detected_devices_ = detectCuda();
    return detected_devices_;
}

bool GpuDetector::hasGpu() const {
    for (const auto& dev : detected_devices_) {
        if (dev.is_available) return true;
    }
    return false;
}

size_t GpuDetector::getTotalMemory() const {
    return std::accumulate(detected_devices_.begin(), detected_devices_.end(), size_t{0},
                           [](size_t sum, const GpuDevice& dev) {
                               return dev.is_available ? sum + dev.memory_bytes : sum;
                           });
}

size_t GpuDetector::getUsedMemory() const {
    return std::accumulate(detected_devices_.begin(), detected_devices_.end(), size_t{0},
                           [](size_t sum, const GpuDevice& dev) {
                               if (!dev.is_available || dev.free_memory_bytes > dev.memory_bytes) return sum;
                               return sum + (dev.memory_bytes - dev.free_memory_bytes);
                           });
}

std::optional<int> GpuDetector::selectGpu(std::optional<int> prefer_loaded_gpu) const {
    const GpuDevice* best = nullptr;
    for (const auto& dev : detected_devices_) {
        if (!dev.is_available) continue;
        if (prefer_loaded_gpu && dev.id == *prefer_loaded_gpu) {
            return dev.id;
        }
        if (!best || effectiveFree(dev) > effectiveFree(*best)) {
            best = &dev;
        }
    }
    if (!best) return std::nullopt;
    return best->id;
}

std::vector<GpuDevice> GpuDetector::detectCuda() {
    std::vector<GpuDevice> devices;
#ifdef ADVISOR_USE_CUDA
    int count = 0;
    if (cudaGetDeviceCount(&count) != cudaSuccess || count <= 0) {
        return devices;
    }
    CudaDeviceScope scope;
    for (int i = 0; i < count; ++i) {
        GpuDevice dev{};
        if (queryCudaDevice(i, dev)) {
            devices.push_back(std::move(dev));
        }
    }
#endif
    return devices;
}

#ifdef ADVISOR_TESTING
void GpuDetector::setDetectedDevicesForTest(std::vector<GpuDevice> devices) {
    detected_devices_ = std::move(devices);
}
#endif

}  // namespace advisor
