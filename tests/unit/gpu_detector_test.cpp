#include <gtest/gtest.h>
#include <optional>

#include "system/gpu_detector.h"

namespace {

using advisor::GpuDetector;
using advisor::GpuDevice;

constexpr size_t kGiB = 1024ull * 1024 * 1024;

TEST(GpuDetectorSmokeTest, DefaultsAreEmpty) {
    GpuDetector detector;

    EXPECT_FALSE(detector.hasGpu());
    EXPECT_EQ(detector.getTotalMemory(), 0u);
    EXPECT_EQ(detector.getUsedMemory(), 0u);
    EXPECT_FALSE(detector.selectGpu().has_value());
}

TEST(GpuDetectorTest, TotalMemorySumsAvailableDevicesOnly) {
    GpuDetector detector;

    std::vector<GpuDevice> devices = {
        {0, "NVIDIA A100", 40 * kGiB, 30 * kGiB, "8.0", "nvidia", true},
        {1, "NVIDIA Disabled", 16 * kGiB, 8 * kGiB, "7.5", "nvidia", false},
        {2, "NVIDIA RTX 4060", 8 * kGiB, 7 * kGiB, "8.9", "nvidia", true},
    };

    detector.setDetectedDevicesForTest(devices);

    // 利用不可のGPUはメモリ計算から除外される想定
    EXPECT_EQ(detector.getTotalMemory(), 48 * kGiB);
    EXPECT_EQ(detector.getUsedMemory(), 11 * kGiB);
    EXPECT_TRUE(detector.hasGpu());
}

TEST(GpuDetectorTest, HasGpuIsFalseWhenAllDevicesUnavailable) {
    GpuDetector detector;
    detector.setDetectedDevicesForTest({
        {0, "Disabled", 4 * kGiB, 1 * kGiB, "5.0", "nvidia", false},
    });
    EXPECT_FALSE(detector.hasGpu());
    EXPECT_EQ(detector.getTotalMemory(), 0u);
}

TEST(GpuDetectorTest, SelectGpuPrefersMostFreeMemory) {
    GpuDetector detector;
    detector.setDetectedDevicesForTest({
        {0, "Small", 8 * kGiB, 2 * kGiB, "8.6", "nvidia", true},
        {1, "Large", 24 * kGiB, 20 * kGiB, "8.9", "nvidia", true},
        {2, "Huge but disabled", 80 * kGiB, 80 * kGiB, "9.0", "nvidia", false},
    });

    auto selected = detector.selectGpu();
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, 1);
}

TEST(GpuDetectorTest, SelectGpuHonorsPreferredDeviceWhenAvailable) {
    GpuDetector detector;
    detector.setDetectedDevicesForTest({
        {0, "Small", 8 * kGiB, 2 * kGiB, "8.6", "nvidia", true},
        {1, "Large", 24 * kGiB, 20 * kGiB, "8.9", "nvidia", true},
    });

    EXPECT_EQ(detector.selectGpu(0), std::optional<int>(0));
    // 存在しないIDは無視して空きメモリ最大のGPUへ
    EXPECT_EQ(detector.selectGpu(5), std::optional<int>(1));
}

TEST(GpuDetectorTest, UsedMemoryIgnoresInconsistentFreeValues) {
    GpuDetector detector;
    detector.setDetectedDevicesForTest({
        {0, "Odd", 4 * kGiB, 6 * kGiB, "8.0", "nvidia", true},
        {1, "Normal", 8 * kGiB, 6 * kGiB, "8.0", "nvidia", true},
    });
    EXPECT_EQ(detector.getUsedMemory(), 2 * kGiB);
}

}  // namespace
