#include "loopguard/memory/memory_meter.h"
#include "loopguard/config/guard_config.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace loopguard;

namespace {

std::filesystem::path write_status(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::path(::testing::TempDir()) / name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

} // namespace

TEST(ProcessMemoryMeterTest, ReadsResidentAndPeakFromStatus) {
    const auto path = write_status("loopguard_status_full",
        "Name:\tphp\n"
        "VmPeak:\t  409600 kB\n"
        "VmHWM:\t   20480 kB\n"
        "VmRSS:\t   10240 kB\n"
        "Threads:\t1\n");

    ProcessMemoryMeter meter(path);
    EXPECT_EQ(meter.current_bytes(), 10 * MiB);
    EXPECT_EQ(meter.peak_bytes(), 20 * MiB);
}

TEST(ProcessMemoryMeterTest, PeakFallsBackToCurrent) {
    const auto path = write_status("loopguard_status_no_hwm", "VmRSS:\t 2048 kB\n");

    ProcessMemoryMeter meter(path);
    EXPECT_EQ(meter.peak_bytes(), 2 * MiB);
}

TEST(ProcessMemoryMeterTest, MissingStatusReadsAsZero) {
    ProcessMemoryMeter meter(std::filesystem::path(::testing::TempDir()) / "loopguard_status_missing");

    EXPECT_EQ(meter.current_bytes(), 0u);
    EXPECT_EQ(meter.peak_bytes(), 0u);
    EXPECT_EQ(meter.collect(), 0u);
}

TEST(ProcessMemoryMeterTest, ReadsThisProcess) {
    ProcessMemoryMeter meter;

    const size_t current = meter.current_bytes();
    const size_t peak = meter.peak_bytes();
    EXPECT_GT(current, 0u);
    EXPECT_GE(peak, current);
}
