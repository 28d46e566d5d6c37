#pragma once

#include <cstddef>
#include <filesystem>

namespace loopguard {

/**
 * @brief Source of process memory figures
 */
class IMemoryMeter {
public:
    virtual ~IMemoryMeter() = default;

    /// Resident memory right now, in bytes
    [[nodiscard]] virtual size_t current_bytes() const = 0;

    /// Highest resident memory seen by the process, in bytes
    [[nodiscard]] virtual size_t peak_bytes() const = 0;

    /**
     * @brief Return free memory to the system where the platform allows it
     * @return Bytes released, 0 when nothing could be measured
     */
    virtual size_t collect() = 0;
};

/**
 * @brief Reads VmRSS/VmHWM from procfs and trims the malloc heap
 */
class ProcessMemoryMeter : public IMemoryMeter {
public:
    explicit ProcessMemoryMeter(std::filesystem::path status_file = "/proc/self/status");

    [[nodiscard]] size_t current_bytes() const override;
    [[nodiscard]] size_t peak_bytes() const override;
    size_t collect() override;

private:
    std::filesystem::path status_file_;

    [[nodiscard]] size_t read_field(const char* field) const;
};

} // namespace loopguard
