#include "loopguard/memory/memory_meter.h"

#include <fstream>
#include <sstream>
#include <string>

#include <malloc.h>

namespace loopguard {

ProcessMemoryMeter::ProcessMemoryMeter(std::filesystem::path status_file)
    : status_file_(std::move(status_file)) {
}

size_t ProcessMemoryMeter::read_field(const char* field) const {
    std::ifstream status(status_file_);
    if (!status) {
        return 0;
    }

    const std::string prefix = std::string(field) + ":";
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        // "VmRSS:	   10240 kB"
        std::istringstream fields(line.substr(prefix.size()));
        size_t value = 0;
        std::string unit;
        if (fields >> value) {
            fields >> unit;
            return unit == "kB" ? value * 1024 : value;
        }
        return 0;
    }
    return 0;
}

size_t ProcessMemoryMeter::current_bytes() const {
    return read_field("VmRSS");
}

size_t ProcessMemoryMeter::peak_bytes() const {
    const size_t peak = read_field("VmHWM");
    return peak != 0 ? peak : current_bytes();
}

size_t ProcessMemoryMeter::collect() {
    const size_t before = current_bytes();
    malloc_trim(0);
    const size_t after = current_bytes();
    return before > after ? before - after : 0;
}

} // namespace loopguard
