#pragma once

#include <exception>
#include <string>

namespace loopguard {

// ============================================================================
// Exception hierarchy
// ============================================================================

/**
 * @brief Base exception for every error raised by loopguard
 *
 * Runtime alerts (blocking detected, memory pressure, leaked contexts) are
 * delivered through callbacks and logs, never through these types.
 */
class LoopguardException : public std::exception {
public:
    explicit LoopguardException(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

/**
 * @brief Invalid component configuration (threshold ordering, intervals, ...)
 */
class ConfigurationException : public LoopguardException {
public:
    explicit ConfigurationException(const std::string& message)
        : LoopguardException("Invalid configuration: " + message) {}
};

/**
 * @brief A cache handed to the memory guard cannot be monitored
 */
class CacheRegistrationException : public ConfigurationException {
public:
    CacheRegistrationException(const std::string& cache_name, const std::string& reason)
        : ConfigurationException("cache '" + cache_name + "' rejected: " + reason) {}
};

/**
 * @brief Source file could not be read for analysis
 */
class SourceReadException : public LoopguardException {
public:
    SourceReadException(const std::string& path, const std::string& reason)
        : LoopguardException("Cannot read '" + path + "': " + reason) {}
};

} // namespace loopguard
