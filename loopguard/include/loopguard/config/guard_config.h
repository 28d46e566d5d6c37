#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace loopguard {

inline constexpr size_t KiB = 1024;
inline constexpr size_t MiB = 1024 * KiB;
inline constexpr size_t GiB = 1024 * MiB;

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Configuration validation result
 */
struct ValidationResult {
    bool is_valid = true;                       ///< Overall validation status
    std::vector<std::string> errors;            ///< Critical errors (prevent startup)
    std::vector<std::string> warnings;          ///< Non-critical warnings

    void add_error(std::string message) {
        is_valid = false;
        errors.push_back(std::move(message));
    }

    void add_warning(std::string message) {
        warnings.push_back(std::move(message));
    }

    void merge(const ValidationResult& other);

    [[nodiscard]] bool has_issues() const noexcept {
        return !errors.empty() || !warnings.empty();
    }

    /**
     * @brief Get formatted validation report
     * @return Human-readable validation report
     */
    [[nodiscard]] std::string report() const;

    /**
     * @brief Throw ConfigurationException listing every error
     * @param component Name used as the message prefix
     */
    void throw_if_invalid(const std::string& component) const;
};

// ============================================================================
// Component configurations
// ============================================================================

/**
 * @brief Memory guard thresholds and timing
 *
 * Thresholds compare against resident set size and must be strictly
 * increasing: gc < warning < critical.
 */
struct MemoryGuardConfig {
    size_t gc_threshold = 100 * MiB;                    ///< Trigger a collection pass
    size_t warning_threshold = 200 * MiB;               ///< Also halve every cache
    size_t critical_threshold = 300 * MiB;              ///< Clear caches, request restart
    size_t memory_limit = 256 * MiB;                    ///< Reported only
    std::chrono::milliseconds check_interval{10000};    ///< Memory sampling period
    std::chrono::milliseconds cache_check_interval{2000}; ///< Cache limit enforcement period
    size_t snapshot_capacity = 60;                      ///< Rolling window length
    bool leak_detection_enabled = true;
    size_t leak_min_samples = 6;                        ///< Window size before leak checks start
    size_t leak_growth_per_minute = 1 * MiB;            ///< Growth rate treated as a leak
    std::chrono::milliseconds restart_delay{1000};      ///< Delay before the restart signal
    size_t default_cache_limit = 10 * MiB;              ///< Used when register_cache gets no limit

    [[nodiscard]] ValidationResult validate() const;
};

/**
 * @brief Runtime blocking sampler settings
 */
struct SamplerConfig {
    bool enabled = true;
    std::chrono::milliseconds threshold{100};           ///< Gap since last activity counted as a block
    std::chrono::milliseconds sampling_interval{10};    ///< Sampling timer period
    int max_consecutive_blocks = 5;                     ///< Clamped to >= 1

    [[nodiscard]] ValidationResult validate() const;
};

/**
 * @brief Request isolation settings
 */
struct IsolationConfig {
    bool enabled = true;
    std::chrono::milliseconds max_context_duration{30000}; ///< Age at which a context is reported
    size_t max_memory_growth = 0;                       ///< 0 disables the growth criterion
    std::chrono::milliseconds leak_sweep_interval{10000};

    /// _SERVER keys that survive the per-request reset
    std::vector<std::string> preserved_server_keys = {
        "PHP_SELF", "SCRIPT_NAME", "argv", "argc", "GATEWAY_INTERFACE",
        "SERVER_ADDR", "SERVER_NAME", "SERVER_SOFTWARE", "SERVER_PROTOCOL",
        "REQUEST_TIME", "REQUEST_TIME_FLOAT", "DOCUMENT_ROOT", "SCRIPT_FILENAME"
    };

    /// _ENV keys that survive the per-request reset
    std::vector<std::string> preserved_env_keys = {
        "PATH", "HOME", "USER", "LANG", "LC_ALL", "TZ"
    };

    /// Class -> static properties that may persist across requests; an empty list allows all
    std::map<std::string, std::vector<std::string>> allowed_static_properties;

    [[nodiscard]] ValidationResult validate() const;
};

struct LoggingConfig {
    std::string level = "info";                         ///< trace|debug|info|warn|error|off
    std::string format = "text";                        ///< text|json
    std::string file;                                   ///< Empty logs to the console
    size_t rotate_size_mb = 100;
    size_t rotate_files = 5;

    [[nodiscard]] ValidationResult validate() const;
};

// ============================================================================
// Top-level configuration
// ============================================================================

/**
 * @brief Complete loopguard configuration
 *
 * @code
 * auto config = GuardConfig::from_toml_file("loopguard.toml")
 *                   .value_or(GuardConfig::production())
 *                   .with_environment_overrides();
 * config.configure_logging();
 * @endcode
 */
struct GuardConfig {
    MemoryGuardConfig memory;
    SamplerConfig sampler;
    IsolationConfig isolation;
    LoggingConfig logging;

    // ========================================================================
    // Factory Methods
    // ========================================================================

    static GuardConfig production();

    /**
     * @brief Tighter thresholds and debug logging
     */
    static GuardConfig development();

    /**
     * @brief Load configuration from TOML file
     * @param config_path Path to TOML configuration file
     * @return Parsed configuration or std::nullopt on error (the error is logged)
     */
    static std::optional<GuardConfig> from_toml_file(const std::filesystem::path& config_path);

    /**
     * @brief Load configuration from TOML string
     * @param toml_content TOML configuration content
     * @return Parsed configuration or std::nullopt on error (the error is logged)
     */
    static std::optional<GuardConfig> from_toml_string(const std::string& toml_content);

    /**
     * @brief Defaults with environment variable overrides applied
     *
     * Environment variables:
     * - LOOPGUARD_LOG_LEVEL
     * - LOOPGUARD_LOG_FORMAT
     * - LOOPGUARD_SAMPLER_ENABLED
     * - LOOPGUARD_SAMPLER_THRESHOLD
     * - LOOPGUARD_MEMORY_CRITICAL
     * - LOOPGUARD_MEMORY_CHECK_INTERVAL
     * - LOOPGUARD_ISOLATION_MAX_DURATION
     */
    static GuardConfig from_environment();

    // ========================================================================
    // Validation and Serialization
    // ========================================================================

    [[nodiscard]] ValidationResult validate() const;

    [[nodiscard]] std::string to_toml() const;

    [[nodiscard]] GuardConfig with_environment_overrides() const;

    /**
     * @brief Apply the logging section to the global LoggerFactory
     */
    void configure_logging() const;
};

// ============================================================================
// Value parsing helpers
// ============================================================================

/**
 * @brief Parse duration string (e.g. "100ms", "5s", "2min")
 */
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str);

/**
 * @brief Parse byte size string (e.g. "512", "64KB", "1.5MB", "2GiB"), 1024-based
 */
[[nodiscard]] std::optional<size_t> parse_byte_size(const std::string& size_str);

/**
 * @brief Format a byte count as "12.5 MB"
 */
[[nodiscard]] std::string format_bytes(size_t bytes);

/**
 * @brief Format a duration for TOML output ("250ms", "10s", "2min")
 */
[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

} // namespace loopguard
