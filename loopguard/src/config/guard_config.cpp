#include "loopguard/config/guard_config.h"
#include "loopguard/core/exceptions.h"
#include "loopguard/utils/logger.h"

#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>

namespace loopguard {

// ============================================================================
// Internal Utilities
// ============================================================================

namespace {

/**
 * @brief Trim whitespace from string
 */
std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::optional<std::string>(value) : std::nullopt;
}

/**
 * @brief Parse boolean from string (true/false, yes/no, 1/0, on/off)
 */
std::optional<bool> parse_bool(const std::string& value) {
    std::string lower_value = to_lower(trim(value));

    if (lower_value == "true" || lower_value == "yes" || lower_value == "1" || lower_value == "on") {
        return true;
    }
    if (lower_value == "false" || lower_value == "no" || lower_value == "0" || lower_value == "off") {
        return false;
    }
    return std::nullopt;
}

std::string format_size_for_toml(size_t bytes) {
    if (bytes != 0 && bytes % GiB == 0) return std::to_string(bytes / GiB) + "GB";
    if (bytes != 0 && bytes % MiB == 0) return std::to_string(bytes / MiB) + "MB";
    if (bytes != 0 && bytes % KiB == 0) return std::to_string(bytes / KiB) + "KB";
    return std::to_string(bytes) + "B";
}

std::string toml_quoted(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '\\' || c == '"') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "\"";
}

std::string toml_string_array(const std::vector<std::string>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << toml_quoted(values[i]);
    }
    oss << "]";
    return oss.str();
}

// ----------------------------------------------------------------------------
// TOML readers. Each throws ConfigurationException on a malformed value.
// ----------------------------------------------------------------------------

std::chrono::milliseconds read_duration(const toml::value& section, const std::string& key) {
    const auto& value = toml::find(section, key);
    if (value.is_integer()) {
        auto ms = toml::get<std::int64_t>(value);
        return std::chrono::milliseconds(ms);
    }
    const auto text = toml::get<std::string>(value);
    auto parsed = parse_duration(text);
    if (!parsed) {
        throw ConfigurationException("'" + key + "' is not a duration: " + text);
    }
    return *parsed;
}

size_t read_size(const toml::value& section, const std::string& key) {
    const auto& value = toml::find(section, key);
    if (value.is_integer()) {
        auto bytes = toml::get<std::int64_t>(value);
        if (bytes < 0) {
            throw ConfigurationException("'" + key + "' must not be negative");
        }
        return static_cast<size_t>(bytes);
    }
    const auto text = toml::get<std::string>(value);
    auto parsed = parse_byte_size(text);
    if (!parsed) {
        throw ConfigurationException("'" + key + "' is not a byte size: " + text);
    }
    return *parsed;
}

size_t read_count(const toml::value& section, const std::string& key) {
    auto count = toml::find<std::int64_t>(section, key);
    if (count < 0) {
        throw ConfigurationException("'" + key + "' must not be negative");
    }
    return static_cast<size_t>(count);
}

GuardConfig from_toml_data(const toml::value& toml_data) {
    GuardConfig config;

    if (toml_data.contains("memory")) {
        const auto& section = toml::find(toml_data, "memory");
        auto& memory = config.memory;

        if (section.contains("gc_threshold")) memory.gc_threshold = read_size(section, "gc_threshold");
        if (section.contains("warning_threshold")) memory.warning_threshold = read_size(section, "warning_threshold");
        if (section.contains("critical_threshold")) memory.critical_threshold = read_size(section, "critical_threshold");
        if (section.contains("memory_limit")) memory.memory_limit = read_size(section, "memory_limit");
        if (section.contains("check_interval")) memory.check_interval = read_duration(section, "check_interval");
        if (section.contains("cache_check_interval")) {
            memory.cache_check_interval = read_duration(section, "cache_check_interval");
        }
        if (section.contains("snapshot_capacity")) memory.snapshot_capacity = read_count(section, "snapshot_capacity");
        if (section.contains("leak_detection")) {
            memory.leak_detection_enabled = toml::find<bool>(section, "leak_detection");
        }
        if (section.contains("leak_min_samples")) memory.leak_min_samples = read_count(section, "leak_min_samples");
        if (section.contains("leak_growth_per_minute")) {
            memory.leak_growth_per_minute = read_size(section, "leak_growth_per_minute");
        }
        if (section.contains("restart_delay")) memory.restart_delay = read_duration(section, "restart_delay");
        if (section.contains("default_cache_limit")) {
            memory.default_cache_limit = read_size(section, "default_cache_limit");
        }
    }

    if (toml_data.contains("sampler")) {
        const auto& section = toml::find(toml_data, "sampler");
        auto& sampler = config.sampler;

        if (section.contains("enabled")) sampler.enabled = toml::find<bool>(section, "enabled");
        if (section.contains("threshold")) sampler.threshold = read_duration(section, "threshold");
        if (section.contains("sampling_interval")) {
            sampler.sampling_interval = read_duration(section, "sampling_interval");
        }
        if (section.contains("max_consecutive_blocks")) {
            sampler.max_consecutive_blocks = toml::find<int>(section, "max_consecutive_blocks");
        }
    }

    if (toml_data.contains("isolation")) {
        const auto& section = toml::find(toml_data, "isolation");
        auto& isolation = config.isolation;

        if (section.contains("enabled")) isolation.enabled = toml::find<bool>(section, "enabled");
        if (section.contains("max_context_duration")) {
            isolation.max_context_duration = read_duration(section, "max_context_duration");
        }
        if (section.contains("max_memory_growth")) {
            isolation.max_memory_growth = read_size(section, "max_memory_growth");
        }
        if (section.contains("leak_sweep_interval")) {
            isolation.leak_sweep_interval = read_duration(section, "leak_sweep_interval");
        }
        if (section.contains("preserved_server_keys")) {
            isolation.preserved_server_keys = toml::find<std::vector<std::string>>(section, "preserved_server_keys");
        }
        if (section.contains("preserved_env_keys")) {
            isolation.preserved_env_keys = toml::find<std::vector<std::string>>(section, "preserved_env_keys");
        }
        if (section.contains("allowed_static_properties")) {
            isolation.allowed_static_properties =
                toml::find<std::map<std::string, std::vector<std::string>>>(section, "allowed_static_properties");
        }
    }

    if (toml_data.contains("logging")) {
        const auto& section = toml::find(toml_data, "logging");
        auto& logging = config.logging;

        if (section.contains("level")) logging.level = toml::find<std::string>(section, "level");
        if (section.contains("format")) logging.format = toml::find<std::string>(section, "format");
        if (section.contains("file")) logging.file = toml::find<std::string>(section, "file");
        if (section.contains("rotate_size_mb")) logging.rotate_size_mb = read_count(section, "rotate_size_mb");
        if (section.contains("rotate_files")) logging.rotate_files = read_count(section, "rotate_files");
    }

    return config;
}

} // namespace

// ============================================================================
// Value parsing helpers
// ============================================================================

std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str) {
    static const std::regex duration_regex(R"(^(\d+)\s*(ms|s|sec|m|min|h)$)", std::regex::icase);
    std::smatch match;

    const std::string input = trim(duration_str);
    if (!std::regex_match(input, match, duration_regex)) {
        return std::nullopt;
    }

    const long long value = std::stoll(match[1].str());
    const std::string unit = to_lower(match[2].str());

    if (unit == "ms") {
        return std::chrono::milliseconds(value);
    } else if (unit == "s" || unit == "sec") {
        return std::chrono::milliseconds(value * 1000);
    } else if (unit == "m" || unit == "min") {
        return std::chrono::milliseconds(value * 60 * 1000);
    } else if (unit == "h") {
        return std::chrono::milliseconds(value * 60 * 60 * 1000);
    }

    return std::nullopt;
}

std::optional<size_t> parse_byte_size(const std::string& size_str) {
    static const std::regex size_regex(R"(^(\d+(?:\.\d+)?)\s*([kmg]i?b?|b)?$)", std::regex::icase);
    std::smatch match;

    const std::string input = trim(size_str);
    if (!std::regex_match(input, match, size_regex)) {
        return std::nullopt;
    }

    const double value = std::stod(match[1].str());
    const std::string unit = match[2].matched ? to_lower(match[2].str()) : "b";

    double multiplier = 1.0;
    switch (unit.front()) {
        case 'k': multiplier = static_cast<double>(KiB); break;
        case 'm': multiplier = static_cast<double>(MiB); break;
        case 'g': multiplier = static_cast<double>(GiB); break;
        default:  multiplier = 1.0; break;
    }

    return static_cast<size_t>(std::llround(value * multiplier));
}

std::string format_bytes(size_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;

    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        // Two decimals at most, trailing zeros dropped
        oss << std::fixed << std::setprecision(2) << value;
        std::string text = oss.str();
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.') text.pop_back();
        return text + " " + units[unit];
    }
    return oss.str();
}

std::string format_duration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms != 0 && ms % 60000 == 0) return std::to_string(ms / 60000) + "min";
    if (ms != 0 && ms % 1000 == 0) return std::to_string(ms / 1000) + "s";
    return std::to_string(ms) + "ms";
}

// ============================================================================
// ValidationResult
// ============================================================================

void ValidationResult::merge(const ValidationResult& other) {
    is_valid = is_valid && other.is_valid;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

std::string ValidationResult::report() const {
    std::ostringstream oss;
    oss << "Configuration " << (is_valid ? "valid" : "INVALID");

    if (!errors.empty()) {
        oss << "\nErrors:";
        for (const auto& e : errors) oss << "\n  - " << e;
    }
    if (!warnings.empty()) {
        oss << "\nWarnings:";
        for (const auto& w : warnings) oss << "\n  - " << w;
    }
    return oss.str();
}

void ValidationResult::throw_if_invalid(const std::string& component) const {
    if (is_valid) {
        return;
    }

    std::string message = component + ": ";
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) message += "; ";
        message += errors[i];
    }
    throw ConfigurationException(message);
}

// ============================================================================
// Component validation
// ============================================================================

ValidationResult MemoryGuardConfig::validate() const {
    ValidationResult result;

    if (!(gc_threshold < warning_threshold && warning_threshold < critical_threshold)) {
        result.add_error("thresholds must be strictly increasing (gc " + format_bytes(gc_threshold) +
                         ", warning " + format_bytes(warning_threshold) +
                         ", critical " + format_bytes(critical_threshold) + ")");
    }
    if (check_interval <= std::chrono::milliseconds::zero()) {
        result.add_error("check_interval must be positive");
    }
    if (cache_check_interval <= std::chrono::milliseconds::zero()) {
        result.add_error("cache_check_interval must be positive");
    }
    if (restart_delay < std::chrono::milliseconds::zero()) {
        result.add_error("restart_delay must not be negative");
    }
    if (snapshot_capacity < 2) {
        result.add_error("snapshot_capacity must be at least 2");
    }
    if (leak_min_samples < 2) {
        result.add_error("leak_min_samples must be at least 2");
    } else if (leak_min_samples > snapshot_capacity) {
        result.add_warning("leak_min_samples exceeds snapshot_capacity; leak detection can never run");
    }
    if (leak_growth_per_minute == 0) {
        result.add_warning("leak_growth_per_minute is 0; any growth is reported as a leak");
    }
    if (memory_limit != 0 && memory_limit < warning_threshold) {
        result.add_warning("memory_limit is below warning_threshold");
    }

    return result;
}

ValidationResult SamplerConfig::validate() const {
    ValidationResult result;

    if (threshold <= std::chrono::milliseconds::zero()) {
        result.add_error("sampler threshold must be positive");
    }
    if (sampling_interval <= std::chrono::milliseconds::zero()) {
        result.add_error("sampling_interval must be positive");
    }
    if (sampling_interval >= threshold && threshold > std::chrono::milliseconds::zero()) {
        result.add_warning("sampling_interval is not shorter than threshold; blocks are detected late");
    }

    return result;
}

ValidationResult IsolationConfig::validate() const {
    ValidationResult result;

    if (max_context_duration <= std::chrono::milliseconds::zero()) {
        result.add_error("max_context_duration must be positive");
    }
    if (leak_sweep_interval <= std::chrono::milliseconds::zero()) {
        result.add_error("leak_sweep_interval must be positive");
    }

    return result;
}

ValidationResult LoggingConfig::validate() const {
    ValidationResult result;

    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "fatal", "off"
    };
    if (std::find(levels.begin(), levels.end(), to_lower(level)) == levels.end()) {
        result.add_error("unknown log level '" + level + "'");
    }

    const std::string fmt = to_lower(format);
    if (fmt != "text" && fmt != "json") {
        result.add_error("log format must be 'text' or 'json'");
    }

    return result;
}

// ============================================================================
// GuardConfig
// ============================================================================

GuardConfig GuardConfig::production() {
    GuardConfig config;
    config.logging.format = "json";
    return config;
}

GuardConfig GuardConfig::development() {
    GuardConfig config;
    config.memory.gc_threshold = 64 * MiB;
    config.memory.warning_threshold = 128 * MiB;
    config.memory.critical_threshold = 192 * MiB;
    config.memory.memory_limit = 160 * MiB;
    config.memory.check_interval = std::chrono::seconds(5);
    config.sampler.threshold = std::chrono::milliseconds(50);
    config.isolation.max_context_duration = std::chrono::seconds(10);
    config.logging.level = "debug";
    config.logging.format = "text";
    return config;
}

std::optional<GuardConfig> GuardConfig::from_toml_file(const std::filesystem::path& config_path) {
    auto logger = LoggerFactory::get_logger("loopguard.config");

    try {
        if (!std::filesystem::exists(config_path)) {
            logger->error("Configuration file not found", {{"path", config_path.string()}});
            return std::nullopt;
        }

        auto toml_data = toml::parse(config_path.string());
        return from_toml_data(toml_data);
    } catch (const std::exception& e) {
        logger->error("Failed to load configuration", {{"path", config_path.string()}, {"error", e.what()}});
        return std::nullopt;
    }
}

std::optional<GuardConfig> GuardConfig::from_toml_string(const std::string& toml_content) {
    try {
        std::istringstream stream(toml_content);
        auto toml_data = toml::parse(stream, "<string>");
        return from_toml_data(toml_data);
    } catch (const std::exception& e) {
        LoggerFactory::get_logger("loopguard.config")->error("Failed to parse configuration",
                                                               {{"error", e.what()}});
        return std::nullopt;
    }
}

GuardConfig GuardConfig::from_environment() {
    return GuardConfig{}.with_environment_overrides();
}

GuardConfig GuardConfig::with_environment_overrides() const {
    GuardConfig config = *this;
    auto logger = LoggerFactory::get_logger("loopguard.config");

    auto ignored = [&logger](const std::string& name, const std::string& value) {
        logger->warn("Ignoring malformed environment override", {{"variable", name}, {"value", value}});
    };

    if (auto level = get_env("LOOPGUARD_LOG_LEVEL")) {
        config.logging.level = trim(*level);
    }

    if (auto format = get_env("LOOPGUARD_LOG_FORMAT")) {
        config.logging.format = to_lower(trim(*format));
    }

    if (auto enabled_str = get_env("LOOPGUARD_SAMPLER_ENABLED")) {
        if (auto enabled = parse_bool(*enabled_str)) {
            config.sampler.enabled = *enabled;
        } else {
            ignored("LOOPGUARD_SAMPLER_ENABLED", *enabled_str);
        }
    }

    if (auto threshold_str = get_env("LOOPGUARD_SAMPLER_THRESHOLD")) {
        if (auto threshold = parse_duration(*threshold_str)) {
            config.sampler.threshold = *threshold;
        } else {
            ignored("LOOPGUARD_SAMPLER_THRESHOLD", *threshold_str);
        }
    }

    if (auto critical_str = get_env("LOOPGUARD_MEMORY_CRITICAL")) {
        if (auto critical = parse_byte_size(*critical_str)) {
            config.memory.critical_threshold = *critical;
        } else {
            ignored("LOOPGUARD_MEMORY_CRITICAL", *critical_str);
        }
    }

    if (auto interval_str = get_env("LOOPGUARD_MEMORY_CHECK_INTERVAL")) {
        if (auto interval = parse_duration(*interval_str)) {
            config.memory.check_interval = *interval;
        } else {
            ignored("LOOPGUARD_MEMORY_CHECK_INTERVAL", *interval_str);
        }
    }

    if (auto duration_str = get_env("LOOPGUARD_ISOLATION_MAX_DURATION")) {
        if (auto duration = parse_duration(*duration_str)) {
            config.isolation.max_context_duration = *duration;
        } else {
            ignored("LOOPGUARD_ISOLATION_MAX_DURATION", *duration_str);
        }
    }

    return config;
}

ValidationResult GuardConfig::validate() const {
    ValidationResult result;
    result.merge(memory.validate());
    result.merge(sampler.validate());
    result.merge(isolation.validate());
    result.merge(logging.validate());
    return result;
}

std::string GuardConfig::to_toml() const {
    std::ostringstream oss;

    oss << "[memory]\n";
    oss << "gc_threshold = \"" << format_size_for_toml(memory.gc_threshold) << "\"\n";
    oss << "warning_threshold = \"" << format_size_for_toml(memory.warning_threshold) << "\"\n";
    oss << "critical_threshold = \"" << format_size_for_toml(memory.critical_threshold) << "\"\n";
    oss << "memory_limit = \"" << format_size_for_toml(memory.memory_limit) << "\"\n";
    oss << "check_interval = \"" << format_duration(memory.check_interval) << "\"\n";
    oss << "cache_check_interval = \"" << format_duration(memory.cache_check_interval) << "\"\n";
    oss << "snapshot_capacity = " << memory.snapshot_capacity << "\n";
    oss << "leak_detection = " << (memory.leak_detection_enabled ? "true" : "false") << "\n";
    oss << "leak_min_samples = " << memory.leak_min_samples << "\n";
    oss << "leak_growth_per_minute = \"" << format_size_for_toml(memory.leak_growth_per_minute) << "\"\n";
    oss << "restart_delay = \"" << format_duration(memory.restart_delay) << "\"\n";
    oss << "default_cache_limit = \"" << format_size_for_toml(memory.default_cache_limit) << "\"\n";
    oss << "\n";

    oss << "[sampler]\n";
    oss << "enabled = " << (sampler.enabled ? "true" : "false") << "\n";
    oss << "threshold = \"" << format_duration(sampler.threshold) << "\"\n";
    oss << "sampling_interval = \"" << format_duration(sampler.sampling_interval) << "\"\n";
    oss << "max_consecutive_blocks = " << sampler.max_consecutive_blocks << "\n";
    oss << "\n";

    oss << "[isolation]\n";
    oss << "enabled = " << (isolation.enabled ? "true" : "false") << "\n";
    oss << "max_context_duration = \"" << format_duration(isolation.max_context_duration) << "\"\n";
    oss << "max_memory_growth = " << isolation.max_memory_growth << "\n";
    oss << "leak_sweep_interval = \"" << format_duration(isolation.leak_sweep_interval) << "\"\n";
    oss << "preserved_server_keys = " << toml_string_array(isolation.preserved_server_keys) << "\n";
    oss << "preserved_env_keys = " << toml_string_array(isolation.preserved_env_keys) << "\n";
    oss << "allowed_static_properties = {";
    for (auto it = isolation.allowed_static_properties.begin(); it != isolation.allowed_static_properties.end(); ++it) {
        oss << (it == isolation.allowed_static_properties.begin() ? " " : ", ")
            << toml_quoted(it->first) << " = " << toml_string_array(it->second);
    }
    oss << (isolation.allowed_static_properties.empty() ? "}\n" : " }\n");
    oss << "\n";

    oss << "[logging]\n";
    oss << "level = \"" << logging.level << "\"\n";
    oss << "format = \"" << logging.format << "\"\n";
    if (!logging.file.empty()) {
        oss << "file = \"" << logging.file << "\"\n";
        oss << "rotate_size_mb = " << logging.rotate_size_mb << "\n";
        oss << "rotate_files = " << logging.rotate_files << "\n";
    }

    return oss.str();
}

void GuardConfig::configure_logging() const {
    LoggerFactory::set_global_level(log_level_from_string(logging.level));

    if (to_lower(logging.format) == "json") {
        LoggerFactory::set_default_formatter(std::make_shared<JsonFormatter>());
    } else {
        LoggerFactory::set_default_formatter(std::make_shared<TextFormatter>());
    }

    if (!logging.file.empty()) {
        auto sink = std::make_shared<FileSink>(logging.file);
        if (logging.rotate_files > 0) {
            sink->enable_rotation(logging.rotate_size_mb, logging.rotate_files);
        }
        LoggerFactory::set_default_sink(sink);
    }
}

} // namespace loopguard
