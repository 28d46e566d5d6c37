#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <map>
#include <unordered_map>
#include <vector>
#include <atomic>
#include <mutex>
#include <thread>
#include <fstream>
#include <type_traits>

namespace loopguard {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

[[nodiscard]] std::string to_string(LogLevel level);
[[nodiscard]] LogLevel log_level_from_string(const std::string& level_str);

/**
 * @brief Structured key/value fields attached to a single log record
 *
 * Ordered so that text output is stable between runs.
 */
using LogFields = std::map<std::string, std::string>;

// ============================================================================
// Log message
// ============================================================================

struct LogMessage {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;

    LogFields fields;  ///< Logger-wide fields merged with per-call fields

    LogMessage() = default;
    LogMessage(LogLevel lvl, std::string comp, std::string msg,
               std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());
};

// ============================================================================
// Formatters
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogMessage& message) = 0;
};

/**
 * @brief `[ts] [LEVEL] [component] message {k=v, ...}`
 */
class TextFormatter : public ILogFormatter {
public:
    explicit TextFormatter(bool include_thread_id = false);
    std::string format(const LogMessage& message) override;

private:
    bool include_thread_id_;
};

/**
 * @brief One JSON object per record, built with nlohmann::json
 */
class JsonFormatter : public ILogFormatter {
public:
    explicit JsonFormatter(bool pretty_print = false);
    std::string format(const LogMessage& message) override;

private:
    bool pretty_print_;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(LogLevel level, const std::string& formatted_message) = 0;
    virtual void flush() = 0;
};

class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override;

private:
    bool use_colors_;
    std::mutex mutex_;

    [[nodiscard]] const char* get_color_code(LogLevel level) const;
};

class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override;
    void enable_rotation(size_t max_size_mb = 100, size_t max_files = 10);

private:
    std::string filename_;
    std::ofstream file_;
    std::mutex mutex_;

    bool rotation_enabled_ = false;
    size_t max_size_bytes_ = 0;
    size_t max_files_ = 0;
    size_t current_size_ = 0;

    void rotate_if_needed();
    void perform_rotation();
};

/**
 * @brief Keeps formatted records in memory; used by tests and the health endpoint
 */
class MemorySink : public ILogSink {
public:
    struct Record {
        LogLevel level;
        std::string text;
    };

    explicit MemorySink(size_t capacity = 1000);

    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override {}

    [[nodiscard]] std::vector<Record> records() const;
    [[nodiscard]] size_t count(LogLevel level) const;
    [[nodiscard]] bool contains(const std::string& needle) const;
    void clear();

private:
    size_t capacity_;
    std::vector<Record> records_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Component logger with pluggable formatter and sinks
 *
 * A fresh logger writes text to the console at INFO. Components in this
 * library accept a `std::shared_ptr<Logger>` and create their own named
 * logger when none is supplied.
 */
class Logger {
public:
    explicit Logger(std::string component);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger();

    // ========================================================================
    // Level methods
    // ========================================================================

    void trace(const std::string& message, const LogFields& fields = {});
    void debug(const std::string& message, const LogFields& fields = {});
    void info(const std::string& message, const LogFields& fields = {});
    void warn(const std::string& message, const LogFields& fields = {});
    void error(const std::string& message, const LogFields& fields = {});
    void fatal(const std::string& message, const LogFields& fields = {});
    void log(LogLevel level, const std::string& message, const LogFields& fields = {});

    // ========================================================================
    // Structured fields carried by every record
    // ========================================================================

    Logger& with_field(const std::string& key, const std::string& value);

    template<typename T>
    Logger& with_field(const std::string& key, T value);

    // ========================================================================
    // Configuration
    // ========================================================================

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level() const;
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void flush();

    [[nodiscard]] const std::string& component() const;

private:
    std::string component_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    LogFields fields_;
    std::mutex fields_mutex_;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::shared_ptr<ILogFormatter> formatter_;
    std::mutex config_mutex_;

    void do_log(LogLevel level, const std::string& message, const LogFields& fields);
};

// ============================================================================
// Global logger registry
// ============================================================================

class LoggerFactory {
public:
    static std::shared_ptr<Logger> get_logger(const std::string& component);

    static void set_global_level(LogLevel level);
    static void set_default_sink(std::shared_ptr<ILogSink> sink);
    static void set_default_formatter(std::shared_ptr<ILogFormatter> formatter);

private:
    static std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<ILogSink> default_sink_;
    static std::shared_ptr<ILogFormatter> default_formatter_;
    static LogLevel global_level_;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename T>
Logger& Logger::with_field(const std::string& key, T value) {
    std::lock_guard<std::mutex> lock(fields_mutex_);

    if constexpr (std::is_same_v<T, bool>) {
        fields_[key] = value ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        fields_[key] = std::to_string(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        fields_[key] = std::string(value);
    } else {
        static_assert(std::is_convertible_v<T, std::string>, "Type not supported for logging field");
    }

    return *this;
}

} // namespace loopguard
