#include "loopguard/utils/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace loopguard {

// ============================================================================
// LogLevel helpers
// ============================================================================

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel log_level_from_string(const std::string& level_str) {
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_str == "TRACE") return LogLevel::TRACE;
    if (upper_str == "DEBUG") return LogLevel::DEBUG;
    if (upper_str == "INFO")  return LogLevel::INFO;
    if (upper_str == "WARN" || upper_str == "WARNING") return LogLevel::WARN;
    if (upper_str == "ERROR") return LogLevel::ERROR;
    if (upper_str == "FATAL") return LogLevel::FATAL;
    if (upper_str == "OFF")   return LogLevel::OFF;

    return LogLevel::INFO;
}

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // namespace

// ============================================================================
// LogMessage
// ============================================================================

LogMessage::LogMessage(LogLevel lvl, std::string comp, std::string msg,
                       std::chrono::system_clock::time_point ts)
    : level(lvl)
    , component(std::move(comp))
    , message(std::move(msg))
    , timestamp(ts)
    , thread_id(std::this_thread::get_id()) {
}

// ============================================================================
// TextFormatter
// ============================================================================

TextFormatter::TextFormatter(bool include_thread_id)
    : include_thread_id_(include_thread_id) {
}

std::string TextFormatter::format(const LogMessage& message) {
    std::ostringstream oss;

    oss << "[" << format_timestamp(message.timestamp) << "] ";
    oss << "[" << std::setw(5) << std::left << to_string(message.level) << "] ";

    if (!message.component.empty()) {
        oss << "[" << message.component << "] ";
    }

    if (include_thread_id_) {
        oss << "[thread=" << message.thread_id << "] ";
    }

    oss << message.message;

    if (!message.fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : message.fields) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// ============================================================================
// JsonFormatter
// ============================================================================

JsonFormatter::JsonFormatter(bool pretty_print)
    : pretty_print_(pretty_print) {
}

std::string JsonFormatter::format(const LogMessage& message) {
    nlohmann::json j;
    j["timestamp"] = format_timestamp(message.timestamp);
    j["level"] = to_string(message.level);

    if (!message.component.empty()) {
        j["component"] = message.component;
    }

    std::ostringstream tid;
    tid << message.thread_id;
    j["thread_id"] = tid.str();
    j["message"] = message.message;

    if (!message.fields.empty()) {
        j["fields"] = message.fields;
    }

    return pretty_print_ ? j.dump(2) : j.dump();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {
}

void ConsoleSink::write(LogLevel level, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& out = level >= LogLevel::WARN ? std::cerr : std::clog;
    if (use_colors_) {
        out << get_color_code(level) << formatted_message << "\033[0m\n";
    } else {
        out << formatted_message << "\n";
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog.flush();
    std::cerr.flush();
}

const char* ConsoleSink::get_color_code(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "\033[37m";    // White
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35m";    // Magenta
        default: return "\033[0m";
    }
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& filename, bool append)
    : filename_(filename) {

    auto parent_path = std::filesystem::path(filename).parent_path();
    if (!parent_path.empty()) {
        std::filesystem::create_directories(parent_path);
    }

    auto mode = append ? std::ios::out | std::ios::app : std::ios::out;
    file_.open(filename_, mode);

    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename_);
    }

    if (std::filesystem::exists(filename_)) {
        current_size_ = std::filesystem::file_size(filename_);
    }
}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::write(LogLevel /*level*/, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_.is_open()) return;

    file_ << formatted_message << "\n";
    current_size_ += formatted_message.length() + 1;

    if (rotation_enabled_) {
        rotate_if_needed();
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::enable_rotation(size_t max_size_mb, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    rotation_enabled_ = max_files > 0;
    max_size_bytes_ = max_size_mb * 1024 * 1024;
    max_files_ = max_files;
}

void FileSink::rotate_if_needed() {
    if (current_size_ >= max_size_bytes_) {
        perform_rotation();
    }
}

void FileSink::perform_rotation() {
    file_.close();

    // filename.N is the oldest and is dropped
    std::error_code ec;
    std::filesystem::remove(filename_ + "." + std::to_string(max_files_), ec);
    for (size_t i = max_files_; i > 1; --i) {
        std::string old_name = filename_ + "." + std::to_string(i - 1);
        if (std::filesystem::exists(old_name)) {
            std::filesystem::rename(old_name, filename_ + "." + std::to_string(i), ec);
        }
    }

    if (std::filesystem::exists(filename_)) {
        std::filesystem::rename(filename_, filename_ + ".1", ec);
    }

    file_.open(filename_, std::ios::out);
    current_size_ = 0;
}

// ============================================================================
// MemorySink
// ============================================================================

MemorySink::MemorySink(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void MemorySink::write(LogLevel level, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.size() >= capacity_) {
        records_.erase(records_.begin());
    }
    records_.push_back(Record{level, formatted_message});
}

std::vector<MemorySink::Record> MemorySink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t MemorySink::count(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [level](const Record& r) { return r.level == level; }));
}

bool MemorySink::contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(records_.begin(), records_.end(),
        [&needle](const Record& r) { return r.text.find(needle) != std::string::npos; });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , formatter_(std::make_shared<TextFormatter>()) {
    sinks_.push_back(std::make_shared<ConsoleSink>(false));
}

Logger::~Logger() {
    flush();
}

void Logger::trace(const std::string& message, const LogFields& fields) {
    log(LogLevel::TRACE, message, fields);
}

void Logger::debug(const std::string& message, const LogFields& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::info(const std::string& message, const LogFields& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::warn(const std::string& message, const LogFields& fields) {
    log(LogLevel::WARN, message, fields);
}

void Logger::error(const std::string& message, const LogFields& fields) {
    log(LogLevel::ERROR, message, fields);
}

void Logger::fatal(const std::string& message, const LogFields& fields) {
    log(LogLevel::FATAL, message, fields);
}

void Logger::log(LogLevel level, const std::string& message, const LogFields& fields) {
    if (!is_enabled(level)) {
        return;
    }
    do_log(level, message, fields);
}

Logger& Logger::with_field(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(fields_mutex_);
    fields_[key] = value;
    return *this;
}

void Logger::set_level(LogLevel level) {
    min_level_ = level;
}

LogLevel Logger::get_level() const {
    return min_level_.load();
}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::OFF && level >= min_level_.load();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.clear();
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    formatter_ = std::move(formatter);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

const std::string& Logger::component() const {
    return component_;
}

void Logger::do_log(LogLevel level, const std::string& message, const LogFields& fields) {
    LogMessage log_msg(level, component_, message);

    {
        std::lock_guard<std::mutex> lock(fields_mutex_);
        log_msg.fields = fields_;
    }
    for (const auto& [key, value] : fields) {
        log_msg.fields[key] = value;
    }

    // Snapshot the configuration so sinks run without the lock held
    std::shared_ptr<ILogFormatter> formatter;
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        formatter = formatter_;
        sinks = sinks_;
    }

    const std::string formatted_message = formatter ? formatter->format(log_msg) : message;

    for (auto& sink : sinks) {
        if (sink) {
            sink->write(level, formatted_message);
        }
    }
}

// ============================================================================
// LoggerFactory
// ============================================================================

std::unordered_map<std::string, std::shared_ptr<Logger>> LoggerFactory::loggers_;
std::mutex LoggerFactory::registry_mutex_;
std::shared_ptr<ILogSink> LoggerFactory::default_sink_;
std::shared_ptr<ILogFormatter> LoggerFactory::default_formatter_;
LogLevel LoggerFactory::global_level_ = LogLevel::INFO;

std::shared_ptr<Logger> LoggerFactory::get_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = loggers_.find(component);
    if (it != loggers_.end()) {
        return it->second;
    }

    auto logger = std::make_shared<Logger>(component);
    logger->set_level(global_level_);

    if (default_sink_) {
        logger->clear_sinks();
        logger->add_sink(default_sink_);
    }

    if (default_formatter_) {
        logger->set_formatter(default_formatter_);
    }

    loggers_[component] = logger;
    return logger;
}

void LoggerFactory::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_level_ = level;

    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
}

void LoggerFactory::set_default_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_sink_ = std::move(sink);

    if (default_sink_) {
        for (auto& [name, logger] : loggers_) {
            logger->clear_sinks();
            logger->add_sink(default_sink_);
        }
    }
}

void LoggerFactory::set_default_formatter(std::shared_ptr<ILogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_formatter_ = std::move(formatter);

    if (default_formatter_) {
        for (auto& [name, logger] : loggers_) {
            logger->set_formatter(default_formatter_);
        }
    }
}

} // namespace loopguard
