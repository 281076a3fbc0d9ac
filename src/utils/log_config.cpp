#include "structwire/utils/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace structwire::utils {

namespace {

std::tm to_local_tm(const std::chrono::system_clock::time_point& tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRIT";
        default: return "OFF";
    }
}

} // namespace

// UnifiedLogFormatter
UnifiedLogFormatter::UnifiedLogFormatter() : config_{} {}
UnifiedLogFormatter::UnifiedLogFormatter(const FormatConfig& config) : config_(config) {}

std::string UnifiedLogFormatter::format_timestamp(const std::chrono::system_clock::time_point& tp,
                                                  const std::string& pattern) const {
    std::tm tm = to_local_tm(tp);
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), pattern.c_str(), &tm);
    return std::string(buf, n);
}

std::string UnifiedLogFormatter::format_text(const LogEntry& e, const FormatConfig& cfg) const {
    std::ostringstream ss;
    ss << format_timestamp(e.timestamp, cfg.timestamp_format) << cfg.field_separator
       << level_label(e.level) << cfg.field_separator << e.logger_name;
    if (cfg.include_thread_id && !e.thread_id.empty()) {
        ss << cfg.field_separator << "tid=" << e.thread_id;
    }
    if (cfg.include_file_info && !e.file.empty()) {
        ss << cfg.field_separator << e.file << ':' << e.line;
    }
    ss << cfg.field_separator << e.message;
    if (cfg.include_metadata && !e.metadata.empty()) {
        // unordered_map iteration order is unspecified; sort for stable output
        std::vector<std::pair<std::string, std::string>> md(e.metadata.begin(), e.metadata.end());
        std::sort(md.begin(), md.end());
        ss << cfg.field_separator << '[';
        bool first = true;
        for (const auto& [k, v] : md) {
            if (!first) ss << ',';
            first = false;
            ss << k << '=' << v;
        }
        ss << ']';
    }
    return ss.str();
}

std::string UnifiedLogFormatter::format(const LogEntry& e) const {
    FormatConfig cfg = get_config();
    if (cfg.json) return format_json(e);
    return format_text(e, cfg);
}

std::string UnifiedLogFormatter::format_json(const LogEntry& e) const {
    FormatConfig cfg = get_config();
    nlohmann::json j;
    j["time"] = format_timestamp(e.timestamp, cfg.timestamp_format);
    j["level"] = level_label(e.level);
    j["logger"] = e.logger_name;
    j["msg"] = e.message;
    if (cfg.include_file_info && !e.file.empty()) {
        j["file"] = e.file;
        j["line"] = e.line;
    }
    if (cfg.include_metadata && !e.metadata.empty()) {
        j["metadata"] = e.metadata;
    }
    return j.dump();
}

void UnifiedLogFormatter::update_config(const FormatConfig& cfg) {
    std::lock_guard<std::mutex> lk(format_mutex_);
    config_ = cfg;
}

UnifiedLogFormatter::FormatConfig UnifiedLogFormatter::get_config() const {
    std::lock_guard<std::mutex> lk(format_mutex_);
    return config_;
}

// LogSink
LogSink::LogSink() : formatter_(std::make_shared<UnifiedLogFormatter>()) {}

void LogSink::set_formatter(std::shared_ptr<UnifiedLogFormatter> formatter) {
    if (formatter) formatter_ = std::move(formatter);
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(bool use_colors) : ConsoleLogSink(std::clog, use_colors) {}

ConsoleLogSink::ConsoleLogSink(std::ostream& stream, bool use_colors)
    : stream_(stream), use_colors_(use_colors) {}

std::string ConsoleLogSink::colorize(LogLevel level, const std::string& text) const {
    if (!use_colors_) return text;
    const char* c = "\033[0m";
    switch (level) {
        case LogLevel::Trace: c = "\033[37m"; break;
        case LogLevel::Debug: c = "\033[36m"; break;
        case LogLevel::Info: c = "\033[32m"; break;
        case LogLevel::Warning: c = "\033[33m"; break;
        case LogLevel::Error: c = "\033[31m"; break;
        case LogLevel::Critical: c = "\033[35m"; break;
        default: break;
    }
    return std::string(c) + text + "\033[0m";
}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::string line = formatter_->format(entry);
    std::lock_guard<std::mutex> lk(console_mutex_);
    stream_ << colorize(entry.level, line) << '\n';
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lk(console_mutex_);
    stream_.flush();
}

// FileLogSink
FileLogSink::FileLogSink(const std::filesystem::path& file_path, std::size_t max_file_size, std::size_t max_files)
    : file_path_(file_path), max_file_size_(max_file_size), max_files_(max_files) {
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::app);
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path_, ec);
    if (!ec) current_file_size_ = static_cast<std::size_t>(size);
}

FileLogSink::~FileLogSink() { close(); }

void FileLogSink::write(const LogEntry& entry) {
    std::string line = formatter_->format(entry);
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (!file_stream_ || !file_stream_->is_open()) return;
    (*file_stream_) << line << '\n';
    current_file_size_ += line.size() + 1;
    if (max_file_size_ && current_file_size_ > max_file_size_) rotate_file();
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_) file_stream_->flush();
}

void FileLogSink::close() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
        file_stream_->close();
    }
}

// file -> file.1 -> file.2 ... oldest beyond max_files is dropped
void FileLogSink::rotate_file() {
    if (!file_stream_) return;
    file_stream_->close();
    std::error_code ec;
    if (max_files_ > 0) {
        std::filesystem::remove(get_rotated_file_path(max_files_ - 1), ec);
        for (std::size_t i = max_files_ - 1; i-- > 0;) {
            auto src = get_rotated_file_path(i);
            if (std::filesystem::exists(src, ec)) {
                std::filesystem::rename(src, get_rotated_file_path(i + 1), ec);
            }
        }
        std::filesystem::rename(file_path_, get_rotated_file_path(0), ec);
    }
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::trunc);
    current_file_size_ = 0;
}

std::filesystem::path FileLogSink::get_rotated_file_path(std::size_t index) const {
    return std::filesystem::path(file_path_.string() + "." + std::to_string(index + 1));
}

// Logger
Logger::Logger(const std::string& name) : name_(name), min_level_(LogLevel::Info) {}

void Logger::add_sink(std::shared_ptr<LogSink> s) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), s) == sinks_.end()) sinks_.push_back(std::move(s));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& s) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), s), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    min_level_ = l;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    return min_level_;
}

bool Logger::should_log(LogLevel level) const {
    return level != LogLevel::Off && level >= get_level();
}

void Logger::write_to_sinks(const LogEntry& e) {
    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lk(sinks_mutex_);
        sinks = sinks_;
    }
    for (auto& s : sinks) {
        if (e.level >= s->get_min_level()) s->write(e);
    }
}

std::string Logger::get_thread_id() const {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line, const std::string& function) {
    log_with_metadata(level, message, {}, file, line, function);
}

void Logger::log_with_metadata(LogLevel level, const std::string& message,
                               const std::unordered_map<std::string, std::string>& metadata,
                               const std::string& file, int line, const std::string& function) {
    if (!should_log(level)) return;
    LogEntry e{level, name_, message, std::chrono::system_clock::now(), get_thread_id(), file, line, function, metadata};
    write_to_sinks(e);
}

void Logger::trace(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Trace, m, f, l, fn); }
void Logger::debug(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Debug, m, f, l, fn); }
void Logger::info(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Info, m, f, l, fn); }
void Logger::warning(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Warning, m, f, l, fn); }
void Logger::error(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Error, m, f, l, fn); }
void Logger::critical(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Critical, m, f, l, fn); }

void Logger::flush() {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    for (auto& s : sinks_) s->flush();
}

std::string Logger::get_name() const { return name_; }

// LogManager
LogManager& LogManager::instance() {
    static LogManager inst;
    return inst;
}

LogManager::~LogManager() { shutdown(); }

std::shared_ptr<Logger> LogManager::get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) return it->second;
    auto l = std::make_shared<Logger>(name);
    l->set_level(global_level_);
    for (auto& s : global_sinks_) l->add_sink(s);
    loggers_[name] = l;
    return l;
}

std::shared_ptr<Logger> LogManager::get_default_logger() { return get_logger("structwire"); }

void LogManager::remove_logger(const std::string& name) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    loggers_.erase(name);
}

void LogManager::clear_loggers() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    loggers_.clear();
}

void LogManager::set_global_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    global_level_ = l;
    for (auto& [n, logger] : loggers_) logger->set_level(l);
}

LogLevel LogManager::get_global_level() const {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    return global_level_;
}

void LogManager::add_global_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    global_sinks_.push_back(sink);
    for (auto& [n, logger] : loggers_) logger->add_sink(sink);
}

void LogManager::clear_global_sinks() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, logger] : loggers_) {
        for (auto& s : global_sinks_) logger->remove_sink(s);
    }
    global_sinks_.clear();
}

void LogManager::flush_all() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, l] : loggers_) l->flush();
}

void LogManager::shutdown() {
    flush_all();
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& s : global_sinks_) s->close();
}

// log_utils
LogLevel log_utils::parse_log_level(const std::string& s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical" || lower == "fatal") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

std::string log_utils::log_level_to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        default: return "off";
    }
}

void log_utils::setup_basic_logging(LogLevel level, bool log_to_console, const std::filesystem::path& log_file) {
    auto& manager = LogManager::instance();
    manager.clear_global_sinks();
    manager.set_global_level(level);
    if (log_to_console) {
        manager.add_global_sink(std::make_shared<ConsoleLogSink>());
    }
    if (!log_file.empty()) {
        manager.add_global_sink(std::make_shared<FileLogSink>(log_file));
    }
}

} // namespace structwire::utils
