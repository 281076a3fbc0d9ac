#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace structwire::utils {

/**
 * @brief Log level
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Log entry
 */
struct LogEntry {
    LogLevel level;
    std::string logger_name;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string thread_id;
    std::string file;
    int line = 0;
    std::string function;
    std::unordered_map<std::string, std::string> metadata;
};

/**
 * @brief Log formatter shared by the sinks
 */
class UnifiedLogFormatter {
public:
    /**
     * @brief Format settings
     */
    struct FormatConfig {
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
        bool include_thread_id = false;
        bool include_file_info = false;
        bool include_metadata = true;
        bool json = false;
        std::string field_separator = " | ";
    };

    UnifiedLogFormatter();
    explicit UnifiedLogFormatter(const FormatConfig& config);

    /**
     * @brief Format a log entry according to the current config
     * @param entry Log entry
     * @return Single line without trailing newline
     */
    std::string format(const LogEntry& entry) const;

    /**
     * @brief Format a log entry as one JSON object
     * @param entry Log entry
     * @return JSON string
     */
    std::string format_json(const LogEntry& entry) const;

    void update_config(const FormatConfig& new_config);
    FormatConfig get_config() const;

private:
    FormatConfig config_;
    mutable std::mutex format_mutex_;

    std::string format_text(const LogEntry& entry, const FormatConfig& config) const;
    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp,
                                 const std::string& pattern) const;
};

/**
 * @brief Log sink (output destination)
 */
class LogSink {
public:
    LogSink();
    virtual ~LogSink() = default;

    /**
     * @brief Write a log entry
     * @param entry Log entry
     */
    virtual void write(const LogEntry& entry) = 0;

    virtual void flush() {}
    virtual void close() {}

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

    void set_formatter(std::shared_ptr<UnifiedLogFormatter> formatter);
    std::shared_ptr<UnifiedLogFormatter> get_formatter() const { return formatter_; }

protected:
    LogLevel min_level_ = LogLevel::Trace;
    std::shared_ptr<UnifiedLogFormatter> formatter_;
};

/**
 * @brief Console log sink
 *
 * Writes to std::clog by default so that program output on stdout stays clean.
 */
class ConsoleLogSink : public LogSink {
public:
    explicit ConsoleLogSink(bool use_colors = true);
    ConsoleLogSink(std::ostream& stream, bool use_colors);

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::ostream& stream_;
    bool use_colors_;
    std::mutex console_mutex_;
    std::string colorize(LogLevel level, const std::string& text) const;
};

/**
 * @brief File log sink with size based rotation
 */
class FileLogSink : public LogSink {
public:
    /**
     * @brief Constructor
     * @param file_path File path
     * @param max_file_size Maximum file size in bytes (0 = unlimited)
     * @param max_files Number of rotated files kept (file.1 .. file.N)
     */
    explicit FileLogSink(const std::filesystem::path& file_path,
                         std::size_t max_file_size = 10 * 1024 * 1024,
                         std::size_t max_files = 5);

    ~FileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;
    void close() override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
    std::size_t max_file_size_;
    std::size_t max_files_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex file_mutex_;
    std::size_t current_file_size_{0};

    void rotate_file();
    std::filesystem::path get_rotated_file_path(std::size_t index) const;
};

/**
 * @brief Named logger
 */
class Logger {
public:
    explicit Logger(const std::string& name);

    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * @brief Emit a log entry
     * @param level Log level
     * @param message Message
     * @param file Source file
     * @param line Source line
     * @param function Function name
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0, const std::string& function = "");

    void log_with_metadata(LogLevel level, const std::string& message,
                           const std::unordered_map<std::string, std::string>& metadata,
                           const std::string& file = "", int line = 0, const std::string& function = "");

    void trace(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void debug(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void info(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void warning(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void error(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void critical(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");

    bool should_log(LogLevel level) const;
    void flush();
    std::string get_name() const;

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
    LogLevel min_level_;

    void write_to_sinks(const LogEntry& entry);
    std::string get_thread_id() const;
};

/**
 * @brief Process wide registry of named loggers
 */
class LogManager {
public:
    static LogManager& instance();

    /**
     * @brief Get a logger, creating it with the global level and sinks if needed
     * @param name Logger name
     * @return Logger
     */
    std::shared_ptr<Logger> get_logger(const std::string& name);
    std::shared_ptr<Logger> get_default_logger();

    void remove_logger(const std::string& name);
    void clear_loggers();

    /**
     * @brief Set the level of existing and future loggers
     */
    void set_global_level(LogLevel level);
    LogLevel get_global_level() const;

    /**
     * @brief Attach a sink to existing and future loggers
     */
    void add_global_sink(std::shared_ptr<LogSink> sink);
    void clear_global_sinks();

    void flush_all();
    void shutdown();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

private:
    std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
    mutable std::mutex loggers_mutex_;
    LogLevel global_level_{LogLevel::Warning};
    std::vector<std::shared_ptr<LogSink>> global_sinks_;

    LogManager() = default;
    ~LogManager();
};

/**
 * @brief Log macros
 */
#define STRUCTWIRE_LOG_TRACE(logger, message) \
    logger->trace(message, __FILE__, __LINE__, __FUNCTION__)

#define STRUCTWIRE_LOG_DEBUG(logger, message) \
    logger->debug(message, __FILE__, __LINE__, __FUNCTION__)

#define STRUCTWIRE_LOG_INFO(logger, message) \
    logger->info(message, __FILE__, __LINE__, __FUNCTION__)

#define STRUCTWIRE_LOG_WARNING(logger, message) \
    logger->warning(message, __FILE__, __LINE__, __FUNCTION__)

#define STRUCTWIRE_LOG_ERROR(logger, message) \
    logger->error(message, __FILE__, __LINE__, __FUNCTION__)

#define STRUCTWIRE_LOG_CRITICAL(logger, message) \
    logger->critical(message, __FILE__, __LINE__, __FUNCTION__)

namespace log_utils {
    /**
     * @brief Parse a log level name ("trace", "debug", "info", "warn",
     *        "warning", "error", "critical", "off"); unknown names map to Info
     */
    LogLevel parse_log_level(const std::string& level_str);

    std::string log_level_to_string(LogLevel level);

    /**
     * @brief Configure the global logger set
     * @param level Minimum level
     * @param log_to_console Attach a console sink
     * @param log_file Log file path (empty = no file sink)
     */
    void setup_basic_logging(LogLevel level = LogLevel::Info,
                             bool log_to_console = true,
                             const std::filesystem::path& log_file = {});
}

} // namespace structwire::utils
