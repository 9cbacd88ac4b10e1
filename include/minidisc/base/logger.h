#ifndef MINIDISC_BASE_LOGGER_H
#define MINIDISC_BASE_LOGGER_H

#include <elio/log/logger.hpp>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace minidisc {

// Alias for Elio's log level
using LogLevel = elio::log::level;

enum class LogOutput {
    Stdout,
    Stderr,
    File
};

LogLevel parse_log_level(const std::string& level);
const char* log_level_name(LogLevel level);

// Process-wide log backend.
class Logger {
public:
    ~Logger();

    static Logger& instance();

    // Level control
    void set_level(LogLevel level);
    LogLevel get_level() const;

    // Output configuration
    void set_output(LogOutput output);
    void set_file_output(const std::string& path);
    void close_file_output();

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::debug, message); }
    void info(const std::string& message) { log(LogLevel::info, message); }
    void warning(const std::string& message) { log(LogLevel::warning, message); }
    void error(const std::string& message) { log(LogLevel::error, message); }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write_file(LogLevel level, const std::string& message);
    void close_file_locked();

    elio::log::logger& logger_ = elio::log::logger::instance();
    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::info;
    LogOutput output_ = LogOutput::Stderr;
    std::unique_ptr<std::ofstream> file_stream_;
};

// Logging capability handed to registry and discovery components. Library
// code never talks to Logger directly so that embedding processes decide
// where (and whether) messages go.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::debug, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::info, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::warning, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::error, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
};

// Discards everything. Default for all components.
class NullLogSink : public LogSink {
public:
    void log(LogLevel, const std::string&) override {}
};

// Forwards to Logger::instance().
class GlobalLogSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override;
};

std::shared_ptr<LogSink> null_log_sink();

} // namespace minidisc

#endif // MINIDISC_BASE_LOGGER_H
