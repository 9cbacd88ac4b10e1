#include "minidisc/base/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace minidisc {

namespace {

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug") return LogLevel::debug;
    if (level == "info") return LogLevel::info;
    if (level == "warning" || level == "warn") return LogLevel::warning;
    if (level == "error") return LogLevel::error;
    return LogLevel::info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warning: return "WARN";
        case LogLevel::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_locked();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_output(LogOutput output) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = output;
}

void Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_locked();
    file_stream_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        file_stream_.reset();
    } else {
        output_ = LogOutput::File;
    }
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_locked();
    if (output_ == LogOutput::File) {
        output_ = LogOutput::Stderr;
    }
}

void Logger::close_file_locked() {
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) return;

    switch (output_) {
        case LogOutput::Stdout:
            std::cout << "[" << get_timestamp() << "] [" << log_level_name(level) << "] "
                      << message << std::endl;
            break;
        case LogOutput::Stderr:
            logger_.log(level, "", 0, "{}", message);
            break;
        case LogOutput::File:
            write_file(level, message);
            break;
    }
}

void Logger::write_file(LogLevel level, const std::string& message) {
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << "[" << get_timestamp() << "] [" << log_level_name(level) << "] "
                      << message << std::endl;
        file_stream_->flush();
    }
}

void GlobalLogSink::log(LogLevel level, const std::string& message) {
    Logger::instance().log(level, message);
}

std::shared_ptr<LogSink> null_log_sink() {
    static auto sink = std::make_shared<NullLogSink>();
    return sink;
}

} // namespace minidisc
