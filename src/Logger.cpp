#include "Logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace garlic_shell {

std::mutex Logger::log_mutex_;
LogLevel Logger::min_log_level_ = LogLevel::Info;
bool Logger::console_output_enabled_ = true;
Logger::FileSink Logger::log_file_;
Logger::FileSink Logger::audit_file_;

namespace {
    std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);

        char buffer[32];
        const size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
        char withMillis[40];
        std::snprintf(withMillis, sizeof(withMillis), "%.*s.%03d",
                      static_cast<int>(length), buffer, static_cast<int>(millis));
        return withMillis;
    }
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Security: return "SECURITY";
        case LogLevel::Fatal:    return "FATAL";
        default:                 return "UNKNOWN";
    }
}

void Logger::logEvent(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (level < min_log_level_) {
        return;
    }
    emit(level, std::string(message));
}

void Logger::logError(ErrorCode code, std::string_view details) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    emit(LogLevel::Error, std::string(toString(code)) + ": " + std::string(details));
}

void Logger::logAudit(std::string_view record) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (audit_file_.path.empty()) {
        return;
    }
    append(audit_file_, timestamp() + " " + std::string(record) + "\n");
}

void Logger::emit(LogLevel level, const std::string& message) {
    const std::string line =
        "[" + std::string(toString(level)) + "] " + timestamp() + " " + message + "\n";

    if (console_output_enabled_) {
        std::cerr << line;
    }
    if (!log_file_.path.empty()) {
        append(log_file_, line);
    }
}

void Logger::reopen(FileSink& sink, std::string_view path) {
    if (sink.stream.is_open()) {
        sink.stream.close();
    }
    sink.path = path;
    if (!sink.path.empty()) {
        sink.stream.open(sink.path, std::ios::app);
    }
}

void Logger::append(FileSink& sink, const std::string& line) {
    if (!sink.stream.is_open()) {
        sink.stream.clear();
        sink.stream.open(sink.path, std::ios::app);
    }

    sink.stream << line;
    sink.stream.flush();
    if (!sink.stream) {
        // Retry the open on the next line
        sink.stream.close();
        if (console_output_enabled_) {
            std::cerr << "[FILE_ERROR] Cannot write " << sink.path << ": " << line;
        }
    }
}

void Logger::setLogLevel(LogLevel minLevel) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = minLevel;
}

void Logger::setLogFile(std::string_view path) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    reopen(log_file_, path);
}

void Logger::setAuditFile(std::string_view path) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    reopen(audit_file_, path);
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_enabled_ = enable;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr.flush();
    if (log_file_.stream.is_open()) {
        log_file_.stream.flush();
    }
    if (audit_file_.stream.is_open()) {
        audit_file_.stream.flush();
    }
}

} // namespace garlic_shell
