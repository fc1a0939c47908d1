#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include "SecureTypes.hpp"

namespace garlic_shell {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Security,
    Fatal
};

const char* toString(LogLevel level);

/**
 * Process-wide log sink.
 *
 * Lines read "[LEVEL] yyyy-mm-dd hh:mm:ss.mmm message" and go to stderr
 * and, when set, an append-only log file. The command audit trail is a
 * separate file that ignores the level filter.
 */
class Logger {
public:
    static void logEvent(LogLevel level, std::string_view message);
    static void logError(ErrorCode code, std::string_view details);
    static void logAudit(std::string_view record);

    static void setLogLevel(LogLevel minLevel);
    // An empty path closes the file
    static void setLogFile(std::string_view path);
    static void setAuditFile(std::string_view path);
    static void enableConsoleOutput(bool enable);

    static void flush();

private:
    struct FileSink {
        std::string path;
        std::ofstream stream;
    };

    static std::mutex log_mutex_;
    static LogLevel min_log_level_;
    static bool console_output_enabled_;
    static FileSink log_file_;
    static FileSink audit_file_;

    // Callers hold log_mutex_
    static void emit(LogLevel level, const std::string& line);
    static void reopen(FileSink& sink, std::string_view path);
    static void append(FileSink& sink, const std::string& line);

    Logger() = delete;
    ~Logger() = delete;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

} // namespace garlic_shell
