#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace pysandbox {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

// Console output always goes to stderr: stdout of the process carries results.
class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool setLevel(const std::string& name);
    static LogLevel parseLevel(const std::string& name, LogLevel def = LogLevel::INFO);
    static const char* levelName(LogLevel level);
    static void setPattern(const std::string& pattern);
    static void enableConsole(bool enable);
    static void enableFile(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void flush();
    static void rotate();

    static void onLog(std::function<void(const LogEntry&)> callback);

    static uint64_t getLogCount();
    static uint64_t getErrorCount();

    static std::string getLogPath();
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();
    static bool isInitialized();

    static void setAllowSensitiveLogging(bool allow);
    static bool isAllowSensitiveLogging();

    // Submitted code is logged as size and fingerprint unless sensitive logging is on.
    static std::string redactCode(const std::string& code);
};

#define LOG_TRACE(cat, msg) do { if (pysandbox::utils::Logger::getLevel() <= pysandbox::utils::LogLevel::TRACE) pysandbox::utils::Logger::log(pysandbox::utils::LogLevel::TRACE, cat, msg); } while(0)
#define LOG_DEBUG(cat, msg) do { if (pysandbox::utils::Logger::getLevel() <= pysandbox::utils::LogLevel::DEBUG) pysandbox::utils::Logger::log(pysandbox::utils::LogLevel::DEBUG, cat, msg); } while(0)
#define LOG_INFO(cat, msg) pysandbox::utils::Logger::log(pysandbox::utils::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg) pysandbox::utils::Logger::log(pysandbox::utils::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) pysandbox::utils::Logger::log(pysandbox::utils::LogLevel::ERROR, cat, msg)
#define LOG_FATAL(cat, msg) pysandbox::utils::Logger::log(pysandbox::utils::LogLevel::FATAL, cat, msg)

}
}
