#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <deque>
#include <algorithm>
#include <cstdlib>

namespace pysandbox {
namespace utils {

static LogLevel currentLevel = LogLevel::INFO;
static std::ofstream logFile;
static std::string logPath;
static std::string logPattern = "%Y-%m-%d %H:%M:%S";
static std::mutex logMutex;
static bool consoleEnabled = true;
static bool fileEnabled = true;
static uint64_t maxFileSize = 10 * 1024 * 1024;
static uint32_t maxFiles = 5;
static std::atomic<uint64_t> logCount{0};
static std::atomic<uint64_t> errorCount{0};
static std::function<void(const LogEntry&)> logCallback;
static std::deque<LogEntry> recentLogs;
static const size_t maxRecentLogs = 500;
static bool initialized = false;
static bool allowSensitive = false;

static uint64_t getThreadId() {
    std::hash<std::thread::id> hasher;
    return hasher(std::this_thread::get_id());
}

static void rotateLocked() {
    if (logPath.empty()) return;

    if (logFile.is_open()) {
        logFile.close();
    }

    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        if (!std::filesystem::exists(oldPath, ec)) continue;
        if (i == static_cast<int>(maxFiles) - 1) {
            std::filesystem::remove(oldPath, ec);
        } else {
            std::filesystem::rename(oldPath, logPath + "." + std::to_string(i + 1), ec);
        }
    }

    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }

    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel || level == LogLevel::OFF) return;

    std::lock_guard<std::mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), logPattern.c_str(), std::localtime(&now));

    std::ostringstream oss;
    oss << timeBuf << " [" << std::left << std::setw(5) << Logger::levelName(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << msg << "\n";
    std::string line = oss.str();

    if (consoleEnabled) {
        std::cerr << line;
    }

    if (fileEnabled && logFile.is_open()) {
        logFile << line;
        logFile.flush();
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateLocked();
        }
    }

    logCount++;
    if (level >= LogLevel::ERROR) errorCount++;

    LogEntry entry;
    entry.level = level;
    entry.message = msg;
    entry.category = category;
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = getThreadId();

    recentLogs.push_back(entry);
    while (recentLogs.size() > maxRecentLogs) {
        recentLogs.pop_front();
    }

    if (logCallback) {
        logCallback(entry);
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;

    if (!path.empty()) {
        std::filesystem::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path(), ec);
        }
        logFile.open(path, std::ios::app);
    }
    initialized = true;

    const char* env = std::getenv("PYSANDBOX_ALLOW_SENSITIVE_LOGS");
    if (env && *env) {
        std::string v(env);
        if (v == "1" || v == "true" || v == "TRUE") allowSensitive = true;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
    initialized = false;
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::setLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    static const char* known[] = {"trace", "debug", "info", "warn", "warning", "error", "fatal", "off"};
    for (const char* k : known) {
        if (lower == k) {
            currentLevel = parseLevel(lower);
            return true;
        }
    }
    return false;
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel def) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    if (lower == "off") return LogLevel::OFF;
    return def;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default: return "?????";
    }
}

void Logger::setPattern(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPattern = pattern;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::enableFile(bool enable) {
    fileEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    maxFiles = count;
}

void Logger::trace(const std::string& msg) { writeLog(LogLevel::TRACE, "", msg); }
void Logger::debug(const std::string& msg) { writeLog(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { writeLog(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { writeLog(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { writeLog(LogLevel::ERROR, "", msg); }
void Logger::fatal(const std::string& msg) { writeLog(LogLevel::FATAL, "", msg); }

void Logger::log(LogLevel level, const std::string& msg) {
    writeLog(level, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cerr.flush();
    if (logFile.is_open()) {
        logFile.flush();
    }
}

void Logger::rotate() {
    std::lock_guard<std::mutex> lock(logMutex);
    rotateLocked();
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    std::lock_guard<std::mutex> lock(logMutex);
    logCallback = callback;
}

uint64_t Logger::getLogCount() {
    return logCount;
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

std::string Logger::getLogPath() {
    std::lock_guard<std::mutex> lock(logMutex);
    return logPath;
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::vector<LogEntry> result;
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    for (size_t i = start; i < recentLogs.size(); i++) {
        result.push_back(recentLogs[i]);
    }
    return result;
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
    logCount = 0;
    errorCount = 0;
}

bool Logger::isInitialized() {
    return initialized;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

bool Logger::isAllowSensitiveLogging() {
    return allowSensitive;
}

std::string Logger::redactCode(const std::string& code) {
    if (allowSensitive) {
        return code;
    }
    // FNV-1a, only used to correlate log lines of one submission.
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : code) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    std::ostringstream oss;
    oss << "<code " << code.size() << " bytes, fp " << std::hex << std::setw(16)
        << std::setfill('0') << hash << ">";
    return oss.str();
}

}
}
