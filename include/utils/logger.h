#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace snipguard {
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

class Logger {
public:
    // Opens (appends to) a log file. Console output works without init().
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    
    static void log(LogLevel level, const std::string& category, const std::string& msg);
    static void flush();
    
    static void onLog(std::function<void(const LogEntry&)> callback);
    
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();
    static bool isInitialized();
};

#define SG_LOG(level, category, msg) do { if (snipguard::utils::Logger::getLevel() <= (level)) snipguard::utils::Logger::log(level, category, msg); } while(0)
#define SG_DEBUG(category, msg) SG_LOG(snipguard::utils::LogLevel::DEBUG, category, msg)
#define SG_INFO(category, msg) SG_LOG(snipguard::utils::LogLevel::INFO, category, msg)
#define SG_WARN(category, msg) SG_LOG(snipguard::utils::LogLevel::WARN, category, msg)
#define SG_ERROR(category, msg) SG_LOG(snipguard::utils::LogLevel::ERROR, category, msg)

}
}
