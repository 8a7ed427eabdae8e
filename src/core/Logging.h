#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <optional>

namespace lan_scan {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    void log(LogLevel level, const std::string& msg);
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }
private:
    Logger() = default;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

}
