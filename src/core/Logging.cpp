#include "Logging.h"
#include "Utils.h"
#include <iostream>
#include <chrono>
#include <ctime>

namespace lan_scan {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

const char* log_level_name(LogLevel level){
    switch(level){
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(const std::string& name){
    std::string s = utils::to_lower(utils::trim(name));
    if(s=="error") return LogLevel::Error;
    if(s=="warn" || s=="warning") return LogLevel::Warn;
    if(s=="info") return LogLevel::Info;
    if(s=="debug") return LogLevel::Debug;
    if(s=="trace") return LogLevel::Trace;
    return std::nullopt;
}

void Logger::log(LogLevel level, const std::string& msg){
    if(static_cast<int>(level) > static_cast<int>(level_.load())) return;
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{}; gmtime_r(&now, &tm);
    char ts[32]; std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << '[' << ts << "] [" << log_level_name(level) << "] " << msg << '\n';
}

}
