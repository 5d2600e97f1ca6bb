#include "deskshell/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#endif

namespace deskshell {

std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
    std::string up(s);
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    if (up == "TRACE") return LogLevel::TRACE;
    if (up == "DEBUG") return LogLevel::DEBUG;
    if (up == "INFO") return LogLevel::INFO;
    if (up == "WARN" || up == "WARNING") return LogLevel::WARN;
    if (up == "ERROR") return LogLevel::ERR;
    return std::nullopt;
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mu_);

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %X");
    std::string ts = ss.str();

    if (level >= min_level_ && !quiet_) {
        std::string formatted =
            "[" + ts + "] [" + std::string(log_level_name(level)) + "] " + msg;
        std::cerr << formatted << std::endl;
#ifdef _WIN32
        std::string win_msg = formatted + "\n";
        OutputDebugStringA(win_msg.c_str());
#endif
    }

    buffer_.push_back(LogMessage{level, ts, msg});
    if (buffer_.size() > MAX_LOGS) {
        buffer_.erase(buffer_.begin());
    }
}

std::vector<LogMessage> Logger::get_recent_logs(size_t count) {
    std::lock_guard<std::mutex> lk(mu_);
    if (count >= buffer_.size()) return buffer_;
    return std::vector<LogMessage>(buffer_.end() - count, buffer_.end());
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return min_level_;
}

void Logger::set_quiet(bool quiet) {
    std::lock_guard<std::mutex> lk(mu_);
    quiet_ = quiet;
}

} // namespace deskshell
