#include "log_system.hpp"

#include <chrono>
#include <ctime>

LogSystem logsys;

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     break;
    }
    return "";
}

} // namespace

void LogSystem::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel LogSystem::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void LogSystem::setStream(std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &out;
}

void LogSystem::emit(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t time_now = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_now, &local);
    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << timestamp << " - " << levelName(level) << " - " << message << std::endl;
}
