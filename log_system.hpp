#ifndef LOG_SYSTEM_HPP
#define LOG_SYSTEM_HPP

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

/**
 * @enum LogLevel
 * @brief Severity of a log line, lowest first.
 */
enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

/**
 * @class LogSystem
 * @brief Console logger shared by every scan task.
 *
 * Lines are formatted as "YYYY-MM-DD HH:MM:SS - LEVEL - message". Writes are
 * serialised so output from concurrent port tasks never interleaves.
 */
class LogSystem {
public:
    LogSystem() : level_(LogLevel::Info), out_(&std::cerr) {}

    void setLevel(LogLevel level);
    LogLevel level() const;

    /**
     * @brief Redirects output; used by tests to capture log lines.
     * @param out Stream to write to (must outlive the logger's use).
     */
    void setStream(std::ostream& out);

    template<typename... Args>
    void Debug(Args&&... args) { write(LogLevel::Debug, std::forward<Args>(args)...); }

    template<typename... Args>
    void Info(Args&&... args) { write(LogLevel::Info, std::forward<Args>(args)...); }

    template<typename... Args>
    void Warning(Args&&... args) { write(LogLevel::Warning, std::forward<Args>(args)...); }

    template<typename... Args>
    void Error(Args&&... args) { write(LogLevel::Error, std::forward<Args>(args)...); }

private:
    template<typename... Args>
    void write(LogLevel level, Args&&... args) {
        if (level < this->level()) return;
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        emit(level, ss.str());
    }

    void emit(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LogLevel level_;
    std::ostream* out_;
};

extern LogSystem logsys;

#endif // LOG_SYSTEM_HPP
