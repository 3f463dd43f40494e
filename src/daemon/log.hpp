#pragma once

#include <format>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

enum class LogLevel { Debug, Info, Warn, Error, Critical };

std::string_view to_string(LogLevel level);

// Line-oriented logger shared by the key thread, the work pool and the main loop.
class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    // An empty sink writes to stderr.
    explicit Logger(LogLevel min_level = LogLevel::Info, Sink sink = {});

    void set_min_level(LogLevel level);
    LogLevel min_level() const;

    void write(LogLevel level, std::string_view msg);

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (level < min_level()) return;
        write(level, std::format(fmt, std::forward<Args>(args)...));
    }

    mutable std::mutex mutex_;
    LogLevel min_level_;
    Sink sink_;
};
