#include "log.hpp"

#include <print>

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
    }
    return "unknown";
}

Logger::Logger(LogLevel min_level, Sink sink)
    : min_level_(min_level), sink_(std::move(sink)) {}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::min_level() const {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::write(LogLevel level, std::string_view msg) {
    std::lock_guard lock(mutex_);
    if (level < min_level_) return;

    if (sink_) {
        sink_(level, msg);
        return;
    }
    std::println(stderr, "[holdtalk] {}: {}", to_string(level), msg);
}
