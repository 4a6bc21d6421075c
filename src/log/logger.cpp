/**
 * @file logger.cpp
 * @brief Реализация логгера
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace arbor::log {

std::optional<LogLevel> parse_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

// =============================================================================
// Singleton
// =============================================================================

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

// =============================================================================
// Конфигурация
// =============================================================================

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    level_.store(config.level, std::memory_order_relaxed);
}

void Logger::set_callback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool Logger::enabled(LogLevel level) const noexcept {
    return level >= level_.load(std::memory_order_relaxed);
}

uint64_t Logger::get_messages_count() const noexcept {
    return messages_count_.load(std::memory_order_relaxed);
}

// =============================================================================
// Запись
// =============================================================================

void Logger::write(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    messages_count_++;

    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (config_.console_output) {
            log_to_console(level, component, message);
        }
        callback = callback_;
    }

    // Вне блокировки: callback может писать в лог
    if (callback) {
        callback(level, component, message);
    }
}

void Logger::log_to_console(LogLevel level, std::string_view component, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << level_to_string(level) << "] ";
    ss << "[" << component << "] ";
    ss << message;

    // Диагностика идёт в stderr, чтобы не смешиваться с выводом команд
    if (!config_.color) {
        std::cerr << ss.str() << std::endl;
        return;
    }

    switch (level) {
        case LogLevel::Debug:
            std::cerr << "\033[90m" << ss.str() << "\033[0m" << std::endl;
            break;
        case LogLevel::Info:
            std::cerr << "\033[32m" << ss.str() << "\033[0m" << std::endl;
            break;
        case LogLevel::Warning:
            std::cerr << "\033[33m" << ss.str() << "\033[0m" << std::endl;
            break;
        case LogLevel::Error:
            std::cerr << "\033[31m" << ss.str() << "\033[0m" << std::endl;
            break;
    }
}

} // namespace arbor::log
