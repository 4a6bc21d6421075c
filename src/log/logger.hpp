/**
 * @file logger.hpp
 * @brief Логирование Arbor
 *
 * Предоставляет:
 * - Уровни сообщений (debug, info, warning, error)
 * - Вывод в консоль с временной меткой и ANSI цветами
 * - Callback для внешних обработчиков (например, в тестах)
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace arbor::log {

// =============================================================================
// Уровни логирования
// =============================================================================

/**
 * @brief Уровень сообщения
 */
enum class LogLevel {
    Debug,     ///< Подробности операций над деревьями
    Info,      ///< Жизненный цикл деревьев
    Warning,   ///< Отклонённые изменения параметров
    Error      ///< Ошибки окружения
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из строки конфигурации ("debug", "info", "warn", "error")
 */
[[nodiscard]] std::optional<LogLevel> parse_level(std::string_view name) noexcept;

/**
 * @brief Callback для внешних обработчиков
 *
 * @param level Уровень
 * @param component Компонент-источник
 * @param message Сообщение
 */
using LogCallback = std::function<void(LogLevel level, std::string_view component, std::string_view message)>;

/**
 * @brief Конфигурация логгера
 */
struct LoggerConfig {
    /// @brief Минимальный уровень для вывода
    LogLevel level{LogLevel::Info};

    /// @brief Включить вывод в консоль
    bool console_output{true};

    /// @brief Включить ANSI цвета
    bool color{true};
};

// =============================================================================
// Logger
// =============================================================================

/**
 * @brief Логгер (единственный экземпляр на процесс)
 */
class Logger {
public:
    /**
     * @brief Получить единственный экземпляр
     */
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Установить конфигурацию
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Установить callback (пустой - отключить)
     */
    void set_callback(LogCallback callback);

    /**
     * @brief Записать сообщение
     *
     * @param level Уровень
     * @param component Компонент-источник ("CartesianMerkleTree", "cli", ...)
     * @param message Сообщение
     */
    void write(LogLevel level, std::string_view component, std::string_view message);

    /**
     * @brief Проверить, будет ли выведен уровень
     */
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    /**
     * @brief Количество выведенных сообщений
     */
    [[nodiscard]] uint64_t get_messages_count() const noexcept;

private:
    Logger() = default;
    ~Logger() = default;

    void log_to_console(LogLevel level, std::string_view component, std::string_view message);

    LoggerConfig config_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    LogCallback callback_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> messages_count_{0};
};

// =============================================================================
// Короткие функции
// =============================================================================

inline void debug(std::string_view component, std::string_view message) {
    Logger::instance().write(LogLevel::Debug, component, message);
}

inline void info(std::string_view component, std::string_view message) {
    Logger::instance().write(LogLevel::Info, component, message);
}

inline void warn(std::string_view component, std::string_view message) {
    Logger::instance().write(LogLevel::Warning, component, message);
}

inline void error(std::string_view component, std::string_view message) {
    Logger::instance().write(LogLevel::Error, component, message);
}

} // namespace arbor::log
