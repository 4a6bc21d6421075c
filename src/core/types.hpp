/**
 * @file types.hpp
 * @brief Базовые типы Arbor
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256 / ByteSpan: сырые байты для SHA256
 * - NodeId: идентификатор узла в арене
 * - ErrorCode / Error: коды ошибок деревьев и окружения
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ошибки деревьев возвращаются как значения: операция либо
 *       выполняется целиком, либо не меняет состояние дерева.
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace arbor {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта) в сыром виде
 *
 * Используется как выход SHA256. Для ключей, значений и хешей узлов
 * деревьев используется core::Bytes32.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Идентификатор узла в арене (0 - пустой узел)
 */
using NodeId = uint64_t;

// =============================================================================
// Коды ошибок Arbor
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки жизненного цикла и параметров дерева (100-199)
    AlreadyInitialized = 100,
    NotInitialized = 101,
    InvalidProofSize = 102,
    InvalidDepth = 103,
    DepthCanOnlyIncrease = 104,
    DepthExceedsHardCap = 105,
    TreeNotEmpty = 106,

    // Ошибки данных (200-299)
    ZeroKey = 200,
    DuplicateKey = 201,
    KeyNotFound = 202,
    InvalidLowLeaf = 203,
    MaxDepthReached = 204,
    ProofTooLarge = 205,
    InvalidProofIndex = 206,
    IndexOutOfBounds = 207,

    // Ошибки конфигурации (300-399)
    ConfigNotFound = 300,
    ConfigParseError = 301,
    ConfigInvalidValue = 302,

    // Ошибки командной строки (400-499)
    CommandParseError = 400,
    UnknownCommand = 401,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::AlreadyInitialized: return "Дерево уже инициализировано";
        case ErrorCode::NotInitialized: return "Дерево не инициализировано";
        case ErrorCode::InvalidProofSize: return "Размер доказательства должен быть больше нуля";
        case ErrorCode::InvalidDepth: return "Максимальная глубина должна быть больше нуля";
        case ErrorCode::DepthCanOnlyIncrease: return "Новая максимальная глубина должна быть больше текущей";
        case ErrorCode::DepthExceedsHardCap: return "Максимальная глубина превышает предел";
        case ErrorCode::TreeNotEmpty: return "Дерево не пустое";
        case ErrorCode::ZeroKey: return "Ключ не может быть нулевым";
        case ErrorCode::DuplicateKey: return "Ключ уже существует";
        case ErrorCode::KeyNotFound: return "Узел не существует";
        case ErrorCode::InvalidLowLeaf: return "Некорректный low leaf";
        case ErrorCode::MaxDepthReached: return "Достигнута максимальная глубина";
        case ErrorCode::ProofTooLarge: return "Желаемый размер доказательства слишком мал";
        case ErrorCode::InvalidProofIndex: return "Некорректный индекс для доказательства";
        case ErrorCode::IndexOutOfBounds: return "Индекс вне диапазона";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::CommandParseError: return "Ошибка разбора команды";
        case ErrorCode::UnknownCommand: return "Неизвестная команда";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Пример использования:
 * @code
 * auto result = tree.add(key);
 * if (!result) {
 *     std::cerr << result.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace arbor
