/**
 * @file config.hpp
 * @brief Конфигурация Arbor
 *
 * Загрузка и парсинг конфигурации из TOML файла. Все секции и ключи
 * необязательны: отсутствующие значения берутся по умолчанию.
 *
 * Пример конфигурации (arbor.toml):
 * @code
 * [cartesian]
 * desired_proof_size = 40
 *
 * [sparse]
 * max_depth = 20
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace arbor {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки Cartesian дерева
 */
struct CartesianConfig {
    /// @brief Размер доказательства по умолчанию
    uint32_t desired_proof_size = constants::DEFAULT_CARTESIAN_PROOF_SIZE;
};

/**
 * @brief Настройки Sparse дерева
 */
struct SparseConfig {
    /// @brief Максимальная глубина
    uint32_t max_depth = constants::DEFAULT_SPARSE_MAX_DEPTH;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень: debug, info, warn, error
    std::string level = "info";

    /// @brief Цветной вывод
    bool color = true;
};

/**
 * @brief Полная конфигурация Arbor
 */
struct Config {
    CartesianConfig cartesian;
    SparseConfig sparse;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из TOML текста
     *
     * @param content Содержимое файла
     * @return Result<Config> Конфигурация или ConfigParseError
     */
    [[nodiscard]] static Result<Config> parse(std::string_view content);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./arbor.toml
     * 3. /etc/arbor/arbor.toml
     * 4. ~/.config/arbor/arbor.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * - desired_proof_size > 0
     * - max_depth в диапазоне 1..256
     * - известный уровень логирования
     *
     * @return Result<void> Успех или ConfigInvalidValue
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace arbor
