/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <vector>

namespace arbor {

namespace {

/**
 * @brief Прочитать неотрицательное целое, не выходящее за uint32_t
 */
Result<void> read_u32(const toml::table& section, std::string_view key,
                      std::string_view section_name, uint32_t& out) {
    auto node = section[key];
    if (!node) {
        return {};
    }

    auto val = node.value<int64_t>();
    if (!val || *val < 0 || *val > static_cast<int64_t>(UINT32_MAX)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("{}.{} должен быть неотрицательным целым", section_name, key)
        );
    }

    out = static_cast<uint32_t>(*val);
    return {};
}

Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [cartesian] ===
    if (auto cartesian = table["cartesian"].as_table()) {
        auto res = read_u32(*cartesian, "desired_proof_size", "cartesian",
                            config.cartesian.desired_proof_size);
        if (!res) {
            return std::unexpected(res.error());
        }
    }

    // === Секция [sparse] ===
    if (auto sparse = table["sparse"].as_table()) {
        auto res = read_u32(*sparse, "max_depth", "sparse", config.sparse.max_depth);
        if (!res) {
            return std::unexpected(res.error());
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view content) {
    try {
        auto table = toml::parse(content);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("arbor.toml");
    search_paths.push_back("/etc/arbor/arbor.toml");

    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "arbor" / "arbor.toml"
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            log::debug("Config", std::format("Найден файл {}", search_path.string()));
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (cartesian.desired_proof_size == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "cartesian.desired_proof_size должен быть больше 0"
        );
    }

    if (sparse.max_depth == 0 || sparse.max_depth > constants::SPARSE_MAX_DEPTH_HARD_CAP) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("sparse.max_depth должен быть от 1 до {}",
                        constants::SPARSE_MAX_DEPTH_HARD_CAP)
        );
    }

    if (!log::parse_level(logging.level)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный уровень логирования '{}'", logging.level)
        );
    }

    return {};
}

} // namespace arbor
