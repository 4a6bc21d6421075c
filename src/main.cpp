/**
 * @file main.cpp
 * @brief Точка входа arbor-cli
 *
 * Выполняет команды над Cartesian, Sparse и Indexed деревьями из
 * stdin или из файла сценария.
 *
 * Использование:
 *   arbor-cli [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -s, --script PATH    Файл с командами (по умолчанию stdin)
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 *   --test-config        Проверить конфигурацию и выйти
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "cli/command_runner.hpp"
#include "log/logger.hpp"

#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
Arbor v)" << VERSION << R"(
Аутентифицированные Merkle деревья: Cartesian, Sparse, Indexed

ИСПОЛЬЗОВАНИЕ:
    arbor-cli [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (arbor.toml)
    -s, --script PATH    Файл с командами (по умолчанию stdin)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти

КОМАНДЫ:
    cmt add|remove|proof <key>
    cmt root|count
    smt add|update <index> <value>
    smt proof <index>
    smt root|count
    imt add <value> [low]
    imt proof <index> <value>
    imt root|count

ПРИМЕРЫ:
    echo "cmt add 0x05" | arbor-cli
    arbor-cli -c /etc/arbor/arbor.toml -s commands.txt

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "Arbor v" << VERSION << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> script_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-s" || arg == "--script") && i + 1 < argc) {
            args.script_path = argv[++i];
        }
    }

    return args;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace arbor;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Конфигурация необязательна: без файла работаем со значениями по умолчанию
    Config config;

    auto config_result = args.config_path
        ? Config::load(*args.config_path)
        : Config::load_with_search();

    if (config_result) {
        config = *config_result;
    } else if (args.config_path || config_result.error().code != ErrorCode::ConfigNotFound) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    log::LoggerConfig logger_config;
    logger_config.level = log::parse_level(config.logging.level).value_or(log::LogLevel::Info);
    logger_config.color = config.logging.color;
    log::Logger::instance().configure(logger_config);

    if (args.test_config) {
        std::cout << "Конфигурация корректна" << std::endl;
        return 0;
    }

    cli::CommandRunner runner(config);

    auto init = runner.init();
    if (!init) {
        log::error("main", init.error().message);
        return 1;
    }

    if (args.script_path) {
        std::ifstream script(*args.script_path);
        if (!script) {
            log::error("main", std::format("Не удалось открыть файл {}", *args.script_path));
            return 1;
        }
        return runner.run(script, std::cout);
    }

    return runner.run(std::cin, std::cout);
}
