/**
 * @file command_runner.hpp
 * @brief Выполнение текстовых команд над деревьями
 *
 * Одна строка - одна команда:
 *
 *   cmt add|remove|proof <key>     cmt root|count
 *   smt add|update <index> <value> smt proof <index>   smt root|count
 *   imt add <value> [low]          imt proof <index> <value>   imt root|count
 *
 * Ключи, индексы и значения Sparse дерева, значения Indexed дерева
 * задаются в hex (префикс 0x необязателен). Индексы листьев Indexed
 * дерева - десятичные числа.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../trees/cartesian_merkle_tree.hpp"
#include "../trees/sparse_merkle_tree.hpp"
#include "../trees/indexed_merkle_tree.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace arbor::cli {

/**
 * @brief Разбить строку на слова по пробельным символам
 */
[[nodiscard]] std::vector<std::string_view> tokenize(std::string_view line);

/**
 * @brief Исполнитель команд
 *
 * Владеет по одному дереву каждого типа.
 */
class CommandRunner {
public:
    explicit CommandRunner(const Config& config);

    /**
     * @brief Инициализировать деревья параметрами конфигурации
     */
    [[nodiscard]] Result<void> init();

    /**
     * @brief Выполнить одну команду
     *
     * @param line Строка команды
     * @return Result<std::string> Строка результата или ошибка
     */
    [[nodiscard]] Result<std::string> execute(std::string_view line);

    /**
     * @brief Выполнить поток команд
     *
     * Пустые строки и строки, начинающиеся с '#', пропускаются.
     * Ошибка выводится как "error: <сообщение>" и не прерывает выполнение.
     *
     * @return int 0 если все команды успешны, иначе 1
     */
    int run(std::istream& in, std::ostream& out);

    [[nodiscard]] const trees::CartesianMerkleTree& cartesian() const noexcept { return cartesian_; }
    [[nodiscard]] const trees::SparseMerkleTree& sparse() const noexcept { return sparse_; }
    [[nodiscard]] const trees::IndexedMerkleTree& indexed() const noexcept { return indexed_; }

private:
    using Args = std::vector<std::string_view>;

    [[nodiscard]] Result<std::string> execute_cartesian(const Args& args);
    [[nodiscard]] Result<std::string> execute_sparse(const Args& args);
    [[nodiscard]] Result<std::string> execute_indexed(const Args& args);

    Config config_;

    trees::CartesianMerkleTree cartesian_;
    trees::SparseMerkleTree sparse_;
    trees::IndexedMerkleTree indexed_;
};

} // namespace arbor::cli
