/**
 * @file indexed_merkle_tree.hpp
 * @brief Indexed Merkle Tree
 *
 * Листья образуют отсортированный по value односвязный список
 * (next_leaf_index, 0 - конец списка) и одновременно нижний уровень
 * двоичного Merkle дерева. Лист 0 {value 0, next 0} создаётся при
 * инициализации.
 *
 * Непринадлежность значения доказывается через low leaf:
 *   low.value < value && (low.next == 0 || leaf[low.next].value > value)
 *
 * Хеши (SHA256):
 *   leaf = sha256(active(1) || index(32 BE) || value(32) || next(32 BE))
 *   node = sha256(left || right)
 * Отсутствующий правый сосед заменяется хешем пустого поддерева
 * соответствующего уровня.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/bytes32.hpp"

#include <mutex>
#include <vector>

namespace arbor::trees {

using core::Bytes32;

/**
 * @brief Данные листа
 */
struct IndexedLeaf {
    Bytes32 value;
    uint64_t next_leaf_index{0};
};

/**
 * @brief Доказательство для листа
 *
 * existence == false означает, что лист является low leaf для
 * запрошенного значения. value и next_leaf_index - данные самого листа.
 */
struct IndexedProof {
    Bytes32 root;
    std::vector<Bytes32> siblings;
    bool existence{false};
    uint64_t index{0};
    Bytes32 value;
    uint64_t next_leaf_index{0};
};

/**
 * @brief Indexed Merkle Tree (только добавление)
 */
class IndexedMerkleTree {
public:
    IndexedMerkleTree() = default;

    IndexedMerkleTree(const IndexedMerkleTree&) = delete;
    IndexedMerkleTree& operator=(const IndexedMerkleTree&) = delete;

    /**
     * @brief Инициализировать дерево нулевым листом
     */
    [[nodiscard]] Result<void> initialize();

    /**
     * @brief Добавить значение
     *
     * @param value Новое значение
     * @param low_leaf_index Индекс low leaf для value
     * @return Result<uint64_t> Индекс нового листа
     */
    [[nodiscard]] Result<uint64_t> add(const Bytes32& value, uint64_t low_leaf_index);

    /**
     * @brief Построить доказательство
     *
     * @param index Индекс листа
     * @param value Значение, для которого строится доказательство
     * @return Result<IndexedProof> InvalidProofIndex если лист не содержит
     *         value и не является для него low leaf
     */
    [[nodiscard]] Result<IndexedProof> get_proof(uint64_t index, const Bytes32& value) const;

    /**
     * @brief Вычислить корень из доказательства
     */
    [[nodiscard]] static Bytes32 process_proof(const IndexedProof& proof);

    /**
     * @brief Проверить доказательство против текущего корня
     */
    [[nodiscard]] bool verify_proof(const IndexedProof& proof) const;

    /**
     * @brief Найти low leaf для значения (линейный поиск)
     *
     * @return Result<uint64_t> InvalidLowLeaf если значение уже есть
     */
    [[nodiscard]] Result<uint64_t> find_low_leaf(const Bytes32& value) const;

    // =========================================================================
    // Геттеры
    // =========================================================================

    [[nodiscard]] Bytes32 get_root() const;
    [[nodiscard]] Result<IndexedLeaf> get_leaf_data(uint64_t index) const;

    /**
     * @brief Хеш узла (0 для несуществующего)
     */
    [[nodiscard]] Bytes32 get_node_hash(uint64_t index, uint64_t level) const;

    [[nodiscard]] uint64_t get_levels_count() const;
    [[nodiscard]] uint64_t get_leaves_count() const;
    [[nodiscard]] uint64_t get_level_nodes_count(uint64_t level) const;
    [[nodiscard]] bool is_initialized() const;

    /**
     * @brief Хеш листа
     */
    [[nodiscard]] static Bytes32 hash_leaf(
        bool active,
        uint64_t index,
        const Bytes32& value,
        uint64_t next_leaf_index
    );

    /**
     * @brief Хеш внутреннего узла
     */
    [[nodiscard]] static Bytes32 hash_node(const Bytes32& left, const Bytes32& right);

    /**
     * @brief Хеш пустого поддерева высоты level
     */
    [[nodiscard]] static const Bytes32& zero_hash(std::size_t level);

private:
    [[nodiscard]] bool is_low_leaf(uint64_t index, const Bytes32& value) const;
    [[nodiscard]] Bytes32 calculate_node_hash(uint64_t index, std::size_t level) const;

    void set_node(std::size_t level, uint64_t index, const Bytes32& hash);
    void update_path(uint64_t leaf_index);
    void push_leaf(uint64_t leaf_index, const IndexedLeaf& leaf);

    mutable std::mutex mutex_;

    std::vector<IndexedLeaf> leaves_;
    std::vector<std::vector<Bytes32>> levels_;
    std::size_t levels_count_{0};
};

} // namespace arbor::trees
