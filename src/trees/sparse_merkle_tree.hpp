/**
 * @file sparse_merkle_tree.hpp
 * @brief Sparse Merkle Tree фиксированной максимальной глубины
 *
 * Двоичный бор по битам 32-байтного индекса. Бит d индекса (начиная с
 * младшего) выбирает потомка на глубине d: 0 - левый, 1 - правый.
 *
 * Хеши узлов:
 *   Empty  -> 0
 *   Leaf   -> hash3(index, value, 1)
 *   Middle -> hash2(left_hash, right_hash)
 *
 * Повторное add() с тем же индексом заменяет значение.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/bytes32.hpp"
#include "../crypto/hash_provider.hpp"
#include "node_store.hpp"

#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace arbor::trees {

using core::Bytes32;

/**
 * @brief Тип узла Sparse дерева
 */
enum class SparseNodeType : uint8_t {
    Empty = 0,
    Leaf = 1,
    Middle = 2
};

[[nodiscard]] constexpr std::string_view node_type_to_string(SparseNodeType type) noexcept {
    switch (type) {
        case SparseNodeType::Empty:  return "empty";
        case SparseNodeType::Leaf:   return "leaf";
        case SparseNodeType::Middle: return "middle";
        default: return "unknown";
    }
}

/**
 * @brief Узел Sparse дерева
 */
struct SparseNode {
    SparseNodeType node_type{SparseNodeType::Empty};
    NodeId child_left{0};
    NodeId child_right{0};
    Bytes32 node_hash;

    /// @brief Индекс листа
    Bytes32 key;

    /// @brief Значение листа
    Bytes32 value;

    [[nodiscard]] bool empty() const noexcept {
        return node_type == SparseNodeType::Empty;
    }
};

/**
 * @brief Доказательство для индекса
 *
 * siblings[d] - хеш непосещённого потомка Middle узла на глубине d.
 * Если путь заканчивается листом с другим индексом, этот лист
 * раскрывается через aux_* поля.
 */
struct SparseProof {
    Bytes32 root;
    std::vector<Bytes32> siblings;
    bool existence{false};
    Bytes32 index;
    Bytes32 value;
    bool aux_existence{false};
    Bytes32 aux_index;
    Bytes32 aux_value;
};

/**
 * @brief Sparse Merkle Tree
 *
 * Все публичные методы потокобезопасны. Любая ошибка оставляет дерево
 * без изменений.
 */
class SparseMerkleTree {
public:
    SparseMerkleTree();

    SparseMerkleTree(const SparseMerkleTree&) = delete;
    SparseMerkleTree& operator=(const SparseMerkleTree&) = delete;

    // =========================================================================
    // Конфигурация
    // =========================================================================

    /**
     * @brief Инициализировать дерево
     *
     * @param max_depth Максимальная глубина листа (1..256)
     */
    [[nodiscard]] Result<void> initialize(uint32_t max_depth);

    /**
     * @brief Увеличить максимальную глубину
     *
     * @return Result<void> DepthCanOnlyIncrease если new_depth <= текущей
     */
    [[nodiscard]] Result<void> set_max_depth(uint32_t new_depth);

    /**
     * @brief Установить хеш-функцию (только для пустого дерева)
     */
    [[nodiscard]] Result<void> set_hasher(std::shared_ptr<const crypto::HashProvider> hasher);

    // =========================================================================
    // Изменение
    // =========================================================================

    /**
     * @brief Добавить или заменить значение по индексу
     *
     * @return Result<void> NotInitialized или MaxDepthReached при ошибке
     */
    [[nodiscard]] Result<void> add(const Bytes32& index, const Bytes32& value);

    /**
     * @brief Заменить значение существующего листа
     *
     * @return Result<void> KeyNotFound если листа с индексом нет
     */
    [[nodiscard]] Result<void> update(const Bytes32& index, const Bytes32& value);

    // =========================================================================
    // Чтение
    // =========================================================================

    [[nodiscard]] SparseProof get_proof(const Bytes32& index) const;
    [[nodiscard]] Bytes32 get_root() const;
    [[nodiscard]] SparseNode get_node(NodeId id) const;

    /**
     * @brief Лист по индексу (пустой узел если листа нет)
     */
    [[nodiscard]] SparseNode get_node_by_index(const Bytes32& index) const;

    [[nodiscard]] uint32_t get_max_depth() const;
    [[nodiscard]] uint64_t get_nodes_count() const;
    [[nodiscard]] NodeId get_root_id() const;
    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] bool is_custom_hasher_set() const;
    [[nodiscard]] std::shared_ptr<const crypto::HashProvider> get_hasher() const;

private:
    NodeId add_node(NodeId node_id, const Bytes32& index, const Bytes32& value, uint32_t depth);
    NodeId push_leaf(NodeId new_leaf, NodeId old_leaf, uint32_t depth);

    [[nodiscard]] SparseNode make_leaf(const Bytes32& index, const Bytes32& value) const;
    [[nodiscard]] NodeId find_leaf(const Bytes32& index) const;

    /**
     * @brief Проверить, поместится ли индекс в дерево
     *
     * Находит лист, который придётся опустить, и глубину, на которой
     * разойдутся биты индексов.
     */
    [[nodiscard]] Result<void> check_depth(const Bytes32& index) const;

    mutable std::mutex mutex_;

    NodeStore<SparseNode> store_;
    NodeId root_id_{0};

    bool initialized_{false};
    uint32_t max_depth_{0};

    std::shared_ptr<const crypto::HashProvider> hasher_;
    bool custom_hasher_{false};
};

} // namespace arbor::trees
