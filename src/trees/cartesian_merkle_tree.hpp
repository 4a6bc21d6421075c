/**
 * @file cartesian_merkle_tree.hpp
 * @brief Cartesian Merkle Tree (treap с Merkle коммитментом)
 *
 * Двоичное дерево поиска по 32-байтным ключам, одновременно являющееся
 * max-кучей по детерминированному приоритету узла:
 *
 *   priority = старшие 16 байт hash1(key)
 *
 * Форма дерева зависит только от набора ключей, поэтому корень не
 * зависит от порядка вставки. Хеш каждого узла:
 *
 *   merkle_hash = hash3(key, min(left_hash, right_hash), max(left_hash, right_hash))
 *
 * Хеши потомков сортируются, поэтому доказательство не зависит от того,
 * слева или справа находится соседнее поддерево.
 *
 * Ключ 0 зарезервирован за пустым узлом.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/bytes32.hpp"
#include "../crypto/hash_provider.hpp"
#include "node_store.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace arbor::trees {

using core::Bytes32;
using core::Priority;

/**
 * @brief Узел Cartesian дерева
 */
struct CartesianNode {
    /// @brief Ключ (0 - пустой узел)
    Bytes32 key;

    /// @brief Приоритет кучи
    Priority priority{};

    /// @brief Левый потомок (0 - нет)
    NodeId child_left{0};

    /// @brief Правый потомок (0 - нет)
    NodeId child_right{0};

    /// @brief Коммитмент поддерева
    Bytes32 merkle_hash;

    [[nodiscard]] bool empty() const noexcept { return key.is_zero(); }
};

/**
 * @brief Доказательство (не)принадлежности ключа
 *
 * siblings заполняется парами от корня вниз:
 * - (key узла, хеш соседнего поддерева) для каждого пройденного узла;
 * - последняя пара - хеши потомков конечного узла.
 * Неиспользованные элементы равны нулю.
 */
struct CartesianProof {
    Bytes32 root;
    std::vector<Bytes32> siblings;
    uint64_t siblings_length{0};
    bool existence{false};
    Bytes32 key;

    /// @brief Ключ узла, на котором оборвался поиск (если existence == false)
    Bytes32 non_existence_key;
};

/**
 * @brief Cartesian Merkle Tree
 *
 * Все публичные методы потокобезопасны (мьютекс на экземпляр).
 * Любая ошибка оставляет дерево без изменений.
 */
class CartesianMerkleTree {
public:
    CartesianMerkleTree();

    CartesianMerkleTree(const CartesianMerkleTree&) = delete;
    CartesianMerkleTree& operator=(const CartesianMerkleTree&) = delete;

    // =========================================================================
    // Конфигурация
    // =========================================================================

    /**
     * @brief Инициализировать дерево
     *
     * @param desired_proof_size Размер массива siblings по умолчанию (> 0)
     * @return Result<void> AlreadyInitialized или InvalidProofSize при ошибке
     */
    [[nodiscard]] Result<void> initialize(uint32_t desired_proof_size);

    /**
     * @brief Изменить размер доказательства по умолчанию
     */
    [[nodiscard]] Result<void> set_desired_proof_size(uint32_t desired_proof_size);

    /**
     * @brief Установить хеш-функцию
     *
     * Разрешено только пока в дереве нет узлов. nullptr возвращает
     * хешер по умолчанию.
     *
     * @return Result<void> TreeNotEmpty если узлы уже есть
     */
    [[nodiscard]] Result<void> set_hasher(std::shared_ptr<const crypto::HashProvider> hasher);

    // =========================================================================
    // Изменение
    // =========================================================================

    /**
     * @brief Добавить ключ
     *
     * @return Result<void> NotInitialized, ZeroKey или DuplicateKey при ошибке
     */
    [[nodiscard]] Result<void> add(const Bytes32& key);

    /**
     * @brief Удалить ключ
     *
     * На пустом дереве ничего не делает и возвращает успех.
     *
     * @return Result<void> NotInitialized, ZeroKey или KeyNotFound при ошибке
     */
    [[nodiscard]] Result<void> remove(const Bytes32& key);

    // =========================================================================
    // Чтение
    // =========================================================================

    /**
     * @brief Построить доказательство для ключа
     *
     * @param key Ключ
     * @param desired_proof_size Размер siblings (0 - размер по умолчанию)
     * @return Result<CartesianProof> ProofTooLarge если пути не хватает места
     */
    [[nodiscard]] Result<CartesianProof> get_proof(
        const Bytes32& key,
        uint32_t desired_proof_size = 0
    ) const;

    /**
     * @brief Корневой коммитмент (0 для пустого дерева)
     */
    [[nodiscard]] Bytes32 get_root() const;

    /**
     * @brief Узел по id (пустой узел для 0 и удалённых id)
     */
    [[nodiscard]] CartesianNode get_node(NodeId id) const;

    /**
     * @brief Узел по ключу (пустой узел если ключа нет)
     */
    [[nodiscard]] CartesianNode get_node_by_key(const Bytes32& key) const;

    /**
     * @brief Количество живых узлов
     */
    [[nodiscard]] uint64_t get_nodes_count() const;

    [[nodiscard]] uint32_t get_desired_proof_size() const;
    [[nodiscard]] NodeId get_root_id() const;
    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] bool is_custom_hasher_set() const;
    [[nodiscard]] std::shared_ptr<const crypto::HashProvider> get_hasher() const;

    /**
     * @brief Приоритет, который получит ключ
     */
    [[nodiscard]] Priority priority_of(const Bytes32& key) const;

private:
    NodeId insert_node(NodeId root_id, const Bytes32& key, const Priority& priority);
    NodeId remove_node(NodeId root_id, const Bytes32& key);

    NodeId rotate_left(NodeId node_id);
    NodeId rotate_right(NodeId node_id);

    void update_hash(NodeId node_id);
    [[nodiscard]] Bytes32 hash_children(const Bytes32& key, NodeId left, NodeId right) const;
    [[nodiscard]] NodeId find(const Bytes32& key) const;

    mutable std::mutex mutex_;

    NodeStore<CartesianNode> store_;
    NodeId root_id_{0};

    bool initialized_{false};
    uint32_t desired_proof_size_{0};

    std::shared_ptr<const crypto::HashProvider> hasher_;
    bool custom_hasher_{false};
};

} // namespace arbor::trees
