/**
 * @file proof_verifier.hpp
 * @brief Проверка доказательств Cartesian и Sparse деревьев
 *
 * Функции не обращаются к дереву: корень восстанавливается только из
 * доказательства и хеш-функции, которой было построено дерево.
 */

#pragma once

#include "../crypto/hash_provider.hpp"
#include "cartesian_merkle_tree.hpp"
#include "sparse_merkle_tree.hpp"

namespace arbor::trees {

// =============================================================================
// Cartesian
// =============================================================================

/**
 * @brief Восстановить корень из доказательства Cartesian дерева
 *
 * Последняя пара siblings - хеши потомков конечного узла (его ключ
 * key или non_existence_key). Каждая предыдущая пара (k, s) поднимается
 * на уровень вверх: acc = hash3(k, min(acc, s), max(acc, s)).
 *
 * @return Result<Bytes32> ProofTooLarge если siblings_length некорректен
 */
[[nodiscard]] Result<Bytes32> compute_cartesian_root(
    const CartesianProof& proof,
    const crypto::HashProvider& hasher
);

/**
 * @brief Проверить доказательство против proof.root
 *
 * Для доказательства непринадлежности также требуется, чтобы
 * non_existence_key отличался от key.
 */
[[nodiscard]] bool verify_cartesian_proof(
    const CartesianProof& proof,
    const crypto::HashProvider& hasher
);

// =============================================================================
// Sparse
// =============================================================================

/**
 * @brief Восстановить корень из доказательства Sparse дерева
 *
 * Начальный хеш - лист index (existence), aux лист (aux_existence) или 0.
 * Свёртка идёт от самого глубокого ненулевого sibling к корню по битам
 * index.
 */
[[nodiscard]] Bytes32 compute_sparse_root(
    const SparseProof& proof,
    const crypto::HashProvider& hasher
);

/**
 * @brief Проверить доказательство против proof.root
 */
[[nodiscard]] bool verify_sparse_proof(
    const SparseProof& proof,
    const crypto::HashProvider& hasher
);

} // namespace arbor::trees
