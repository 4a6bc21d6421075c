/**
 * @file proof_verifier.cpp
 * @brief Реализация проверки доказательств
 */

#include "proof_verifier.hpp"

#include <format>

namespace arbor::trees {

namespace {

Bytes32 hash_sorted(
    const crypto::HashProvider& hasher,
    const Bytes32& key,
    const Bytes32& a,
    const Bytes32& b
) {
    if (a > b) {
        return hasher.hash3(key, b, a);
    }
    return hasher.hash3(key, a, b);
}

} // anonymous namespace

// =============================================================================
// Cartesian
// =============================================================================

Result<Bytes32> compute_cartesian_root(
    const CartesianProof& proof,
    const crypto::HashProvider& hasher
) {
    const uint64_t length = proof.siblings_length;

    if (length == 0) {
        // Пустое дерево
        return Bytes32{};
    }
    if (length % 2 != 0 || length > proof.siblings.size()) {
        return Err<Bytes32>(ErrorCode::ProofTooLarge,
                            std::format("Некорректная длина доказательства {} из {}",
                                        length, proof.siblings.size()));
    }

    const Bytes32& node_key = proof.existence ? proof.key : proof.non_existence_key;

    Bytes32 computed = hash_sorted(hasher, node_key,
                                   proof.siblings[length - 2],
                                   proof.siblings[length - 1]);

    for (uint64_t i = length - 2; i >= 2; i -= 2) {
        const Bytes32& key = proof.siblings[i - 2];
        const Bytes32& sibling = proof.siblings[i - 1];
        computed = hash_sorted(hasher, key, computed, sibling);
    }

    return computed;
}

bool verify_cartesian_proof(
    const CartesianProof& proof,
    const crypto::HashProvider& hasher
) {
    if (!proof.existence && proof.siblings_length != 0) {
        const uint64_t length = proof.siblings_length;
        if (proof.non_existence_key == proof.key ||
            length % 2 != 0 || length > proof.siblings.size()) {
            return false;
        }

        // Потомок конечного узла на стороне key должен быть пустым
        const Bytes32& child = proof.key < proof.non_existence_key
            ? proof.siblings[length - 2]
            : proof.siblings[length - 1];
        if (!child.is_zero()) {
            return false;
        }
    }

    auto root = compute_cartesian_root(proof, hasher);
    if (!root) {
        return false;
    }
    return *root == proof.root;
}

// =============================================================================
// Sparse
// =============================================================================

Bytes32 compute_sparse_root(
    const SparseProof& proof,
    const crypto::HashProvider& hasher
) {
    Bytes32 computed;
    if (proof.existence) {
        computed = hasher.hash3(proof.index, proof.value, Bytes32::one());
    } else if (proof.aux_existence) {
        computed = hasher.hash3(proof.aux_index, proof.aux_value, Bytes32::one());
    }

    std::size_t levels = proof.siblings.size();
    while (levels > 0 && proof.siblings[levels - 1].is_zero()) {
        --levels;
    }

    for (std::size_t depth = levels; depth-- > 0;) {
        const Bytes32& sibling = proof.siblings[depth];
        if (proof.index.bit(depth)) {
            computed = hasher.hash2(sibling, computed);
        } else {
            computed = hasher.hash2(computed, sibling);
        }
    }

    return computed;
}

bool verify_sparse_proof(
    const SparseProof& proof,
    const crypto::HashProvider& hasher
) {
    if (proof.existence && proof.aux_existence) {
        return false;
    }
    if (proof.aux_existence && proof.aux_index == proof.index) {
        return false;
    }
    return compute_sparse_root(proof, hasher) == proof.root;
}

} // namespace arbor::trees
