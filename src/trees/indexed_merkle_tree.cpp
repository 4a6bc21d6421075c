/**
 * @file indexed_merkle_tree.cpp
 * @brief Реализация Indexed Merkle Tree
 */

#include "indexed_merkle_tree.hpp"
#include "../core/constants.hpp"
#include "../crypto/sha256.hpp"
#include "../log/logger.hpp"

#include <format>

namespace arbor::trees {

namespace {

constexpr std::string_view COMPONENT = "IndexedMerkleTree";

std::vector<Bytes32> build_zero_hashes() {
    std::vector<Bytes32> hashes;
    hashes.reserve(constants::INDEXED_MAX_LEVELS + 1);

    Bytes32 current = IndexedMerkleTree::hash_leaf(false, 0, Bytes32{}, 0);
    hashes.push_back(current);

    for (std::size_t i = 1; i <= constants::INDEXED_MAX_LEVELS; ++i) {
        current = IndexedMerkleTree::hash_node(current, current);
        hashes.push_back(current);
    }

    return hashes;
}

} // anonymous namespace

// =============================================================================
// Хеширование
// =============================================================================

Bytes32 IndexedMerkleTree::hash_leaf(
    bool active,
    uint64_t index,
    const Bytes32& value,
    uint64_t next_leaf_index
) {
    const Bytes32 index_bytes{index};
    const Bytes32 next_bytes{next_leaf_index};

    crypto::Sha256 hasher;
    hasher.write_byte(active ? 1 : 0)
          .write(index_bytes.bytes())
          .write(value.bytes())
          .write(next_bytes.bytes());

    return Bytes32{hasher.finalize()};
}

Bytes32 IndexedMerkleTree::hash_node(const Bytes32& left, const Bytes32& right) {
    crypto::Sha256 hasher;
    hasher.write(left.bytes()).write(right.bytes());
    return Bytes32{hasher.finalize()};
}

const Bytes32& IndexedMerkleTree::zero_hash(std::size_t level) {
    static const std::vector<Bytes32> hashes = build_zero_hashes();
    return hashes.at(level);
}

// =============================================================================
// Изменение
// =============================================================================

Result<void> IndexedMerkleTree::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (levels_count_ != 0) {
        return Err<void>(ErrorCode::AlreadyInitialized);
    }

    levels_count_ = 1;
    levels_.resize(1);
    push_leaf(0, IndexedLeaf{});

    log::info(COMPONENT, std::format("Инициализировано, корень {}", levels_[0][0].to_hex()));
    return {};
}

Result<uint64_t> IndexedMerkleTree::add(const Bytes32& value, uint64_t low_leaf_index) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (levels_count_ == 0) {
        return Err<uint64_t>(ErrorCode::NotInitialized);
    }
    if (low_leaf_index >= leaves_.size()) {
        return Err<uint64_t>(ErrorCode::IndexOutOfBounds,
                             std::format("Лист {} не существует", low_leaf_index));
    }
    if (!is_low_leaf(low_leaf_index, value)) {
        return Err<uint64_t>(ErrorCode::InvalidLowLeaf,
                             std::format("Лист {} не является low leaf для {}",
                                         low_leaf_index, value.to_hex()));
    }
    const uint64_t new_index = leaves_.size();

    IndexedLeaf leaf;
    leaf.value = value;
    leaf.next_leaf_index = leaves_[low_leaf_index].next_leaf_index;

    leaves_[low_leaf_index].next_leaf_index = new_index;
    update_path(low_leaf_index);

    push_leaf(new_index, leaf);

    if (log::Logger::instance().enabled(log::LogLevel::Debug)) {
        log::debug(COMPONENT, std::format("add {} (low {}) -> лист {}", value.to_hex(),
                                          low_leaf_index, new_index));
    }
    return new_index;
}

bool IndexedMerkleTree::is_low_leaf(uint64_t index, const Bytes32& value) const {
    const IndexedLeaf& leaf = leaves_[index];

    if (!(leaf.value < value)) {
        return false;
    }
    return leaf.next_leaf_index == 0 || leaves_[leaf.next_leaf_index].value > value;
}

Bytes32 IndexedMerkleTree::calculate_node_hash(uint64_t index, std::size_t level) const {
    const std::size_t children_level = level - 1;
    const auto& children = levels_[children_level];

    const uint64_t left = index * 2;
    const uint64_t right = index * 2 + 1;

    const Bytes32& right_hash = right < children.size() ? children[right] : zero_hash(children_level);
    return hash_node(children[left], right_hash);
}

void IndexedMerkleTree::set_node(std::size_t level, uint64_t index, const Bytes32& hash) {
    auto& nodes = levels_[level];
    if (index == nodes.size()) {
        nodes.push_back(hash);
    } else {
        nodes[index] = hash;
    }
}

void IndexedMerkleTree::update_path(uint64_t leaf_index) {
    uint64_t level_index = leaf_index;

    for (std::size_t level = 0; level < levels_count_; ++level) {
        Bytes32 hash;
        if (level == constants::INDEXED_LEAVES_LEVEL) {
            const IndexedLeaf& leaf = leaves_[level_index];
            hash = hash_leaf(true, level_index, leaf.value, leaf.next_leaf_index);
        } else {
            hash = calculate_node_hash(level_index, level);
        }

        set_node(level, level_index, hash);
        level_index /= 2;
    }
}

void IndexedMerkleTree::push_leaf(uint64_t leaf_index, const IndexedLeaf& leaf) {
    leaves_.push_back(leaf);

    uint64_t level_index = leaf_index;

    for (std::size_t level = 0; level < levels_count_; ++level) {
        Bytes32 hash;
        if (level == constants::INDEXED_LEAVES_LEVEL) {
            hash = hash_leaf(true, level_index, leaf.value, leaf.next_leaf_index);
        } else {
            hash = calculate_node_hash(level_index, level);
        }

        set_node(level, level_index, hash);

        // Второй узел на верхнем уровне - дерево растёт на уровень
        if (level + 1 == levels_count_ && levels_[level].size() > 1) {
            ++levels_count_;
            levels_.resize(levels_count_);
        }

        level_index /= 2;
    }
}

// =============================================================================
// Доказательства
// =============================================================================

Result<IndexedProof> IndexedMerkleTree::get_proof(uint64_t index, const Bytes32& value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (index >= leaves_.size()) {
        return Err<IndexedProof>(ErrorCode::IndexOutOfBounds,
                                 std::format("Лист {} не существует", index));
    }

    const IndexedLeaf& leaf = leaves_[index];

    IndexedProof proof;

    if (leaf.value == value) {
        proof.existence = true;
    } else if (is_low_leaf(index, value)) {
        proof.existence = false;
    } else {
        return Err<IndexedProof>(ErrorCode::InvalidProofIndex,
                                 std::format("Лист {} не подходит для {}", index, value.to_hex()));
    }

    uint64_t current = index;

    for (std::size_t level = 0; level + 1 < levels_count_; ++level) {
        const uint64_t sibling = (current % 2 != 0) ? current - 1 : current + 1;
        const auto& nodes = levels_[level];

        proof.siblings.push_back(sibling < nodes.size() ? nodes[sibling] : zero_hash(level));
        current /= 2;
    }

    proof.root = levels_[levels_count_ - 1][0];
    proof.index = index;
    proof.value = leaf.value;
    proof.next_leaf_index = leaf.next_leaf_index;

    return proof;
}

Bytes32 IndexedMerkleTree::process_proof(const IndexedProof& proof) {
    Bytes32 computed = hash_leaf(true, proof.index, proof.value, proof.next_leaf_index);

    for (std::size_t i = 0; i < proof.siblings.size(); ++i) {
        const bool right = i < 64 && ((proof.index >> i) & 1) != 0;
        if (right) {
            computed = hash_node(proof.siblings[i], computed);
        } else {
            computed = hash_node(computed, proof.siblings[i]);
        }
    }

    return computed;
}

bool IndexedMerkleTree::verify_proof(const IndexedProof& proof) const {
    return process_proof(proof) == get_root();
}

Result<uint64_t> IndexedMerkleTree::find_low_leaf(const Bytes32& value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (uint64_t i = 0; i < leaves_.size(); ++i) {
        if (is_low_leaf(i, value)) {
            return i;
        }
    }

    return Err<uint64_t>(ErrorCode::InvalidLowLeaf,
                         std::format("Нет low leaf для {}", value.to_hex()));
}

// =============================================================================
// Геттеры
// =============================================================================

Bytes32 IndexedMerkleTree::get_root() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (levels_count_ == 0) {
        return Bytes32{};
    }
    return levels_[levels_count_ - 1][0];
}

Result<IndexedLeaf> IndexedMerkleTree::get_leaf_data(uint64_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (index >= leaves_.size()) {
        return Err<IndexedLeaf>(ErrorCode::IndexOutOfBounds,
                                std::format("Лист {} не существует", index));
    }
    return leaves_[index];
}

Bytes32 IndexedMerkleTree::get_node_hash(uint64_t index, uint64_t level) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level >= levels_.size() || index >= levels_[level].size()) {
        return Bytes32{};
    }
    return levels_[level][index];
}

uint64_t IndexedMerkleTree::get_levels_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return levels_count_;
}

uint64_t IndexedMerkleTree::get_leaves_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leaves_.size();
}

uint64_t IndexedMerkleTree::get_level_nodes_count(uint64_t level) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level >= levels_.size()) {
        return 0;
    }
    return levels_[level].size();
}

bool IndexedMerkleTree::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return levels_count_ != 0;
}

} // namespace arbor::trees
