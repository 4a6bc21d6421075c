/**
 * @file sparse_merkle_tree.cpp
 * @brief Реализация Sparse Merkle Tree
 */

#include "sparse_merkle_tree.hpp"
#include "../core/constants.hpp"
#include "../log/logger.hpp"

#include <format>

namespace arbor::trees {

namespace {

constexpr std::string_view COMPONENT = "SparseMerkleTree";

Result<void> validate_depth(uint32_t depth) {
    if (depth == 0) {
        return Err<void>(ErrorCode::InvalidDepth);
    }
    if (depth > constants::SPARSE_MAX_DEPTH_HARD_CAP) {
        return Err<void>(ErrorCode::DepthExceedsHardCap,
                         std::format("Глубина {} больше {}", depth,
                                     constants::SPARSE_MAX_DEPTH_HARD_CAP));
    }
    return {};
}

} // anonymous namespace

SparseMerkleTree::SparseMerkleTree()
    : hasher_(crypto::default_hash_provider()) {}

// =============================================================================
// Конфигурация
// =============================================================================

Result<void> SparseMerkleTree::initialize(uint32_t max_depth) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return Err<void>(ErrorCode::AlreadyInitialized);
    }

    auto valid = validate_depth(max_depth);
    if (!valid) {
        return valid;
    }

    initialized_ = true;
    max_depth_ = max_depth;

    log::info(COMPONENT, std::format("Инициализировано, максимальная глубина {}, хешер {}",
                                     max_depth, hasher_->name()));
    return {};
}

Result<void> SparseMerkleTree::set_max_depth(uint32_t new_depth) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Err<void>(ErrorCode::NotInitialized);
    }

    auto valid = validate_depth(new_depth);
    if (!valid) {
        return valid;
    }

    if (new_depth <= max_depth_) {
        log::warn(COMPONENT, std::format("Отказ в изменении глубины {} -> {}", max_depth_, new_depth));
        return Err<void>(ErrorCode::DepthCanOnlyIncrease);
    }

    max_depth_ = new_depth;
    return {};
}

Result<void> SparseMerkleTree::set_hasher(std::shared_ptr<const crypto::HashProvider> hasher) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!store_.empty()) {
        log::warn(COMPONENT, "Отказ в смене хешера: дерево не пустое");
        return Err<void>(ErrorCode::TreeNotEmpty);
    }

    custom_hasher_ = hasher != nullptr;
    hasher_ = hasher ? std::move(hasher) : crypto::default_hash_provider();

    log::info(COMPONENT, std::format("Установлен хешер {}", hasher_->name()));
    return {};
}

// =============================================================================
// Изменение
// =============================================================================

Result<void> SparseMerkleTree::add(const Bytes32& index, const Bytes32& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Err<void>(ErrorCode::NotInitialized);
    }

    auto fits = check_depth(index);
    if (!fits) {
        return fits;
    }

    root_id_ = add_node(root_id_, index, value, 0);

    if (log::Logger::instance().enabled(log::LogLevel::Debug)) {
        log::debug(COMPONENT, std::format("add {} -> корень {}", index.to_hex(),
                                          store_.get(root_id_).node_hash.to_hex()));
    }
    return {};
}

Result<void> SparseMerkleTree::update(const Bytes32& index, const Bytes32& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Err<void>(ErrorCode::NotInitialized);
    }
    if (find_leaf(index) == 0) {
        return Err<void>(ErrorCode::KeyNotFound,
                         std::format("Узел не существует: {}", index.to_hex()));
    }

    // Существующий лист: add() только заменит значение и пересчитает путь
    root_id_ = add_node(root_id_, index, value, 0);

    if (log::Logger::instance().enabled(log::LogLevel::Debug)) {
        log::debug(COMPONENT, std::format("update {} -> корень {}", index.to_hex(),
                                          store_.get(root_id_).node_hash.to_hex()));
    }
    return {};
}

Result<void> SparseMerkleTree::check_depth(const Bytes32& index) const {
    NodeId current = root_id_;
    uint32_t depth = 0;

    while (true) {
        const SparseNode& node = store_.get(current);

        switch (node.node_type) {
            case SparseNodeType::Empty:
                return {};

            case SparseNodeType::Leaf: {
                if (node.key == index) {
                    return {};
                }

                // Оба листа опускаются, пока биты совпадают
                uint32_t divergence = depth;
                while (node.key.bit(divergence) == index.bit(divergence)) {
                    ++divergence;
                }

                if (divergence >= max_depth_) {
                    return Err<void>(ErrorCode::MaxDepthReached,
                                     std::format("Индексы {} и {} расходятся на глубине {}, максимум {}",
                                                 node.key.to_hex(), index.to_hex(),
                                                 divergence, max_depth_));
                }
                return {};
            }

            case SparseNodeType::Middle:
                current = index.bit(depth) ? node.child_right : node.child_left;
                ++depth;
                break;
        }
    }
}

NodeId SparseMerkleTree::add_node(NodeId node_id, const Bytes32& index, const Bytes32& value, uint32_t depth) {
    // Копия: allocate() может переразместить арену
    const SparseNode node = store_.get(node_id);

    switch (node.node_type) {
        case SparseNodeType::Empty:
            return store_.allocate(make_leaf(index, value));

        case SparseNodeType::Leaf: {
            if (node.key == index) {
                SparseNode& leaf = store_.at(node_id);
                leaf.value = value;
                leaf.node_hash = hasher_->hash3(index, value, Bytes32::one());
                return node_id;
            }

            const NodeId new_leaf = store_.allocate(make_leaf(index, value));
            return push_leaf(new_leaf, node_id, depth);
        }

        case SparseNodeType::Middle:
            break;
    }

    if (index.bit(depth)) {
        const NodeId child = add_node(node.child_right, index, value, depth + 1);
        store_.at(node_id).child_right = child;
    } else {
        const NodeId child = add_node(node.child_left, index, value, depth + 1);
        store_.at(node_id).child_left = child;
    }

    const SparseNode& middle = store_.get(node_id);
    const Bytes32 hash = hasher_->hash2(store_.get(middle.child_left).node_hash,
                                        store_.get(middle.child_right).node_hash);
    store_.at(node_id).node_hash = hash;

    return node_id;
}

NodeId SparseMerkleTree::push_leaf(NodeId new_leaf, NodeId old_leaf, uint32_t depth) {
    const bool new_bit = store_.get(new_leaf).key.bit(depth);
    const bool old_bit = store_.get(old_leaf).key.bit(depth);

    SparseNode middle;
    middle.node_type = SparseNodeType::Middle;

    if (new_bit == old_bit) {
        const NodeId child = push_leaf(new_leaf, old_leaf, depth + 1);
        if (new_bit) {
            middle.child_right = child;
        } else {
            middle.child_left = child;
        }
    } else if (new_bit) {
        middle.child_left = old_leaf;
        middle.child_right = new_leaf;
    } else {
        middle.child_left = new_leaf;
        middle.child_right = old_leaf;
    }

    middle.node_hash = hasher_->hash2(store_.get(middle.child_left).node_hash,
                                      store_.get(middle.child_right).node_hash);

    return store_.allocate(std::move(middle));
}

SparseNode SparseMerkleTree::make_leaf(const Bytes32& index, const Bytes32& value) const {
    SparseNode leaf;
    leaf.node_type = SparseNodeType::Leaf;
    leaf.key = index;
    leaf.value = value;
    leaf.node_hash = hasher_->hash3(index, value, Bytes32::one());
    return leaf;
}

NodeId SparseMerkleTree::find_leaf(const Bytes32& index) const {
    NodeId current = root_id_;
    uint32_t depth = 0;

    while (true) {
        const SparseNode& node = store_.get(current);

        if (node.node_type == SparseNodeType::Empty) {
            return 0;
        }
        if (node.node_type == SparseNodeType::Leaf) {
            return node.key == index ? current : 0;
        }

        current = index.bit(depth) ? node.child_right : node.child_left;
        ++depth;
    }
}

// =============================================================================
// Доказательства
// =============================================================================

SparseProof SparseMerkleTree::get_proof(const Bytes32& index) const {
    std::lock_guard<std::mutex> lock(mutex_);

    SparseProof proof;
    proof.root = store_.get(root_id_).node_hash;
    proof.siblings.assign(max_depth_, Bytes32{});
    proof.index = index;

    NodeId current = root_id_;

    for (uint32_t depth = 0; depth <= max_depth_; ++depth) {
        const SparseNode& node = store_.get(current);

        if (node.node_type == SparseNodeType::Empty) {
            break;
        }

        if (node.node_type == SparseNodeType::Leaf) {
            if (node.key == index) {
                proof.existence = true;
            } else {
                proof.aux_existence = true;
                proof.aux_index = node.key;
                proof.aux_value = node.value;
            }
            proof.value = node.value;
            break;
        }

        if (index.bit(depth)) {
            proof.siblings[depth] = store_.get(node.child_left).node_hash;
            current = node.child_right;
        } else {
            proof.siblings[depth] = store_.get(node.child_right).node_hash;
            current = node.child_left;
        }
    }

    return proof;
}

// =============================================================================
// Геттеры
// =============================================================================

Bytes32 SparseMerkleTree::get_root() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.get(root_id_).node_hash;
}

SparseNode SparseMerkleTree::get_node(NodeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.get(id);
}

SparseNode SparseMerkleTree::get_node_by_index(const Bytes32& index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.get(find_leaf(index));
}

uint32_t SparseMerkleTree::get_max_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_depth_;
}

uint64_t SparseMerkleTree::get_nodes_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.live_count();
}

NodeId SparseMerkleTree::get_root_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return root_id_;
}

bool SparseMerkleTree::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

bool SparseMerkleTree::is_custom_hasher_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custom_hasher_;
}

std::shared_ptr<const crypto::HashProvider> SparseMerkleTree::get_hasher() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hasher_;
}

} // namespace arbor::trees
