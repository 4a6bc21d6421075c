/**
 * @file cartesian_merkle_tree.cpp
 * @brief Реализация Cartesian Merkle Tree
 */

#include "cartesian_merkle_tree.hpp"
#include "../log/logger.hpp"

#include <format>

namespace arbor::trees {

namespace {

constexpr std::string_view COMPONENT = "CartesianMerkleTree";

} // anonymous namespace

CartesianMerkleTree::CartesianMerkleTree()
    : hasher_(crypto::default_hash_provider()) {}

// =============================================================================
// Конфигурация
// =============================================================================

Result<void> CartesianMerkleTree::initialize(uint32_t desired_proof_size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return Err<void>(ErrorCode::AlreadyInitialized);
    }
    if (desired_proof_size == 0) {
        return Err<void>(ErrorCode::InvalidProofSize);
    }

    initialized_ = true;
    desired_proof_size_ = desired_proof_size;

    log::info(COMPONENT, std::format("Инициализировано, размер доказательства {}, хешер {}",
                                     desired_proof_size, hasher_->name()));
    return {};
}

Result<void> CartesianMerkleTree::set_desired_proof_size(uint32_t desired_proof_size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Err<void>(ErrorCode::NotInitialized);
    }
    if (desired_proof_size == 0) {
        return Err<void>(ErrorCode::InvalidProofSize);
    }

    desired_proof_size_ = desired_proof_size;
    return {};
}

Result<void> CartesianMerkleTree::set_hasher(std::shared_ptr<const crypto::HashProvider> hasher) {
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

Result<void> CartesianMerkleTree::add(const Bytes32& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Err<void>(ErrorCode::NotInitialized);
    }
    if (key.is_zero()) {
        return Err<void>(ErrorCode::ZeroKey);
    }
    if (find(key) != 0) {
        return Err<void>(ErrorCode::DuplicateKey,
                         std::format("Ключ уже существует: {}", key.to_hex()));
    }

    const Priority priority = hasher_->hash1(key).high_half();
    root_id_ = insert_node(root_id_, key, priority);

    if (log::Logger::instance().enabled(log::LogLevel::Debug)) {
        log::debug(COMPONENT, std::format("add {} -> корень {}", key.to_hex(),
                                          store_.get(root_id_).merkle_hash.to_hex()));
    }
    return {};
}

Result<void> CartesianMerkleTree::remove(const Bytes32& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Err<void>(ErrorCode::NotInitialized);
    }
    if (key.is_zero()) {
        return Err<void>(ErrorCode::ZeroKey);
    }
    if (root_id_ == 0) {
        // Удаление из пустого дерева - не ошибка
        return {};
    }
    if (find(key) == 0) {
        return Err<void>(ErrorCode::KeyNotFound,
                         std::format("Узел не существует: {}", key.to_hex()));
    }

    root_id_ = remove_node(root_id_, key);

    if (log::Logger::instance().enabled(log::LogLevel::Debug)) {
        log::debug(COMPONENT, std::format("remove {} -> корень {}", key.to_hex(),
                                          store_.get(root_id_).merkle_hash.to_hex()));
    }
    return {};
}

// =============================================================================
// Treap: вставка, удаление, повороты
// =============================================================================

NodeId CartesianMerkleTree::insert_node(NodeId root_id, const Bytes32& key, const Priority& priority) {
    if (root_id == 0) {
        CartesianNode node;
        node.key = key;
        node.priority = priority;
        node.merkle_hash = hash_children(key, 0, 0);
        return store_.allocate(std::move(node));
    }

    // Ссылки на узлы не удерживаются через allocate(): арена может переразместиться
    if (store_.get(root_id).key > key) {
        const NodeId child = insert_node(store_.get(root_id).child_left, key, priority);
        store_.at(root_id).child_left = child;

        if (store_.get(child).priority > store_.get(root_id).priority) {
            root_id = rotate_right(root_id);
        }
    } else {
        const NodeId child = insert_node(store_.get(root_id).child_right, key, priority);
        store_.at(root_id).child_right = child;

        if (store_.get(child).priority > store_.get(root_id).priority) {
            root_id = rotate_left(root_id);
        }
    }

    update_hash(root_id);
    return root_id;
}

NodeId CartesianMerkleTree::remove_node(NodeId root_id, const Bytes32& key) {
    const Bytes32 node_key = store_.get(root_id).key;

    if (key < node_key) {
        const NodeId child = remove_node(store_.get(root_id).child_left, key);
        store_.at(root_id).child_left = child;
    } else if (key > node_key) {
        const NodeId child = remove_node(store_.get(root_id).child_right, key);
        store_.at(root_id).child_right = child;
    } else {
        const NodeId left = store_.get(root_id).child_left;
        const NodeId right = store_.get(root_id).child_right;

        if (left == 0 || right == 0) {
            // Хеш поднимающегося поддерева не меняется
            const NodeId replacement = left == 0 ? right : left;
            store_.tombstone(root_id);
            return replacement;
        }

        // Наверх поднимается потомок с большим приоритетом
        if (store_.get(left).priority < store_.get(right).priority) {
            root_id = rotate_left(root_id);
            const NodeId child = remove_node(store_.get(root_id).child_left, key);
            store_.at(root_id).child_left = child;
        } else {
            root_id = rotate_right(root_id);
            const NodeId child = remove_node(store_.get(root_id).child_right, key);
            store_.at(root_id).child_right = child;
        }
    }

    update_hash(root_id);
    return root_id;
}

NodeId CartesianMerkleTree::rotate_left(NodeId node_id) {
    const NodeId right_id = store_.get(node_id).child_right;

    store_.at(node_id).child_right = store_.get(right_id).child_left;
    store_.at(right_id).child_left = node_id;

    update_hash(node_id);
    return right_id;
}

NodeId CartesianMerkleTree::rotate_right(NodeId node_id) {
    const NodeId left_id = store_.get(node_id).child_left;

    store_.at(node_id).child_left = store_.get(left_id).child_right;
    store_.at(left_id).child_right = node_id;

    update_hash(node_id);
    return left_id;
}

void CartesianMerkleTree::update_hash(NodeId node_id) {
    if (node_id == 0) {
        return;
    }
    const CartesianNode& node = store_.get(node_id);
    const Bytes32 hash = hash_children(node.key, node.child_left, node.child_right);
    store_.at(node_id).merkle_hash = hash;
}

Bytes32 CartesianMerkleTree::hash_children(const Bytes32& key, NodeId left, NodeId right) const {
    const Bytes32& left_hash = store_.get(left).merkle_hash;
    const Bytes32& right_hash = store_.get(right).merkle_hash;

    if (left_hash > right_hash) {
        return hasher_->hash3(key, right_hash, left_hash);
    }
    return hasher_->hash3(key, left_hash, right_hash);
}

NodeId CartesianMerkleTree::find(const Bytes32& key) const {
    NodeId current = root_id_;

    while (current != 0) {
        const CartesianNode& node = store_.get(current);
        if (node.key == key) {
            return current;
        }
        current = node.key > key ? node.child_left : node.child_right;
    }

    return 0;
}

// =============================================================================
// Доказательства
// =============================================================================

Result<CartesianProof> CartesianMerkleTree::get_proof(
    const Bytes32& key,
    uint32_t desired_proof_size
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (desired_proof_size == 0) {
        desired_proof_size = desired_proof_size_;
    }

    CartesianProof proof;
    proof.root = store_.get(root_id_).merkle_hash;
    proof.siblings.assign(desired_proof_size, Bytes32{});
    proof.key = key;

    if (root_id_ == 0) {
        return proof;
    }

    std::size_t index = 0;
    auto push = [&](const Bytes32& value) -> bool {
        if (index >= proof.siblings.size()) {
            return false;
        }
        proof.siblings[index++] = value;
        return true;
    };

    NodeId current = root_id_;

    while (true) {
        const CartesianNode& node = store_.get(current);

        NodeId next;
        NodeId other;
        if (node.key > key) {
            next = node.child_left;
            other = node.child_right;
        } else {
            next = node.child_right;
            other = node.child_left;
        }

        const bool matched = node.key == key;

        if (matched || next == 0) {
            if (!push(store_.get(node.child_left).merkle_hash) ||
                !push(store_.get(node.child_right).merkle_hash)) {
                return Err<CartesianProof>(ErrorCode::ProofTooLarge);
            }

            proof.existence = matched;
            if (!matched) {
                proof.non_existence_key = node.key;
            }
            break;
        }

        if (!push(node.key) || !push(store_.get(other).merkle_hash)) {
            return Err<CartesianProof>(ErrorCode::ProofTooLarge);
        }

        current = next;
    }

    proof.siblings_length = index;
    return proof;
}

// =============================================================================
// Геттеры
// =============================================================================

Bytes32 CartesianMerkleTree::get_root() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.get(root_id_).merkle_hash;
}

CartesianNode CartesianMerkleTree::get_node(NodeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.get(id);
}

CartesianNode CartesianMerkleTree::get_node_by_key(const Bytes32& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.get(find(key));
}

uint64_t CartesianMerkleTree::get_nodes_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.live_count();
}

uint32_t CartesianMerkleTree::get_desired_proof_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return desired_proof_size_;
}

NodeId CartesianMerkleTree::get_root_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return root_id_;
}

bool CartesianMerkleTree::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

bool CartesianMerkleTree::is_custom_hasher_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custom_hasher_;
}

std::shared_ptr<const crypto::HashProvider> CartesianMerkleTree::get_hasher() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hasher_;
}

Priority CartesianMerkleTree::priority_of(const Bytes32& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hasher_->hash1(key).high_half();
}

} // namespace arbor::trees
