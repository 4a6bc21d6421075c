/**
 * @file test_cartesian_merkle_tree.cpp
 * @brief Тесты Cartesian Merkle Tree
 *
 * Проверяет жизненный цикл дерева, инварианты treap (порядок ключей и
 * max-куча по приоритету), независимость корня от порядка вставки и
 * доказательства (не)принадлежности.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <vector>

#include "crypto/sha256.hpp"
#include "trees/cartesian_merkle_tree.hpp"
#include "trees/proof_verifier.hpp"

namespace arbor::trees::test {

namespace {

Bytes32 key_of(uint64_t n) {
    return Bytes32{n};
}

/**
 * @brief Хешер для тестов: SHA256 над входами в обратном порядке
 */
class ReversedSha256Provider final : public crypto::HashProvider {
public:
    [[nodiscard]] Bytes32 hash1(const Bytes32& a) const override {
        crypto::Sha256 hasher;
        hasher.write(a.bytes()).write_byte(0xFF);
        return Bytes32{hasher.finalize()};
    }

    [[nodiscard]] Bytes32 hash2(const Bytes32& a, const Bytes32& b) const override {
        crypto::Sha256 hasher;
        hasher.write(b.bytes()).write(a.bytes());
        return Bytes32{hasher.finalize()};
    }

    [[nodiscard]] Bytes32 hash3(const Bytes32& a, const Bytes32& b, const Bytes32& c) const override {
        crypto::Sha256 hasher;
        hasher.write(c.bytes()).write(b.bytes()).write(a.bytes());
        return Bytes32{hasher.finalize()};
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "reversed-sha256"; }
};

} // anonymous namespace

/**
 * @brief Фикстура с инициализированным деревом
 */
class CartesianMerkleTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tree_.initialize(40).has_value());
    }

    void add_all(CartesianMerkleTree& tree, const std::vector<uint64_t>& keys) {
        for (uint64_t k : keys) {
            ASSERT_TRUE(tree.add(key_of(k)).has_value()) << "key " << k;
        }
    }

    /**
     * @brief Проверить порядок ключей, кучу и хеши поддерева
     *
     * @return Количество узлов в поддереве
     */
    uint64_t check_subtree(const CartesianMerkleTree& tree, NodeId id,
                           const Bytes32* lower, const Bytes32* upper) {
        if (id == 0) {
            return 0;
        }

        const CartesianNode node = tree.get_node(id);
        EXPECT_FALSE(node.empty());

        if (lower) {
            EXPECT_GT(node.key, *lower);
        }
        if (upper) {
            EXPECT_LT(node.key, *upper);
        }

        EXPECT_EQ(node.priority, hasher_.hash1(node.key).high_half());

        const CartesianNode left = tree.get_node(node.child_left);
        const CartesianNode right = tree.get_node(node.child_right);

        if (node.child_left != 0) {
            EXPECT_LE(left.priority, node.priority);
        }
        if (node.child_right != 0) {
            EXPECT_LE(right.priority, node.priority);
        }

        const Bytes32& lh = left.merkle_hash;
        const Bytes32& rh = right.merkle_hash;
        const Bytes32 expected = lh < rh
            ? hasher_.hash3(node.key, lh, rh)
            : hasher_.hash3(node.key, rh, lh);
        EXPECT_EQ(node.merkle_hash, expected);

        return 1
            + check_subtree(tree, node.child_left, lower, &node.key)
            + check_subtree(tree, node.child_right, &node.key, upper);
    }

    void check_invariants(const CartesianMerkleTree& tree) {
        const uint64_t count = check_subtree(tree, tree.get_root_id(), nullptr, nullptr);
        EXPECT_EQ(count, tree.get_nodes_count());
    }

    CartesianMerkleTree tree_;
    crypto::Sha256HashProvider hasher_;
};

// =============================================================================
// Жизненный цикл
// =============================================================================

TEST(CartesianMerkleTreeLifecycleTest, RequiresInitialization) {
    CartesianMerkleTree tree;

    EXPECT_FALSE(tree.is_initialized());

    auto add = tree.add(key_of(1));
    ASSERT_FALSE(add);
    EXPECT_EQ(add.error().code, ErrorCode::NotInitialized);

    auto remove = tree.remove(key_of(1));
    ASSERT_FALSE(remove);
    EXPECT_EQ(remove.error().code, ErrorCode::NotInitialized);
}

TEST(CartesianMerkleTreeLifecycleTest, InitializeValidatesProofSize) {
    CartesianMerkleTree tree;

    auto zero = tree.initialize(0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidProofSize);
    EXPECT_FALSE(tree.is_initialized());

    ASSERT_TRUE(tree.initialize(10).has_value());
    EXPECT_TRUE(tree.is_initialized());
    EXPECT_EQ(tree.get_desired_proof_size(), 10u);

    auto twice = tree.initialize(10);
    ASSERT_FALSE(twice);
    EXPECT_EQ(twice.error().code, ErrorCode::AlreadyInitialized);
}

TEST_F(CartesianMerkleTreeTest, SetDesiredProofSize) {
    ASSERT_TRUE(tree_.set_desired_proof_size(20).has_value());
    EXPECT_EQ(tree_.get_desired_proof_size(), 20u);

    auto zero = tree_.set_desired_proof_size(0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidProofSize);
    EXPECT_EQ(tree_.get_desired_proof_size(), 20u);
}

TEST_F(CartesianMerkleTreeTest, EmptyTree) {
    EXPECT_TRUE(tree_.get_root().is_zero());
    EXPECT_EQ(tree_.get_nodes_count(), 0u);
    EXPECT_EQ(tree_.get_root_id(), 0u);

    auto proof = tree_.get_proof(key_of(7));
    ASSERT_TRUE(proof.has_value());
    EXPECT_FALSE(proof->existence);
    EXPECT_EQ(proof->siblings_length, 0u);
    EXPECT_EQ(proof->siblings.size(), 40u);
    EXPECT_TRUE(std::all_of(proof->siblings.begin(), proof->siblings.end(),
                            [](const Bytes32& s) { return s.is_zero(); }));
    EXPECT_TRUE(verify_cartesian_proof(*proof, hasher_));
}

// =============================================================================
// add / remove
// =============================================================================

TEST(CartesianMerkleTreeScenarioTest, AddProveRemove) {
    CartesianMerkleTree tree;
    ASSERT_TRUE(tree.initialize(10).has_value());

    Bytes32 previous = tree.get_root();
    for (uint64_t k : {5ULL, 3ULL, 8ULL}) {
        ASSERT_TRUE(tree.add(key_of(k)).has_value());
        EXPECT_NE(tree.get_root(), previous) << "key " << k;
        previous = tree.get_root();
    }
    EXPECT_EQ(tree.get_nodes_count(), 3u);

    auto present = tree.get_proof(key_of(3));
    ASSERT_TRUE(present.has_value());
    EXPECT_TRUE(present->existence);
    EXPECT_EQ(present->root, tree.get_root());

    ASSERT_TRUE(tree.remove(key_of(3)).has_value());

    auto absent = tree.get_proof(key_of(3));
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(absent->existence);
    EXPECT_EQ(tree.get_nodes_count(), 2u);
}

TEST_F(CartesianMerkleTreeTest, SingleNodeHash) {
    ASSERT_TRUE(tree_.add(key_of(1)).has_value());

    const Bytes32 expected = hasher_.hash3(key_of(1), Bytes32{}, Bytes32{});
    EXPECT_EQ(tree_.get_root(), expected);

    const CartesianNode node = tree_.get_node(tree_.get_root_id());
    EXPECT_EQ(node.key, key_of(1));
    EXPECT_EQ(node.child_left, 0u);
    EXPECT_EQ(node.child_right, 0u);
}

TEST_F(CartesianMerkleTreeTest, ZeroKeyRejected) {
    add_all(tree_, {1, 2, 3});
    const Bytes32 root = tree_.get_root();

    auto add = tree_.add(Bytes32{});
    ASSERT_FALSE(add);
    EXPECT_EQ(add.error().code, ErrorCode::ZeroKey);

    auto remove = tree_.remove(Bytes32{});
    ASSERT_FALSE(remove);
    EXPECT_EQ(remove.error().code, ErrorCode::ZeroKey);

    EXPECT_EQ(tree_.get_root(), root);
    EXPECT_EQ(tree_.get_nodes_count(), 3u);
}

TEST_F(CartesianMerkleTreeTest, DuplicateKeyRejected) {
    add_all(tree_, {1, 2, 3});
    const Bytes32 root = tree_.get_root();

    auto dup = tree_.add(key_of(2));
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::DuplicateKey);
    EXPECT_EQ(tree_.get_root(), root);
    EXPECT_EQ(tree_.get_nodes_count(), 3u);
}

TEST_F(CartesianMerkleTreeTest, RemoveMissingKey) {
    add_all(tree_, {1, 2, 3});
    const Bytes32 root = tree_.get_root();

    auto missing = tree_.remove(key_of(4));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::KeyNotFound);
    EXPECT_EQ(tree_.get_root(), root);
}

TEST_F(CartesianMerkleTreeTest, RemoveFromEmptyTreeIsNoop) {
    EXPECT_TRUE(tree_.remove(key_of(4)).has_value());
    EXPECT_TRUE(tree_.get_root().is_zero());
    EXPECT_EQ(tree_.get_nodes_count(), 0u);
}

TEST_F(CartesianMerkleTreeTest, RemoveAllKeys) {
    std::vector<uint64_t> keys(30);
    std::iota(keys.begin(), keys.end(), 1);
    add_all(tree_, keys);

    std::mt19937_64 rng(7);
    std::shuffle(keys.begin(), keys.end(), rng);

    for (uint64_t k : keys) {
        ASSERT_TRUE(tree_.remove(key_of(k)).has_value()) << "key " << k;
        check_invariants(tree_);
    }

    EXPECT_TRUE(tree_.get_root().is_zero());
    EXPECT_EQ(tree_.get_root_id(), 0u);
    EXPECT_EQ(tree_.get_nodes_count(), 0u);
}

// =============================================================================
// Инварианты
// =============================================================================

TEST_F(CartesianMerkleTreeTest, HeapAndOrderInvariants) {
    std::mt19937_64 rng(42);
    std::vector<uint64_t> keys;
    for (int i = 0; i < 200; ++i) {
        keys.push_back(rng() | 1);
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    add_all(tree_, keys);
    check_invariants(tree_);

    for (std::size_t i = 0; i < keys.size(); i += 3) {
        ASSERT_TRUE(tree_.remove(key_of(keys[i])).has_value());
    }
    check_invariants(tree_);
}

TEST_F(CartesianMerkleTreeTest, RootIndependentOfInsertionOrder) {
    std::vector<uint64_t> keys(64);
    std::iota(keys.begin(), keys.end(), 100);

    add_all(tree_, keys);

    std::mt19937_64 rng(2024);
    for (int round = 0; round < 3; ++round) {
        std::shuffle(keys.begin(), keys.end(), rng);

        CartesianMerkleTree other;
        ASSERT_TRUE(other.initialize(40).has_value());
        add_all(other, keys);

        EXPECT_EQ(other.get_root(), tree_.get_root()) << "round " << round;
    }
}

TEST_F(CartesianMerkleTreeTest, RemoveRestoresCanonicalShape) {
    add_all(tree_, {10, 20, 30, 40, 50, 60});
    ASSERT_TRUE(tree_.remove(key_of(30)).has_value());
    ASSERT_TRUE(tree_.remove(key_of(50)).has_value());

    CartesianMerkleTree fresh;
    ASSERT_TRUE(fresh.initialize(40).has_value());
    add_all(fresh, {60, 10, 40, 20});

    EXPECT_EQ(tree_.get_root(), fresh.get_root());
}

// =============================================================================
// Доказательства
// =============================================================================

TEST_F(CartesianMerkleTreeTest, MembershipProofsVerify) {
    std::vector<uint64_t> keys(50);
    std::iota(keys.begin(), keys.end(), 1);
    add_all(tree_, keys);

    for (uint64_t k : keys) {
        auto proof = tree_.get_proof(key_of(k));
        ASSERT_TRUE(proof.has_value()) << "key " << k;
        EXPECT_TRUE(proof->existence);
        EXPECT_EQ(proof->key, key_of(k));
        EXPECT_EQ(proof->siblings_length % 2, 0u);
        EXPECT_TRUE(verify_cartesian_proof(*proof, hasher_)) << "key " << k;

        auto root = compute_cartesian_root(*proof, hasher_);
        ASSERT_TRUE(root.has_value());
        EXPECT_EQ(*root, tree_.get_root());
    }
}

TEST_F(CartesianMerkleTreeTest, NonMembershipProofsVerify) {
    for (uint64_t k = 2; k <= 100; k += 2) {
        ASSERT_TRUE(tree_.add(key_of(k)).has_value());
    }

    for (uint64_t k = 1; k <= 101; k += 2) {
        auto proof = tree_.get_proof(key_of(k));
        ASSERT_TRUE(proof.has_value()) << "key " << k;
        EXPECT_FALSE(proof->existence);
        EXPECT_NE(proof->non_existence_key, key_of(k));
        EXPECT_FALSE(tree_.get_node_by_key(proof->non_existence_key).empty());
        EXPECT_TRUE(verify_cartesian_proof(*proof, hasher_)) << "key " << k;
    }
}

TEST_F(CartesianMerkleTreeTest, TamperedProofFails) {
    add_all(tree_, {1, 2, 3, 4, 5, 6, 7, 8});

    auto proof = tree_.get_proof(key_of(5));
    ASSERT_TRUE(proof.has_value());
    ASSERT_GE(proof->siblings_length, 2u);

    auto wrong_key = *proof;
    wrong_key.key = key_of(9);
    EXPECT_FALSE(verify_cartesian_proof(wrong_key, hasher_));

    auto wrong_sibling = *proof;
    wrong_sibling.siblings[0] = key_of(12345);
    EXPECT_FALSE(verify_cartesian_proof(wrong_sibling, hasher_));
}

TEST_F(CartesianMerkleTreeTest, ForgedNonMembershipRejected) {
    add_all(tree_, {1, 2, 3, 4, 5, 6, 7, 8});

    const CartesianNode root = tree_.get_node(tree_.get_root_id());
    const NodeId child_id = root.child_right != 0 ? root.child_right : root.child_left;
    ASSERT_NE(child_id, 0u);
    const Bytes32 present_key = tree_.get_node(child_id).key;

    // Доказательство принадлежности корня, выданное за отсутствие ключа потомка
    auto proof = tree_.get_proof(root.key);
    ASSERT_TRUE(proof.has_value());
    ASSERT_TRUE(verify_cartesian_proof(*proof, hasher_));

    auto forged = *proof;
    forged.existence = false;
    forged.non_existence_key = root.key;
    forged.key = present_key;

    ASSERT_EQ(compute_cartesian_root(forged, hasher_).value(), tree_.get_root());
    EXPECT_FALSE(verify_cartesian_proof(forged, hasher_));
}

TEST_F(CartesianMerkleTreeTest, ProofSizeOverride) {
    add_all(tree_, {1, 2, 3, 4, 5});

    auto proof = tree_.get_proof(key_of(3), 64);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->siblings.size(), 64u);
    EXPECT_TRUE(verify_cartesian_proof(*proof, hasher_));
}

TEST_F(CartesianMerkleTreeTest, ProofTooLarge) {
    std::vector<uint64_t> keys(20);
    std::iota(keys.begin(), keys.end(), 1);
    add_all(tree_, keys);

    // Лист на глубине > 0 требует больше двух элементов
    const CartesianNode root = tree_.get_node(tree_.get_root_id());
    const Bytes32 root_key = root.key;

    Bytes32 deep_key;
    for (uint64_t k : keys) {
        if (key_of(k) != root_key) {
            deep_key = key_of(k);
            break;
        }
    }

    auto too_small = tree_.get_proof(deep_key, 2);
    ASSERT_FALSE(too_small);
    EXPECT_EQ(too_small.error().code, ErrorCode::ProofTooLarge);

    auto root_proof = tree_.get_proof(root_key, 2);
    ASSERT_TRUE(root_proof.has_value());
    EXPECT_EQ(root_proof->siblings_length, 2u);

    auto one = tree_.get_proof(root_key, 1);
    ASSERT_FALSE(one);
    EXPECT_EQ(one.error().code, ErrorCode::ProofTooLarge);
}

// =============================================================================
// Геттеры
// =============================================================================

TEST_F(CartesianMerkleTreeTest, NodeLookups) {
    add_all(tree_, {11, 22, 33});

    const CartesianNode node = tree_.get_node_by_key(key_of(22));
    EXPECT_EQ(node.key, key_of(22));

    EXPECT_TRUE(tree_.get_node_by_key(key_of(44)).empty());
    EXPECT_TRUE(tree_.get_node(0).empty());
    EXPECT_TRUE(tree_.get_node(999).empty());
}

TEST_F(CartesianMerkleTreeTest, PriorityIsHighHalfOfHash) {
    EXPECT_EQ(tree_.priority_of(key_of(5)), hasher_.hash1(key_of(5)).high_half());
}

// =============================================================================
// Хешер
// =============================================================================

TEST_F(CartesianMerkleTreeTest, CustomHasher) {
    EXPECT_FALSE(tree_.is_custom_hasher_set());

    auto custom = std::make_shared<const ReversedSha256Provider>();
    ASSERT_TRUE(tree_.set_hasher(custom).has_value());
    EXPECT_TRUE(tree_.is_custom_hasher_set());

    add_all(tree_, {1, 2, 3, 4});

    CartesianMerkleTree reference;
    ASSERT_TRUE(reference.initialize(40).has_value());
    add_all(reference, {1, 2, 3, 4});
    EXPECT_NE(tree_.get_root(), reference.get_root());

    auto proof = tree_.get_proof(key_of(3));
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(verify_cartesian_proof(*proof, *custom));
    EXPECT_FALSE(verify_cartesian_proof(*proof, hasher_));

    auto busy = tree_.set_hasher(nullptr);
    ASSERT_FALSE(busy);
    EXPECT_EQ(busy.error().code, ErrorCode::TreeNotEmpty);
    EXPECT_TRUE(tree_.is_custom_hasher_set());
}

TEST_F(CartesianMerkleTreeTest, HasherCanBeChangedAfterClearing) {
    add_all(tree_, {1, 2});
    ASSERT_TRUE(tree_.remove(key_of(1)).has_value());
    ASSERT_TRUE(tree_.remove(key_of(2)).has_value());

    ASSERT_TRUE(tree_.set_hasher(std::make_shared<const ReversedSha256Provider>()).has_value());
    EXPECT_TRUE(tree_.is_custom_hasher_set());

    ASSERT_TRUE(tree_.set_hasher(nullptr).has_value());
    EXPECT_FALSE(tree_.is_custom_hasher_set());
    EXPECT_EQ(tree_.get_hasher()->name(), "sha256");
}

} // namespace arbor::trees::test
