/**
 * @file test_bytes32.cpp
 * @brief Тесты Bytes32
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <unordered_set>

#include "core/primitives/bytes32.hpp"

namespace arbor::core::test {

// =============================================================================
// Конструкторы
// =============================================================================

TEST(Bytes32Test, DefaultIsZero) {
    Bytes32 value;
    EXPECT_TRUE(value.is_zero());
    EXPECT_EQ(value, Bytes32::zero());
}

TEST(Bytes32Test, FromU64IsBigEndian) {
    Bytes32 value{0x0102ULL};

    EXPECT_EQ(value[31], 0x02);
    EXPECT_EQ(value[30], 0x01);
    EXPECT_EQ(value[0], 0x00);
    EXPECT_EQ(value.low_u64(), 0x0102ULL);
}

// =============================================================================
// Сравнение
// =============================================================================

TEST(Bytes32Test, NumericOrdering) {
    EXPECT_LT(Bytes32{1ULL}, Bytes32{2ULL});
    EXPECT_LT(Bytes32{0xFFULL}, Bytes32{0x100ULL});
    EXPECT_GT(Bytes32::max(), Bytes32{~0ULL});
    EXPECT_EQ(Bytes32{5ULL}, Bytes32::from_hex("05"));
}

// =============================================================================
// Биты
// =============================================================================

TEST(Bytes32Test, BitIsLsbFirst) {
    Bytes32 value{0b101ULL};

    EXPECT_TRUE(value.bit(0));
    EXPECT_FALSE(value.bit(1));
    EXPECT_TRUE(value.bit(2));
    EXPECT_FALSE(value.bit(3));
}

TEST(Bytes32Test, HighBit) {
    Bytes32 value;
    value[0] = 0x80;

    EXPECT_TRUE(value.bit(255));
    EXPECT_FALSE(value.bit(254));
    EXPECT_FALSE(value.bit(0));
}

TEST(Bytes32Test, HighHalf) {
    auto value = Bytes32::from_hex(
        "0102030405060708090a0b0c0d0e0f10ffffffffffffffffffffffffffffffff");

    Priority priority = value.high_half();
    EXPECT_EQ(priority[0], 0x01);
    EXPECT_EQ(priority[15], 0x10);
}

// =============================================================================
// Hex
// =============================================================================

TEST(Bytes32Test, HexRoundTrip) {
    const std::string hex =
        "00000000000000000000000000000000000000000000000000000000deadbeef";

    auto value = Bytes32::from_hex(hex);
    EXPECT_EQ(value.low_u64(), 0xdeadbeefULL);
    EXPECT_EQ(value.to_hex(), hex);
}

TEST(Bytes32Test, HexPrefixAndShortForm) {
    EXPECT_EQ(Bytes32::from_hex("0x0a"), Bytes32{10ULL});
    EXPECT_EQ(Bytes32::from_hex("0XA"), Bytes32{10ULL});
    EXPECT_EQ(Bytes32::from_hex("abc"), Bytes32{0xabcULL});
}

TEST(Bytes32Test, HexRejectsInvalid) {
    EXPECT_THROW((void)Bytes32::from_hex(""), std::invalid_argument);
    EXPECT_THROW((void)Bytes32::from_hex("0x"), std::invalid_argument);
    EXPECT_THROW((void)Bytes32::from_hex("xyz"), std::invalid_argument);
    EXPECT_THROW((void)Bytes32::from_hex(std::string(65, '1')), std::invalid_argument);
}

TEST(Bytes32Test, Hashable) {
    std::unordered_set<Bytes32> set;
    set.insert(Bytes32{1ULL});
    set.insert(Bytes32{1ULL});
    set.insert(Bytes32{2ULL});

    EXPECT_EQ(set.size(), 2u);
}

} // namespace arbor::core::test
