/**
 * @file test_config.cpp
 * @brief Тесты загрузки конфигурации
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/config.hpp"

namespace arbor::core::test {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("arbor_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, Defaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->cartesian.desired_proof_size, constants::DEFAULT_CARTESIAN_PROOF_SIZE);
    EXPECT_EQ(config->sparse.max_depth, constants::DEFAULT_SPARSE_MAX_DEPTH);
    EXPECT_EQ(config->logging.level, "info");
    EXPECT_TRUE(config->logging.color);
    EXPECT_TRUE(config->validate().has_value());
}

TEST_F(ConfigTest, ParseAllSections) {
    auto config = Config::parse(R"(
[cartesian]
desired_proof_size = 64

[sparse]
max_depth = 160

[logging]
level = "debug"
color = false
)");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->cartesian.desired_proof_size, 64u);
    EXPECT_EQ(config->sparse.max_depth, 160u);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);
    EXPECT_TRUE(config->validate().has_value());
}

TEST_F(ConfigTest, ParseError) {
    auto config = Config::parse("[cartesian\ndesired_proof_size = ");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

TEST_F(ConfigTest, NegativeValueRejected) {
    auto config = Config::parse("[sparse]\nmax_depth = -1\n");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);
}

TEST_F(ConfigTest, WrongTypeRejected) {
    auto config = Config::parse("[cartesian]\ndesired_proof_size = \"big\"\n");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_file("arbor.toml", "[sparse]\nmax_depth = 32\n");

    auto config = Config::load(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sparse.max_depth, 32u);
}

TEST_F(ConfigTest, LoadMissingFile) {
    auto config = Config::load(dir_ / "missing.toml");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);

    auto searched = Config::load_with_search(dir_ / "missing.toml");
    ASSERT_FALSE(searched);
    EXPECT_EQ(searched.error().code, ErrorCode::ConfigNotFound);
}

TEST_F(ConfigTest, LoadBrokenFile) {
    auto path = write_file("broken.toml", "[logging\n");

    auto config = Config::load(path);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

TEST_F(ConfigTest, ValidateRanges) {
    Config config;

    config.cartesian.desired_proof_size = 0;
    EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigInvalidValue);
    config.cartesian.desired_proof_size = 10;

    config.sparse.max_depth = 0;
    EXPECT_FALSE(config.validate());
    config.sparse.max_depth = 257;
    EXPECT_FALSE(config.validate());
    config.sparse.max_depth = 256;
    EXPECT_TRUE(config.validate().has_value());

    config.logging.level = "verbose";
    EXPECT_FALSE(config.validate());
    config.logging.level = "warn";
    EXPECT_TRUE(config.validate().has_value());
}

} // namespace arbor::core::test
