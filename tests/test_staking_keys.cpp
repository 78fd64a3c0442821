/**
 * Unit tests for staking key files and consensus configuration
 *
 * Tests:
 * - Encrypted staking key files (missing, wrong password, round trip)
 * - Cipher tamper detection
 * - ConsensusConfig validation and JSON persistence
 */

#include "consensus/config.h"
#include "consensus/staking_keys.h"
#include "crypto/cipher.h"
#include "crypto/keys.h"
#include "models/ids.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace clique::consensus;
using clique::models::Address;

namespace {

PrivateKey fresh_key() {
    auto key = clique::crypto::generate_random_private_key();
    EXPECT_TRUE(key.is_ok()) << key.error();
    return key.value();
}

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class StakingKeysTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("clique_staking_") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        path_ = (dir_ / "staking_keys.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::string path_;
};

// ============================================================================
// Staking key files
// ============================================================================

TEST_F(StakingKeysTest, MissingFileYieldsNoKeys) {
    auto keys = load_initial_staking_keys(path_, TEST_PASSWORD);
    ASSERT_TRUE(keys.is_ok()) << keys.error();
    EXPECT_TRUE(keys.value().empty());
}

TEST_F(StakingKeysTest, SavedKeysLoadBackWithTheirAddresses) {
    std::vector<PrivateKey> private_keys{fresh_key(), fresh_key(), fresh_key()};
    ASSERT_TRUE(save_staking_keys(path_, TEST_PASSWORD, private_keys).is_ok());

    auto loaded = load_initial_staking_keys(path_, TEST_PASSWORD);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    ASSERT_EQ(loaded.value().size(), private_keys.size());

    for (const auto &private_key : private_keys) {
        auto public_key = clique::crypto::derive_public_key(private_key);
        ASSERT_TRUE(public_key.is_ok());
        auto address = Address::from_public_key(public_key.value());

        auto it = loaded.value().find(address);
        ASSERT_NE(it, loaded.value().end());
        EXPECT_EQ(it->second.first, public_key.value());
        EXPECT_EQ(it->second.second, private_key);
    }
}

TEST_F(StakingKeysTest, WrongPasswordIsAnError) {
    ASSERT_TRUE(save_staking_keys(path_, TEST_PASSWORD, {fresh_key()}).is_ok());

    auto loaded = load_initial_staking_keys(path_, "not the password");
    EXPECT_TRUE(loaded.is_err());
}

TEST_F(StakingKeysTest, GarbageFileIsAnError) {
    {
        std::ofstream file(path_, std::ios::binary);
        file << "definitely not encrypted";
    }

    auto loaded = load_initial_staking_keys(path_, TEST_PASSWORD);
    EXPECT_TRUE(loaded.is_err());
}

TEST_F(StakingKeysTest, EncryptedNonArrayIsAnError) {
    const std::string text = R"({"keys": []})";
    auto encrypted = clique::crypto::encrypt(
        TEST_PASSWORD, std::vector<uint8_t>(text.begin(), text.end()));
    ASSERT_TRUE(encrypted.is_ok());
    {
        std::ofstream file(path_, std::ios::binary);
        const auto &bytes = encrypted.value();
        file.write(reinterpret_cast<const char *>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
    }

    auto loaded = load_initial_staking_keys(path_, TEST_PASSWORD);
    EXPECT_TRUE(loaded.is_err());
}

TEST_F(StakingKeysTest, MalformedPrivateKeyIsRejected) {
    auto keys = staking_keys_from_private({PrivateKey(5, 0x01)});
    EXPECT_TRUE(keys.is_err());
}

TEST_F(StakingKeysTest, CipherDetectsTampering) {
    const std::string secret = "staking secret";
    auto encrypted = clique::crypto::encrypt(
        "pw", std::vector<uint8_t>(secret.begin(), secret.end()));
    ASSERT_TRUE(encrypted.is_ok());

    auto decrypted = clique::crypto::decrypt("pw", encrypted.value());
    ASSERT_TRUE(decrypted.is_ok());
    EXPECT_EQ(std::string(decrypted.value().begin(), decrypted.value().end()),
              secret);

    auto tampered = encrypted.value();
    tampered.back() ^= 0xff;
    EXPECT_TRUE(clique::crypto::decrypt("pw", tampered).is_err());
}

// ============================================================================
// Consensus configuration
// ============================================================================

TEST_F(StakingKeysTest, DefaultConfigIsValid) {
    auto config = ConsensusConfigLoader::create_default();
    EXPECT_EQ(ConsensusConfigLoader::validate_config(config), "");
    EXPECT_EQ(config.genesis_key.size(), 32u);
    EXPECT_GT(config.genesis_timestamp_ms, 0u);
}

TEST_F(StakingKeysTest, InvalidConfigsAreReported) {
    auto config = ConsensusConfigLoader::create_default();

    auto bad_threads = config;
    bad_threads.thread_count = 3;
    EXPECT_NE(ConsensusConfigLoader::validate_config(bad_threads), "");

    auto bad_key = config;
    bad_key.genesis_key = PrivateKey(12, 0);
    EXPECT_NE(ConsensusConfigLoader::validate_config(bad_key), "");

    auto bad_channel = config;
    bad_channel.channel_size = 0;
    EXPECT_NE(ConsensusConfigLoader::validate_config(bad_channel), "");

    auto bad_t0 = config;
    bad_t0.thread_count = 32;
    bad_t0.t0_ms = 16;
    EXPECT_NE(ConsensusConfigLoader::validate_config(bad_t0), "");
}

TEST_F(StakingKeysTest, ConfigSurvivesFileRoundTrip) {
    auto config = ConsensusConfigLoader::create_default();
    config.thread_count = 4;
    config.t0_ms = 2000;
    config.staking_keys_path = path_;
    config.max_dependency_blocks = 17;

    const auto config_path = (dir_ / "consensus.json").string();
    ASSERT_TRUE(ConsensusConfigLoader::save_to_file(config, config_path));

    auto loaded = ConsensusConfigLoader::load_from_file(config_path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->thread_count, 4);
    EXPECT_EQ(loaded->t0_ms, 2000u);
    EXPECT_EQ(loaded->genesis_key, config.genesis_key);
    EXPECT_EQ(loaded->genesis_timestamp_ms, config.genesis_timestamp_ms);
    EXPECT_EQ(loaded->staking_keys_path, path_);
    EXPECT_EQ(loaded->max_dependency_blocks, 17u);
}

TEST_F(StakingKeysTest, MissingJsonFieldsKeepDefaults) {
    auto loaded = ConsensusConfigLoader::load_from_json(
        nlohmann::json{{"t0_ms", 500}});
    ASSERT_TRUE(loaded.has_value());

    ConsensusConfig defaults;
    EXPECT_EQ(loaded->t0_ms, 500u);
    EXPECT_EQ(loaded->thread_count, defaults.thread_count);
    EXPECT_EQ(loaded->channel_size, defaults.channel_size);
    EXPECT_TRUE(loaded->genesis_key.empty());
}

TEST_F(StakingKeysTest, MalformedConfigIsRejected) {
    EXPECT_FALSE(ConsensusConfigLoader::load_from_json(
                     nlohmann::json{{"genesis_key", "zz"}})
                     .has_value());
    EXPECT_FALSE(ConsensusConfigLoader::load_from_json(
                     nlohmann::json{{"t0_ms", "soon"}})
                     .has_value());
    EXPECT_FALSE(ConsensusConfigLoader::load_from_file(
                     (dir_ / "does_not_exist.json").string())
                     .has_value());
}
