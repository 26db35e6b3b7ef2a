#include <gtest/gtest.h>
#include "lanbeam/core/config.hpp"
#include "lanbeam/core/engine.hpp"
#include <fstream>
#include <filesystem>

using namespace lanbeam::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_config.txt";
    }

    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "true");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("string.value", "hello world");
    config.set("millis.value", "250");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
    EXPECT_EQ(config.get_millis("millis.value", std::chrono::milliseconds(1)), std::chrono::milliseconds(250));
}

TEST_F(ConfigTest, BoolParsingToleratesNonAsciiText) {
    auto& config = Config::instance();

    config.set("bool.upper", "TRUE");
    config.set("bool.utf8", "j\xC3\xA4");

    EXPECT_TRUE(config.get_bool("bool.upper"));
    EXPECT_FALSE(config.get_bool("bool.utf8", true));
}

TEST_F(ConfigTest, MalformedNumbersFallBack) {
    auto& config = Config::instance();

    config.set("int.value", "12abc");
    config.set("millis.negative", "-5");

    EXPECT_EQ(config.get_int("int.value", 7), 7);
    EXPECT_EQ(config.get_millis("millis.negative", std::chrono::milliseconds(100)), std::chrono::milliseconds(100));
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "key1=value1\n";
    file << "key2 = value2 \n";
    file << "bool.setting=true\n";
    file << "int.setting=100\n";
    file << "no separator here\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_TRUE(config.get_bool("bool.setting"));
    EXPECT_EQ(config.get_int("int.setting"), 100);
    EXPECT_EQ(config.values().size(), 4u);
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, DefaultsMatchProtocolPorts) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_int("discovery.port"), 53317);
    EXPECT_EQ(config.get_int("transfer.port"), 53318);
    EXPECT_EQ(config.get_string("ipc.socket"), "/tmp/lanbeam.sock");
}

TEST_F(ConfigTest, EngineOptionsFromConfig) {
    Config config;
    config.set_defaults();
    config.set("discovery.port", "40000");
    config.set("discovery.announce_interval_ms", "250");
    config.set("transfer.port", "0");
    config.set("transfer.chunk_size", "4096");
    config.set("offer.proposal_timeout_ms", "1500");
    config.set("storage.download_dir", "/tmp/lanbeam-downloads");

    auto options = EngineOptions::from_config(config);

    EXPECT_EQ(options.discovery.listen_port, 40000);
    EXPECT_EQ(options.discovery.announce_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(options.peer_expiry, std::chrono::milliseconds(3000));
    EXPECT_EQ(options.transfer_port, 0);
    EXPECT_EQ(options.transfer.chunk_size, 4096u);
    EXPECT_EQ(options.negotiation.proposal_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(options.download_directory, std::filesystem::path("/tmp/lanbeam-downloads"));
}
