#include <gtest/gtest.h>
#include "AuctionTestSupport.hpp"
#include "ModuleConfig.hpp"
#include <filesystem>
#include <fstream>

using namespace auction;
using namespace auction::testing_support;

class ModuleConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
        testDir = "test_module_config";
        std::filesystem::create_directories(testDir);
        configFile = testDir + "/module.conf";
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    void writeFile(const std::string& content) {
        std::ofstream file(configFile);
        file << content;
    }

    std::string testDir;
    std::string configFile;
};

TEST_F(ModuleConfigTest, SaveAndLoad) {
    ModuleConfig config;
    config.hubAddress = addressOf("hub");
    config.moduleAddress = addressOf("module");
    config.collectableTemplate = addressOf("template");
    config.dataDirectory = "some/dir";
    ASSERT_TRUE(config.saveToFile(configFile));

    ModuleConfig loaded;
    ASSERT_TRUE(ModuleConfig::loadFromFile(configFile, loaded));
    EXPECT_EQ(loaded.hubAddress, config.hubAddress);
    EXPECT_EQ(loaded.moduleAddress, config.moduleAddress);
    EXPECT_EQ(loaded.collectableTemplate, config.collectableTemplate);
    EXPECT_EQ(loaded.dataDirectory, "some/dir");
}

TEST_F(ModuleConfigTest, CommentsAndPrefixedAddresses) {
    writeFile("# comentario\n"
              "hub = 0x" + std::string(40, 'A') + "\n"
              "\n"
              "module=" + std::string(40, 'b') + "\n"
              "collectable_template=" + std::string(40, 'c') + "\n");

    ModuleConfig config;
    ASSERT_TRUE(ModuleConfig::loadFromFile(configFile, config));
    EXPECT_EQ(config.hubAddress, std::string(40, 'a'));
    EXPECT_EQ(config.dataDirectory, "auction_data");
}

TEST_F(ModuleConfigTest, InvalidAddressFailsWithoutTouchingConfig) {
    writeFile("hub=xyz\n");

    ModuleConfig config;
    config.hubAddress = addressOf("previous");
    EXPECT_FALSE(ModuleConfig::loadFromFile(configFile, config));
    EXPECT_EQ(config.hubAddress, addressOf("previous"));
}

TEST_F(ModuleConfigTest, IncompleteConfigFails) {
    writeFile("hub=" + std::string(40, 'a') + "\n");

    ModuleConfig config;
    EXPECT_FALSE(ModuleConfig::loadFromFile(configFile, config));
    EXPECT_FALSE(config.isValid());
}

TEST_F(ModuleConfigTest, MissingFileFails) {
    ModuleConfig config;
    EXPECT_FALSE(ModuleConfig::loadFromFile(testDir + "/missing.conf", config));
}
