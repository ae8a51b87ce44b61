/**
 * @file test_config_manager.cpp
 * @brief Unit tests for ConfigManager lookup order and typed getters
 */

#include <gtest/gtest.h>
#include <ddd/common/config_manager.h>

#include <cstdlib>
#include <string>

using namespace ddd::common;

// Explicit sets live for the whole process, so every test uses its own keys.
class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager& config = ConfigManager::getInstance();

    void TearDown() override {
        for (const char* key : {"DDD_TEST_ENV", "DDD_TEST_ENV_OVERRIDE", "DDD_LOG_TO_FILE"}) {
            unsetenv(key);
        }
    }
};

TEST_F(ConfigManagerTest, SingletonInstance) {
    EXPECT_EQ(&ConfigManager::getInstance(), &config);
}

TEST_F(ConfigManagerTest, MissingKeyReturnsDefault) {
    EXPECT_EQ(config.getString("DDD_TEST_MISSING", "fallback"), "fallback");
    EXPECT_EQ(config.getString("DDD_TEST_MISSING"), "");
    EXPECT_TRUE(config.getBool("DDD_TEST_MISSING", true));
}

TEST_F(ConfigManagerTest, SetValueIsReturned) {
    config.set("DDD_TEST_STRING", "value");

    EXPECT_EQ(config.getString("DDD_TEST_STRING"), "value");
}

TEST_F(ConfigManagerTest, EnvironmentIsUsedWhenNotSet) {
    setenv("DDD_TEST_ENV", "from-env", 1);

    EXPECT_EQ(config.getString("DDD_TEST_ENV"), "from-env");
}

TEST_F(ConfigManagerTest, SetValueOverridesEnvironment) {
    setenv("DDD_TEST_ENV_OVERRIDE", "from-env", 1);
    config.set("DDD_TEST_ENV_OVERRIDE", "explicit");

    EXPECT_EQ(config.getString("DDD_TEST_ENV_OVERRIDE"), "explicit");
}

TEST_F(ConfigManagerTest, GetBoolAcceptsCommonSpellings) {
    for (const char* value : {"true", "TRUE", "1", "yes", " On "}) {
        config.set("DDD_TEST_BOOL", value);
        EXPECT_TRUE(config.getBool("DDD_TEST_BOOL", false)) << value;
    }
    for (const char* value : {"false", "0", "NO", "off"}) {
        config.set("DDD_TEST_BOOL", value);
        EXPECT_FALSE(config.getBool("DDD_TEST_BOOL", true)) << value;
    }
}

TEST_F(ConfigManagerTest, GetBoolFallsBackOnGarbage) {
    config.set("DDD_TEST_BOOL_GARBAGE", "maybe");

    EXPECT_TRUE(config.getBool("DDD_TEST_BOOL_GARBAGE", true));
    EXPECT_FALSE(config.getBool("DDD_TEST_BOOL_GARBAGE", false));
}

TEST_F(ConfigManagerTest, LoadFromEnvironmentCapturesLogKeys) {
    setenv(ConfigManager::LOG_TO_FILE, "false", 1);

    config.loadFromEnvironment();
    unsetenv(ConfigManager::LOG_TO_FILE);

    EXPECT_EQ(config.getString(ConfigManager::LOG_TO_FILE), "false");
    EXPECT_FALSE(config.getBool(ConfigManager::LOG_TO_FILE, true));
}
