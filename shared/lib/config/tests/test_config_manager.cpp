/**
 * @file test_config_manager.cpp
 * @brief Unit tests for ConfigManager typed getters
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include "config_manager.h"

using common::ConfigManager;

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager& cfg = ConfigManager::getInstance();
};

TEST_F(ConfigManagerTest, GetString_OverrideAndDefault) {
    cfg.set("TEST_CFG_STRING", "value");
    EXPECT_EQ(cfg.getString("TEST_CFG_STRING"), "value");
    EXPECT_EQ(cfg.getString("TEST_CFG_ABSENT_KEY", "fallback"), "fallback");
    EXPECT_TRUE(cfg.has("TEST_CFG_STRING"));
    EXPECT_FALSE(cfg.has("TEST_CFG_ABSENT_KEY"));
}

TEST_F(ConfigManagerTest, GetString_FallsBackToEnvironment) {
    setenv("TEST_CFG_FROM_ENV", "env-value", 1);
    EXPECT_EQ(cfg.getString("TEST_CFG_FROM_ENV"), "env-value");
    unsetenv("TEST_CFG_FROM_ENV");
}

TEST_F(ConfigManagerTest, GetInt_Parsing) {
    cfg.set("TEST_CFG_INT", "8443");
    EXPECT_EQ(cfg.getInt("TEST_CFG_INT", 1), 8443);

    cfg.set("TEST_CFG_INT", "80x");
    EXPECT_EQ(cfg.getInt("TEST_CFG_INT", 1), 1);

    cfg.set("TEST_CFG_INT", "abc");
    EXPECT_EQ(cfg.getInt("TEST_CFG_INT", 7), 7);

    EXPECT_EQ(cfg.getInt("TEST_CFG_ABSENT_KEY", 42), 42);
}

TEST_F(ConfigManagerTest, GetBool_Variants) {
    for (const char* v : {"true", "1", "YES", "on"}) {
        cfg.set("TEST_CFG_BOOL", v);
        EXPECT_TRUE(cfg.getBool("TEST_CFG_BOOL", false)) << v;
    }
    for (const char* v : {"false", "0", "no", "OFF"}) {
        cfg.set("TEST_CFG_BOOL", v);
        EXPECT_FALSE(cfg.getBool("TEST_CFG_BOOL", true)) << v;
    }
    cfg.set("TEST_CFG_BOOL", "maybe");
    EXPECT_TRUE(cfg.getBool("TEST_CFG_BOOL", true));
}

TEST_F(ConfigManagerTest, LoadFromEnvironment_PredefinedKeys) {
    setenv(ConfigManager::SSO_ACS_URL, "https://sp.test/acs", 1);
    cfg.loadFromEnvironment();
    unsetenv(ConfigManager::SSO_ACS_URL);

    // Loaded values survive removal from the environment
    EXPECT_EQ(cfg.getString(ConfigManager::SSO_ACS_URL), "https://sp.test/acs");
}
