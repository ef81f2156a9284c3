#include <gtest/gtest.h>
#include <cstdio>
#include "ConfigManager.hpp"
#include "DeviceConfig.hpp"
#include "Vectors.hpp"

namespace {

const char* const DEVICE_JSON = R"({
    "device": {
        "devEUI": "0004A30B001C0530",
        "appEUI": "70B3D57ED0000000",
        "appKey": "00112233445566778899AABBCCDDEEFF"
    },
    "network": { "region": "AS923_3" },
    "options": {
        "adr": false,
        "max_join_attempts": 3,
        "join_retry_delay_ms": 2000,
        "rx_window_ms": 300,
        "battery_level": 128,
        "session_file": "/var/lib/node/session.json"
    }
})";

} // namespace

TEST(ConfigManagerTest, NestedGettersAndDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));

    EXPECT_EQ("AS923_3", config.getString("network.region"));
    EXPECT_EQ(3, config.getInt("options.max_join_attempts"));
    EXPECT_FALSE(config.getBool("options.adr", true));
    EXPECT_TRUE(config.has("device"));
    EXPECT_FALSE(config.has("device.nwkKey"));

    // Missing path or wrong type falls back to the default
    EXPECT_EQ("none", config.getString("device.nwkKey", "none"));
    EXPECT_EQ(7, config.getInt("network.region", 7));
    EXPECT_TRUE(config.getBool("options.verbose", true));
}

TEST(ConfigManagerTest, RejectsInvalidDocuments) {
    ConfigManager config;
    EXPECT_FALSE(config.loadFromString("{ \"device\": "));
    EXPECT_FALSE(config.loadFromString("[1, 2]"));
    EXPECT_FALSE(config.has("device"));
}

TEST(ConfigManagerTest, HexBytes) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));

    uint8_t key[16];
    ASSERT_TRUE(config.getHexBytes("device.appKey", key, sizeof(key)));
    EXPECT_EQ(0x00, key[0]);
    EXPECT_EQ(0xFF, key[15]);

    uint8_t shortBuffer[4];
    EXPECT_FALSE(config.getHexBytes("device.appKey", shortBuffer, sizeof(shortBuffer)));
    EXPECT_FALSE(config.getHexBytes("options.adr", shortBuffer, sizeof(shortBuffer)));
}

TEST(ConfigManagerTest, SettersCreateIntermediateObjects) {
    ConfigManager config;
    config.setString("device.devEUI", "0102030405060708");
    config.setInt("options.rx_window_ms", 250);
    config.setBool("options.adr", true);
    config.setInt("options.rx_window_ms", 400);

    EXPECT_EQ("0102030405060708", config.getString("device.devEUI"));
    EXPECT_EQ(400, config.getInt("options.rx_window_ms"));
    EXPECT_TRUE(config.getBool("options.adr"));
}

TEST(ConfigManagerTest, SaveAndReload) {
    std::string path = ::testing::TempDir() + "config_manager_test.json";
    {
        ConfigManager config(path);
        config.setString("network.region", "EU433");
        ASSERT_TRUE(config.saveConfig());
    }
    ConfigManager reloaded(path);
    ASSERT_TRUE(reloaded.loadConfig());
    EXPECT_EQ("EU433", reloaded.getString("network.region"));
    std::remove(path.c_str());

    ConfigManager missing(path);
    EXPECT_FALSE(missing.loadConfig());
}

TEST(DeviceConfigTest, LoadsEveryField) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));

    DeviceConfig device;
    ASSERT_TRUE(DeviceConfig::load(config, device));
    EXPECT_EQ(vectors::eui(vectors::DEV_EUI), device.devEUI);
    EXPECT_EQ(0x30, device.devEUI[0]);
    EXPECT_EQ(vectors::eui(vectors::APP_EUI), device.appEUI);
    EXPECT_EQ(vectors::key(vectors::APP_KEY), device.appKey);
    EXPECT_EQ(Region::AS923_3, device.region);
    EXPECT_FALSE(device.adr);
    EXPECT_EQ(3, device.maxJoinAttempts);
    EXPECT_EQ(2000u, device.joinRetryDelayMs);
    EXPECT_EQ(300u, device.rxWindowMs);
    EXPECT_EQ(128, device.batteryLevel);
    EXPECT_EQ("/var/lib/node/session.json", device.sessionFile);
}

TEST(DeviceConfigTest, DefaultsForOptionalFields) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"({"device": {
        "devEUI": "0004A30B001C0530", "appEUI": "70B3D57ED0000000",
        "appKey": "00112233445566778899AABBCCDDEEFF"}})"));

    DeviceConfig device;
    ASSERT_TRUE(DeviceConfig::load(config, device));
    EXPECT_EQ(Region::EU868, device.region);
    EXPECT_TRUE(device.adr);
    EXPECT_EQ(5, device.maxJoinAttempts);
    EXPECT_EQ(10000u, device.joinRetryDelayMs);
    EXPECT_EQ(500u, device.rxWindowMs);
    EXPECT_EQ(255, device.batteryLevel);
    EXPECT_TRUE(device.sessionFile.empty());
}

TEST(DeviceConfigTest, RejectsBadValues) {
    DeviceConfig device;
    device.maxJoinAttempts = 42;

    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));
    config.setString("device.appKey", "0011");
    EXPECT_FALSE(DeviceConfig::load(config, device));

    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));
    config.setString("device.devEUI", "0004A30B001C05ZZ");
    EXPECT_FALSE(DeviceConfig::load(config, device));

    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));
    config.setString("network.region", "US915");
    EXPECT_FALSE(DeviceConfig::load(config, device));

    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));
    config.setInt("options.battery_level", 300);
    EXPECT_FALSE(DeviceConfig::load(config, device));

    ASSERT_TRUE(config.loadFromString(DEVICE_JSON));
    config.setInt("options.max_join_attempts", 0);
    EXPECT_FALSE(DeviceConfig::load(config, device));

    // Output untouched on failure
    EXPECT_EQ(42, device.maxJoinAttempts);
}
