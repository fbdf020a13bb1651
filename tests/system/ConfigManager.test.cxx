// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "system/ConfigManager.hxx"
#include "utils/FileHandle.hxx"

using namespace mbusMQTT;

namespace {
    std::string writeTempConfig(const char* name, const std::string& content) {
        const std::string path = (std::filesystem::temp_directory_path() / name).string();
        const utils::FileHandle file(path.c_str(), "wb");
        TEST_ASSERT_TRUE(static_cast<bool>(file));
        TEST_ASSERT_TRUE(file.writeAll(content));
        return path;
    }

    AppConfig applied(const char* json) {
        AppConfig cfg;
        cJSON* root = cJSON_Parse(json);
        TEST_ASSERT_NOT_NULL(root);
        TEST_ASSERT_TRUE(ConfigManager::applyJson(root, cfg));
        cJSON_Delete(root);
        ConfigManager::normalize(cfg);
        return cfg;
    }
}

static void test_config_missing_file_gives_defaults() {
    auto& cm = ConfigManager::Instance();
    const std::string path = (std::filesystem::temp_directory_path() / "mbus2mqtt_absent.json").string();
    std::error_code ec;
    std::filesystem::remove(path, ec);

    TEST_ASSERT_EQUAL(GW_OK, cm.init(path));
    const AppConfig cfg = cm.getConfig();
    TEST_ASSERT_EQUAL_STRING("localhost", cfg.mqtt_broker.c_str());
    TEST_ASSERT_EQUAL_UINT16(1883, cfg.mqtt_port);
    TEST_ASSERT_EQUAL_UINT32(3600, cfg.mbus_scan_interval);
    TEST_ASSERT_EQUAL_STRING("FFFFFFFFFFFFFFFF", cfg.mbus_scan_mask.c_str());
    TEST_ASSERT_EQUAL_STRING("mbus/bridge/state", cfg.ha_bridge_state_topic.c_str());
    TEST_ASSERT_TRUE(cfg.mbus_devices.empty());
}

static void test_config_nested_file_is_loaded() {
    const std::string path = writeTempConfig("mbus2mqtt_nested.json", R"({
        "mqtt": {"broker": "broker.lan", "port": 8883, "username": "gw", "password": "secret", "qos": 0},
        "mbus": {"port": "/dev/ttyAMA0", "baudrate": 2400, "timeout": 1.5, "scan_mask": "12ffffffffffffff",
                 "devices": [{"address": 5, "name": "Heat", "poll_interval": 60},
                             {"address": "1234567847240107", "enabled": false},
                             {"name": "no address"}]},
        "homeassistant": {"expire_after": 120, "heartbeat_interval": 30},
        "persistence": {"database": ":memory:", "max_queue_size": 50},
        "logging": {"level": "debug"}
    })");

    auto& cm = ConfigManager::Instance();
    TEST_ASSERT_EQUAL(GW_OK, cm.init(path));
    const AppConfig cfg = cm.getConfig();

    TEST_ASSERT_EQUAL_STRING("broker.lan", cfg.mqtt_broker.c_str());
    TEST_ASSERT_EQUAL_UINT16(8883, cfg.mqtt_port);
    TEST_ASSERT_EQUAL_STRING("secret", cfg.mqtt_pass.c_str());
    TEST_ASSERT_EQUAL_INT(0, cfg.mqtt_qos);
    TEST_ASSERT_EQUAL_STRING("/dev/ttyAMA0", cfg.mbus_port.c_str());
    TEST_ASSERT_EQUAL_UINT32(2400, cfg.mbus_baudrate);
    TEST_ASSERT_TRUE(cfg.mbus_timeout == 1.5);
    TEST_ASSERT_EQUAL_STRING("12FFFFFFFFFFFFFF", cfg.mbus_scan_mask.c_str());
    TEST_ASSERT_EQUAL_size_t(2, cfg.mbus_devices.size());
    TEST_ASSERT_EQUAL_STRING("5", cfg.mbus_devices[0].address.c_str());
    TEST_ASSERT_EQUAL_UINT32(60, cfg.mbus_devices[0].poll_interval);
    TEST_ASSERT_FALSE(cfg.mbus_devices[1].enabled);
    TEST_ASSERT_EQUAL_UINT32(30, cfg.ha_heartbeat_interval);
    TEST_ASSERT_EQUAL_STRING(":memory:", cfg.db_path.c_str());
    TEST_ASSERT_EQUAL_STRING("debug", cfg.log_level.c_str());
    // Untouched sections keep their defaults
    TEST_ASSERT_TRUE(cfg.breaker_enabled);
}

static void test_config_parse_error_is_reported() {
    const std::string path = writeTempConfig("mbus2mqtt_broken.json", "{\"mqtt\": {");
    TEST_ASSERT_EQUAL(GW_ERR_INVALID_ARG, ConfigManager::Instance().init(path));

    const std::string array_path = writeTempConfig("mbus2mqtt_array.json", "[1, 2]");
    TEST_ASSERT_EQUAL(GW_ERR_INVALID_ARG, ConfigManager::Instance().init(array_path));
}

static void test_config_normalize_clamps_values() {
    AppConfig cfg = applied(R"({
        "mqtt": {"qos": 5},
        "mbus": {"scan_mask": "nothex", "max_retries": 0, "primary_scan_last": 400},
        "homeassistant": {"expire_after": 100, "heartbeat_interval": 100}
    })");
    TEST_ASSERT_EQUAL_INT(1, cfg.mqtt_qos);
    TEST_ASSERT_EQUAL_STRING("FFFFFFFFFFFFFFFF", cfg.mbus_scan_mask.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, cfg.mbus_max_retries);
    TEST_ASSERT_EQUAL_UINT32(250, cfg.mbus_primary_scan_last);
    TEST_ASSERT_EQUAL_UINT32(50, cfg.ha_heartbeat_interval);

    // Heartbeat stays strictly below expire_after even at the smallest setting
    const AppConfig tight = applied(R"({"homeassistant": {"expire_after": 1, "heartbeat_interval": 1}})");
    TEST_ASSERT_EQUAL_UINT32(2, tight.ha_expire_after);
    TEST_ASSERT_EQUAL_UINT32(1, tight.ha_heartbeat_interval);
    TEST_ASSERT_TRUE(tight.ha_heartbeat_interval < tight.ha_expire_after);
}

static void test_config_password_masking() {
    const std::string path = writeTempConfig("mbus2mqtt_secret.json", R"({"mqtt": {"password": "hunter2"}})");
    auto& cm = ConfigManager::Instance();
    TEST_ASSERT_EQUAL(GW_OK, cm.init(path));

    cJSON* masked = cm.getSerializedConfig();
    TEST_ASSERT_EQUAL_STRING("***", cJSON_GetObjectItem(cJSON_GetObjectItem(masked, "mqtt"), "password")->valuestring);
    cJSON_Delete(masked);

    // Masked value sent back does not overwrite the password
    AppConfig cfg = cm.getConfig();
    cJSON* root = cJSON_Parse(R"({"mqtt": {"password": "***"}})");
    TEST_ASSERT_TRUE(ConfigManager::applyJson(root, cfg));
    cJSON_Delete(root);
    TEST_ASSERT_EQUAL_STRING("hunter2", cfg.mqtt_pass.c_str());
}

static void test_config_update_classification() {
    const std::string path = writeTempConfig("mbus2mqtt_update.json", "{}");
    auto& cm = ConfigManager::Instance();
    TEST_ASSERT_EQUAL(GW_OK, cm.init(path));

    TEST_ASSERT_EQUAL(ConfigUpdateResult::MQTTUpdate, cm.updateConfigFromJson(R"({"mqtt": {"broker": "10.0.0.2"}})"));
    TEST_ASSERT_EQUAL_STRING("10.0.0.2", cm.getConfig().mqtt_broker.c_str());

    TEST_ASSERT_EQUAL(ConfigUpdateResult::BusUpdate, cm.updateConfigFromJson(R"({"mbus": {"read_interval": 30}})"));
    TEST_ASSERT_EQUAL(ConfigUpdateResult::SystemUpdate, cm.updateConfigFromJson(R"({"logging": {"level": "warn"}})"));
    TEST_ASSERT_EQUAL(ConfigUpdateResult::NoUpdate, cm.updateConfigFromJson(R"({"garbage": 1})"));
    TEST_ASSERT_EQUAL(ConfigUpdateResult::NoUpdate, cm.updateConfigFromJson("not json"));

    // The saved file reloads to the same configuration
    TEST_ASSERT_EQUAL(GW_OK, cm.load());
    TEST_ASSERT_EQUAL_STRING("10.0.0.2", cm.getConfig().mqtt_broker.c_str());
    TEST_ASSERT_EQUAL_UINT32(30, cm.getConfig().mbus_read_interval);
    TEST_ASSERT_EQUAL_STRING("warn", cm.getConfig().log_level.c_str());
}

void run_config_manager_tests() {
    RUN_TEST(test_config_missing_file_gives_defaults);
    RUN_TEST(test_config_nested_file_is_loaded);
    RUN_TEST(test_config_parse_error_is_reported);
    RUN_TEST(test_config_normalize_clamps_values);
    RUN_TEST(test_config_password_masking);
    RUN_TEST(test_config_update_classification);
}
