// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/ConfigManager.hxx"
#include "system/Logger.hxx"
#include "utils/FileHandle.hxx"
#include "mbus/MBusTypes.hxx"

namespace mbusMQTT
{
    static constexpr char TAG[] = "Config";
    static constexpr char PasswordMask[] = "***";

    namespace {
        void readString(const cJSON* obj, const char* key, std::string& out) {
            const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
            if (cJSON_IsString(item) && item->valuestring != nullptr) {
                out = item->valuestring;
            }
        }

        // Пароль "***" означает "не менять"
        void readSecret(const cJSON* obj, const char* key, std::string& out) {
            const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
            if (cJSON_IsString(item) && item->valuestring != nullptr && std::strcmp(item->valuestring, PasswordMask) != 0) {
                out = item->valuestring;
            }
        }

        template <typename T>
        void readNumber(const cJSON* obj, const char* key, T& out) {
            const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
            if (!cJSON_IsNumber(item)) return;
            if constexpr (std::is_floating_point_v<T>) {
                out = static_cast<T>(item->valuedouble);
            } else {
                if (item->valuedouble < 0) {
                    MBUS_LOGW(TAG, "Negative value for '%s' ignored", key);
                    return;
                }
                out = static_cast<T>(item->valuedouble);
            }
        }

        void readBool(const cJSON* obj, const char* key, bool& out) {
            const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
            if (cJSON_IsBool(item)) {
                out = cJSON_IsTrue(item);
            } else if (cJSON_IsNumber(item)) {
                out = item->valueint != 0;
            }
        }

        // Address may be given as a number (primary) or a string
        std::string addressOf(const cJSON* item) {
            const cJSON* address = cJSON_GetObjectItemCaseSensitive(item, "address");
            if (cJSON_IsNumber(address)) {
                return std::to_string(address->valueint);
            }
            if (cJSON_IsString(address) && address->valuestring != nullptr) {
                return address->valuestring;
            }
            return {};
        }

        bool sameMqtt(const AppConfig& a, const AppConfig& b) {
            return a.mqtt_broker == b.mqtt_broker && a.mqtt_port == b.mqtt_port &&
                   a.mqtt_user == b.mqtt_user && a.mqtt_pass == b.mqtt_pass &&
                   a.mqtt_client_id == b.mqtt_client_id && a.mqtt_topic_prefix == b.mqtt_topic_prefix &&
                   a.mqtt_qos == b.mqtt_qos && a.mqtt_keepalive == b.mqtt_keepalive &&
                   a.mqtt_reconnect_delay_min == b.mqtt_reconnect_delay_min &&
                   a.mqtt_reconnect_delay_max == b.mqtt_reconnect_delay_max &&
                   a.ha_bridge_state_topic == b.ha_bridge_state_topic;
        }

        bool sameBus(const AppConfig& a, const AppConfig& b) {
            const bool same_devices = std::ranges::equal(a.mbus_devices, b.mbus_devices,
                [](const KnownDeviceConfig& x, const KnownDeviceConfig& y) {
                    return x.address == y.address && x.name == y.name && x.enabled == y.enabled &&
                           x.poll_interval == y.poll_interval;
                });
            return same_devices && a.mbus_port == b.mbus_port && a.mbus_baudrate == b.mbus_baudrate &&
                   a.mbus_timeout == b.mbus_timeout && a.mbus_scan_interval == b.mbus_scan_interval &&
                   a.mbus_read_interval == b.mbus_read_interval && a.mbus_max_retries == b.mbus_max_retries &&
                   a.mbus_retry_delay == b.mbus_retry_delay && a.mbus_probe_settle_ms == b.mbus_probe_settle_ms &&
                   a.mbus_read_settle_ms == b.mbus_read_settle_ms && a.mbus_ping_retries == b.mbus_ping_retries &&
                   a.mbus_primary_scan_first == b.mbus_primary_scan_first &&
                   a.mbus_primary_scan_last == b.mbus_primary_scan_last && a.mbus_scan_mask == b.mbus_scan_mask &&
                   a.mbus_probe_retries == b.mbus_probe_retries &&
                   a.mbus_scan_with_known_devices == b.mbus_scan_with_known_devices;
        }

        std::string printTree(cJSON* root) {
            std::string out;
            if (char* text = cJSON_Print(root)) {
                out = text;
                cJSON_free(text);
            }
            return out;
        }
    }

    gw_err_t ConfigManager::init(const std::string& path) {
        {
            std::lock_guard<std::mutex> lock(config_mutex);
            config_path = path.empty() ? DefaultConfigPath : path;
        }
        return load();
    }

    gw_err_t ConfigManager::load() {
        std::lock_guard<std::mutex> lock(config_mutex);

        AppConfig cfg{};
        const utils::FileHandle file(config_path.c_str(), "rb");
        if (!file) {
            MBUS_LOGW(TAG, "Config file %s not found, using defaults", config_path.c_str());
            config_cache = cfg;
            return GW_OK;
        }

        const auto content = file.readAll();
        if (!content) {
            MBUS_LOGE(TAG, "Failed to read %s", config_path.c_str());
            return GW_ERR_IO;
        }

        cJSON* root = cJSON_ParseWithLength(content->data(), content->size());
        if (root == nullptr) {
            MBUS_LOGE(TAG, "Failed to parse configuration JSON in %s", config_path.c_str());
            return GW_ERR_INVALID_ARG;
        }
        const bool applied = applyJson(root, cfg);
        cJSON_Delete(root);
        if (!applied) {
            MBUS_LOGE(TAG, "Configuration root must be an object");
            return GW_ERR_INVALID_ARG;
        }

        normalize(cfg);
        config_cache = cfg;
        MBUS_LOGI(TAG, "Configuration loaded from %s (%zu known devices)", config_path.c_str(), cfg.mbus_devices.size());
        return GW_OK;
    }

    bool ConfigManager::applyJson(const cJSON* root, AppConfig& cfg) {
        if (!cJSON_IsObject(root)) {
            return false;
        }

        if (const cJSON* mqtt = cJSON_GetObjectItemCaseSensitive(root, "mqtt"); cJSON_IsObject(mqtt)) {
            readString(mqtt, "broker", cfg.mqtt_broker);
            readNumber(mqtt, "port", cfg.mqtt_port);
            readString(mqtt, "username", cfg.mqtt_user);
            readSecret(mqtt, "password", cfg.mqtt_pass);
            readString(mqtt, "client_id", cfg.mqtt_client_id);
            readString(mqtt, "topic_prefix", cfg.mqtt_topic_prefix);
            readNumber(mqtt, "qos", cfg.mqtt_qos);
            readNumber(mqtt, "keepalive", cfg.mqtt_keepalive);
            readNumber(mqtt, "reconnect_delay_min", cfg.mqtt_reconnect_delay_min);
            readNumber(mqtt, "reconnect_delay_max", cfg.mqtt_reconnect_delay_max);
        }

        if (const cJSON* mbus = cJSON_GetObjectItemCaseSensitive(root, "mbus"); cJSON_IsObject(mbus)) {
            readString(mbus, "port", cfg.mbus_port);
            readNumber(mbus, "baudrate", cfg.mbus_baudrate);
            readNumber(mbus, "timeout", cfg.mbus_timeout);
            readNumber(mbus, "scan_interval", cfg.mbus_scan_interval);
            readNumber(mbus, "read_interval", cfg.mbus_read_interval);
            readNumber(mbus, "max_retries", cfg.mbus_max_retries);
            readNumber(mbus, "retry_delay", cfg.mbus_retry_delay);
            readNumber(mbus, "probe_settle_ms", cfg.mbus_probe_settle_ms);
            readNumber(mbus, "read_settle_ms", cfg.mbus_read_settle_ms);
            readNumber(mbus, "ping_retries", cfg.mbus_ping_retries);
            readNumber(mbus, "primary_scan_first", cfg.mbus_primary_scan_first);
            readNumber(mbus, "primary_scan_last", cfg.mbus_primary_scan_last);
            readString(mbus, "scan_mask", cfg.mbus_scan_mask);
            readNumber(mbus, "probe_retries", cfg.mbus_probe_retries);
            readBool(mbus, "scan_with_known_devices", cfg.mbus_scan_with_known_devices);

            if (const cJSON* devices = cJSON_GetObjectItemCaseSensitive(mbus, "devices"); cJSON_IsArray(devices)) {
                cfg.mbus_devices.clear();
                const cJSON* item = nullptr;
                cJSON_ArrayForEach(item, devices) {
                    KnownDeviceConfig device;
                    device.address = addressOf(item);
                    if (device.address.empty()) {
                        MBUS_LOGW(TAG, "Device entry without address skipped");
                        continue;
                    }
                    readString(item, "name", device.name);
                    readBool(item, "enabled", device.enabled);
                    readNumber(item, "poll_interval", device.poll_interval);
                    cfg.mbus_devices.push_back(std::move(device));
                }
            }
        }

        if (const cJSON* ha = cJSON_GetObjectItemCaseSensitive(root, "homeassistant"); cJSON_IsObject(ha)) {
            readString(ha, "discovery_prefix", cfg.ha_discovery_prefix);
            readString(ha, "bridge_state_topic", cfg.ha_bridge_state_topic);
            readNumber(ha, "expire_after", cfg.ha_expire_after);
            readNumber(ha, "heartbeat_interval", cfg.ha_heartbeat_interval);
        }

        if (const cJSON* db = cJSON_GetObjectItemCaseSensitive(root, "persistence"); cJSON_IsObject(db)) {
            readString(db, "database", cfg.db_path);
            readNumber(db, "history_days", cfg.history_days);
            readNumber(db, "max_queue_size", cfg.max_queue_size);
            readNumber(db, "cleanup_interval", cfg.cleanup_interval);
            readNumber(db, "queue_batch_size", cfg.queue_batch_size);
            readNumber(db, "queue_interval", cfg.queue_interval);
        }

        if (const cJSON* cb = cJSON_GetObjectItemCaseSensitive(root, "circuit_breaker"); cJSON_IsObject(cb)) {
            readBool(cb, "enabled", cfg.breaker_enabled);
            readNumber(cb, "failure_threshold", cfg.breaker_failure_threshold);
            readNumber(cb, "timeout", cfg.breaker_timeout);
        }

        if (const cJSON* perf = cJSON_GetObjectItemCaseSensitive(root, "performance"); cJSON_IsObject(perf)) {
            readNumber(perf, "worker_threads", cfg.worker_threads);
            readNumber(perf, "graceful_shutdown_timeout", cfg.graceful_shutdown_timeout);
            readNumber(perf, "tick_ms", cfg.tick_ms);
            readNumber(perf, "metrics_interval", cfg.metrics_interval);
        }

        if (const cJSON* mon = cJSON_GetObjectItemCaseSensitive(root, "monitoring"); cJSON_IsObject(mon)) {
            readString(mon, "status_file", cfg.status_file);
        }

        if (const cJSON* logging = cJSON_GetObjectItemCaseSensitive(root, "logging"); cJSON_IsObject(logging)) {
            readString(logging, "level", cfg.log_level);
            readBool(logging, "syslog", cfg.syslog_enabled);
            readString(logging, "syslog_server", cfg.syslog_server);
        }

        if (const cJSON* gw = cJSON_GetObjectItemCaseSensitive(root, "gateway"); cJSON_IsObject(gw)) {
            readString(gw, "name", cfg.gateway_name);
            readString(gw, "manufacturer", cfg.gateway_manufacturer);
            readString(gw, "model", cfg.gateway_model);
            readString(gw, "version", cfg.gateway_version);
        }
        return true;
    }

    void ConfigManager::normalize(AppConfig& cfg) {
        if (cfg.mqtt_qos < 0 || cfg.mqtt_qos > 2) {
            MBUS_LOGW(TAG, "mqtt.qos %d out of range, using 1", cfg.mqtt_qos);
            cfg.mqtt_qos = 1;
        }
        if (cfg.mbus_primary_scan_last > common::AddressMaxPrimary) {
            cfg.mbus_primary_scan_last = common::AddressMaxPrimary;
        }
        if (cfg.mbus_scan_mask.size() != common::SecondaryAddressLength || !utils::isHexString(cfg.mbus_scan_mask)) {
            MBUS_LOGW(TAG, "Invalid scan_mask '%s', scanning the whole bus", cfg.mbus_scan_mask.c_str());
            cfg.mbus_scan_mask = common::SecondaryWildcardMask;
        }
        cfg.mbus_scan_mask = utils::toUpper(cfg.mbus_scan_mask);

        if (cfg.mbus_max_retries == 0) cfg.mbus_max_retries = 1;
        if (cfg.mbus_read_interval == 0) cfg.mbus_read_interval = 1;
        if (cfg.worker_threads == 0) cfg.worker_threads = 1;
        if (cfg.tick_ms == 0) cfg.tick_ms = 1000;
        if (cfg.queue_batch_size == 0) cfg.queue_batch_size = 1;
        if (cfg.ha_expire_after == 0) cfg.ha_expire_after = 300;
        if (cfg.ha_expire_after < 2) {
            MBUS_LOGW(TAG, "expire_after %u leaves no room for a heartbeat, using 2", cfg.ha_expire_after);
            cfg.ha_expire_after = 2;
        }

        if (cfg.ha_heartbeat_interval == 0 || cfg.ha_heartbeat_interval >= cfg.ha_expire_after) {
            const uint32_t clamped = std::max<uint32_t>(cfg.ha_expire_after / 2, 1);
            MBUS_LOGW(TAG, "heartbeat_interval %u must be below expire_after %u, using %u",
                      cfg.ha_heartbeat_interval, cfg.ha_expire_after, clamped);
            cfg.ha_heartbeat_interval = clamped;
        }
    }

    gw_err_t ConfigManager::saveMainConfig(const AppConfig& new_config) {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(config_mutex);
            config_cache = new_config;
            path = config_path;
        }

        cJSON* root = serialize(new_config, false);
        const std::string text = printTree(root);
        cJSON_Delete(root);

        const utils::FileHandle file(path.c_str(), "wb");
        if (!file || !file.writeAll(text)) {
            MBUS_LOGE(TAG, "Failed to write configuration to %s", path.c_str());
            return GW_ERR_IO;
        }
        MBUS_LOGI(TAG, "Configuration saved successfully.");
        return GW_OK;
    }

    AppConfig ConfigManager::getConfig() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config_cache;
    }

    void ConfigManager::setConfig(const AppConfig& new_config) {
        std::lock_guard<std::mutex> lock(config_mutex);
        config_cache = new_config;
    }

    std::string ConfigManager::getPath() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config_path;
    }

    cJSON* ConfigManager::getSerializedConfig(const bool mask_passwords) const {
        return serialize(getConfig(), mask_passwords);
    }

    cJSON* ConfigManager::serialize(const AppConfig& cfg, const bool mask_passwords) {
        cJSON* root = cJSON_CreateObject();

        cJSON* mqtt = cJSON_AddObjectToObject(root, "mqtt");
        cJSON_AddStringToObject(mqtt, "broker", cfg.mqtt_broker.c_str());
        cJSON_AddNumberToObject(mqtt, "port", cfg.mqtt_port);
        cJSON_AddStringToObject(mqtt, "username", cfg.mqtt_user.c_str());
        cJSON_AddStringToObject(mqtt, "password", mask_passwords ? PasswordMask : cfg.mqtt_pass.c_str());
        cJSON_AddStringToObject(mqtt, "client_id", cfg.mqtt_client_id.c_str());
        cJSON_AddStringToObject(mqtt, "topic_prefix", cfg.mqtt_topic_prefix.c_str());
        cJSON_AddNumberToObject(mqtt, "qos", cfg.mqtt_qos);
        cJSON_AddNumberToObject(mqtt, "keepalive", cfg.mqtt_keepalive);
        cJSON_AddNumberToObject(mqtt, "reconnect_delay_min", cfg.mqtt_reconnect_delay_min);
        cJSON_AddNumberToObject(mqtt, "reconnect_delay_max", cfg.mqtt_reconnect_delay_max);

        cJSON* mbus = cJSON_AddObjectToObject(root, "mbus");
        cJSON_AddStringToObject(mbus, "port", cfg.mbus_port.c_str());
        cJSON_AddNumberToObject(mbus, "baudrate", cfg.mbus_baudrate);
        cJSON_AddNumberToObject(mbus, "timeout", cfg.mbus_timeout);
        cJSON_AddNumberToObject(mbus, "scan_interval", cfg.mbus_scan_interval);
        cJSON_AddNumberToObject(mbus, "read_interval", cfg.mbus_read_interval);
        cJSON_AddNumberToObject(mbus, "max_retries", cfg.mbus_max_retries);
        cJSON_AddNumberToObject(mbus, "retry_delay", cfg.mbus_retry_delay);
        cJSON_AddNumberToObject(mbus, "probe_settle_ms", cfg.mbus_probe_settle_ms);
        cJSON_AddNumberToObject(mbus, "read_settle_ms", cfg.mbus_read_settle_ms);
        cJSON_AddNumberToObject(mbus, "ping_retries", cfg.mbus_ping_retries);
        cJSON_AddNumberToObject(mbus, "primary_scan_first", cfg.mbus_primary_scan_first);
        cJSON_AddNumberToObject(mbus, "primary_scan_last", cfg.mbus_primary_scan_last);
        cJSON_AddStringToObject(mbus, "scan_mask", cfg.mbus_scan_mask.c_str());
        cJSON_AddNumberToObject(mbus, "probe_retries", cfg.mbus_probe_retries);
        cJSON_AddBoolToObject(mbus, "scan_with_known_devices", cfg.mbus_scan_with_known_devices);
        cJSON* devices = cJSON_AddArrayToObject(mbus, "devices");
        for (const auto& device : cfg.mbus_devices) {
            cJSON* item = cJSON_CreateObject();
            cJSON_AddStringToObject(item, "address", device.address.c_str());
            cJSON_AddStringToObject(item, "name", device.name.c_str());
            cJSON_AddBoolToObject(item, "enabled", device.enabled);
            cJSON_AddNumberToObject(item, "poll_interval", device.poll_interval);
            cJSON_AddItemToArray(devices, item);
        }

        cJSON* ha = cJSON_AddObjectToObject(root, "homeassistant");
        cJSON_AddStringToObject(ha, "discovery_prefix", cfg.ha_discovery_prefix.c_str());
        cJSON_AddStringToObject(ha, "bridge_state_topic", cfg.ha_bridge_state_topic.c_str());
        cJSON_AddNumberToObject(ha, "expire_after", cfg.ha_expire_after);
        cJSON_AddNumberToObject(ha, "heartbeat_interval", cfg.ha_heartbeat_interval);

        cJSON* db = cJSON_AddObjectToObject(root, "persistence");
        cJSON_AddStringToObject(db, "database", cfg.db_path.c_str());
        cJSON_AddNumberToObject(db, "history_days", cfg.history_days);
        cJSON_AddNumberToObject(db, "max_queue_size", cfg.max_queue_size);
        cJSON_AddNumberToObject(db, "cleanup_interval", cfg.cleanup_interval);
        cJSON_AddNumberToObject(db, "queue_batch_size", cfg.queue_batch_size);
        cJSON_AddNumberToObject(db, "queue_interval", cfg.queue_interval);

        cJSON* cb = cJSON_AddObjectToObject(root, "circuit_breaker");
        cJSON_AddBoolToObject(cb, "enabled", cfg.breaker_enabled);
        cJSON_AddNumberToObject(cb, "failure_threshold", cfg.breaker_failure_threshold);
        cJSON_AddNumberToObject(cb, "timeout", cfg.breaker_timeout);

        cJSON* perf = cJSON_AddObjectToObject(root, "performance");
        cJSON_AddNumberToObject(perf, "worker_threads", cfg.worker_threads);
        cJSON_AddNumberToObject(perf, "graceful_shutdown_timeout", cfg.graceful_shutdown_timeout);
        cJSON_AddNumberToObject(perf, "tick_ms", cfg.tick_ms);
        cJSON_AddNumberToObject(perf, "metrics_interval", cfg.metrics_interval);

        cJSON* mon = cJSON_AddObjectToObject(root, "monitoring");
        cJSON_AddStringToObject(mon, "status_file", cfg.status_file.c_str());

        cJSON* logging = cJSON_AddObjectToObject(root, "logging");
        cJSON_AddStringToObject(logging, "level", cfg.log_level.c_str());
        cJSON_AddBoolToObject(logging, "syslog", cfg.syslog_enabled);
        cJSON_AddStringToObject(logging, "syslog_server", cfg.syslog_server.c_str());

        cJSON* gw = cJSON_AddObjectToObject(root, "gateway");
        cJSON_AddStringToObject(gw, "name", cfg.gateway_name.c_str());
        cJSON_AddStringToObject(gw, "manufacturer", cfg.gateway_manufacturer.c_str());
        cJSON_AddStringToObject(gw, "model", cfg.gateway_model.c_str());
        cJSON_AddStringToObject(gw, "version", cfg.gateway_version.c_str());

        return root;
    }

    ConfigUpdateResult ConfigManager::updateConfigFromJson(const char* json_str) {
        cJSON* root = cJSON_Parse(json_str);
        if (root == nullptr) {
            MBUS_LOGE(TAG, "Failed to parse configuration JSON");
            return ConfigUpdateResult::NoUpdate;
        }

        const AppConfig old_cfg = getConfig();
        AppConfig new_cfg = old_cfg;
        const bool applied = applyJson(root, new_cfg);
        cJSON_Delete(root);
        if (!applied) {
            return ConfigUpdateResult::NoUpdate;
        }
        normalize(new_cfg);

        const bool mqtt_changed = !sameMqtt(old_cfg, new_cfg);
        const bool bus_changed = !sameBus(old_cfg, new_cfg);

        // Остальное сравниваем по сериализованному виду
        cJSON* new_tree = serialize(new_cfg, false);
        const std::string new_text = printTree(new_tree);
        cJSON_Delete(new_tree);

        cJSON* old_tree = serialize(old_cfg, false);
        const std::string old_text = printTree(old_tree);
        cJSON_Delete(old_tree);

        if (new_text == old_text) {
            return ConfigUpdateResult::NoUpdate;
        }

        if (saveMainConfig(new_cfg) != GW_OK) {
            MBUS_LOGW(TAG, "Configuration applied in memory only");
            setConfig(new_cfg);
        }

        if (mqtt_changed) return ConfigUpdateResult::MQTTUpdate;
        if (bus_changed) return ConfigUpdateResult::BusUpdate;
        return ConfigUpdateResult::SystemUpdate;
    }
}
