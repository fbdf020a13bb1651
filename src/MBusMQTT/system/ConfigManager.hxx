// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MBUSMQTT_CONFIGMANAGER_HXX
#define MBUSMQTT_CONFIGMANAGER_HXX

#include "system/GatewayError.hxx"

#ifndef MBUSMQTT_VERSION
#define MBUSMQTT_VERSION "0.0.0-dev"
#endif

namespace mbusMQTT
{
    constexpr char DefaultConfigPath[] = "/etc/mbus2mqtt/config.json";

    struct KnownDeviceConfig {
        std::string address;
        std::string name;
        bool enabled{true};
        uint32_t poll_interval{0};    // seconds, 0 -> mbus.read_interval
    };

    struct AppConfig {
        // MQTT
        std::string mqtt_broker{"localhost"};
        uint16_t mqtt_port{1883};
        std::string mqtt_user;
        std::string mqtt_pass;
        std::string mqtt_client_id{"mbus_gateway"};
        std::string mqtt_topic_prefix{"homeassistant"};
        int mqtt_qos{1};
        uint32_t mqtt_keepalive{60};
        uint32_t mqtt_reconnect_delay_min{5};
        uint32_t mqtt_reconnect_delay_max{300};

        // M-Bus
        std::string mbus_port{"/dev/ttyUSB0"};
        uint32_t mbus_baudrate{9600};
        double mbus_timeout{5.0};
        uint32_t mbus_scan_interval{3600};
        uint32_t mbus_read_interval{15};
        uint32_t mbus_max_retries{3};
        double mbus_retry_delay{2.0};
        uint32_t mbus_probe_settle_ms{500};
        uint32_t mbus_read_settle_ms{300};
        uint32_t mbus_ping_retries{2};
        uint32_t mbus_primary_scan_first{1};
        uint32_t mbus_primary_scan_last{10};
        std::string mbus_scan_mask{"FFFFFFFFFFFFFFFF"};
        uint32_t mbus_probe_retries{1};
        bool mbus_scan_with_known_devices{false};
        std::vector<KnownDeviceConfig> mbus_devices;

        // Home Assistant
        std::string ha_discovery_prefix{"homeassistant"};
        std::string ha_bridge_state_topic{"mbus/bridge/state"};
        uint32_t ha_expire_after{300};
        uint32_t ha_heartbeat_interval{60};

        // Persistence
        std::string db_path{"/var/lib/mbus-gateway/state.db"};
        uint32_t history_days{7};
        uint32_t max_queue_size{0};       // 0 -> unbounded
        uint32_t cleanup_interval{86400};
        uint32_t queue_batch_size{100};
        uint32_t queue_interval{10};

        // Circuit breaker
        bool breaker_enabled{true};
        uint32_t breaker_failure_threshold{5};
        uint32_t breaker_timeout{300};

        // Performance
        uint32_t worker_threads{4};
        uint32_t graceful_shutdown_timeout{30};
        uint32_t tick_ms{1000};
        uint32_t metrics_interval{30};

        // Monitoring
        std::string status_file;

        // Logging
        std::string log_level{"info"};
        bool syslog_enabled{false};
        std::string syslog_server;

        // Gateway
        std::string gateway_name{"M-Bus Gateway"};
        std::string gateway_manufacturer{"Custom"};
        std::string gateway_model{"M-Bus MQTT Gateway v2"};
        std::string gateway_version{MBUSMQTT_VERSION};
    };

    enum class ConfigUpdateResult {
        NoUpdate,
        MQTTUpdate,
        BusUpdate,
        SystemUpdate
    };

    class ConfigManager {
        public:
            ConfigManager(const ConfigManager&) = delete;
            ConfigManager& operator=(const ConfigManager&) = delete;

            [[nodiscard]] static ConfigManager& Instance() {
                static ConfigManager instance;
                return instance;
            }

            // Remember the file path and load it
            gw_err_t init(const std::string& path);

            // Missing file -> defaults
            gw_err_t load();

            gw_err_t saveMainConfig(const AppConfig& new_config);

            [[nodiscard]] AppConfig getConfig() const;
            void setConfig(const AppConfig& new_config);
            [[nodiscard]] std::string getPath() const;

            // Caller owns the returned tree
            struct cJSON* getSerializedConfig(bool mask_passwords = true) const;

            ConfigUpdateResult updateConfigFromJson(const char* json_str);

            /**
             * @brief Apply the nested document onto cfg, leaving absent keys untouched.
             * @return false if root is not an object.
             */
            static bool applyJson(const cJSON* root, AppConfig& cfg);

            // Range checks and the heartbeat < expire_after clamp
            static void normalize(AppConfig& cfg);

        private:
            ConfigManager() = default;
            static cJSON* serialize(const AppConfig& cfg, bool mask_passwords);

            AppConfig config_cache{};
            std::string config_path{DefaultConfigPath};
            mutable std::mutex config_mutex{};
    };
}

#endif //MBUSMQTT_CONFIGMANAGER_HXX
