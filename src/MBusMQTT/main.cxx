#include <csignal>

#include "system/ConfigManager.hxx"
#include "system/AppController.hxx"
#include "system/SyslogConfig.hxx"
#include "system/Logger.hxx"
#include "mbus/driver/SerialPort.hxx"
#include "mqtt/MQTTClient.hxx"

static constexpr char TAG[] = "mbusMQTT";

namespace {
    std::atomic<mbusMQTT::AppController*> g_controller{nullptr};

    void onSignal(int) {
        if (auto* controller = g_controller.load()) {
            controller->requestStop();
        }
    }
}

int main(const int argc, char** argv) {
    using namespace mbusMQTT;

    MBUS_LOGI("", "M-Bus-to-MQTT Gateway v.%s", MBUSMQTT_VERSION);
    MBUS_LOGI(TAG, "M-Bus-to-MQTT Gateway starting...");

    auto& config_manager = ConfigManager::Instance();
    if (config_manager.init(argc > 1 ? argv[1] : DefaultConfigPath) != GW_OK) {
        MBUS_LOGE(TAG, "Invalid configuration in %s", config_manager.getPath().c_str());
        return 1;
    }
    const AppConfig config = config_manager.getConfig();

    log::setLevel(log::levelFromString(config.log_level));
    if (config.syslog_enabled) {
        log::enableLocalSyslog("mbus2mqtt");
    }
    if (!config.syslog_server.empty()) {
        SyslogConfig::getInstance().init(config.syslog_server);
    }

    MqttEventChannel events;
    auto& mqtt = MQTTClient::Instance();
    MqttSettings settings;
    settings.host = config.mqtt_broker;
    settings.port = config.mqtt_port;
    settings.client_id = config.mqtt_client_id;
    settings.username = config.mqtt_user;
    settings.password = config.mqtt_pass;
    settings.keepalive = config.mqtt_keepalive;
    settings.reconnect_delay_min = config.mqtt_reconnect_delay_min;
    settings.reconnect_delay_max = config.mqtt_reconnect_delay_max;
    settings.will_topic = config.ha_bridge_state_topic;
    settings.will_payload = PayloadOffline;

    if (mqtt.init(settings, &events) != GW_OK || mqtt.connect() != GW_OK) {
        MBUS_LOGE(TAG, "MQTT client could not be started");
        return 1;
    }

    SerialPort serial(config.mbus_port, config.mbus_baudrate);

    int exit_code = 0;
    {
        AppController controller(config, serial, mqtt, events);
        g_controller = &controller;
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        if (controller.start() != GW_OK) {
            MBUS_LOGE(TAG, "Gateway startup failed");
            exit_code = 1;
        } else {
            MBUS_LOGI(TAG, "Application setup complete.");
            controller.run();
        }

        controller.shutdown();
        g_controller = nullptr;
    }

    mqtt.disconnect();
    SyslogConfig::getInstance().stop();
    return exit_code;
}
