#include "mqtt/MQTTClient.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT
{
    static constexpr char TAG[] = "MQTTClient";

    MQTTClient::~MQTTClient() {
        destroy();
    }

    void MQTTClient::destroy() {
        std::lock_guard<std::mutex> lock(m_client_mutex);
        if (!m_mosq) return;

        if (m_loop_running) {
            mosquitto_disconnect(m_mosq);
            mosquitto_loop_stop(m_mosq, true);
            m_loop_running = false;
        }
        mosquitto_destroy(m_mosq);
        m_mosq = nullptr;
        mosquitto_lib_cleanup();
        m_status = MqttStatus::DISCONNECTED;
    }

    gw_err_t MQTTClient::init(const MqttSettings& settings, MqttEventChannel* events) {
        destroy();

        std::lock_guard<std::mutex> lock(m_client_mutex);
        m_settings = settings;
        m_events = events;

        mosquitto_lib_init();
        m_mosq = mosquitto_new(m_settings.client_id.c_str(), true, this);
        if (!m_mosq) {
            MBUS_LOGE(TAG, "Can't create mosquitto instance");
            mosquitto_lib_cleanup();
            return GW_ERR_NO_MEM;
        }

        mosquitto_connect_callback_set(m_mosq, onConnect);
        mosquitto_disconnect_callback_set(m_mosq, onDisconnect);
        mosquitto_message_callback_set(m_mosq, onMessage);
        mosquitto_log_callback_set(m_mosq, onLog);

        if (!m_settings.username.empty()) {
            const int rc = mosquitto_username_pw_set(m_mosq, m_settings.username.c_str(),
                                                     m_settings.password.empty() ? nullptr : m_settings.password.c_str());
            if (rc != MOSQ_ERR_SUCCESS) {
                MBUS_LOGE(TAG, "Failed to set credentials: %s", mosquitto_strerror(rc));
                return GW_ERR_INVALID_ARG;
            }
        }

        if (!m_settings.will_topic.empty()) {
            const int rc = mosquitto_will_set(m_mosq, m_settings.will_topic.c_str(),
                                              static_cast<int>(m_settings.will_payload.size()),
                                              m_settings.will_payload.c_str(), 1, true);
            if (rc != MOSQ_ERR_SUCCESS) {
                MBUS_LOGE(TAG, "Failed to set last will: %s", mosquitto_strerror(rc));
                return GW_ERR_INVALID_ARG;
            }
        }

        mosquitto_reconnect_delay_set(m_mosq, m_settings.reconnect_delay_min, m_settings.reconnect_delay_max, true);
        m_status = MqttStatus::DISCONNECTED;

        MBUS_LOGI(TAG, "MQTT client initialized for %s:%u as '%s'",
                  m_settings.host.c_str(), m_settings.port, m_settings.client_id.c_str());
        return GW_OK;
    }

    gw_err_t MQTTClient::connect() {
        std::lock_guard<std::mutex> lock(m_client_mutex);
        if (!m_mosq) return GW_ERR_INVALID_STATE;

        m_status = MqttStatus::CONNECTING;
        const int rc = mosquitto_connect_async(m_mosq, m_settings.host.c_str(), m_settings.port,
                                               static_cast<int>(m_settings.keepalive));
        if (rc != MOSQ_ERR_SUCCESS) {
            // Сетевой поток продолжит попытки переподключения
            MBUS_LOGW(TAG, "Initial connect to %s:%u failed: %s", m_settings.host.c_str(), m_settings.port,
                      rc == MOSQ_ERR_ERRNO ? strerror(errno) : mosquitto_strerror(rc));
        }

        if (!m_loop_running) {
            const int loop_rc = mosquitto_loop_start(m_mosq);
            if (loop_rc != MOSQ_ERR_SUCCESS) {
                MBUS_LOGE(TAG, "Failed to start network loop: %s", mosquitto_strerror(loop_rc));
                m_status = MqttStatus::DISCONNECTED;
                return GW_FAIL;
            }
            m_loop_running = true;
        }
        return GW_OK;
    }

    void MQTTClient::disconnect() {
        std::lock_guard<std::mutex> lock(m_client_mutex);
        if (!m_mosq) return;

        mosquitto_disconnect(m_mosq);
        if (m_loop_running) {
            mosquitto_loop_stop(m_mosq, false);
            m_loop_running = false;
        }
        m_status = MqttStatus::DISCONNECTED;
    }

    MqttStatus MQTTClient::getStatus() const {
        return m_status;
    }

    bool MQTTClient::isConnected() const {
        return m_status == MqttStatus::CONNECTED;
    }

    gw_err_t MQTTClient::publish(const std::string& topic, const std::string& payload, const int qos, const bool retain) {
        std::lock_guard<std::mutex> lock(m_client_mutex);
        if (!m_mosq || m_status != MqttStatus::CONNECTED) return GW_ERR_INVALID_STATE;

        const int rc = mosquitto_publish(m_mosq, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                         payload.data(), qos, retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            MBUS_LOGW(TAG, "Publish to %s failed: %s", topic.c_str(), mosquitto_strerror(rc));
            return rc == MOSQ_ERR_NO_CONN ? GW_ERR_INVALID_STATE : GW_FAIL;
        }
        return GW_OK;
    }

    gw_err_t MQTTClient::subscribe(const std::string& topic, const int qos) {
        std::lock_guard<std::mutex> lock(m_client_mutex);
        if (!m_mosq) return GW_ERR_INVALID_STATE;

        const int rc = mosquitto_subscribe(m_mosq, nullptr, topic.c_str(), qos);
        if (rc != MOSQ_ERR_SUCCESS) {
            MBUS_LOGW(TAG, "Subscribe to %s failed: %s", topic.c_str(), mosquitto_strerror(rc));
            return GW_FAIL;
        }
        return GW_OK;
    }

    void MQTTClient::onConnect([[maybe_unused]] mosquitto* mosq, void* obj, const int rc) {
        auto* client = static_cast<MQTTClient*>(obj);
        if (!client) return;

        if (rc != 0) {
            MBUS_LOGE(TAG, "Broker refused connection: %s", mosquitto_connack_string(rc));
            client->m_status = MqttStatus::CONNECTING;
            return;
        }
        MBUS_LOGI(TAG, "Connected to broker");
        client->m_status = MqttStatus::CONNECTED;
        if (client->m_events) {
            client->m_events->push({MqttEventType::Connected, {}, {}, rc});
        }
    }

    void MQTTClient::onDisconnect([[maybe_unused]] mosquitto* mosq, void* obj, const int rc) {
        auto* client = static_cast<MQTTClient*>(obj);
        if (!client) return;

        if (rc == 0) {
            MBUS_LOGI(TAG, "Disconnected from broker");
        } else {
            MBUS_LOGW(TAG, "Connection to broker lost (rc=%d), reconnecting", rc);
        }
        client->m_status = rc == 0 ? MqttStatus::DISCONNECTED : MqttStatus::CONNECTING;
        if (client->m_events) {
            client->m_events->push({MqttEventType::Disconnected, {}, {}, rc});
        }
    }

    void MQTTClient::onMessage([[maybe_unused]] mosquitto* mosq, void* obj, const mosquitto_message* message) {
        auto* client = static_cast<MQTTClient*>(obj);
        if (!client || !message || !message->topic) return;

        MqttEvent event;
        event.type = MqttEventType::Message;
        event.topic = message->topic;
        if (message->payload && message->payloadlen > 0) {
            event.payload.assign(static_cast<const char*>(message->payload), static_cast<size_t>(message->payloadlen));
        }
        MBUS_LOGD(TAG, "Message on %s (%zu bytes)", event.topic.c_str(), event.payload.size());
        if (client->m_events) {
            client->m_events->push(std::move(event));
        }
    }

    void MQTTClient::onLog([[maybe_unused]] mosquitto* mosq, [[maybe_unused]] void* obj, const int level, const char* str) {
        if (level & (MOSQ_LOG_ERR | MOSQ_LOG_WARNING)) {
            MBUS_LOGW(TAG, "libmosquitto: %s", str);
        } else {
            MBUS_LOGV(TAG, "libmosquitto: %s", str);
        }
    }
} // mbusMQTT
