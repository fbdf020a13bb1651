#ifndef MBUSMQTT_MQTTCLIENT_HXX
#define MBUSMQTT_MQTTCLIENT_HXX

#include <mosquitto.h>
#include "mqtt/MQTTTransport.hxx"
#include "mqtt/MQTTEvents.hxx"

namespace mbusMQTT
{
    enum class MqttStatus {
        DISCONNECTED,
        CONNECTING,
        CONNECTED
    };

    struct MqttSettings {
        std::string host{"localhost"};
        uint16_t port{1883};
        std::string client_id{"mbus_gateway"};
        std::string username{};
        std::string password{};
        uint32_t keepalive{60};
        uint32_t reconnect_delay_min{5};
        uint32_t reconnect_delay_max{300};
        std::string will_topic{};
        std::string will_payload{"offline"};
    };

    class MQTTClient final : public IMqttTransport {
        public:
            MQTTClient(const MQTTClient&) = delete;
            MQTTClient& operator=(const MQTTClient&) = delete;

            static MQTTClient& Instance() {
                static MQTTClient instance;
                return instance;
            }

            /**
             * @brief Create the libmosquitto handle, set credentials, LWT and reconnect backoff.
             * @param events receives connect/disconnect/message events from the network thread.
             */
            gw_err_t init(const MqttSettings& settings, MqttEventChannel* events);

            // Non-blocking, the network thread keeps reconnecting on its own
            gw_err_t connect();
            void disconnect();

            [[nodiscard]] MqttStatus getStatus() const;

            [[nodiscard]] bool isConnected() const override;
            gw_err_t publish(const std::string& topic, const std::string& payload, int qos, bool retain) override;
            gw_err_t subscribe(const std::string& topic, int qos) override;

        private:
            MQTTClient() = default;
            ~MQTTClient() override;

            void destroy();

            static void onConnect(mosquitto* mosq, void* obj, int rc);
            static void onDisconnect(mosquitto* mosq, void* obj, int rc);
            static void onMessage(mosquitto* mosq, void* obj, const mosquitto_message* message);
            static void onLog(mosquitto* mosq, void* obj, int level, const char* str);

            mosquitto* m_mosq{nullptr};
            MqttSettings m_settings{};
            MqttEventChannel* m_events{nullptr};
            std::atomic<MqttStatus> m_status{MqttStatus::DISCONNECTED};
            bool m_loop_running{false};
            mutable std::mutex m_client_mutex{};
    };
} // mbusMQTT

#endif //MBUSMQTT_MQTTCLIENT_HXX
