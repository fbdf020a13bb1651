#ifndef MBUSMQTT_TESTS_FAKEMQTTTRANSPORT_HXX
#define MBUSMQTT_TESTS_FAKEMQTTTRANSPORT_HXX

#include "mqtt/MQTTTransport.hxx"
#include "mqtt/MQTTEvents.hxx"

namespace mbusMQTT::test
{
    struct PublishedMessage {
        std::string topic;
        std::string payload;
        int qos{0};
        bool retain{false};
    };

    // Broker stand-in: records what was handed over, can drop the session or refuse publishes
    class FakeMqttTransport : public IMqttTransport {
        public:
            explicit FakeMqttTransport(MqttEventChannel* events = nullptr) : m_events(events) {}

            // Flip the flag and queue the matching event like the client thread does
            void connect() {
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_connected = true;
                }
                if (m_events) m_events->push({MqttEventType::Connected, {}, {}, 0});
            }

            void disconnect() {
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_connected = false;
                }
                if (m_events) m_events->push({MqttEventType::Disconnected, {}, {}, 7});
            }

            void deliver(const std::string& topic, const std::string& payload) {
                if (m_events) m_events->push({MqttEventType::Message, topic, payload, 0});
            }

            // Next n publishes fail
            void failNext(const size_t n) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_fail_next = n;
            }

            void clear() {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_published.clear();
            }

            [[nodiscard]] std::vector<PublishedMessage> published() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_published;
            }

            [[nodiscard]] std::vector<PublishedMessage> publishedTo(const std::string& topic) const {
                std::lock_guard<std::mutex> lock(m_mutex);
                std::vector<PublishedMessage> out;
                std::ranges::copy_if(m_published, std::back_inserter(out),
                                     [&](const PublishedMessage& m) { return m.topic == topic; });
                return out;
            }

            [[nodiscard]] size_t countWithSuffix(const std::string& suffix) const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return static_cast<size_t>(std::ranges::count_if(m_published, [&](const PublishedMessage& m) {
                    return m.topic.size() >= suffix.size() &&
                           m.topic.compare(m.topic.size() - suffix.size(), suffix.size(), suffix) == 0;
                }));
            }

            [[nodiscard]] std::vector<std::string> subscriptions() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_subscriptions;
            }

            [[nodiscard]] bool isConnected() const override {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_connected;
            }

            gw_err_t publish(const std::string& topic, const std::string& payload, const int qos, const bool retain) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_connected) return GW_ERR_INVALID_STATE;
                if (m_fail_next > 0) {
                    --m_fail_next;
                    return GW_FAIL;
                }
                m_published.push_back({topic, payload, qos, retain});
                return GW_OK;
            }

            gw_err_t subscribe(const std::string& topic, int) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_connected) return GW_ERR_INVALID_STATE;
                m_subscriptions.push_back(topic);
                return GW_OK;
            }

        private:
            MqttEventChannel* m_events;
            bool m_connected{false};
            size_t m_fail_next{0};
            std::vector<PublishedMessage> m_published;
            std::vector<std::string> m_subscriptions;
            mutable std::mutex m_mutex;
    };
} // mbusMQTT::test

#endif //MBUSMQTT_TESTS_FAKEMQTTTRANSPORT_HXX
