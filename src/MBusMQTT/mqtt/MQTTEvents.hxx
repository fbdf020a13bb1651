#ifndef MBUSMQTT_MQTTEVENTS_HXX
#define MBUSMQTT_MQTTEVENTS_HXX

namespace mbusMQTT
{
    enum class MqttEventType : uint8_t {
        Connected,
        Disconnected,
        Message
    };

    struct MqttEvent {
        MqttEventType type{MqttEventType::Disconnected};
        std::string topic{};
        std::string payload{};
        int rc{0};
    };

    // Filled from the client network thread, drained by the scheduler
    class MqttEventChannel {
        public:
            void push(MqttEvent event) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_events.push_back(std::move(event));
            }

            [[nodiscard]] std::vector<MqttEvent> drain() {
                std::lock_guard<std::mutex> lock(m_mutex);
                std::vector<MqttEvent> out(std::make_move_iterator(m_events.begin()),
                                           std::make_move_iterator(m_events.end()));
                m_events.clear();
                return out;
            }

            [[nodiscard]] size_t size() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_events.size();
            }

        private:
            std::deque<MqttEvent> m_events;
            mutable std::mutex m_mutex;
    };
} // mbusMQTT

#endif //MBUSMQTT_MQTTEVENTS_HXX
