#ifndef MBUSMQTT_HEALTHMONITOR_HXX
#define MBUSMQTT_HEALTHMONITOR_HXX

namespace mbusMQTT
{
    constexpr char ComponentMBus[] = "mbus";
    constexpr char ComponentMqtt[] = "mqtt";
    constexpr char ComponentStorage[] = "storage";

    struct ComponentHealth {
        bool healthy{false};
        std::string detail{};
        std::chrono::system_clock::time_point last_check{};
    };

    class HealthMonitor {
        public:
            HealthMonitor();

            HealthMonitor(const HealthMonitor&) = delete;
            HealthMonitor& operator=(const HealthMonitor&) = delete;

            void updateComponentStatus(const std::string& component, bool healthy, const std::string& detail = {});

            // All components healthy
            [[nodiscard]] bool isHealthy() const;
            [[nodiscard]] uint64_t uptimeSeconds() const;
            [[nodiscard]] std::map<std::string, ComponentHealth> components() const;

            // {"status","uptime","timestamp","components":{name:{"healthy","message","last_check"}}}
            [[nodiscard]] std::string toJson() const;
            [[nodiscard]] std::string toPrometheus() const;

        private:
            std::chrono::steady_clock::time_point m_start;
            std::map<std::string, ComponentHealth> m_components;
            mutable std::mutex m_health_mutex;
    };
} // mbusMQTT

#endif //MBUSMQTT_HEALTHMONITOR_HXX
