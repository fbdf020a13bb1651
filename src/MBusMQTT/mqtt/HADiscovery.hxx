#ifndef MBUSMQTT_HA_DISCOVERY_HXX
#define MBUSMQTT_HA_DISCOVERY_HXX

#include "mbus/MBusTypes.hxx"

namespace mbusMQTT
{
    constexpr char PayloadOnline[] = "online";
    constexpr char PayloadOffline[] = "offline";
    constexpr char StatusAttribute[] = "Status";

    struct DiscoverySettings {
        std::string discovery_prefix{"homeassistant"};
        std::string topic_prefix{"homeassistant"};
        std::string bridge_state_topic{"mbus/bridge/state"};
        uint32_t expire_after{300};
        int qos{1};
    };

    // Shared "device" block of every entity
    struct DiscoveryDevice {
        std::string device_id{};
        std::string name{};
        std::string manufacturer{};
        std::string model{};
        std::string sw_version{};
    };

    struct DiscoveryAttribute {
        std::string name{};
        std::string unit{};
    };

    struct AttributeClass {
        std::string component{"sensor"};   // "sensor" | "binary_sensor"
        std::string device_class{};
        std::string state_class{};
        std::string icon{"mdi:gauge"};
    };

    struct DiscoveryMessage {
        std::string object_id{};
        std::string topic{};
        std::string payload{};
        std::string state_topic{};
    };

    namespace HADiscovery {
        [[nodiscard]] std::string objectId(const std::string& device_id, const std::string& attribute);
        [[nodiscard]] std::string stateTopic(const DiscoverySettings& settings, const std::string& device_id, const std::string& attribute);

        /**
         * @brief Keyword lookup on attribute name and unit.
         * Energy, power, temperature, voltage, current, volume, ip, status and uptime
         * are recognised, anything else is a plain gauge.
         */
        [[nodiscard]] AttributeClass classifyAttribute(std::string_view name, std::string_view unit);

        [[nodiscard]] DiscoveryMessage build(const DiscoverySettings& settings, const DiscoveryDevice& device,
                                             const DiscoveryAttribute& attribute);

        [[nodiscard]] DiscoveryDevice describe(const MBusDevice& device);

        // Records plus the availability attribute
        [[nodiscard]] std::vector<DiscoveryAttribute> attributesOf(const MBusDevice& device);
    }
} // mbusMQTT

#endif // MBUSMQTT_HA_DISCOVERY_HXX
