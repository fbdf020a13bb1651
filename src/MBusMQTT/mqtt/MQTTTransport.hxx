#ifndef MBUSMQTT_MQTTTRANSPORT_HXX
#define MBUSMQTT_MQTTTRANSPORT_HXX

#include "system/GatewayError.hxx"

namespace mbusMQTT
{
    // Broker session as seen by the sync engine
    class IMqttTransport {
        public:
            virtual ~IMqttTransport() = default;

            [[nodiscard]] virtual bool isConnected() const = 0;

            /**
             * @brief Hand a message to the client.
             * @return GW_OK only when the client accepted the message for delivery.
             */
            virtual gw_err_t publish(const std::string& topic, const std::string& payload, int qos, bool retain) = 0;

            virtual gw_err_t subscribe(const std::string& topic, int qos) = 0;
    };
} // mbusMQTT

#endif //MBUSMQTT_MQTTTRANSPORT_HXX
