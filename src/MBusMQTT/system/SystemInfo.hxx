#ifndef MBUSMQTT_SYSTEMINFO_HXX
#define MBUSMQTT_SYSTEMINFO_HXX

namespace mbusMQTT::SystemInfo
{
    // Source address the kernel would pick for outbound traffic, "127.0.0.1" if offline
    [[nodiscard]] std::string getLocalIp();

    // First non-loopback interface, lowercase hex without separators
    [[nodiscard]] std::optional<std::string> getMacAddress();

    // gateway_<mac>
    [[nodiscard]] std::string getGatewayId();
}

#endif //MBUSMQTT_SYSTEMINFO_HXX
