#include "system/SystemInfo.hxx"
#include "system/Logger.hxx"
#include "utils/StringUtils.hxx"
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mbusMQTT::SystemInfo
{
    static constexpr char TAG[] = "SystemInfo";

    std::string getLocalIp() {
        const int sock = socket(AF_INET, SOCK_DGRAM, 0);
        if (sock < 0) {
            MBUS_LOGW(TAG, "socket() failed: %s", strerror(errno));
            return "127.0.0.1";
        }

        // UDP connect не отправляет пакетов, только выбирает маршрут
        sockaddr_in remote{};
        remote.sin_family = AF_INET;
        remote.sin_port = htons(80);
        inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

        std::string result = "127.0.0.1";
        if (connect(sock, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
            sockaddr_in local{};
            socklen_t len = sizeof(local);
            if (getsockname(sock, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
                char buf[INET_ADDRSTRLEN] = {};
                if (inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) != nullptr) {
                    result = buf;
                }
            }
        } else {
            MBUS_LOGD(TAG, "No route for IP lookup: %s", strerror(errno));
        }
        close(sock);
        return result;
    }

    std::optional<std::string> getMacAddress() {
        ifaddrs* list = nullptr;
        if (getifaddrs(&list) != 0) {
            MBUS_LOGW(TAG, "getifaddrs() failed: %s", strerror(errno));
            return std::nullopt;
        }

        std::optional<std::string> mac;
        for (const ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
            if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_PACKET) continue;
            if (it->ifa_flags & IFF_LOOPBACK) continue;

            const auto* ll = reinterpret_cast<const sockaddr_ll*>(it->ifa_addr);
            if (ll->sll_halen != 6) continue;
            const bool all_zero = std::all_of(ll->sll_addr, ll->sll_addr + 6, [](const uint8_t b) { return b == 0; });
            if (all_zero) continue;

            mac = utils::stringFormat("%02x%02x%02x%02x%02x%02x",
                                      ll->sll_addr[0], ll->sll_addr[1], ll->sll_addr[2],
                                      ll->sll_addr[3], ll->sll_addr[4], ll->sll_addr[5]);
            break;
        }
        freeifaddrs(list);
        return mac;
    }

    std::string getGatewayId() {
        if (const auto mac = getMacAddress()) {
            return "gateway_" + *mac;
        }
        MBUS_LOGW(TAG, "No hardware address found, using a fixed gateway id");
        return "gateway_000000000000";
    }
}
