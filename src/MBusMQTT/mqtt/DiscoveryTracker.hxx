#ifndef MBUSMQTT_DISCOVERYTRACKER_HXX
#define MBUSMQTT_DISCOVERYTRACKER_HXX

namespace mbusMQTT
{
    // Object ids announced during the current broker session
    struct DiscoverySession {
        uint64_t session_id{0};
        std::unordered_set<std::string> sent{};
    };

    [[nodiscard]] inline bool discoverySent(const DiscoverySession& session, const std::string& object_id) {
        return session.sent.contains(object_id);
    }

    // false if the id was already announced in this session
    inline bool discoveryMark(DiscoverySession& session, const std::string& object_id) {
        return session.sent.insert(object_id).second;
    }

    // Новая сессия: всё обнаружение будет отправлено заново
    inline void discoveryReset(DiscoverySession& session) {
        session.sent.clear();
        ++session.session_id;
    }
} // mbusMQTT

#endif //MBUSMQTT_DISCOVERYTRACKER_HXX
