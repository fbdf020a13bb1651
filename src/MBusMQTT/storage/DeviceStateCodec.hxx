#ifndef MBUSMQTT_DEVICESTATECODEC_HXX
#define MBUSMQTT_DEVICESTATECODEC_HXX

#include "mbus/MBusTypes.hxx"
#include "storage/StateStore.hxx"

namespace mbusMQTT::DeviceStateCodec {

    constexpr char DeviceTypeMeter[] = "mbus_meter";
    constexpr char DeviceTypeGateway[] = "gateway";

    // {"address","medium","identification","version","attributes":[{"name","value","numeric","unit","function"}]}
    [[nodiscard]] std::string encode(const MBusDevice& device);

    /**
     * @brief Restore address, metadata and records from a state_json document.
     * @return false when the document is not valid JSON or lacks a parseable address.
     */
    [[nodiscard]] bool decode(std::string_view state_json, MBusDevice& out);

    [[nodiscard]] DeviceSnapshot toSnapshot(const MBusDevice& device);

    /**
     * @brief Rebuild a meter from its persisted row.
     * A device persisted offline comes back with max_retries failures so that
     * the offline/online invariant keeps holding.
     */
    [[nodiscard]] std::optional<MBusDevice> fromSnapshot(const DeviceSnapshot& snapshot, uint32_t max_retries);
}

#endif //MBUSMQTT_DEVICESTATECODEC_HXX
