#ifndef MBUSMQTT_MBUSDEVICEREGISTRY_HXX
#define MBUSMQTT_MBUSDEVICEREGISTRY_HXX

#include "mbus/MBusTypes.hxx"

namespace mbusMQTT
{
    // Known meters keyed by device_id. Devices are never removed, only marked offline.
    class MBusDeviceRegistry {
    public:
        MBusDeviceRegistry() = default;
        MBusDeviceRegistry(const MBusDeviceRegistry&) = delete;
        MBusDeviceRegistry& operator=(const MBusDeviceRegistry&) = delete;

        /**
         * @brief Insert a device unless its id is already known.
         * @return true when the device was new.
         */
        bool add(MBusDevice device);

        [[nodiscard]] std::optional<MBusDevice> get(const std::string& device_id) const;
        [[nodiscard]] bool contains(const std::string& device_id) const;
        [[nodiscard]] std::vector<MBusDevice> snapshot() const;
        [[nodiscard]] std::vector<std::string> ids() const;
        [[nodiscard]] size_t size() const;
        [[nodiscard]] size_t onlineCount() const;

        /**
         * @brief Mutate a device under the registry lock.
         * @return false if the id is unknown.
         */
        bool update(const std::string& device_id, const std::function<void(MBusDevice&)>& fn);

    private:
        std::map<std::string, MBusDevice> m_devices;
        mutable std::mutex m_devices_mutex;
    };
} // mbusMQTT

#endif //MBUSMQTT_MBUSDEVICEREGISTRY_HXX
