#include "mbus/MBusDeviceRegistry.hxx"

namespace mbusMQTT {

    bool MBusDeviceRegistry::add(MBusDevice device) {
        std::lock_guard lock(m_devices_mutex);
        const auto id = device.device_id;
        return m_devices.try_emplace(id, std::move(device)).second;
    }

    std::optional<MBusDevice> MBusDeviceRegistry::get(const std::string& device_id) const {
        std::lock_guard lock(m_devices_mutex);
        if (const auto it = m_devices.find(device_id); it != m_devices.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool MBusDeviceRegistry::contains(const std::string& device_id) const {
        std::lock_guard lock(m_devices_mutex);
        return m_devices.contains(device_id);
    }

    std::vector<MBusDevice> MBusDeviceRegistry::snapshot() const {
        std::lock_guard lock(m_devices_mutex);
        std::vector<MBusDevice> out;
        out.reserve(m_devices.size());
        for (const auto& [id, device] : m_devices) {
            out.push_back(device);
        }
        return out;
    }

    std::vector<std::string> MBusDeviceRegistry::ids() const {
        std::lock_guard lock(m_devices_mutex);
        std::vector<std::string> out;
        out.reserve(m_devices.size());
        for (const auto& [id, device] : m_devices) {
            out.push_back(id);
        }
        return out;
    }

    size_t MBusDeviceRegistry::size() const {
        std::lock_guard lock(m_devices_mutex);
        return m_devices.size();
    }

    size_t MBusDeviceRegistry::onlineCount() const {
        std::lock_guard lock(m_devices_mutex);
        return static_cast<size_t>(std::ranges::count_if(m_devices, [](const auto& entry) {
            return entry.second.online;
        }));
    }

    bool MBusDeviceRegistry::update(const std::string& device_id, const std::function<void(MBusDevice&)>& fn) {
        std::lock_guard lock(m_devices_mutex);
        const auto it = m_devices.find(device_id);
        if (it == m_devices.end()) {
            return false;
        }
        fn(it->second);
        return true;
    }
} // mbusMQTT
