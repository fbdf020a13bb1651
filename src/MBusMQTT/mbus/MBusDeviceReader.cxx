#include "mbus/MBusDeviceReader.hxx"
#include "mbus/MBusDataRecords.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT {
    static constexpr char TAG[] = "MBusReader";

    const char* readStatusToString(const ReadStatus status) {
        switch (status) {
            case ReadStatus::Ok:             return "ok";
            case ReadStatus::ShortCircuited: return "short-circuited";
            case ReadStatus::NoDevice:       return "no-device";
            case ReadStatus::NoReply:        return "no-reply";
            case ReadStatus::BusError:       return "bus-error";
            case ReadStatus::ProtocolError:  return "protocol-error";
        }
        return "unknown";
    }

    MBusDeviceReader::MBusDeviceReader(MBusAdapter& adapter, MBusDeviceRegistry& registry,
                                       ReaderOptions options, ClockFn clock)
        : m_adapter(adapter), m_registry(registry), m_options(options), m_clock(std::move(clock)) {
        if (!m_clock) {
            m_clock = [] { return SteadyClock::now(); };
        }
        m_breaker.failure_threshold = std::max<uint32_t>(1, m_options.failure_threshold);
        m_breaker.timeout = m_options.breaker_timeout;
    }

    CircuitBreaker MBusDeviceReader::breaker() const {
        std::lock_guard lock(m_breaker_mutex);
        return m_breaker;
    }

    ReadStatus MBusDeviceReader::exchange(const MBusAddress& address, Frames::LongFrame& out) {
        uint8_t target = common::AddressNetworkLayer;

        if (address.isPrimary()) {
            if (!m_adapter.ping(address.primary)) {
                return ReadStatus::NoReply;
            }
            target = address.primary;
        } else {
            const auto select = m_adapter.selectSecondary(address.secondary);
            if (select.status == BusStatus::IoError) return ReadStatus::BusError;
            if (select.status == BusStatus::NoReply) return ReadStatus::NoReply;
            if (select.kind != Frames::ReplyKind::Ack) return ReadStatus::ProtocolError;
        }

        const auto reply = m_adapter.requestData(target, m_adapter.timing().read_settle);
        if (reply.status == BusStatus::IoError) return ReadStatus::BusError;
        if (reply.status == BusStatus::NoReply) return ReadStatus::NoReply;
        if (reply.kind != Frames::ReplyKind::Long) return ReadStatus::ProtocolError;

        out = reply.frame;
        return ReadStatus::Ok;
    }

    ReadResult MBusDeviceReader::read(const std::string& device_id) {
        ReadResult result;

        const auto device = m_registry.get(device_id);
        if (!device) {
            MBUS_LOGW(TAG, "Read requested for unknown device %s", device_id.c_str());
            return result;
        }

        std::lock_guard bus_lock(m_adapter.busMutex());

        if (m_options.breaker_enabled) {
            std::lock_guard lock(m_breaker_mutex);
            const auto gate = breakerTryAcquire(m_breaker, m_clock());
            if (gate.next.state != m_breaker.state) {
                MBUS_LOGI(TAG, "Circuit breaker %s -> %s",
                          breakerStateToString(m_breaker.state), breakerStateToString(gate.next.state));
            }
            m_breaker = gate.next;
            if (!gate.allowed) {
                MBUS_LOGD(TAG, "Circuit breaker open, skipping read of %s", device_id.c_str());
                result.status = ReadStatus::ShortCircuited;
                return result;
            }
        }

        Frames::LongFrame frame;
        result.status = exchange(device->address, frame);

        std::optional<DataRecords::VariableData> data;
        if (result.status == ReadStatus::Ok) {
            data = DataRecords::decode(frame);
            if (!data) {
                result.status = ReadStatus::ProtocolError;
            }
        }

        if (m_options.breaker_enabled) {
            std::lock_guard lock(m_breaker_mutex);
            const auto next = result.ok() ? breakerOnSuccess(m_breaker) : breakerOnFailure(m_breaker, m_clock());
            if (next.state != m_breaker.state) {
                MBUS_LOGW(TAG, "Circuit breaker %s -> %s (failures: %u)",
                          breakerStateToString(m_breaker.state), breakerStateToString(next.state), next.failure_count);
            }
            m_breaker = next;
        }

        if (result.ok()) {
            result.records = data->records;
            m_registry.update(device_id, [&](MBusDevice& dev) {
                if (!dev.online) {
                    result.change = AvailabilityChange::CameOnline;
                }
                dev.online = true;
                dev.consecutive_failures = 0;
                dev.records = data->records;
                dev.last_seen = WallClock::now();
                dev.manufacturer = DataRecords::manufacturerToString(data->header.manufacturer_code);
                dev.medium = DataRecords::mediumToString(data->header.medium);
                dev.identification = data->header.identification;
                dev.version = std::to_string(data->header.version);
            });
            if (result.change == AvailabilityChange::CameOnline) {
                MBUS_LOGI(TAG, "Device %s is back online", device_id.c_str());
            }
            MBUS_LOGD(TAG, "Read %s: %zu record(s)", device_id.c_str(), result.records.size());
            return result;
        }

        m_registry.update(device_id, [&](MBusDevice& dev) {
            dev.consecutive_failures++;
            if (dev.online && dev.consecutive_failures >= m_options.max_retries) {
                dev.online = false;
                result.change = AvailabilityChange::WentOffline;
            }
            MBUS_LOGW(TAG, "Read of %s failed: %s (%u/%u)", device_id.c_str(),
                      readStatusToString(result.status), dev.consecutive_failures, m_options.max_retries);
        });
        if (result.change == AvailabilityChange::WentOffline) {
            MBUS_LOGW(TAG, "Device %s marked offline", device_id.c_str());
        }
        return result;
    }
} // mbusMQTT
