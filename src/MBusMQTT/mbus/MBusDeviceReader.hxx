#ifndef MBUSMQTT_MBUSDEVICEREADER_HXX
#define MBUSMQTT_MBUSDEVICEREADER_HXX

#include "mbus/MBusAdapter.hxx"
#include "mbus/MBusDeviceRegistry.hxx"
#include "mbus/CircuitBreaker.hxx"

namespace mbusMQTT
{
    struct ReaderOptions {
        uint32_t max_retries{3};
        bool breaker_enabled{true};
        uint32_t failure_threshold{5};
        std::chrono::seconds breaker_timeout{300};
    };

    enum class ReadStatus : uint8_t {
        Ok,
        ShortCircuited,   // Breaker open, no bus I/O happened
        NoDevice,
        NoReply,
        BusError,
        ProtocolError
    };

    enum class AvailabilityChange : uint8_t {
        None,
        WentOffline,
        CameOnline
    };

    struct ReadResult {
        ReadStatus status{ReadStatus::NoDevice};
        AvailabilityChange change{AvailabilityChange::None};
        std::vector<MBusRecord> records{};

        [[nodiscard]] bool ok() const { return status == ReadStatus::Ok; }
    };

    const char* readStatusToString(ReadStatus status);

    class MBusDeviceReader {
    public:
        using ClockFn = std::function<SteadyClock::time_point()>;

        MBusDeviceReader(MBusAdapter& adapter, MBusDeviceRegistry& registry, ReaderOptions options, ClockFn clock = {});

        MBusDeviceReader(const MBusDeviceReader&) = delete;
        MBusDeviceReader& operator=(const MBusDeviceReader&) = delete;

        /**
         * @brief One request/response cycle against a registered device.
         * Updates the device's records, counters and availability in the registry.
         */
        ReadResult read(const std::string& device_id);

        [[nodiscard]] CircuitBreaker breaker() const;

    private:
        ReadStatus exchange(const MBusAddress& address, Frames::LongFrame& out);

        MBusAdapter& m_adapter;
        MBusDeviceRegistry& m_registry;
        ReaderOptions m_options;
        ClockFn m_clock;

        CircuitBreaker m_breaker{};
        mutable std::mutex m_breaker_mutex;
    };
} // mbusMQTT

#endif //MBUSMQTT_MBUSDEVICEREADER_HXX
