#ifndef MBUSMQTT_MBUSTYPES_HXX
#define MBUSMQTT_MBUSTYPES_HXX

#include "mbus/MBusCommon.hxx"
#include "utils/StringUtils.hxx"

namespace mbusMQTT
{
    using SteadyClock = std::chrono::steady_clock;
    using WallClock = std::chrono::system_clock;

    // Numeric (already scaled) or textual value of a data record
    using RecordValue = std::variant<double, std::string>;

    inline std::string recordValueToString(const RecordValue& value) {
        if (const auto* number = std::get_if<double>(&value)) {
            return utils::formatNumber(*number);
        }
        return std::get<std::string>(value);
    }

    struct MBusRecord {
        std::string name{};              // Unique within one read
        RecordValue value{0.0};
        std::string unit{};              // "kWh", "m³", "°C", ... or empty
        std::string function_code{};     // instantaneous / maximum / minimum / error
    };

    enum class AddressType : uint8_t {
        Primary,
        Secondary
    };

    struct MBusAddress {
        AddressType type{AddressType::Primary};
        uint8_t primary{0};
        std::string secondary{};         // 16 uppercase hex chars

        [[nodiscard]] std::string toString() const {
            if (type == AddressType::Primary) {
                return std::to_string(primary);
            }
            return secondary;
        }

        [[nodiscard]] bool isPrimary() const { return type == AddressType::Primary; }

        static MBusAddress fromPrimary(const uint8_t address) {
            return MBusAddress{AddressType::Primary, address, {}};
        }

        static MBusAddress fromSecondary(std::string_view address) {
            return MBusAddress{AddressType::Secondary, 0, utils::toUpper(address)};
        }

        // "5" -> primary 5, "1234567847240107" -> secondary
        static std::optional<MBusAddress> parse(std::string_view text) {
            if (utils::isDecimalString(text) && text.size() <= 3) {
                unsigned value = 0;
                std::from_chars(text.data(), text.data() + text.size(), value);
                if (value > common::AddressMaxPrimary) {
                    return std::nullopt;
                }
                return fromPrimary(static_cast<uint8_t>(value));
            }
            if (text.size() == common::SecondaryAddressLength && utils::isHexString(text)) {
                return fromSecondary(text);
            }
            return std::nullopt;
        }

        bool operator==(const MBusAddress& other) const {
            return type == other.type && primary == other.primary && secondary == other.secondary;
        }
    };

    struct MBusDevice {
        MBusAddress address{};
        std::string device_id{};             // mbus_meter_<address>
        std::string name{};
        std::string manufacturer{"Unknown"};
        std::string medium{"Unknown"};
        std::string identification{};
        std::string version{};

        bool online{true};                   // false only after max_retries failures
        uint32_t consecutive_failures{0};
        std::vector<MBusRecord> records{};   // Replaced wholesale on each read
        WallClock::time_point last_seen{};

        std::chrono::seconds poll_interval{0}; // 0 -> mbus.read_interval
        bool from_config{false};
    };

    inline std::string makeDeviceId(const MBusAddress& address) {
        return "mbus_meter_" + utils::toLower(address.toString());
    }

    inline MBusDevice makeDevice(const MBusAddress& address, std::string name = {}) {
        MBusDevice device;
        device.address = address;
        device.device_id = makeDeviceId(address);
        device.name = name.empty() ? utils::stringFormat("M-Bus Meter %s", address.toString().c_str()) : std::move(name);
        return device;
    }
} // mbusMQTT

#endif //MBUSMQTT_MBUSTYPES_HXX
