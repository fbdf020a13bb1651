#ifndef MBUSMQTT_MBUSDATARECORDS_HXX
#define MBUSMQTT_MBUSDATARECORDS_HXX
#include "mbus/MBusFrames.hxx"
#include "mbus/MBusTypes.hxx"

namespace mbusMQTT::DataRecords {

    constexpr size_t VariableHeaderLength = 12;

    struct VariableDataHeader {
        std::string identification{};   // 8 BCD digits
        uint16_t manufacturer_code{0};
        uint8_t version{0};
        uint8_t medium{0};
        uint8_t access_no{0};
        uint8_t status{0};
    };

    struct VariableData {
        VariableDataHeader header{};
        std::vector<MBusRecord> records{};
    };

    [[nodiscard]] std::optional<VariableDataHeader> decodeHeader(std::span<const uint8_t> data);

    /**
     * @brief Decode an RSP_UD long frame (CI 0x72) into header and named records.
     * @return nullopt on wrong CI, truncated header or malformed record stream.
     */
    [[nodiscard]] std::optional<VariableData> decode(const Frames::LongFrame& frame);

    // ID(8) + manufacturer(4) + version(2) + medium(2)
    [[nodiscard]] std::string secondaryAddress(const VariableDataHeader& header);

    [[nodiscard]] std::string manufacturerToString(uint16_t code);
    [[nodiscard]] const char* mediumToString(uint8_t medium);

    // Inverse of the header decode, used to build RSP_UD payloads
    [[nodiscard]] std::vector<uint8_t> encodeHeader(const VariableDataHeader& header);
}

#endif //MBUSMQTT_MBUSDATARECORDS_HXX
