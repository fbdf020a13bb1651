#ifndef MBUSMQTT_MBUSFRAMES_HXX
#define MBUSMQTT_MBUSFRAMES_HXX
#include "mbus/MBusCommon.hxx"

namespace mbusMQTT::Frames {

    using Frame = std::vector<uint8_t>;

    struct LongFrame {
        uint8_t control{0};
        uint8_t address{0};
        uint8_t control_info{0};
        std::vector<uint8_t> data{};
    };

    enum class ReplyKind : uint8_t {
        None,      // Nothing received
        Ack,       // Single 0xE5
        Short,     // 10 C A CS 16
        Long,      // 68 L L 68 ... CS 16
        Invalid    // Garbage, bad checksum, truncated
    };

    enum class DecodeStatus : uint8_t {
        Ok,
        Empty,
        Incomplete,
        BadStart,
        BadLength,
        BadChecksum,
        BadStop
    };

    [[nodiscard]] uint8_t checksum(std::span<const uint8_t> bytes);

    /**
     * @brief Total frame length derivable from the first received bytes.
     * @return >0 expected length, 0 if more bytes are needed, -1 if the start is not a frame.
     */
    [[nodiscard]] int expectedLength(std::span<const uint8_t> head);

    [[nodiscard]] DecodeStatus decodeLong(std::span<const uint8_t> raw, LongFrame& out);

    [[nodiscard]] ReplyKind classify(std::span<const uint8_t> raw, LongFrame* long_out = nullptr);

    // "1234567FFFFFFFFF" -> 8 byte SELECT payload, nullopt if the mask is malformed
    [[nodiscard]] std::optional<std::vector<uint8_t>> encodeSecondaryMask(std::string_view mask);
    [[nodiscard]] std::string decodeSecondaryMask(std::span<const uint8_t> payload);

    [[nodiscard]] bool maskMatches(std::string_view mask, std::string_view address);

    namespace Factory {
        [[nodiscard]] Frame Short(common::Control control, uint8_t address);
        [[nodiscard]] Frame Long(uint8_t control, uint8_t address, uint8_t control_info, std::span<const uint8_t> data);

        [[nodiscard]] inline Frame Ping(const uint8_t address) {
            return Short(common::Control::SndNke, address);
        }

        [[nodiscard]] inline Frame RequestData(const uint8_t address) {
            return Short(common::Control::ReqUd2, address);
        }

        [[nodiscard]] std::optional<Frame> SelectSecondary(std::string_view mask);
    }
}

#endif //MBUSMQTT_MBUSFRAMES_HXX
