#include "mbus/MBusFrames.hxx"
#include "utils/StringUtils.hxx"

namespace mbusMQTT::Frames {

    namespace {
        std::optional<uint8_t> hexNibble(const char c) {
            if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
            if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
            if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
            return std::nullopt;
        }

        constexpr char hexChar(const uint8_t nibble) {
            return "0123456789ABCDEF"[nibble & 0x0F];
        }
    }

    uint8_t checksum(const std::span<const uint8_t> bytes) {
        uint8_t sum = 0;
        for (const auto b : bytes) {
            sum = static_cast<uint8_t>(sum + b);
        }
        return sum;
    }

    int expectedLength(const std::span<const uint8_t> head) {
        if (head.empty()) return 0;

        switch (head[0]) {
            case common::FrameAck:
                return 1;
            case common::FrameShortStart:
                return static_cast<int>(common::FrameShortLength);
            case common::FrameLongStart:
                if (head.size() < 3) return 0;
                if (head[1] != head[2]) return -1;
                if (head.size() >= 4 && head[3] != common::FrameLongStart) return -1;
                return head[1] + static_cast<int>(common::FrameLongOverhead);
            default:
                return -1;
        }
    }

    DecodeStatus decodeLong(const std::span<const uint8_t> raw, LongFrame& out) {
        if (raw.empty()) return DecodeStatus::Empty;
        if (raw[0] != common::FrameLongStart) return DecodeStatus::BadStart;
        if (raw.size() < common::FrameLongHeaderLength) return DecodeStatus::Incomplete;
        if (raw[3] != common::FrameLongStart) return DecodeStatus::BadStart;

        const size_t len = raw[1];
        if (raw[2] != raw[1] || len < 3) return DecodeStatus::BadLength;
        if (raw.size() < len + common::FrameLongOverhead) return DecodeStatus::Incomplete;
        if (raw.size() > len + common::FrameLongOverhead) return DecodeStatus::BadLength;

        const auto body = raw.subspan(common::FrameLongHeaderLength, len);
        if (checksum(body) != raw[common::FrameLongHeaderLength + len]) return DecodeStatus::BadChecksum;
        if (raw[common::FrameLongHeaderLength + len + 1] != common::FrameStop) return DecodeStatus::BadStop;

        out.control = body[0];
        out.address = body[1];
        out.control_info = body[2];
        out.data.assign(body.begin() + 3, body.end());
        return DecodeStatus::Ok;
    }

    ReplyKind classify(const std::span<const uint8_t> raw, LongFrame* long_out) {
        if (raw.empty()) return ReplyKind::None;

        if (raw.size() == 1 && raw[0] == common::FrameAck) {
            return ReplyKind::Ack;
        }

        if (raw[0] == common::FrameShortStart) {
            if (raw.size() == common::FrameShortLength &&
                checksum(raw.subspan(1, 2)) == raw[3] &&
                raw[4] == common::FrameStop) {
                return ReplyKind::Short;
            }
            return ReplyKind::Invalid;
        }

        if (raw[0] == common::FrameLongStart) {
            LongFrame frame;
            if (decodeLong(raw, frame) == DecodeStatus::Ok) {
                if (long_out) *long_out = std::move(frame);
                return ReplyKind::Long;
            }
        }
        return ReplyKind::Invalid;
    }

    std::optional<std::vector<uint8_t>> encodeSecondaryMask(const std::string_view mask) {
        if (mask.size() != common::SecondaryAddressLength) {
            return std::nullopt;
        }

        std::array<uint8_t, common::SecondaryAddressLength> nibbles{};
        for (size_t i = 0; i < mask.size(); ++i) {
            const auto nibble = hexNibble(mask[i]);
            if (!nibble) return std::nullopt;
            nibbles[i] = *nibble;
        }

        std::vector<uint8_t> payload(8);
        // Identification, BCD, LSB first
        for (size_t i = 0; i < 4; ++i) {
            const size_t hi = 6 - 2 * i;
            payload[i] = static_cast<uint8_t>((nibbles[hi] << 4) | nibbles[hi + 1]);
        }
        const uint16_t manufacturer = static_cast<uint16_t>(
            (nibbles[8] << 12) | (nibbles[9] << 8) | (nibbles[10] << 4) | nibbles[11]);
        payload[4] = static_cast<uint8_t>(manufacturer & 0xFF);
        payload[5] = static_cast<uint8_t>(manufacturer >> 8);
        payload[6] = static_cast<uint8_t>((nibbles[12] << 4) | nibbles[13]);
        payload[7] = static_cast<uint8_t>((nibbles[14] << 4) | nibbles[15]);
        return payload;
    }

    std::string decodeSecondaryMask(const std::span<const uint8_t> payload) {
        if (payload.size() < 8) return {};

        std::string out;
        out.reserve(common::SecondaryAddressLength);
        for (int i = 3; i >= 0; --i) {
            out.push_back(hexChar(payload[i] >> 4));
            out.push_back(hexChar(payload[i]));
        }
        const uint16_t manufacturer = static_cast<uint16_t>(payload[4] | (payload[5] << 8));
        out += utils::stringFormat("%04X%02X%02X", manufacturer, payload[6], payload[7]);
        return out;
    }

    bool maskMatches(const std::string_view mask, const std::string_view address) {
        if (mask.size() != common::SecondaryAddressLength || address.size() != common::SecondaryAddressLength) {
            return false;
        }
        for (size_t i = 0; i < mask.size(); ++i) {
            const auto m = static_cast<char>(std::toupper(static_cast<unsigned char>(mask[i])));
            if (m == 'F') continue;
            if (m != std::toupper(static_cast<unsigned char>(address[i]))) return false;
        }
        return true;
    }

    namespace Factory {
        Frame Short(const common::Control control, const uint8_t address) {
            const auto c = static_cast<uint8_t>(control);
            return {common::FrameShortStart, c, address, static_cast<uint8_t>(c + address), common::FrameStop};
        }

        Frame Long(const uint8_t control, const uint8_t address, const uint8_t control_info, const std::span<const uint8_t> data) {
            const auto len = static_cast<uint8_t>(3 + data.size());
            Frame frame{common::FrameLongStart, len, len, common::FrameLongStart, control, address, control_info};
            frame.insert(frame.end(), data.begin(), data.end());
            frame.push_back(checksum(std::span<const uint8_t>(frame).subspan(common::FrameLongHeaderLength)));
            frame.push_back(common::FrameStop);
            return frame;
        }

        std::optional<Frame> SelectSecondary(const std::string_view mask) {
            const auto payload = encodeSecondaryMask(mask);
            if (!payload) return std::nullopt;
            return Long(static_cast<uint8_t>(common::Control::SndUd),
                        common::AddressNetworkLayer,
                        static_cast<uint8_t>(common::ControlInfo::SelectSecondary),
                        *payload);
        }
    }
}
