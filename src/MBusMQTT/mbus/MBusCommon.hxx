#ifndef MBUSMQTT_MBUSCOMMON_HXX
#define MBUSMQTT_MBUSCOMMON_HXX
namespace mbusMQTT::common {

    constexpr uint8_t FrameAck        = 0xE5;
    constexpr uint8_t FrameShortStart = 0x10;
    constexpr uint8_t FrameLongStart  = 0x68;
    constexpr uint8_t FrameStop       = 0x16;

    constexpr size_t FrameShortLength = 5;
    constexpr size_t FrameLongOverhead = 6;   // 68 L L 68 ... CS 16
    constexpr size_t FrameLongHeaderLength = 4;

    constexpr uint8_t AddressMaxPrimary       = 250;
    constexpr uint8_t AddressNetworkLayer     = 0xFD;
    constexpr uint8_t AddressBroadcastReply   = 0xFE;
    constexpr uint8_t AddressBroadcastNoReply = 0xFF;

    constexpr size_t SecondaryAddressLength = 16;
    constexpr char SecondaryWildcardMask[] = "FFFFFFFFFFFFFFFF";

    enum class Control : uint8_t {
        SndNke = 0x40,
        SndUd  = 0x53,
        ReqUd2 = 0x5B,
        ReqUd1 = 0x5A,
        RspUd  = 0x08
    };

    enum class ControlInfo : uint8_t {
        DataSend         = 0x51,
        SelectSecondary  = 0x52,
        VariableResponse = 0x72,
        FixedResponse    = 0x73
    };

    // Код функции из DIF (биты 4-5)
    enum class FunctionField : uint8_t {
        Instantaneous = 0,
        Maximum       = 1,
        Minimum       = 2,
        ValueDuringError = 3
    };

    constexpr const char* functionFieldToString(const FunctionField fn) {
        switch (fn) {
            case FunctionField::Instantaneous:    return "instantaneous";
            case FunctionField::Maximum:          return "maximum";
            case FunctionField::Minimum:          return "minimum";
            case FunctionField::ValueDuringError: return "error";
        }
        return "unknown";
    }

    constexpr bool isRspUd(const uint8_t control) {
        return (control & 0xCF) == static_cast<uint8_t>(Control::RspUd);
    }

}
#endif //MBUSMQTT_MBUSCOMMON_HXX
