#ifndef MBUSMQTT_GATEWAYERROR_HXX
#define MBUSMQTT_GATEWAYERROR_HXX

namespace mbusMQTT
{
    using gw_err_t = int;

    constexpr gw_err_t GW_OK                = 0;
    constexpr gw_err_t GW_FAIL              = -1;
    constexpr gw_err_t GW_ERR_NO_MEM        = 0x101;
    constexpr gw_err_t GW_ERR_INVALID_ARG   = 0x102;
    constexpr gw_err_t GW_ERR_INVALID_STATE = 0x103;
    constexpr gw_err_t GW_ERR_NOT_FOUND     = 0x105;
    constexpr gw_err_t GW_ERR_TIMEOUT       = 0x107;
    constexpr gw_err_t GW_ERR_IO            = 0x110;
    constexpr gw_err_t GW_ERR_DECODE        = 0x111;
    constexpr gw_err_t GW_ERR_STORAGE       = 0x112;

    constexpr const char* gwErrToName(const gw_err_t err) {
        switch (err) {
            case GW_OK:                return "GW_OK";
            case GW_FAIL:              return "GW_FAIL";
            case GW_ERR_NO_MEM:        return "GW_ERR_NO_MEM";
            case GW_ERR_INVALID_ARG:   return "GW_ERR_INVALID_ARG";
            case GW_ERR_INVALID_STATE: return "GW_ERR_INVALID_STATE";
            case GW_ERR_NOT_FOUND:     return "GW_ERR_NOT_FOUND";
            case GW_ERR_TIMEOUT:       return "GW_ERR_TIMEOUT";
            case GW_ERR_IO:            return "GW_ERR_IO";
            case GW_ERR_DECODE:        return "GW_ERR_DECODE";
            case GW_ERR_STORAGE:       return "GW_ERR_STORAGE";
            default:                   return "UNKNOWN_ERROR";
        }
    }
} // mbusMQTT

#endif //MBUSMQTT_GATEWAYERROR_HXX
