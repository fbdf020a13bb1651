#ifndef MBUSMQTT_BUSTRANSPORT_HXX
#define MBUSMQTT_BUSTRANSPORT_HXX

#include "system/GatewayError.hxx"

namespace mbusMQTT
{
    // Byte-level access to the physical bus
    class IBusTransport {
        public:
            virtual ~IBusTransport() = default;

            virtual gw_err_t open() = 0;
            virtual void close() = 0;
            [[nodiscard]] virtual bool isOpen() const = 0;

            virtual gw_err_t write(std::span<const uint8_t> data) = 0;

            /**
             * @brief Read up to len bytes, waiting at most timeout for the first one.
             * @return bytes read, 0 on timeout, negative on transport error.
             */
            virtual int read(uint8_t* buf, size_t len, std::chrono::milliseconds timeout) = 0;

            virtual void flushInput() = 0;
    };
} // mbusMQTT

#endif //MBUSMQTT_BUSTRANSPORT_HXX
