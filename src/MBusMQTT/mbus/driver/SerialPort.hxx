#ifndef MBUSMQTT_SERIALPORT_HXX
#define MBUSMQTT_SERIALPORT_HXX

#include "mbus/driver/BusTransport.hxx"

namespace mbusMQTT
{
    // termios serial line, 8E1 as required by EN 13757-2
    class SerialPort final : public IBusTransport {
        public:
            SerialPort(std::string device, uint32_t baudrate);
            ~SerialPort() override;

            SerialPort(const SerialPort&) = delete;
            SerialPort& operator=(const SerialPort&) = delete;

            gw_err_t open() override;
            void close() override;
            [[nodiscard]] bool isOpen() const override;

            gw_err_t write(std::span<const uint8_t> data) override;
            int read(uint8_t* buf, size_t len, std::chrono::milliseconds timeout) override;
            void flushInput() override;

            [[nodiscard]] const std::string& device() const { return m_device; }

        private:
            std::string m_device;
            uint32_t m_baudrate;
            int m_fd{-1};
    };
} // mbusMQTT

#endif //MBUSMQTT_SERIALPORT_HXX
