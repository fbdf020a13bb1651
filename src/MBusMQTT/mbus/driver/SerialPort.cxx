#include "mbus/driver/SerialPort.hxx"
#include "system/Logger.hxx"
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace mbusMQTT
{
    static constexpr char TAG[] = "SerialPort";

    namespace {
        std::optional<speed_t> baudToSpeed(const uint32_t baud) {
            switch (baud) {
                case 300:   return B300;
                case 600:   return B600;
                case 1200:  return B1200;
                case 2400:  return B2400;
                case 4800:  return B4800;
                case 9600:  return B9600;
                case 19200: return B19200;
                case 38400: return B38400;
                default:    return std::nullopt;
            }
        }
    }

    SerialPort::SerialPort(std::string device, const uint32_t baudrate)
        : m_device(std::move(device)), m_baudrate(baudrate) {}

    SerialPort::~SerialPort() {
        close();
    }

    gw_err_t SerialPort::open() {
        if (m_fd >= 0) return GW_OK;

        const auto speed = baudToSpeed(m_baudrate);
        if (!speed) {
            MBUS_LOGE(TAG, "Unsupported baud rate %u", m_baudrate);
            return GW_ERR_INVALID_ARG;
        }

        m_fd = ::open(m_device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
        if (m_fd < 0) {
            MBUS_LOGE(TAG, "Failed to open %s: %s", m_device.c_str(), strerror(errno));
            return GW_ERR_IO;
        }

        struct termios tio = {};
        if (::tcgetattr(m_fd, &tio) != 0) {
            MBUS_LOGE(TAG, "tcgetattr failed on %s: %s", m_device.c_str(), strerror(errno));
            close();
            return GW_ERR_IO;
        }

        tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF | IXANY));
        tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
        tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
        tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARODD | CSTOPB));
        // 8 data bits, even parity, 1 stop bit
        tio.c_cflag |= static_cast<tcflag_t>(CS8 | PARENB | CLOCAL | CREAD);
        tio.c_cc[VMIN] = 0;
        tio.c_cc[VTIME] = 0;

        ::cfsetispeed(&tio, *speed);
        ::cfsetospeed(&tio, *speed);

        if (::tcsetattr(m_fd, TCSANOW, &tio) != 0) {
            MBUS_LOGE(TAG, "tcsetattr failed on %s: %s", m_device.c_str(), strerror(errno));
            close();
            return GW_ERR_IO;
        }
        ::tcflush(m_fd, TCIOFLUSH);

        MBUS_LOGI(TAG, "Opened %s at %u baud (8E1)", m_device.c_str(), m_baudrate);
        return GW_OK;
    }

    void SerialPort::close() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    bool SerialPort::isOpen() const {
        return m_fd >= 0;
    }

    gw_err_t SerialPort::write(const std::span<const uint8_t> data) {
        if (m_fd < 0) return GW_ERR_INVALID_STATE;

        size_t written = 0;
        while (written < data.size()) {
            const ssize_t n = ::write(m_fd, data.data() + written, data.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno != EAGAIN && errno != EINTR) {
                MBUS_LOGE(TAG, "Write failed on %s: %s", m_device.c_str(), strerror(errno));
                return GW_ERR_IO;
            }
            struct pollfd pfd = {m_fd, POLLOUT, 0};
            if (::poll(&pfd, 1, 1000) <= 0) {
                MBUS_LOGE(TAG, "Write timeout on %s", m_device.c_str());
                return GW_ERR_TIMEOUT;
            }
        }
        if (::tcdrain(m_fd) != 0) {
            MBUS_LOGW(TAG, "tcdrain failed on %s: %s", m_device.c_str(), strerror(errno));
        }
        return GW_OK;
    }

    int SerialPort::read(uint8_t* buf, const size_t len, const std::chrono::milliseconds timeout) {
        if (m_fd < 0) return -1;

        struct pollfd pfd = {m_fd, POLLIN, 0};
        int rc = 0;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);

        if (rc < 0) {
            MBUS_LOGE(TAG, "poll failed on %s: %s", m_device.c_str(), strerror(errno));
            return -1;
        }
        if (rc == 0) {
            return 0;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            MBUS_LOGE(TAG, "Device %s reported an error condition", m_device.c_str());
            return -1;
        }

        const ssize_t n = ::read(m_fd, buf, len);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) return 0;
            MBUS_LOGE(TAG, "Read failed on %s: %s", m_device.c_str(), strerror(errno));
            return -1;
        }
        return static_cast<int>(n);
    }

    void SerialPort::flushInput() {
        if (m_fd >= 0) {
            ::tcflush(m_fd, TCIFLUSH);
        }
    }
} // mbusMQTT
