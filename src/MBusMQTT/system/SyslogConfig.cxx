#include "system/SyslogConfig.hxx"
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mbusMQTT {

    static constexpr char TAG[] = "SyslogService";
    static constexpr int SYSLOG_PORT = 514;
    static constexpr size_t MESSAGE_BUFFER_LINES = 256;
    static constexpr size_t MAX_LOG_MSG_SIZE = 480;

    SyslogConfig::~SyslogConfig() {
        stop();
    }

    void SyslogConfig::init(const std::string& server_addr) {
        if (m_initialized) {
            setServer(server_addr);
            return;
        }

        m_running = true;
        m_task = std::thread(&SyslogConfig::syslog_task_runner, this);

        log::setSink([this](const log::Level level, const std::string& line) {
            // Строки от собственного потока не пересылаем
            if (std::this_thread::get_id() == m_task.get_id()) {
                return;
            }
            enqueueLine(level, line);
        });
        m_initialized = true;

        setServer(server_addr);
        MBUS_LOGI(TAG, "Syslog forwarder initialized with a background thread.");
    }

    void SyslogConfig::stop() {
        if (!m_initialized) return;

        log::setSink(nullptr);
        m_running = false;
        m_buffer_cv.notify_all();
        if (m_task.joinable()) {
            m_task.join();
        }

        std::lock_guard<std::recursive_mutex> lock(m_sock_mutex);
        if (m_sock >= 0) {
            close(m_sock);
            m_sock = -1;
        }
        m_initialized = false;
    }

    void SyslogConfig::setServer(const std::string& server_addr) {
        std::lock_guard<std::recursive_mutex> lock(m_sock_mutex);

        if (m_sock >= 0) {
            close(m_sock);
            m_sock = -1;
        }
        m_server_addr = server_addr;

        if (m_server_addr.empty()) {
            MBUS_LOGI(TAG, "Syslog server address is empty, remote logging is paused.");
            return;
        }

        struct addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        struct addrinfo *res = nullptr;

        const int err = getaddrinfo(m_server_addr.c_str(), std::to_string(SYSLOG_PORT).c_str(), &hints, &res);
        if (err != 0 || res == nullptr) {
            MBUS_LOGE(TAG, "DNS lookup failed for '%s': %s", m_server_addr.c_str(), gai_strerror(err));
            return;
        }

        m_sock = socket(res->ai_family, res->ai_socktype, 0);
        if (m_sock < 0) {
            MBUS_LOGE(TAG, "Failed to create socket.");
        } else if (connect(m_sock, res->ai_addr, res->ai_addrlen) != 0) {
            MBUS_LOGE(TAG, "Failed to connect socket.");
            close(m_sock);
            m_sock = -1;
        }

        freeaddrinfo(res);
    }

    void SyslogConfig::enqueueLine(const log::Level level, const std::string& line) {
        int priority = 14; // user.info
        switch (level) {
            case log::Level::Error: priority = 11; break;
            case log::Level::Warn:  priority = 12; break;
            case log::Level::Info:  priority = 14; break;
            default:                priority = 15; break;
        }

        {
            std::lock_guard<std::mutex> lock(m_buffer_mutex);
            if (m_log_buffer.size() >= MESSAGE_BUFFER_LINES) {
                m_log_buffer.pop_front();
            }
            m_log_buffer.push_back({priority, line.substr(0, MAX_LOG_MSG_SIZE)});
        }
        m_buffer_cv.notify_one();
    }

    void SyslogConfig::syslog_task_runner() {
        while (true) {
            PendingLine pending;
            {
                std::unique_lock<std::mutex> lock(m_buffer_mutex);
                m_buffer_cv.wait(lock, [this] { return !m_log_buffer.empty() || !m_running; });
                if (m_log_buffer.empty()) {
                    return;
                }
                pending = std::move(m_log_buffer.front());
                m_log_buffer.pop_front();
            }
            send_log_udp(pending.priority, pending.text.c_str(), pending.text.size());
        }
    }

    void SyslogConfig::send_log_udp(const int priority, const char* message, size_t msg_len) {
        std::lock_guard<std::recursive_mutex> lock(m_sock_mutex);

        if (m_sock < 0 || m_server_addr.empty()) {
            return;
        }

        while (msg_len > 0 && (message[msg_len - 1] == '\n' || message[msg_len - 1] == '\r')) {
            msg_len--;
        }
        if (msg_len == 0) return;

        char packet_buf[MAX_LOG_MSG_SIZE + 32];

        const int header_len = snprintf(packet_buf, sizeof(packet_buf), "<%d>mbus2mqtt: ", priority);
        if (header_len < 0) return;

        const size_t max_msg_payload = sizeof(packet_buf) - header_len - 1;
        const size_t copy_len = (msg_len < max_msg_payload) ? msg_len : max_msg_payload;

        memcpy(packet_buf + header_len, message, copy_len);
        packet_buf[header_len + copy_len] = '\0';

        send(m_sock, packet_buf, header_len + copy_len, 0);
    }

} // namespace mbusMQTT
