#ifndef MBUSMQTT_SYSLOGCONFIG_HXX
#define MBUSMQTT_SYSLOGCONFIG_HXX

#include "system/Logger.hxx"

namespace mbusMQTT {
    class SyslogConfig {
        public:
            SyslogConfig(const SyslogConfig&) = delete;
            SyslogConfig& operator=(const SyslogConfig&) = delete;

            static SyslogConfig& getInstance() {
                static SyslogConfig instance;
                return instance;
            }

            void init(const std::string& server_addr);
            void setServer(const std::string& server_addr);
            void stop();

        private:
            SyslogConfig() = default;
            ~SyslogConfig();
            void enqueueLine(log::Level level, const std::string& line);
            void syslog_task_runner();
            void send_log_udp(int priority, const char* message, size_t len);

            std::string m_server_addr;
            int m_sock {-1};
            std::recursive_mutex m_sock_mutex;
            bool m_initialized {false};

            struct PendingLine {
                int priority;
                std::string text;
            };
            std::deque<PendingLine> m_log_buffer;
            std::mutex m_buffer_mutex;
            std::condition_variable m_buffer_cv;
            std::thread m_task;
            std::atomic<bool> m_running {false};
    };
} // mbusMQTT

#endif //MBUSMQTT_SYSLOGCONFIG_HXX
