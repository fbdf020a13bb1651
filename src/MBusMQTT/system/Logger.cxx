#include "system/Logger.hxx"
#include <syslog.h>

namespace mbusMQTT::log
{
    namespace {
        std::atomic<Level> g_level{Level::Info};
        std::atomic<bool> g_local_syslog{false};
        std::mutex g_output_mutex;
        std::mutex g_sink_mutex;
        SinkFn g_sink;
        const auto g_start = std::chrono::steady_clock::now();

        constexpr char levelLetter(const Level level) {
            switch (level) {
                case Level::Error:   return 'E';
                case Level::Warn:    return 'W';
                case Level::Info:    return 'I';
                case Level::Debug:   return 'D';
                case Level::Verbose: return 'V';
                default:             return '?';
            }
        }

        constexpr int syslogPriority(const Level level) {
            switch (level) {
                case Level::Error: return LOG_ERR;
                case Level::Warn:  return LOG_WARNING;
                case Level::Info:  return LOG_INFO;
                default:           return LOG_DEBUG;
            }
        }
    }

    void setLevel(const Level level) {
        g_level = level;
    }

    Level getLevel() {
        return g_level;
    }

    Level levelFromString(const std::string_view name) {
        std::string lower(name);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "none" || lower == "off") return Level::None;
        if (lower == "error" || lower == "critical") return Level::Error;
        if (lower == "warn" || lower == "warning") return Level::Warn;
        if (lower == "debug") return Level::Debug;
        if (lower == "verbose" || lower == "trace") return Level::Verbose;
        return Level::Info;
    }

    void enableLocalSyslog(const char* ident) {
        openlog(ident, LOG_PID | LOG_NDELAY, LOG_DAEMON);
        g_local_syslog = true;
    }

    void disableLocalSyslog() {
        if (g_local_syslog.exchange(false)) {
            closelog();
        }
    }

    void setSink(SinkFn sink) {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        g_sink = std::move(sink);
    }

    void write(const Level level, const char* tag, const char* fmt, ...) {
        if (level == Level::None || level > g_level.load()) {
            return;
        }

        char msg_buffer[512];
        va_list args;
        va_start(args, fmt);
        const int len = vsnprintf(msg_buffer, sizeof(msg_buffer), fmt, args);
        va_end(args);
        if (len < 0) return;

        const auto uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - g_start).count();

        // I (1234) TAG: message
        char line_buffer[600];
        snprintf(line_buffer, sizeof(line_buffer), "%c (%lld) %s: %s",
                 levelLetter(level), static_cast<long long>(uptime_ms), tag, msg_buffer);

        {
            std::lock_guard<std::mutex> lock(g_output_mutex);
            fputs(line_buffer, stderr);
            fputc('\n', stderr);
        }

        if (g_local_syslog) {
            syslog(syslogPriority(level), "%s: %s", tag, msg_buffer);
        }

        SinkFn sink;
        {
            std::lock_guard<std::mutex> lock(g_sink_mutex);
            sink = g_sink;
        }
        if (sink) {
            sink(level, line_buffer);
        }
    }
} // mbusMQTT::log
