#ifndef MBUSMQTT_LOGGER_HXX
#define MBUSMQTT_LOGGER_HXX

namespace mbusMQTT::log
{
    enum class Level : uint8_t {
        None = 0,
        Error,
        Warn,
        Info,
        Debug,
        Verbose
    };

    // Extra consumer of every emitted line (remote syslog forwarder)
    using SinkFn = std::function<void(Level level, const std::string& line)>;

    void setLevel(Level level);
    [[nodiscard]] Level getLevel();
    [[nodiscard]] Level levelFromString(std::string_view name);

    void enableLocalSyslog(const char* ident);
    void disableLocalSyslog();
    void setSink(SinkFn sink);

    void write(Level level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
} // mbusMQTT::log

#define MBUS_LOGE(tag, fmt, ...) ::mbusMQTT::log::write(::mbusMQTT::log::Level::Error, tag, fmt __VA_OPT__(,) __VA_ARGS__)
#define MBUS_LOGW(tag, fmt, ...) ::mbusMQTT::log::write(::mbusMQTT::log::Level::Warn, tag, fmt __VA_OPT__(,) __VA_ARGS__)
#define MBUS_LOGI(tag, fmt, ...) ::mbusMQTT::log::write(::mbusMQTT::log::Level::Info, tag, fmt __VA_OPT__(,) __VA_ARGS__)
#define MBUS_LOGD(tag, fmt, ...) ::mbusMQTT::log::write(::mbusMQTT::log::Level::Debug, tag, fmt __VA_OPT__(,) __VA_ARGS__)
#define MBUS_LOGV(tag, fmt, ...) ::mbusMQTT::log::write(::mbusMQTT::log::Level::Verbose, tag, fmt __VA_OPT__(,) __VA_ARGS__)

#endif //MBUSMQTT_LOGGER_HXX
