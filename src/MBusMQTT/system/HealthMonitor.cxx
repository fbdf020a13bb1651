#include "system/HealthMonitor.hxx"
#include "utils/StringUtils.hxx"

namespace mbusMQTT
{
    namespace {
        double unixSeconds(const std::chrono::system_clock::time_point tp) {
            return std::chrono::duration<double>(tp.time_since_epoch()).count();
        }
    }

    HealthMonitor::HealthMonitor() : m_start(std::chrono::steady_clock::now()) {
        for (const char* name : {ComponentMBus, ComponentMqtt, ComponentStorage}) {
            m_components.emplace(name, ComponentHealth{false, "not started", {}});
        }
    }

    void HealthMonitor::updateComponentStatus(const std::string& component, const bool healthy, const std::string& detail) {
        std::lock_guard<std::mutex> lock(m_health_mutex);
        auto& entry = m_components[component];
        entry.healthy = healthy;
        entry.detail = detail;
        entry.last_check = std::chrono::system_clock::now();
    }

    bool HealthMonitor::isHealthy() const {
        std::lock_guard<std::mutex> lock(m_health_mutex);
        return std::ranges::all_of(m_components, [](const auto& kv) { return kv.second.healthy; });
    }

    uint64_t HealthMonitor::uptimeSeconds() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - m_start).count());
    }

    std::map<std::string, ComponentHealth> HealthMonitor::components() const {
        std::lock_guard<std::mutex> lock(m_health_mutex);
        return m_components;
    }

    std::string HealthMonitor::toJson() const {
        const auto snapshot = components();
        const bool healthy = std::ranges::all_of(snapshot, [](const auto& kv) { return kv.second.healthy; });

        cJSON* root = cJSON_CreateObject();
        cJSON_AddStringToObject(root, "status", healthy ? "healthy" : "unhealthy");
        cJSON_AddNumberToObject(root, "uptime", static_cast<double>(uptimeSeconds()));
        cJSON_AddNumberToObject(root, "timestamp", unixSeconds(std::chrono::system_clock::now()));

        cJSON* list = cJSON_AddObjectToObject(root, "components");
        for (const auto& [name, health] : snapshot) {
            cJSON* item = cJSON_AddObjectToObject(list, name.c_str());
            cJSON_AddBoolToObject(item, "healthy", health.healthy);
            cJSON_AddStringToObject(item, "message", health.detail.c_str());
            cJSON_AddNumberToObject(item, "last_check", unixSeconds(health.last_check));
        }

        std::string out;
        if (char* text = cJSON_PrintUnformatted(root)) {
            out = text;
            cJSON_free(text);
        }
        cJSON_Delete(root);
        return out;
    }

    std::string HealthMonitor::toPrometheus() const {
        const auto snapshot = components();
        const bool healthy = std::ranges::all_of(snapshot, [](const auto& kv) { return kv.second.healthy; });

        std::string out;
        out += "# HELP mbus_gateway_up Gateway is up and healthy\n";
        out += "# TYPE mbus_gateway_up gauge\n";
        out += utils::stringFormat("mbus_gateway_up %d\n", healthy ? 1 : 0);
        out += "# HELP mbus_gateway_uptime_seconds Gateway uptime in seconds\n";
        out += "# TYPE mbus_gateway_uptime_seconds counter\n";
        out += utils::stringFormat("mbus_gateway_uptime_seconds %llu\n", static_cast<unsigned long long>(uptimeSeconds()));
        out += "# HELP mbus_gateway_component_healthy Component health status\n";
        out += "# TYPE mbus_gateway_component_healthy gauge\n";
        for (const auto& [name, health] : snapshot) {
            out += utils::stringFormat("mbus_gateway_component_healthy{component=\"%s\"} %d\n",
                                       name.c_str(), health.healthy ? 1 : 0);
        }
        return out;
    }
} // mbusMQTT
