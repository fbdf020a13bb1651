#include "mqtt/HADiscovery.hxx"

namespace mbusMQTT::HADiscovery
{
    namespace {
        bool contains(const std::string& haystack, const std::string_view needle) {
            return haystack.find(needle) != std::string::npos;
        }

        bool oneOf(const std::string& value, std::initializer_list<std::string_view> options) {
            return std::ranges::any_of(options, [&](const std::string_view option) { return value == option; });
        }
    }

    std::string objectId(const std::string& device_id, const std::string& attribute) {
        return utils::sanitizeId(device_id + "_" + attribute);
    }

    std::string stateTopic(const DiscoverySettings& settings, const std::string& device_id, const std::string& attribute) {
        return utils::stringFormat("%s/device/%s/%s", settings.topic_prefix.c_str(), device_id.c_str(),
                                   utils::sanitizeId(attribute).c_str());
    }

    AttributeClass classifyAttribute(const std::string_view name, const std::string_view unit) {
        const std::string n = utils::toLower(name);
        const std::string u = utils::toLower(unit);
        AttributeClass cls;

        if (n == utils::toLower(StatusAttribute)) {
            cls.component = "binary_sensor";
            cls.device_class = "connectivity";
            cls.icon = "mdi:check-circle";
        } else if (contains(n, "energy") || oneOf(u, {"kwh", "wh", "mwh", "j", "kj", "mj", "gj"})) {
            cls.device_class = "energy";
            cls.state_class = "total_increasing";
            cls.icon = "mdi:lightning-bolt";
        } else if (contains(n, "volume flow") || oneOf(u, {"m³/h", "m3/h", "l/h"})) {
            cls.device_class = "volume_flow_rate";
            cls.state_class = "measurement";
            cls.icon = "mdi:water-pump";
        } else if (contains(n, "power") || oneOf(u, {"w", "kw", "mw"})) {
            cls.device_class = "power";
            cls.state_class = "measurement";
            cls.icon = "mdi:flash";
        } else if (contains(n, "temperature") || oneOf(u, {"°c", "c"})) {
            cls.device_class = "temperature";
            cls.state_class = "measurement";
            cls.icon = "mdi:thermometer";
        } else if (contains(n, "voltage") || u == "v") {
            cls.device_class = "voltage";
            cls.state_class = "measurement";
            cls.icon = "mdi:lightning-bolt";
        } else if (contains(n, "current") || u == "a") {
            cls.device_class = "current";
            cls.state_class = "measurement";
            cls.icon = "mdi:current-ac";
        } else if (contains(n, "volume") || oneOf(u, {"m³", "m3", "l"})) {
            cls.device_class = "water";
            cls.state_class = "total_increasing";
            cls.icon = "mdi:water";
        } else if (n == "ip address" || contains(n, " ip")) {
            cls.icon = "mdi:ip-network";
        } else if (contains(n, "uptime")) {
            cls.device_class = "duration";
            cls.state_class = "measurement";
            cls.icon = "mdi:clock";
        }
        return cls;
    }

    DiscoveryMessage build(const DiscoverySettings& settings, const DiscoveryDevice& device, const DiscoveryAttribute& attribute) {
        const AttributeClass cls = classifyAttribute(attribute.name, attribute.unit);

        DiscoveryMessage msg;
        msg.object_id = objectId(device.device_id, attribute.name);
        msg.state_topic = stateTopic(settings, device.device_id, attribute.name);
        msg.topic = utils::stringFormat("%s/%s/%s/config", settings.discovery_prefix.c_str(),
                                        cls.component.c_str(), msg.object_id.c_str());

        cJSON* root = cJSON_CreateObject();
        cJSON_AddStringToObject(root, "name", attribute.name.c_str());
        cJSON_AddStringToObject(root, "unique_id", msg.object_id.c_str());
        cJSON_AddStringToObject(root, "object_id", msg.object_id.c_str());
        cJSON_AddStringToObject(root, "state_topic", msg.state_topic.c_str());

        cJSON* dev = cJSON_CreateObject();
        cJSON* identifiers = cJSON_CreateArray();
        cJSON_AddItemToArray(identifiers, cJSON_CreateString(device.device_id.c_str()));
        cJSON_AddItemToObject(dev, "identifiers", identifiers);
        cJSON_AddStringToObject(dev, "name", device.name.c_str());
        cJSON_AddStringToObject(dev, "manufacturer", device.manufacturer.c_str());
        cJSON_AddStringToObject(dev, "model", device.model.c_str());
        cJSON_AddStringToObject(dev, "sw_version", device.sw_version.c_str());
        cJSON_AddItemToObject(root, "device", dev);

        cJSON* av_list = cJSON_CreateArray();
        cJSON* av_bridge = cJSON_CreateObject();
        cJSON_AddStringToObject(av_bridge, "topic", settings.bridge_state_topic.c_str());
        cJSON_AddStringToObject(av_bridge, "payload_available", PayloadOnline);
        cJSON_AddStringToObject(av_bridge, "payload_not_available", PayloadOffline);
        cJSON_AddItemToArray(av_list, av_bridge);
        cJSON_AddItemToObject(root, "availability", av_list);

        cJSON_AddNumberToObject(root, "expire_after", settings.expire_after);

        if (!attribute.unit.empty()) {
            cJSON_AddStringToObject(root, "unit_of_measurement", attribute.unit.c_str());
        }
        if (!cls.device_class.empty()) {
            cJSON_AddStringToObject(root, "device_class", cls.device_class.c_str());
        }
        if (!cls.state_class.empty()) {
            cJSON_AddStringToObject(root, "state_class", cls.state_class.c_str());
        }
        cJSON_AddStringToObject(root, "icon", cls.icon.c_str());

        if (cls.component == "binary_sensor") {
            cJSON_AddStringToObject(root, "payload_on", PayloadOnline);
            cJSON_AddStringToObject(root, "payload_off", PayloadOffline);
        }

        if (char* json_payload = cJSON_PrintUnformatted(root)) {
            msg.payload = json_payload;
            cJSON_free(json_payload);
        }
        cJSON_Delete(root);
        return msg;
    }

    DiscoveryDevice describe(const MBusDevice& device) {
        return DiscoveryDevice{
            device.device_id,
            device.name,
            device.manufacturer,
            device.medium,
            device.identification
        };
    }

    std::vector<DiscoveryAttribute> attributesOf(const MBusDevice& device) {
        std::vector<DiscoveryAttribute> out;
        out.reserve(device.records.size() + 1);
        for (const auto& record : device.records) {
            out.push_back({record.name, record.unit});
        }
        out.push_back({StatusAttribute, {}});
        return out;
    }
} // mbusMQTT::HADiscovery
