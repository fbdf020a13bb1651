#include "storage/DeviceStateCodec.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT::DeviceStateCodec {
    static constexpr char TAG[] = "StateCodec";

    namespace {
        std::string getString(const cJSON* obj, const char* key, const char* fallback = "") {
            const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
            if (cJSON_IsString(item) && item->valuestring != nullptr) {
                return item->valuestring;
            }
            return fallback;
        }
    }

    std::string encode(const MBusDevice& device) {
        cJSON* root = cJSON_CreateObject();
        cJSON_AddStringToObject(root, "address", device.address.toString().c_str());
        cJSON_AddStringToObject(root, "medium", device.medium.c_str());
        cJSON_AddStringToObject(root, "identification", device.identification.c_str());
        cJSON_AddStringToObject(root, "version", device.version.c_str());

        cJSON* attributes = cJSON_AddArrayToObject(root, "attributes");
        for (const auto& record : device.records) {
            cJSON* item = cJSON_CreateObject();
            cJSON_AddStringToObject(item, "name", record.name.c_str());
            // Строкой: значение после перезапуска совпадает байт в байт
            cJSON_AddStringToObject(item, "value", recordValueToString(record.value).c_str());
            cJSON_AddBoolToObject(item, "numeric", std::holds_alternative<double>(record.value));
            cJSON_AddStringToObject(item, "unit", record.unit.c_str());
            cJSON_AddStringToObject(item, "function", record.function_code.c_str());
            cJSON_AddItemToArray(attributes, item);
        }

        char* json_str = cJSON_PrintUnformatted(root);
        std::string result = json_str ? json_str : "{}";
        cJSON_free(json_str);
        cJSON_Delete(root);
        return result;
    }

    bool decode(const std::string_view state_json, MBusDevice& out) {
        cJSON* root = cJSON_ParseWithLength(state_json.data(), state_json.size());
        if (root == nullptr) {
            MBUS_LOGW(TAG, "Malformed state document");
            return false;
        }

        const auto address = MBusAddress::parse(getString(root, "address"));
        if (!address) {
            MBUS_LOGW(TAG, "State document without a valid address");
            cJSON_Delete(root);
            return false;
        }
        out.address = *address;
        out.medium = getString(root, "medium", "Unknown");
        out.identification = getString(root, "identification");
        out.version = getString(root, "version");

        out.records.clear();
        const cJSON* attributes = cJSON_GetObjectItemCaseSensitive(root, "attributes");
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, attributes) {
            MBusRecord record;
            record.name = getString(item, "name");
            if (record.name.empty()) continue;

            const std::string value = getString(item, "value");
            if (cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(item, "numeric"))) {
                record.value = std::strtod(value.c_str(), nullptr);
            } else {
                record.value = value;
            }
            record.unit = getString(item, "unit");
            record.function_code = getString(item, "function");
            out.records.push_back(std::move(record));
        }

        cJSON_Delete(root);
        return true;
    }

    DeviceSnapshot toSnapshot(const MBusDevice& device) {
        DeviceSnapshot snapshot;
        snapshot.device_id = device.device_id;
        snapshot.device_type = DeviceTypeMeter;
        snapshot.name = device.name;
        snapshot.manufacturer = device.manufacturer;
        snapshot.model = device.medium;
        snapshot.sw_version = device.identification;
        snapshot.state_json = encode(device);
        if (device.last_seen.time_since_epoch().count() != 0) {
            snapshot.last_update = std::chrono::duration<double>(device.last_seen.time_since_epoch()).count();
        }
        snapshot.online = device.online;
        return snapshot;
    }

    std::optional<MBusDevice> fromSnapshot(const DeviceSnapshot& snapshot, const uint32_t max_retries) {
        if (snapshot.device_type != DeviceTypeMeter) {
            return std::nullopt;
        }

        MBusDevice device;
        if (!decode(snapshot.state_json, device)) {
            MBUS_LOGW(TAG, "Skipping unreadable snapshot of %s", snapshot.device_id.c_str());
            return std::nullopt;
        }
        device.device_id = snapshot.device_id;
        device.name = snapshot.name;
        device.manufacturer = snapshot.manufacturer;
        device.online = snapshot.online;
        device.consecutive_failures = snapshot.online ? 0 : max_retries;
        device.last_seen = WallClock::time_point(std::chrono::duration_cast<WallClock::duration>(
            std::chrono::duration<double>(snapshot.last_update)));
        return device;
    }
}
