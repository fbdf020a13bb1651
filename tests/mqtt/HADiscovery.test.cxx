#include "unity.h"
#include "mqtt/HADiscovery.hxx"

using namespace mbusMQTT;

namespace {
    MBusDevice waterMeter() {
        MBusDevice device = makeDevice(MBusAddress::fromSecondary("123456782C2D0107"));
        device.manufacturer = "KAM";
        device.medium = "Water";
        device.identification = "12345678";
        device.records = {
            {"Energy (kWh)", 12.345, "kWh", "instantaneous"},
            {"Volume (m³)", 1.5, "m³", "instantaneous"}
        };
        return device;
    }
}

static void test_object_id_and_state_topic() {
    TEST_ASSERT_EQUAL_STRING("mbus_meter_5_energy_kwh",
                             HADiscovery::objectId("mbus_meter_5", "Energy (kWh)").c_str());

    DiscoverySettings settings;
    settings.topic_prefix = "mbus";
    TEST_ASSERT_EQUAL_STRING("mbus/device/mbus_meter_5/flow_temperature_c",
                             HADiscovery::stateTopic(settings, "mbus_meter_5", "Flow Temperature (°C)").c_str());
}

static void test_classify_attributes() {
    auto cls = HADiscovery::classifyAttribute("Energy (kWh)", "kWh");
    TEST_ASSERT_EQUAL_STRING("sensor", cls.component.c_str());
    TEST_ASSERT_EQUAL_STRING("energy", cls.device_class.c_str());
    TEST_ASSERT_EQUAL_STRING("total_increasing", cls.state_class.c_str());

    cls = HADiscovery::classifyAttribute("Volume Flow (m³/h)", "m³/h");
    TEST_ASSERT_EQUAL_STRING("volume_flow_rate", cls.device_class.c_str());

    cls = HADiscovery::classifyAttribute("Volume (m³)", "m³");
    TEST_ASSERT_EQUAL_STRING("water", cls.device_class.c_str());

    cls = HADiscovery::classifyAttribute("Return Temperature (°C)", "°C");
    TEST_ASSERT_EQUAL_STRING("temperature", cls.device_class.c_str());
    TEST_ASSERT_EQUAL_STRING("measurement", cls.state_class.c_str());

    cls = HADiscovery::classifyAttribute("Status", "");
    TEST_ASSERT_EQUAL_STRING("binary_sensor", cls.component.c_str());
    TEST_ASSERT_EQUAL_STRING("connectivity", cls.device_class.c_str());

    cls = HADiscovery::classifyAttribute("Uptime", "s");
    TEST_ASSERT_EQUAL_STRING("duration", cls.device_class.c_str());

    cls = HADiscovery::classifyAttribute("Fabrication No", "");
    TEST_ASSERT_EQUAL_STRING("sensor", cls.component.c_str());
    TEST_ASSERT_TRUE(cls.device_class.empty());
    TEST_ASSERT_EQUAL_STRING("mdi:gauge", cls.icon.c_str());
}

static void test_build_sensor_config() {
    DiscoverySettings settings;
    const auto device = waterMeter();
    const auto msg = HADiscovery::build(settings, HADiscovery::describe(device), {"Energy (kWh)", "kWh"});

    TEST_ASSERT_EQUAL_STRING("homeassistant/sensor/mbus_meter_123456782c2d0107_energy_kwh/config", msg.topic.c_str());

    cJSON* root = cJSON_Parse(msg.payload.c_str());
    TEST_ASSERT_NOT_NULL(root);
    TEST_ASSERT_EQUAL_STRING("Energy (kWh)", cJSON_GetObjectItem(root, "name")->valuestring);
    TEST_ASSERT_EQUAL_STRING(msg.object_id.c_str(), cJSON_GetObjectItem(root, "unique_id")->valuestring);
    TEST_ASSERT_EQUAL_STRING(msg.state_topic.c_str(), cJSON_GetObjectItem(root, "state_topic")->valuestring);
    TEST_ASSERT_EQUAL_STRING("kWh", cJSON_GetObjectItem(root, "unit_of_measurement")->valuestring);
    TEST_ASSERT_EQUAL_INT(300, cJSON_GetObjectItem(root, "expire_after")->valueint);

    const cJSON* dev = cJSON_GetObjectItem(root, "device");
    TEST_ASSERT_EQUAL_STRING("KAM", cJSON_GetObjectItem(dev, "manufacturer")->valuestring);
    TEST_ASSERT_EQUAL_STRING("Water", cJSON_GetObjectItem(dev, "model")->valuestring);
    TEST_ASSERT_EQUAL_STRING("mbus_meter_123456782c2d0107",
                             cJSON_GetArrayItem(cJSON_GetObjectItem(dev, "identifiers"), 0)->valuestring);

    const cJSON* availability = cJSON_GetArrayItem(cJSON_GetObjectItem(root, "availability"), 0);
    TEST_ASSERT_EQUAL_STRING("mbus/bridge/state", cJSON_GetObjectItem(availability, "topic")->valuestring);
    cJSON_Delete(root);
}

static void test_build_status_config() {
    DiscoverySettings settings;
    settings.discovery_prefix = "ha";
    const auto msg = HADiscovery::build(settings, HADiscovery::describe(waterMeter()), {StatusAttribute, ""});

    TEST_ASSERT_EQUAL_STRING("ha/binary_sensor/mbus_meter_123456782c2d0107_status/config", msg.topic.c_str());

    cJSON* root = cJSON_Parse(msg.payload.c_str());
    TEST_ASSERT_NOT_NULL(root);
    TEST_ASSERT_EQUAL_STRING("online", cJSON_GetObjectItem(root, "payload_on")->valuestring);
    TEST_ASSERT_EQUAL_STRING("offline", cJSON_GetObjectItem(root, "payload_off")->valuestring);
    TEST_ASSERT_NULL(cJSON_GetObjectItem(root, "unit_of_measurement"));
    cJSON_Delete(root);
}

static void test_attributes_include_status() {
    const auto attributes = HADiscovery::attributesOf(waterMeter());
    TEST_ASSERT_EQUAL_size_t(3, attributes.size());
    TEST_ASSERT_EQUAL_STRING("Status", attributes.back().name.c_str());
}

void run_ha_discovery_tests() {
    RUN_TEST(test_object_id_and_state_topic);
    RUN_TEST(test_classify_attributes);
    RUN_TEST(test_build_sensor_config);
    RUN_TEST(test_build_status_config);
    RUN_TEST(test_attributes_include_status);
}
