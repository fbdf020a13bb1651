// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "system/AppController.hxx"
#include "mocks/SimulatedBus.hxx"
#include "mocks/FakeMqttTransport.hxx"

using namespace mbusMQTT;
using mbusMQTT::test::SimulatedBus;
using mbusMQTT::test::FakeMqttTransport;
using mbusMQTT::test::makeMeter;

namespace {
    constexpr char MeterId[] = "mbus_meter_123456782c2d0107";
    constexpr char EnergyTopic[] = "homeassistant/device/mbus_meter_123456782c2d0107/energy_kwh";
    constexpr char StatusTopic[] = "homeassistant/device/mbus_meter_123456782c2d0107/status";
    constexpr char EnergyConfigTopic[] = "homeassistant/sensor/mbus_meter_123456782c2d0107_energy_kwh/config";
    constexpr auto JobWait = std::chrono::seconds{5};

    AppConfig testConfig() {
        AppConfig cfg;
        cfg.db_path = ":memory:";
        cfg.mbus_timeout = 0.0;
        cfg.mbus_retry_delay = 0.0;
        cfg.mbus_ping_retries = 0;
        cfg.mbus_probe_settle_ms = 0;
        cfg.mbus_read_settle_ms = 0;
        cfg.mbus_primary_scan_first = 1;
        cfg.mbus_primary_scan_last = 0;
        cfg.mbus_read_interval = 15;
        cfg.mbus_max_retries = 3;
        cfg.breaker_failure_threshold = 10;
        cfg.worker_threads = 1;
        cfg.graceful_shutdown_timeout = 5;
        cfg.tick_ms = 10;
        cfg.metrics_interval = 30;
        return cfg;
    }

    AppConfig withKnownMeter(AppConfig cfg) {
        cfg.mbus_devices.push_back({"123456782C2D0107", "Water meter", true, 0});
        return cfg;
    }

    size_t countPayload(const std::vector<test::PublishedMessage>& messages, const std::string& payload) {
        return static_cast<size_t>(std::ranges::count_if(messages, [&](const test::PublishedMessage& m) {
            return m.payload == payload;
        }));
    }

    struct ControllerFixture {
        SimulatedBus bus;
        MqttEventChannel events;
        FakeMqttTransport mqtt{&events};
        SteadyClock::time_point now{SteadyClock::now()};
        size_t meter{bus.addMeter(makeMeter("12345678"))};

        std::unique_ptr<AppController> make(const AppConfig& cfg) {
            return std::make_unique<AppController>(cfg, bus, mqtt, events, [this] { return now; });
        }

        void step(AppController& controller, const std::chrono::seconds advance = std::chrono::seconds{0}) {
            now += advance;
            controller.tick();
            TEST_ASSERT_TRUE(controller.waitForJobs(JobWait));
        }
    };
}

static void test_scan_then_read_publishes_discovery_and_state() {
    ControllerFixture f;
    f.mqtt.connect();
    auto controller = f.make(testConfig());
    TEST_ASSERT_EQUAL(GW_OK, controller->start(std::chrono::milliseconds{0}));

    // Gateway entity is announced on start
    TEST_ASSERT_TRUE(f.mqtt.countWithSuffix("_uptime/config") >= 1);

    f.step(*controller);
    TEST_ASSERT_EQUAL_UINT32(1, controller->scansCompleted());
    TEST_ASSERT_TRUE(controller->registry().contains(MeterId));

    f.step(*controller);
    TEST_ASSERT_EQUAL_UINT32(1, controller->readsCompleted());

    const auto energy = f.mqtt.publishedTo(EnergyTopic);
    TEST_ASSERT_EQUAL_size_t(1, energy.size());
    TEST_ASSERT_EQUAL_STRING("12.345", energy[0].payload.c_str());
    TEST_ASSERT_EQUAL_size_t(1, f.mqtt.publishedTo(EnergyConfigTopic).size());

    const auto states = controller->store().loadAllStates();
    TEST_ASSERT_TRUE(states.contains(MeterId));
    TEST_ASSERT_TRUE(states.contains(controller->gatewayId()));
    TEST_ASSERT_EQUAL_STRING("gateway", states.at(controller->gatewayId()).device_type.c_str());
    // Первое чтение: все значения попадают в историю
    TEST_ASSERT_EQUAL_size_t(3, controller->store().historySize(MeterId));

    // Not due yet: no second read
    f.step(*controller, std::chrono::seconds{5});
    TEST_ASSERT_EQUAL_UINT32(1, controller->readsCompleted());

    // Unchanged values add no history rows
    f.step(*controller, std::chrono::seconds{15});
    TEST_ASSERT_EQUAL_UINT32(2, controller->readsCompleted());
    TEST_ASSERT_EQUAL_size_t(3, controller->store().historySize(MeterId));
}

static void test_meter_goes_offline_once_after_max_retries() {
    ControllerFixture f;
    f.mqtt.connect();
    f.bus.setResponsive(f.meter, false);
    auto controller = f.make(withKnownMeter(testConfig()));
    TEST_ASSERT_EQUAL(GW_OK, controller->start(std::chrono::milliseconds{0}));

    f.step(*controller);
    f.step(*controller, std::chrono::seconds{15});
    TEST_ASSERT_TRUE(controller->registry().get(MeterId)->online);
    TEST_ASSERT_EQUAL_size_t(0, countPayload(f.mqtt.publishedTo(StatusTopic), "offline"));

    f.step(*controller, std::chrono::seconds{15});
    TEST_ASSERT_FALSE(controller->registry().get(MeterId)->online);
    TEST_ASSERT_EQUAL_size_t(1, countPayload(f.mqtt.publishedTo(StatusTopic), "offline"));

    f.step(*controller, std::chrono::seconds{15});
    f.step(*controller, std::chrono::seconds{15});
    TEST_ASSERT_EQUAL_UINT32(5, controller->readsCompleted());
    TEST_ASSERT_EQUAL_size_t(1, countPayload(f.mqtt.publishedTo(StatusTopic), "offline"));

    // The offline state is persisted
    TEST_ASSERT_FALSE(controller->store().loadAllStates().at(MeterId).online);

    f.bus.setResponsive(f.meter, true);
    f.step(*controller, std::chrono::seconds{15});
    TEST_ASSERT_TRUE(controller->registry().get(MeterId)->online);
    TEST_ASSERT_EQUAL_STRING("online", f.mqtt.publishedTo(StatusTopic).back().payload.c_str());
}

static void test_known_devices_disable_scanning() {
    ControllerFixture f;
    f.mqtt.connect();
    auto controller = f.make(withKnownMeter(testConfig()));
    TEST_ASSERT_EQUAL(GW_OK, controller->start(std::chrono::milliseconds{0}));

    f.step(*controller);
    TEST_ASSERT_EQUAL_UINT32(0, controller->scansCompleted());
    TEST_ASSERT_EQUAL_STRING("Water meter", controller->registry().get(MeterId)->name.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, controller->readsCompleted());

    AppConfig cfg = withKnownMeter(testConfig());
    cfg.mbus_scan_with_known_devices = true;
    ControllerFixture g;
    g.mqtt.connect();
    auto scanning = g.make(cfg);
    TEST_ASSERT_EQUAL(GW_OK, scanning->start(std::chrono::milliseconds{0}));
    g.step(*scanning);
    TEST_ASSERT_EQUAL_UINT32(1, scanning->scansCompleted());
}

static void test_state_restored_after_restart() {
    const auto path = (std::filesystem::temp_directory_path() / "mbus2mqtt_controller_test.db").string();
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path + suffix, ec);
    }
    AppConfig cfg = withKnownMeter(testConfig());
    cfg.db_path = path;

    {
        ControllerFixture f;
        f.mqtt.connect();
        auto controller = f.make(cfg);
        TEST_ASSERT_EQUAL(GW_OK, controller->start(std::chrono::milliseconds{0}));
        f.step(*controller);
        TEST_ASSERT_EQUAL_UINT32(1, controller->readsCompleted());
        controller->shutdown();
        TEST_ASSERT_EQUAL_STRING("offline", f.mqtt.publishedTo("mbus/bridge/state").back().payload.c_str());
    }

    ControllerFixture f;
    f.bus.setResponsive(f.meter, false);
    f.mqtt.connect();
    auto controller = f.make(cfg);
    TEST_ASSERT_EQUAL(GW_OK, controller->start(std::chrono::milliseconds{0}));

    // Last known values are back before any bus traffic
    const auto device = controller->registry().get(MeterId);
    TEST_ASSERT_TRUE(device.has_value());
    TEST_ASSERT_EQUAL_size_t(3, device->records.size());
    TEST_ASSERT_EQUAL_STRING("KAM", device->manufacturer.c_str());
    TEST_ASSERT_EQUAL_STRING("Water meter", device->name.c_str());
    TEST_ASSERT_EQUAL_size_t(1, f.mqtt.publishedTo(EnergyTopic).size());
    TEST_ASSERT_EQUAL_STRING("12.345", f.mqtt.publishedTo(EnergyTopic)[0].payload.c_str());
    TEST_ASSERT_EQUAL_UINT32(0, controller->readsCompleted());
}

static void test_disconnected_start_queues_until_broker_returns() {
    ControllerFixture f;
    auto controller = f.make(withKnownMeter(testConfig()));
    TEST_ASSERT_EQUAL(GW_OK, controller->start(std::chrono::milliseconds{0}));

    f.step(*controller);
    TEST_ASSERT_EQUAL_UINT32(1, controller->readsCompleted());
    TEST_ASSERT_TRUE(f.mqtt.published().empty());
    TEST_ASSERT_TRUE(controller->store().queueSize() > 0);

    f.mqtt.connect();
    f.step(*controller);
    TEST_ASSERT_EQUAL_size_t(0, controller->store().queueSize());

    const auto published = f.mqtt.published();
    const auto position = [&](const std::string& topic) {
        return std::ranges::find_if(published, [&](const test::PublishedMessage& m) { return m.topic == topic; }) -
               published.begin();
    };
    TEST_ASSERT_TRUE(position(EnergyConfigTopic) < position(EnergyTopic));
    TEST_ASSERT_TRUE(position(EnergyTopic) < static_cast<std::ptrdiff_t>(published.size()));
}

static void test_health_reflects_components() {
    ControllerFixture f;
    f.mqtt.connect();
    auto controller = f.make(testConfig());
    TEST_ASSERT_EQUAL(GW_OK, controller->start(std::chrono::milliseconds{0}));

    const auto components = controller->health().components();
    TEST_ASSERT_TRUE(components.at(ComponentMqtt).healthy);
    TEST_ASSERT_TRUE(components.at(ComponentStorage).healthy);
    TEST_ASSERT_TRUE(components.at(ComponentMBus).healthy);

    f.mqtt.disconnect();
    f.step(*controller, std::chrono::seconds{30});
    TEST_ASSERT_FALSE(controller->health().isHealthy());
}

void run_app_controller_tests() {
    RUN_TEST(test_scan_then_read_publishes_discovery_and_state);
    RUN_TEST(test_meter_goes_offline_once_after_max_retries);
    RUN_TEST(test_known_devices_disable_scanning);
    RUN_TEST(test_state_restored_after_restart);
    RUN_TEST(test_disconnected_start_queues_until_broker_returns);
    RUN_TEST(test_health_reflects_components);
}
