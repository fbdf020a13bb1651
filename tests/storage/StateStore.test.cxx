// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "storage/StateStore.hxx"
#include "storage/DeviceStateCodec.hxx"

using namespace mbusMQTT;

namespace {
    std::string tempDbPath() {
        const auto path = std::filesystem::temp_directory_path() / "mbus2mqtt_state_test.db";
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path.string() + suffix, ec);
        }
        return path.string();
    }

    MBusDevice sampleMeter() {
        MBusDevice device = makeDevice(MBusAddress::fromSecondary("123456782C2D0107"), "Kitchen water");
        device.manufacturer = "KAM";
        device.medium = "Water";
        device.identification = "12345678";
        device.version = "1";
        device.records = {
            {"Energy (kWh)", 12.345, "kWh", "instantaneous"},
            {"Flow Temperature (°C)", 65.43, "°C", "instantaneous"},
            {"Fabrication No", std::string("00012345"), "", "instantaneous"},
            {"Time Point", std::string("2024-03-01 12:30"), "", "instantaneous"}
        };
        device.last_seen = WallClock::now();
        return device;
    }
}

static void test_state_survives_reopen_byte_identical() {
    const std::string path = tempDbPath();
    const MBusDevice original = sampleMeter();
    const DeviceSnapshot saved = DeviceStateCodec::toSnapshot(original);

    {
        StateStore store(path, 100);
        TEST_ASSERT_EQUAL(GW_OK, store.open());
        TEST_ASSERT_EQUAL(GW_OK, store.saveState(saved));
    }

    StateStore store(path, 100);
    TEST_ASSERT_EQUAL(GW_OK, store.open());
    const auto states = store.loadAllStates();
    TEST_ASSERT_EQUAL_size_t(1, states.size());

    const auto& loaded = states.at(original.device_id);
    TEST_ASSERT_EQUAL_STRING(saved.state_json.c_str(), loaded.state_json.c_str());
    TEST_ASSERT_EQUAL_STRING("Kitchen water", loaded.name.c_str());
    TEST_ASSERT_EQUAL_STRING("Water", loaded.model.c_str());

    const auto restored = DeviceStateCodec::fromSnapshot(loaded, 3);
    TEST_ASSERT_TRUE(restored.has_value());
    TEST_ASSERT_TRUE(restored->address == original.address);
    TEST_ASSERT_EQUAL_size_t(original.records.size(), restored->records.size());
    for (size_t i = 0; i < original.records.size(); ++i) {
        TEST_ASSERT_EQUAL_STRING(original.records[i].name.c_str(), restored->records[i].name.c_str());
        TEST_ASSERT_EQUAL_STRING(recordValueToString(original.records[i].value).c_str(),
                                 recordValueToString(restored->records[i].value).c_str());
        TEST_ASSERT_EQUAL_STRING(original.records[i].unit.c_str(), restored->records[i].unit.c_str());
    }
    TEST_ASSERT_TRUE(std::holds_alternative<double>(restored->records[0].value));
    TEST_ASSERT_TRUE(std::holds_alternative<std::string>(restored->records[2].value));

    // Second round trip does not drift
    TEST_ASSERT_EQUAL_STRING(saved.state_json.c_str(), DeviceStateCodec::toSnapshot(*restored).state_json.c_str());
}

static void test_offline_snapshot_restores_failure_count() {
    MBusDevice device = sampleMeter();
    device.online = false;

    const auto restored = DeviceStateCodec::fromSnapshot(DeviceStateCodec::toSnapshot(device), 4);
    TEST_ASSERT_TRUE(restored.has_value());
    TEST_ASSERT_FALSE(restored->online);
    TEST_ASSERT_EQUAL_UINT32(4, restored->consecutive_failures);

    DeviceSnapshot gateway = DeviceStateCodec::toSnapshot(device);
    gateway.device_type = DeviceStateCodec::DeviceTypeGateway;
    TEST_ASSERT_FALSE(DeviceStateCodec::fromSnapshot(gateway, 4).has_value());

    DeviceSnapshot broken = DeviceStateCodec::toSnapshot(device);
    broken.state_json = "{not json";
    TEST_ASSERT_FALSE(DeviceStateCodec::fromSnapshot(broken, 4).has_value());
}

static void test_save_state_upserts() {
    StateStore store(":memory:", 100);
    TEST_ASSERT_EQUAL(GW_OK, store.open());

    MBusDevice device = sampleMeter();
    TEST_ASSERT_EQUAL(GW_OK, store.saveState(DeviceStateCodec::toSnapshot(device)));
    device.online = false;
    TEST_ASSERT_EQUAL(GW_OK, store.saveState(DeviceStateCodec::toSnapshot(device)));

    const auto states = store.loadAllStates();
    TEST_ASSERT_EQUAL_size_t(1, states.size());
    TEST_ASSERT_FALSE(states.begin()->second.online);
}

static void test_queue_is_fifo_and_acked_individually() {
    StateStore store(":memory:", 100);
    TEST_ASSERT_EQUAL(GW_OK, store.open());

    const auto first = store.enqueue("a/1", "one", 1, true);
    const auto second = store.enqueue("a/2", "two", 0, false);
    TEST_ASSERT_TRUE(first.has_value());
    TEST_ASSERT_TRUE(second.has_value());

    auto batch = store.dequeue(10);
    TEST_ASSERT_EQUAL_size_t(2, batch.size());
    TEST_ASSERT_EQUAL_STRING("a/1", batch[0].topic.c_str());
    TEST_ASSERT_TRUE(batch[0].retain);
    TEST_ASSERT_EQUAL_INT(0, batch[1].qos);
    // dequeue does not remove anything
    TEST_ASSERT_EQUAL_size_t(2, store.queueSize());

    TEST_ASSERT_EQUAL(GW_OK, store.ack(*first));
    TEST_ASSERT_EQUAL(GW_ERR_NOT_FOUND, store.ack(*first));
    batch = store.dequeue(10);
    TEST_ASSERT_EQUAL_size_t(1, batch.size());
    TEST_ASSERT_EQUAL_STRING("two", batch[0].payload.c_str());
}

static void test_full_queue_refuses_and_keeps_undelivered() {
    StateStore store(":memory:", 3);
    TEST_ASSERT_EQUAL(GW_OK, store.open());

    for (int i = 1; i <= 3; ++i) {
        TEST_ASSERT_TRUE(store.enqueue("t/" + std::to_string(i), "x", 1, false).has_value());
    }
    TEST_ASSERT_TRUE(store.queueFull());
    TEST_ASSERT_FALSE(store.enqueue("t/4", "x", 1, false).has_value());

    // Nothing undelivered was removed to make room
    auto batch = store.dequeue(10);
    TEST_ASSERT_EQUAL_size_t(3, batch.size());
    TEST_ASSERT_EQUAL_STRING("t/1", batch.front().topic.c_str());
    TEST_ASSERT_EQUAL_STRING("t/3", batch.back().topic.c_str());

    // An ack frees a slot
    TEST_ASSERT_EQUAL(GW_OK, store.ack(batch.front().id));
    TEST_ASSERT_FALSE(store.queueFull());
    TEST_ASSERT_TRUE(store.enqueue("t/4", "x", 1, false).has_value());
    batch = store.dequeue(10);
    TEST_ASSERT_EQUAL_STRING("t/2", batch.front().topic.c_str());
    TEST_ASSERT_EQUAL_STRING("t/4", batch.back().topic.c_str());

    TEST_ASSERT_EQUAL_size_t(3, store.clearQueue());
    TEST_ASSERT_EQUAL_size_t(0, store.queueSize());
}

static void test_unbounded_queue_by_default() {
    StateStore store(":memory:", 0);
    TEST_ASSERT_EQUAL(GW_OK, store.open());

    for (int i = 0; i < 500; ++i) {
        TEST_ASSERT_TRUE(store.enqueue("u/" + std::to_string(i), "x", 0, false).has_value());
    }
    TEST_ASSERT_FALSE(store.queueFull());
    TEST_ASSERT_EQUAL_size_t(500, store.queueSize());
    TEST_ASSERT_EQUAL_STRING("u/0", store.dequeue(1).front().topic.c_str());
}

static void test_history_append_and_cleanup() {
    StateStore store(":memory:", 100);
    TEST_ASSERT_EQUAL(GW_OK, store.open());

    TEST_ASSERT_EQUAL(GW_OK, store.appendHistory("mbus_meter_5", "Energy (kWh)", "1.5"));
    TEST_ASSERT_EQUAL(GW_OK, store.appendHistory("mbus_meter_5", "Energy (kWh)", "1.6"));
    TEST_ASSERT_EQUAL_size_t(2, store.historySize("mbus_meter_5"));

    // Fresh rows are newer than any retention window
    TEST_ASSERT_EQUAL_size_t(0, store.cleanupHistory(7));
    TEST_ASSERT_EQUAL_size_t(2, store.historySize("mbus_meter_5"));
}

static void test_closed_store_rejects_writes() {
    StateStore store(":memory:", 100);
    TEST_ASSERT_FALSE(store.isOpen());
    TEST_ASSERT_EQUAL(GW_ERR_INVALID_STATE, store.saveState(DeviceSnapshot{}));
    TEST_ASSERT_FALSE(store.enqueue("t", "p", 1, false).has_value());
    TEST_ASSERT_TRUE(store.loadAllStates().empty());
}

void run_state_store_tests() {
    RUN_TEST(test_state_survives_reopen_byte_identical);
    RUN_TEST(test_offline_snapshot_restores_failure_count);
    RUN_TEST(test_save_state_upserts);
    RUN_TEST(test_queue_is_fifo_and_acked_individually);
    RUN_TEST(test_full_queue_refuses_and_keeps_undelivered);
    RUN_TEST(test_unbounded_queue_by_default);
    RUN_TEST(test_history_append_and_cleanup);
    RUN_TEST(test_closed_store_rejects_writes);
}
