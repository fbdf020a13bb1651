// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "system/Logger.hxx"

static constexpr char TAG[] = "TEST_RUNNER";

void run_mbus_frames_tests();
void run_mbus_scanner_tests();
void run_circuit_breaker_tests();
void run_device_reader_tests();
void run_ha_discovery_tests();
void run_sync_engine_tests();
void run_state_store_tests();
void run_config_manager_tests();
void run_health_monitor_tests();
void run_worker_pool_tests();
void run_app_controller_tests();

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

int main() {
    mbusMQTT::log::setLevel(mbusMQTT::log::Level::Warn);
    MBUS_LOGW(TAG, "Starting Unity Tests...");

    UNITY_BEGIN();

    run_mbus_frames_tests();
    run_mbus_scanner_tests();
    run_circuit_breaker_tests();
    run_device_reader_tests();
    run_ha_discovery_tests();
    run_sync_engine_tests();
    run_state_store_tests();
    run_config_manager_tests();
    run_health_monitor_tests();
    run_worker_pool_tests();
    run_app_controller_tests();

    return UNITY_END();
}
