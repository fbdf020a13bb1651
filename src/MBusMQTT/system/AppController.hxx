// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MBUSMQTT_APPCONTROLLER_HXX
#define MBUSMQTT_APPCONTROLLER_HXX

#include "system/ConfigManager.hxx"
#include "system/HealthMonitor.hxx"
#include "system/WorkerPool.hxx"
#include "mbus/MBusScanner.hxx"
#include "mbus/MBusDeviceReader.hxx"
#include "mqtt/SyncEngine.hxx"

namespace mbusMQTT
{
    /**
     * Top-level scheduler. Runs scans and per-device reads on the worker pool,
     * persists results, feeds the sync engine and keeps the periodic MQTT tasks going.
     */
    class AppController {
        public:
            using ClockFn = std::function<SteadyClock::time_point()>;

            AppController(AppConfig config, IBusTransport& bus, IMqttTransport& mqtt, MqttEventChannel& events,
                          ClockFn clock = {});
            ~AppController();

            AppController(const AppController&) = delete;
            AppController& operator=(const AppController&) = delete;

            /**
             * @brief Open the store, restore last-known state, register configured meters
             * and the gateway itself.
             * @param connect_wait how long to wait for the broker before restoring.
             */
            gw_err_t start(std::chrono::milliseconds connect_wait = std::chrono::seconds{5});

            // One scheduler pass
            void tick();

            // tick() every tick_ms until requestStop()
            void run();

            // Async-signal-safe
            void requestStop();

            void shutdown();

            [[nodiscard]] MBusDeviceRegistry& registry() { return m_registry; }
            [[nodiscard]] SyncEngine& sync() { return m_sync; }
            [[nodiscard]] StateStore& store() { return m_store; }
            [[nodiscard]] HealthMonitor& health() { return m_health; }
            [[nodiscard]] const std::string& gatewayId() const { return m_gateway_id; }
            [[nodiscard]] uint32_t scansCompleted() const { return m_scans_completed; }
            [[nodiscard]] uint32_t readsCompleted() const { return m_reads_completed; }

            // Block until submitted bus jobs are done
            bool waitForJobs(std::chrono::milliseconds timeout);

        private:
            struct DeviceSchedule {
                SteadyClock::time_point next_read{};
                bool in_flight{false};
            };

            void runTask(const char* name, const std::function<void()>& task);
            [[nodiscard]] bool due(std::optional<SteadyClock::time_point>& last, std::chrono::seconds interval,
                                   SteadyClock::time_point now) const;
            [[nodiscard]] bool scanningEnabled() const;
            [[nodiscard]] std::chrono::seconds pollIntervalOf(const MBusDevice& device) const;

            void restoreState();
            void registerConfiguredDevices();
            void scheduleScan();
            void scheduleReads(SteadyClock::time_point now);
            void runScan();
            void runRead(const std::string& device_id);
            void handleReadResult(const std::string& device_id, const ReadResult& result,
                                  const std::vector<MBusRecord>& previous);
            void publishGatewayMetrics();
            void refreshHealth();
            void writeStatusFile() const;

            AppConfig m_config;
            ClockFn m_clock;
            std::string m_gateway_id;

            MBusDeviceRegistry m_registry;
            StateStore m_store;
            HealthMonitor m_health;
            MBusAdapter m_adapter;
            MBusScanner m_scanner;
            MBusDeviceReader m_reader;
            IMqttTransport& m_mqtt;
            SyncEngine m_sync;
            WorkerPool m_pool;

            std::map<std::string, DeviceSchedule> m_schedule;
            mutable std::mutex m_schedule_mutex;

            std::optional<SteadyClock::time_point> m_last_scan;
            std::optional<SteadyClock::time_point> m_last_drain;
            std::optional<SteadyClock::time_point> m_last_heartbeat;
            std::optional<SteadyClock::time_point> m_last_metrics;
            std::optional<SteadyClock::time_point> m_last_cleanup;

            std::atomic<bool> m_scan_in_flight{false};
            std::atomic<uint32_t> m_scans_completed{0};
            std::atomic<uint32_t> m_reads_completed{0};
            std::atomic<bool> m_stop_requested{false};
            bool m_started{false};
            bool m_shut_down{false};
    };
} // mbusMQTT

#endif //MBUSMQTT_APPCONTROLLER_HXX
