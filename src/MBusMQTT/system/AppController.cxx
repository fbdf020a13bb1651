// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/AppController.hxx"
#include "system/SystemInfo.hxx"
#include "system/Logger.hxx"
#include "storage/DeviceStateCodec.hxx"
#include "utils/FileHandle.hxx"

namespace mbusMQTT
{
    static constexpr char TAG[] = "AppController";
    static constexpr char AttrIpAddress[] = "IP Address";
    static constexpr char AttrUptime[] = "Uptime";

    namespace {
        std::chrono::milliseconds toMillis(const double seconds) {
            return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
        }

        BusTiming busTimingFrom(const AppConfig& cfg) {
            BusTiming timing;
            timing.reply_timeout = toMillis(cfg.mbus_timeout);
            timing.probe_settle = std::chrono::milliseconds(cfg.mbus_probe_settle_ms);
            timing.read_settle = std::chrono::milliseconds(cfg.mbus_read_settle_ms);
            timing.ping_retry_delay = toMillis(cfg.mbus_retry_delay);
            timing.ping_retries = cfg.mbus_ping_retries;
            return timing;
        }

        ScanOptions scanOptionsFrom(const AppConfig& cfg) {
            ScanOptions options;
            options.start_mask = cfg.mbus_scan_mask;
            options.probe_retries = cfg.mbus_probe_retries;
            options.primary_first = static_cast<uint8_t>(std::min<uint32_t>(cfg.mbus_primary_scan_first, common::AddressMaxPrimary));
            options.primary_last = static_cast<uint8_t>(std::min<uint32_t>(cfg.mbus_primary_scan_last, common::AddressMaxPrimary));
            return options;
        }

        ReaderOptions readerOptionsFrom(const AppConfig& cfg) {
            ReaderOptions options;
            options.max_retries = cfg.mbus_max_retries;
            options.breaker_enabled = cfg.breaker_enabled;
            options.failure_threshold = cfg.breaker_failure_threshold;
            options.breaker_timeout = std::chrono::seconds(cfg.breaker_timeout);
            return options;
        }

        SyncSettings syncSettingsFrom(const AppConfig& cfg) {
            SyncSettings settings;
            settings.discovery.discovery_prefix = cfg.ha_discovery_prefix;
            settings.discovery.topic_prefix = cfg.mqtt_topic_prefix;
            settings.discovery.bridge_state_topic = cfg.ha_bridge_state_topic;
            settings.discovery.expire_after = cfg.ha_expire_after;
            settings.discovery.qos = cfg.mqtt_qos;
            settings.queue_batch_size = cfg.queue_batch_size;
            return settings;
        }

        std::string recordText(const std::vector<MBusRecord>& records, const std::string& name) {
            const auto it = std::ranges::find_if(records, [&](const MBusRecord& r) { return r.name == name; });
            return it == records.end() ? std::string{} : recordValueToString(it->value);
        }
    }

    AppController::AppController(AppConfig config, IBusTransport& bus, IMqttTransport& mqtt, MqttEventChannel& events,
                                 ClockFn clock)
        : m_config(std::move(config)),
          m_clock(clock ? std::move(clock) : ClockFn([] { return SteadyClock::now(); })),
          m_gateway_id(SystemInfo::getGatewayId()),
          m_store(m_config.db_path, m_config.max_queue_size),
          m_adapter(bus, busTimingFrom(m_config)),
          m_scanner(m_adapter, scanOptionsFrom(m_config)),
          m_reader(m_adapter, m_registry, readerOptionsFrom(m_config), m_clock),
          m_mqtt(mqtt),
          m_sync(mqtt, &m_store, m_registry, events, syncSettingsFrom(m_config)),
          m_pool(m_config.worker_threads) {}

    AppController::~AppController() {
        shutdown();
    }

    gw_err_t AppController::start(const std::chrono::milliseconds connect_wait) {
        MBUS_LOGI(TAG, "Starting gateway %s", m_gateway_id.c_str());

        if (const gw_err_t err = m_store.open(); err != GW_OK) {
            MBUS_LOGE(TAG, "State store %s unavailable (%s), queueing disabled",
                      m_config.db_path.c_str(), gwErrToName(err));
            m_health.updateComponentStatus(ComponentStorage, false, "database unavailable");
        } else {
            m_health.updateComponentStatus(ComponentStorage, true, "open");
        }

        MBusDevice gateway = makeDevice(MBusAddress::fromPrimary(0), m_config.gateway_name);
        gateway.device_id = m_gateway_id;
        gateway.manufacturer = m_config.gateway_manufacturer;
        gateway.medium = m_config.gateway_model;
        gateway.identification = m_config.gateway_version;
        m_sync.setGatewayDevice(std::move(gateway));

        // Ожидание брокера перед восстановлением
        const auto deadline = SteadyClock::now() + connect_wait;
        while (!m_mqtt.isConnected() && SteadyClock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!m_mqtt.isConnected()) {
            MBUS_LOGW(TAG, "Broker not connected yet, state will be queued");
        }
        runTask("events", [this] { m_sync.processEvents(); });

        runTask("restore", [this] { restoreState(); });
        registerConfiguredDevices();

        m_started = true;
        runTask("metrics", [this] { publishGatewayMetrics(); });
        m_last_metrics = m_clock();
        m_last_heartbeat = m_clock();
        m_last_drain = m_clock();
        m_last_cleanup = m_clock();

        MBUS_LOGI(TAG, "Gateway started with %zu known device(s)%s", m_registry.size(),
                  scanningEnabled() ? "" : ", periodic scan disabled");
        return GW_OK;
    }

    void AppController::restoreState() {
        if (!m_store.isOpen()) return;

        const auto states = m_store.loadAllStates();
        std::vector<MBusDevice> restored;
        for (const auto& [device_id, snapshot] : states) {
            if (device_id == m_gateway_id) continue;
            auto device = DeviceStateCodec::fromSnapshot(snapshot, m_config.mbus_max_retries);
            if (!device) continue;
            if (m_registry.add(*device)) {
                restored.push_back(std::move(*device));
            }
        }

        for (const auto& device : restored) {
            m_sync.publishDeviceState(device);
        }
        MBUS_LOGI(TAG, "Restored %zu device(s) from %s", restored.size(), m_store.path().c_str());
    }

    void AppController::registerConfiguredDevices() {
        for (const auto& entry : m_config.mbus_devices) {
            if (!entry.enabled) continue;

            const auto address = MBusAddress::parse(entry.address);
            if (!address) {
                MBUS_LOGW(TAG, "Invalid configured address '%s' skipped", entry.address.c_str());
                continue;
            }

            MBusDevice device = makeDevice(*address, entry.name);
            device.poll_interval = std::chrono::seconds(entry.poll_interval);
            device.from_config = true;
            const std::string device_id = device.device_id;

            if (!m_registry.add(device)) {
                m_registry.update(device_id, [&](MBusDevice& known) {
                    if (!entry.name.empty()) known.name = entry.name;
                    known.poll_interval = device.poll_interval;
                    known.from_config = true;
                });
            }
            MBUS_LOGI(TAG, "Configured device %s (%s)", device_id.c_str(), address->toString().c_str());
        }
    }

    bool AppController::scanningEnabled() const {
        if (m_config.mbus_scan_interval == 0) return false;
        const bool has_known = std::ranges::any_of(m_config.mbus_devices, [](const auto& d) { return d.enabled; });
        return !has_known || m_config.mbus_scan_with_known_devices;
    }

    std::chrono::seconds AppController::pollIntervalOf(const MBusDevice& device) const {
        if (device.poll_interval.count() > 0) {
            return device.poll_interval;
        }
        return std::chrono::seconds(m_config.mbus_read_interval);
    }

    bool AppController::due(std::optional<SteadyClock::time_point>& last, const std::chrono::seconds interval,
                            const SteadyClock::time_point now) const {
        if (last && now - *last < interval) {
            return false;
        }
        last = now;
        return true;
    }

    void AppController::runTask(const char* name, const std::function<void()>& task) {
        try {
            task();
        } catch (const std::exception& e) {
            MBUS_LOGE(TAG, "Task '%s' failed: %s", name, e.what());
        }
    }

    void AppController::tick() {
        if (!m_started || m_shut_down) return;
        const auto now = m_clock();

        runTask("events", [this] { m_sync.processEvents(); });

        if (scanningEnabled() && due(m_last_scan, std::chrono::seconds(m_config.mbus_scan_interval), now)) {
            runTask("scan", [this] { scheduleScan(); });
        }

        runTask("reads", [this, now] { scheduleReads(now); });

        if (due(m_last_drain, std::chrono::seconds(m_config.queue_interval), now)) {
            runTask("drain", [this] { m_sync.drainQueue(); });
        }
        if (due(m_last_heartbeat, std::chrono::seconds(m_config.ha_heartbeat_interval), now)) {
            runTask("heartbeat", [this] { m_sync.heartbeat(); });
        }
        if (due(m_last_metrics, std::chrono::seconds(m_config.metrics_interval), now)) {
            runTask("metrics", [this] { publishGatewayMetrics(); });
        }
        if (m_config.cleanup_interval > 0 && due(m_last_cleanup, std::chrono::seconds(m_config.cleanup_interval), now)) {
            runTask("cleanup", [this] {
                const size_t removed = m_store.cleanupHistory(m_config.history_days);
                MBUS_LOGI(TAG, "History cleanup removed %zu row(s)", removed);
            });
        }
    }

    void AppController::scheduleScan() {
        bool expected = false;
        if (!m_scan_in_flight.compare_exchange_strong(expected, true)) {
            MBUS_LOGD(TAG, "Scan still running, skipping");
            return;
        }
        if (!m_pool.submit([this] { runScan(); })) {
            m_scan_in_flight = false;
        }
    }

    void AppController::runScan() {
        runTask("scan job", [this] {
            const ScanResult result = m_scanner.scan();
            if (result.status != GW_OK) {
                m_health.updateComponentStatus(ComponentMBus, false,
                                               utils::stringFormat("scan failed: %s", gwErrToName(result.status)));
            } else {
                m_health.updateComponentStatus(ComponentMBus, true,
                                               utils::stringFormat("%zu device(s) on bus", result.devices.size()));
            }

            size_t added = 0;
            for (const auto& address : result.devices) {
                if (m_registry.add(makeDevice(address))) {
                    ++added;
                    MBUS_LOGI(TAG, "New device %s", makeDeviceId(address).c_str());
                }
            }
            MBUS_LOGI(TAG, "Scan finished: %zu found, %zu new, %u probes",
                      result.devices.size(), added, result.probes);
        });
        ++m_scans_completed;
        m_scan_in_flight = false;
    }

    void AppController::scheduleReads(const SteadyClock::time_point now) {
        for (const auto& device : m_registry.snapshot()) {
            {
                std::lock_guard<std::mutex> lock(m_schedule_mutex);
                auto& slot = m_schedule[device.device_id];
                if (slot.in_flight || now < slot.next_read) {
                    continue;
                }
                slot.in_flight = true;
                slot.next_read = now + pollIntervalOf(device);
            }

            const std::string device_id = device.device_id;
            if (!m_pool.submit([this, device_id] { runRead(device_id); })) {
                std::lock_guard<std::mutex> lock(m_schedule_mutex);
                m_schedule[device_id].in_flight = false;
            }
        }
    }

    void AppController::runRead(const std::string& device_id) {
        runTask("read job", [this, &device_id] {
            std::vector<MBusRecord> previous;
            if (const auto before = m_registry.get(device_id)) {
                previous = before->records;
            }
            const ReadResult result = m_reader.read(device_id);
            handleReadResult(device_id, result, previous);
        });
        ++m_reads_completed;

        std::lock_guard<std::mutex> lock(m_schedule_mutex);
        m_schedule[device_id].in_flight = false;
    }

    void AppController::handleReadResult(const std::string& device_id, const ReadResult& result,
                                         const std::vector<MBusRecord>& previous) {
        if (result.status == ReadStatus::ShortCircuited) {
            m_health.updateComponentStatus(ComponentMBus, false, "circuit breaker open");
            return;
        }

        const auto device = m_registry.get(device_id);
        if (!device) return;

        if (result.ok()) {
            m_health.updateComponentStatus(ComponentMBus, true, "reading");
            if (m_store.isOpen()) {
                for (const auto& record : device->records) {
                    const std::string value = recordValueToString(record.value);
                    if (recordText(previous, record.name) != value &&
                        m_store.appendHistory(device_id, record.name, value) != GW_OK) {
                        MBUS_LOGW(TAG, "History of %s/%s not saved", device_id.c_str(), record.name.c_str());
                    }
                }
                if (m_store.saveState(DeviceStateCodec::toSnapshot(*device)) != GW_OK) {
                    MBUS_LOGW(TAG, "State of %s not saved", device_id.c_str());
                }
            }
            m_sync.publishDeviceState(*device);
            return;
        }

        if (result.change == AvailabilityChange::WentOffline) {
            if (m_store.isOpen() && m_store.saveState(DeviceStateCodec::toSnapshot(*device)) != GW_OK) {
                MBUS_LOGW(TAG, "State of %s not saved", device_id.c_str());
            }
            m_sync.publishStatus(device_id, false);
        }
    }

    void AppController::publishGatewayMetrics() {
        auto gateway = m_sync.gatewayDevice();
        if (!gateway) return;

        gateway->records = {
            MBusRecord{AttrIpAddress, SystemInfo::getLocalIp(), {}, {}},
            MBusRecord{AttrUptime, static_cast<double>(m_health.uptimeSeconds()), "s", {}}
        };
        gateway->online = true;
        gateway->last_seen = WallClock::now();
        m_sync.setGatewayDevice(*gateway);
        m_sync.publishDeviceState(*gateway);

        if (m_store.isOpen()) {
            DeviceSnapshot snapshot = DeviceStateCodec::toSnapshot(*gateway);
            snapshot.device_type = DeviceStateCodec::DeviceTypeGateway;
            if (m_store.saveState(snapshot) != GW_OK) {
                MBUS_LOGW(TAG, "Gateway state not saved");
            }
        }

        refreshHealth();
        writeStatusFile();
    }

    void AppController::refreshHealth() {
        const bool connected = m_mqtt.isConnected();
        m_health.updateComponentStatus(ComponentMqtt, connected, connected ? "connected" : "disconnected");

        if (m_store.isOpen() && m_store.queueFull()) {
            m_health.updateComponentStatus(ComponentStorage, false,
                                           utils::stringFormat("queue full, %zu queued", m_store.queueSize()));
        } else if (m_store.isOpen()) {
            m_health.updateComponentStatus(ComponentStorage, true,
                                           utils::stringFormat("%zu queued", m_store.queueSize()));
        } else {
            m_health.updateComponentStatus(ComponentStorage, false, "database unavailable");
        }

        const CircuitBreaker breaker = m_reader.breaker();
        if (breaker.state == BreakerState::Closed) {
            m_health.updateComponentStatus(ComponentMBus, true,
                                           utils::stringFormat("%zu/%zu online", m_registry.onlineCount(), m_registry.size()));
        } else {
            m_health.updateComponentStatus(ComponentMBus, false,
                                           utils::stringFormat("circuit breaker %s", breakerStateToString(breaker.state)));
        }
    }

    void AppController::writeStatusFile() const {
        if (m_config.status_file.empty()) return;

        const utils::FileHandle file(m_config.status_file.c_str(), "wb");
        if (!file || !file.writeAll(m_health.toJson())) {
            MBUS_LOGW(TAG, "Cannot write status file %s", m_config.status_file.c_str());
        }
    }

    void AppController::run() {
        MBUS_LOGI(TAG, "Scheduler running, tick %u ms", m_config.tick_ms);
        while (!m_stop_requested) {
            tick();
            std::this_thread::sleep_for(std::chrono::milliseconds(m_config.tick_ms));
        }
        MBUS_LOGI(TAG, "Stop requested");
    }

    void AppController::requestStop() {
        m_stop_requested = true;
    }

    bool AppController::waitForJobs(const std::chrono::milliseconds timeout) {
        return m_pool.waitIdle(timeout);
    }

    void AppController::shutdown() {
        if (m_shut_down) return;
        m_shut_down = true;
        m_stop_requested = true;

        if (!m_pool.waitIdle(std::chrono::seconds(m_config.graceful_shutdown_timeout))) {
            MBUS_LOGW(TAG, "Bus jobs still running after %u s", m_config.graceful_shutdown_timeout);
        }
        m_pool.shutdown();

        if (m_started) {
            m_sync.publishBridgeOffline();
        }
        m_adapter.closePort();
        m_store.close();
        MBUS_LOGI(TAG, "Gateway stopped");
    }
} // mbusMQTT
