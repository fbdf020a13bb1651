// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mqtt/SyncEngine.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT
{
    static constexpr char TAG[] = "SyncEngine";

    SyncEngine::SyncEngine(IMqttTransport& transport, StateStore* store, MBusDeviceRegistry& registry,
                           MqttEventChannel& events, SyncSettings settings)
        : m_transport(transport), m_store(store), m_registry(registry), m_events(events),
          m_settings(std::move(settings)) {}

    void SyncEngine::setGatewayDevice(MBusDevice gateway) {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        m_gateway = std::move(gateway);
    }

    std::optional<MBusDevice> SyncEngine::gatewayDevice() const {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        return m_gateway;
    }

    size_t SyncEngine::publishDiscovery(const MBusDevice& device) {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        return publishDiscoveryLocked(device);
    }

    size_t SyncEngine::publishDiscoveryLocked(const MBusDevice& device) {
        if (!sessionOpenLocked()) {
            MBUS_LOGD(TAG, "Discovery of %s deferred until connected", device.device_id.c_str());
            return 0;
        }

        const DiscoveryDevice dev = HADiscovery::describe(device);
        size_t published = 0;
        for (const auto& attribute : HADiscovery::attributesOf(device)) {
            const std::string object_id = HADiscovery::objectId(device.device_id, attribute.name);
            if (discoverySent(m_session, object_id)) {
                continue;
            }
            const DiscoveryMessage msg = HADiscovery::build(m_settings.discovery, dev, attribute);
            // Очередь тоже считается: она доставит конфиг раньше последующих состояний
            if (publishLocked(msg.topic, msg.payload, m_settings.discovery.qos, true, false) ||
                sessionOpenLocked()) {
                discoveryMark(m_session, object_id);
                ++published;
            }
        }
        if (published > 0) {
            MBUS_LOGI(TAG, "Published %zu discovery configs for %s", published, device.device_id.c_str());
        }
        return published;
    }

    void SyncEngine::publishState(const std::string& device_id, const std::vector<MBusRecord>& attributes) {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        publishStateLocked(device_id, attributes);
    }

    void SyncEngine::publishStateLocked(const std::string& device_id, const std::vector<MBusRecord>& attributes) {
        for (const auto& record : attributes) {
            const std::string topic = HADiscovery::stateTopic(m_settings.discovery, device_id, record.name);
            publishLocked(topic, recordValueToString(record.value), m_settings.discovery.qos, true, true);
        }
    }

    void SyncEngine::publishStatus(const std::string& device_id, const bool online) {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        const std::string topic = HADiscovery::stateTopic(m_settings.discovery, device_id, StatusAttribute);
        publishLocked(topic, online ? PayloadOnline : PayloadOffline, m_settings.discovery.qos, true, true);
    }

    void SyncEngine::publishDeviceState(const MBusDevice& device) {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        publishDiscoveryLocked(device);
        publishStateLocked(device.device_id, device.records);

        const std::string topic = HADiscovery::stateTopic(m_settings.discovery, device.device_id, StatusAttribute);
        publishLocked(topic, device.online ? PayloadOnline : PayloadOffline, m_settings.discovery.qos, true, true);
    }

    bool SyncEngine::publish(const std::string& topic, const std::string& payload, const int qos, const bool retain) {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        return publishLocked(topic, payload, qos, retain, true);
    }

    bool SyncEngine::publishLocked(const std::string& topic, const std::string& payload, const int qos,
                                   const bool retain, const bool behind_backlog) {
        if (!sessionOpenLocked()) {
            enqueueLocked(topic, payload, qos, retain);
            MBUS_LOGD(TAG, "Not connected, queued %s", topic.c_str());
            return false;
        }

        if (behind_backlog && m_store && m_store->isOpen() && m_store->queueSize() > 0) {
            enqueueLocked(topic, payload, qos, retain);
            return false;
        }

        try {
            const gw_err_t err = m_transport.publish(topic, payload, qos, retain);
            if (err == GW_OK) {
                MBUS_LOGV(TAG, "Published %s", topic.c_str());
                return true;
            }
            MBUS_LOGW(TAG, "Publish to %s failed (%s), queued", topic.c_str(), gwErrToName(err));
        } catch (const std::exception& e) {
            MBUS_LOGE(TAG, "Publish to %s threw: %s, queued", topic.c_str(), e.what());
        }
        enqueueLocked(topic, payload, qos, retain);
        return false;
    }

    bool SyncEngine::enqueueLocked(const std::string& topic, const std::string& payload, const int qos, const bool retain) {
        if (!m_store || !m_store->isOpen()) {
            MBUS_LOGW(TAG, "No state store, dropping message for %s", topic.c_str());
            return false;
        }
        return m_store->enqueue(topic, payload, qos, retain).has_value();
    }

    size_t SyncEngine::processEvents() {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        return processEventsLocked();
    }

    size_t SyncEngine::processEventsLocked() {
        const auto events = m_events.drain();
        for (const auto& event : events) {
            switch (event.type) {
                case MqttEventType::Connected:
                    onConnectedLocked();
                    break;
                case MqttEventType::Disconnected:
                    m_session_open = false;
                    discoveryReset(m_session);
                    MBUS_LOGW(TAG, "Broker session closed (rc=%d)", event.rc);
                    break;
                case MqttEventType::Message:
                    if (event.topic == m_settings.ha_status_topic) {
                        MBUS_LOGI(TAG, "Home Assistant status: %s", event.payload.c_str());
                        if (event.payload == PayloadOnline) {
                            discoveryReset(m_session);
                            resendAllDiscoveryLocked();
                        }
                    }
                    break;
            }
        }
        return events.size();
    }

    bool SyncEngine::sessionOpenLocked() const {
        return m_session_open && m_transport.isConnected();
    }

    void SyncEngine::onConnectedLocked() {
        MBUS_LOGI(TAG, "Broker session started");
        m_session_open = true;

        // Bridge online and discovery go out before anything else of this session
        publishLocked(m_settings.discovery.bridge_state_topic, PayloadOnline, 1, true, false);

        if (const gw_err_t err = m_transport.subscribe(m_settings.ha_status_topic, 1); err != GW_OK) {
            MBUS_LOGW(TAG, "Subscribe to %s failed: %s", m_settings.ha_status_topic.c_str(), gwErrToName(err));
        }

        discoveryReset(m_session);
        resendAllDiscoveryLocked();
        drainQueueLocked();
    }

    void SyncEngine::resendAllDiscovery() {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        resendAllDiscoveryLocked();
    }

    void SyncEngine::resendAllDiscoveryLocked() {
        MBUS_LOGI(TAG, "Sending discovery for all devices (session %llu)",
                  static_cast<unsigned long long>(m_session.session_id));
        if (m_gateway) {
            publishDiscoveryLocked(*m_gateway);
        }
        for (const auto& device : m_registry.snapshot()) {
            publishDiscoveryLocked(device);
        }
    }

    size_t SyncEngine::drainQueue() {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        return drainQueueLocked();
    }

    size_t SyncEngine::drainQueueLocked() {
        if (!m_store || !m_store->isOpen() || !sessionOpenLocked()) {
            return 0;
        }

        const auto messages = m_store->dequeue(m_settings.queue_batch_size);
        if (messages.empty()) {
            return 0;
        }
        MBUS_LOGI(TAG, "Processing %zu queued messages", messages.size());

        size_t delivered = 0;
        for (const auto& msg : messages) {
            gw_err_t err = GW_FAIL;
            try {
                err = m_transport.publish(msg.topic, msg.payload, msg.qos, msg.retain);
            } catch (const std::exception& e) {
                MBUS_LOGE(TAG, "Queued publish to %s threw: %s", msg.topic.c_str(), e.what());
            }
            if (err != GW_OK) {
                MBUS_LOGW(TAG, "Queued message %lld to %s failed, stopping batch",
                          static_cast<long long>(msg.id), msg.topic.c_str());
                break;
            }
            if (m_store->ack(msg.id) != GW_OK) {
                MBUS_LOGW(TAG, "Failed to remove delivered message %lld", static_cast<long long>(msg.id));
                break;
            }
            ++delivered;
        }
        return delivered;
    }

    bool SyncEngine::heartbeat() {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        processEventsLocked();
        if (!sessionOpenLocked()) {
            return false;
        }
        MBUS_LOGD(TAG, "Heartbeat");
        return publishLocked(m_settings.discovery.bridge_state_topic, PayloadOnline, 1, true, false);
    }

    void SyncEngine::publishBridgeOffline() {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        if (!m_transport.isConnected()) {
            return;
        }
        if (const gw_err_t err = m_transport.publish(m_settings.discovery.bridge_state_topic, PayloadOffline, 1, true);
            err != GW_OK) {
            MBUS_LOGW(TAG, "Final offline publish failed: %s", gwErrToName(err));
        }
    }

    uint64_t SyncEngine::sessionId() const {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        return m_session.session_id;
    }

    size_t SyncEngine::discoverySentCount() const {
        std::lock_guard<std::mutex> lock(m_sync_mutex);
        return m_session.sent.size();
    }
} // mbusMQTT
