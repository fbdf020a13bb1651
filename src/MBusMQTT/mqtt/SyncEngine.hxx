// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MBUSMQTT_SYNCENGINE_HXX
#define MBUSMQTT_SYNCENGINE_HXX

#include "mqtt/MQTTTransport.hxx"
#include "mqtt/MQTTEvents.hxx"
#include "mqtt/HADiscovery.hxx"
#include "mqtt/DiscoveryTracker.hxx"
#include "mbus/MBusDeviceRegistry.hxx"
#include "storage/StateStore.hxx"

namespace mbusMQTT
{
    struct SyncSettings {
        DiscoverySettings discovery{};
        std::string ha_status_topic{"homeassistant/status"};
        size_t queue_batch_size{100};
    };

    /**
     * Turns registry state into discovery and state messages.
     * Undeliverable messages go to the durable queue of the StateStore,
     * discovery is announced once per broker session.
     */
    class SyncEngine {
    public:
        SyncEngine(IMqttTransport& transport, StateStore* store, MBusDeviceRegistry& registry,
                   MqttEventChannel& events, SyncSettings settings);

        SyncEngine(const SyncEngine&) = delete;
        SyncEngine& operator=(const SyncEngine&) = delete;

        // The gateway itself, announced together with the meters
        void setGatewayDevice(MBusDevice gateway);
        [[nodiscard]] std::optional<MBusDevice> gatewayDevice() const;

        /**
         * @brief Announce every attribute of the device not yet announced in this session.
         * Deferred while disconnected, the next session announces everything anyway.
         * @return number of discovery messages handed out.
         */
        size_t publishDiscovery(const MBusDevice& device);

        // One retained message per attribute
        void publishState(const std::string& device_id, const std::vector<MBusRecord>& attributes);
        void publishStatus(const std::string& device_id, bool online);

        // Discovery for new attributes, then records and Status
        void publishDeviceState(const MBusDevice& device);

        /**
         * @brief Publish or enqueue. New messages go behind an existing backlog.
         * @return true when the client accepted the message now.
         */
        bool publish(const std::string& topic, const std::string& payload, int qos, bool retain);

        /**
         * @brief Consume connect/disconnect/message events of the client thread.
         * Every publishing call does this first, so nothing of a new session
         * goes out before its bridge state and discovery.
         */
        size_t processEvents();

        /**
         * @brief Deliver up to queue_batch_size queued messages oldest first.
         * Stops at the first failure, a message leaves the queue only after delivery.
         */
        size_t drainQueue();

        bool heartbeat();
        void publishBridgeOffline();
        void resendAllDiscovery();

        [[nodiscard]] uint64_t sessionId() const;
        [[nodiscard]] size_t discoverySentCount() const;
        [[nodiscard]] const SyncSettings& settings() const { return m_settings; }

    private:
        size_t processEventsLocked();
        void onConnectedLocked();
        // Connected event seen and the client still up
        [[nodiscard]] bool sessionOpenLocked() const;
        size_t publishDiscoveryLocked(const MBusDevice& device);
        void publishStateLocked(const std::string& device_id, const std::vector<MBusRecord>& attributes);
        bool publishLocked(const std::string& topic, const std::string& payload, int qos, bool retain, bool behind_backlog);
        bool enqueueLocked(const std::string& topic, const std::string& payload, int qos, bool retain);
        size_t drainQueueLocked();
        void resendAllDiscoveryLocked();

        IMqttTransport& m_transport;
        StateStore* m_store;
        MBusDeviceRegistry& m_registry;
        MqttEventChannel& m_events;
        SyncSettings m_settings;

        DiscoverySession m_session{};
        bool m_session_open{false};
        std::optional<MBusDevice> m_gateway{};
        mutable std::mutex m_sync_mutex;
    };
} // mbusMQTT

#endif //MBUSMQTT_SYNCENGINE_HXX
