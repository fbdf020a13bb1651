// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MBUSMQTT_STATESTORE_HXX
#define MBUSMQTT_STATESTORE_HXX

#include "system/GatewayError.hxx"
#include "utils/SqliteHandle.hxx"

namespace mbusMQTT
{
    struct DeviceSnapshot {
        std::string device_id{};
        std::string device_type{"mbus_meter"};   // "mbus_meter" | "gateway"
        std::string name{};
        std::string manufacturer{"Unknown"};
        std::string model{"Unknown"};
        std::string sw_version{};
        std::string state_json{"{}"};
        double last_update{0.0};                 // unix seconds
        bool online{true};
    };

    struct QueuedMessage {
        int64_t id{0};
        std::string topic{};
        std::string payload{};
        int qos{1};
        bool retain{false};
        double created_at{0.0};
    };

    /**
     * SQLite (WAL) store for last-known device state, the outbound MQTT queue
     * and a bounded value history. Every write commits on its own.
     */
    class StateStore {
    public:
        // max_queue_size 0: the queue is unbounded
        StateStore(std::string path, size_t max_queue_size);
        ~StateStore();

        StateStore(const StateStore&) = delete;
        StateStore& operator=(const StateStore&) = delete;

        gw_err_t open();
        void close();
        [[nodiscard]] bool isOpen() const;
        [[nodiscard]] const std::string& path() const { return m_path; }

        gw_err_t saveState(const DeviceSnapshot& snapshot);
        [[nodiscard]] std::map<std::string, DeviceSnapshot> loadAllStates() const;

        /**
         * @brief Append a message to the queue. A bounded queue that is full refuses it.
         * @return id of the new row, nullopt when refused or on a database error.
         */
        std::optional<int64_t> enqueue(const std::string& topic, const std::string& payload, int qos, bool retain);

        // Oldest first
        [[nodiscard]] std::vector<QueuedMessage> dequeue(size_t limit) const;
        gw_err_t ack(int64_t message_id);
        [[nodiscard]] size_t queueSize() const;
        [[nodiscard]] bool queueFull() const;
        size_t clearQueue();

        gw_err_t appendHistory(const std::string& device_id, const std::string& attribute, const std::string& value);
        size_t cleanupHistory(uint32_t days);
        [[nodiscard]] size_t historySize(const std::string& device_id) const;

    private:
        gw_err_t exec(const char* sql) const;
        gw_err_t createTables() const;
        [[nodiscard]] size_t countRows(const char* sql, const std::string* arg = nullptr) const;

        std::string m_path;
        size_t m_max_queue_size;
        std::unique_ptr<utils::SqliteHandle> m_db;
        mutable std::mutex m_db_mutex;
    };
} // mbusMQTT

#endif //MBUSMQTT_STATESTORE_HXX
