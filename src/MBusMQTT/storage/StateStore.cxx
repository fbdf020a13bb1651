// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "storage/StateStore.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT {
    static constexpr char TAG[] = "StateStore";

    namespace {
        double unixNow() {
            return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
        }
    }

    StateStore::StateStore(std::string path, const size_t max_queue_size)
        : m_path(std::move(path)), m_max_queue_size(max_queue_size) {}

    StateStore::~StateStore() {
        close();
    }

    gw_err_t StateStore::open() {
        std::lock_guard lock(m_db_mutex);
        if (m_db) return GW_OK;

        if (m_path != ":memory:") {
            const auto parent = std::filesystem::path(m_path).parent_path();
            std::error_code ec;
            if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    MBUS_LOGE(TAG, "Cannot create directory %s: %s", parent.c_str(), ec.message().c_str());
                    return GW_ERR_STORAGE;
                }
            }
        }

        auto db = std::make_unique<utils::SqliteHandle>(m_path);
        if (!*db) {
            return GW_ERR_STORAGE;
        }
        m_db = std::move(db);

        if (exec("PRAGMA journal_mode=WAL;") != GW_OK ||
            exec("PRAGMA synchronous=NORMAL;") != GW_OK ||
            createTables() != GW_OK) {
            m_db.reset();
            return GW_ERR_STORAGE;
        }

        MBUS_LOGI(TAG, "State store opened at %s", m_path.c_str());
        return GW_OK;
    }

    void StateStore::close() {
        std::lock_guard lock(m_db_mutex);
        if (m_db) {
            m_db.reset();
            MBUS_LOGI(TAG, "State store closed");
        }
    }

    bool StateStore::isOpen() const {
        std::lock_guard lock(m_db_mutex);
        return m_db != nullptr;
    }

    gw_err_t StateStore::exec(const char* sql) const {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db->get(), sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            MBUS_LOGE(TAG, "SQL error: %s", err_msg ? err_msg : "unknown");
            sqlite3_free(err_msg);
            return GW_ERR_STORAGE;
        }
        return GW_OK;
    }

    gw_err_t StateStore::createTables() const {
        static constexpr const char* SCHEMA[] = {
            "CREATE TABLE IF NOT EXISTS device_states ("
            " device_id TEXT PRIMARY KEY,"
            " device_type TEXT NOT NULL,"
            " name TEXT NOT NULL,"
            " manufacturer TEXT,"
            " model TEXT,"
            " sw_version TEXT,"
            " state_json TEXT NOT NULL,"
            " last_update REAL NOT NULL,"
            " online INTEGER DEFAULT 1)",

            "CREATE TABLE IF NOT EXISTS mqtt_queue ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " topic TEXT NOT NULL,"
            " payload TEXT NOT NULL,"
            " qos INTEGER DEFAULT 1,"
            " retain INTEGER DEFAULT 0,"
            " created_at REAL NOT NULL)",

            "CREATE TABLE IF NOT EXISTS state_history ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " device_id TEXT NOT NULL,"
            " attribute TEXT NOT NULL,"
            " value TEXT NOT NULL,"
            " timestamp REAL NOT NULL)",

            "CREATE INDEX IF NOT EXISTS idx_history_device_time ON state_history(device_id, timestamp DESC)",
        };
        for (const auto* sql : SCHEMA) {
            if (exec(sql) != GW_OK) return GW_ERR_STORAGE;
        }
        return GW_OK;
    }

    size_t StateStore::countRows(const char* sql, const std::string* arg) const {
        const utils::SqliteStatement stmt(m_db->get(), sql);
        if (!stmt) return 0;
        if (arg) stmt.bindText(1, *arg);
        if (stmt.step() != SQLITE_ROW) return 0;
        return static_cast<size_t>(stmt.columnInt64(0));
    }

    gw_err_t StateStore::saveState(const DeviceSnapshot& snapshot) {
        std::lock_guard lock(m_db_mutex);
        if (!m_db) return GW_ERR_INVALID_STATE;

        const utils::SqliteStatement stmt(m_db->get(),
            "INSERT INTO device_states"
            " (device_id, device_type, name, manufacturer, model, sw_version, state_json, last_update, online)"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
            " ON CONFLICT(device_id) DO UPDATE SET"
            " device_type = excluded.device_type,"
            " name = excluded.name,"
            " manufacturer = excluded.manufacturer,"
            " model = excluded.model,"
            " sw_version = excluded.sw_version,"
            " state_json = excluded.state_json,"
            " last_update = excluded.last_update,"
            " online = excluded.online");
        if (!stmt) return GW_ERR_STORAGE;

        const double last_update = snapshot.last_update > 0.0 ? snapshot.last_update : unixNow();
        stmt.bindText(1, snapshot.device_id);
        stmt.bindText(2, snapshot.device_type);
        stmt.bindText(3, snapshot.name);
        stmt.bindText(4, snapshot.manufacturer);
        stmt.bindText(5, snapshot.model);
        stmt.bindText(6, snapshot.sw_version);
        stmt.bindText(7, snapshot.state_json);
        stmt.bindDouble(8, last_update);
        stmt.bindInt64(9, snapshot.online ? 1 : 0);

        if (stmt.step() != SQLITE_DONE) {
            MBUS_LOGE(TAG, "Failed to save state of %s: %s", snapshot.device_id.c_str(), sqlite3_errmsg(m_db->get()));
            return GW_ERR_STORAGE;
        }
        MBUS_LOGV(TAG, "Saved state of %s", snapshot.device_id.c_str());
        return GW_OK;
    }

    std::map<std::string, DeviceSnapshot> StateStore::loadAllStates() const {
        std::lock_guard lock(m_db_mutex);
        std::map<std::string, DeviceSnapshot> states;
        if (!m_db) return states;

        const utils::SqliteStatement stmt(m_db->get(),
            "SELECT device_id, device_type, name, manufacturer, model, sw_version, state_json, last_update, online"
            " FROM device_states");
        if (!stmt) return states;

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            DeviceSnapshot snapshot;
            snapshot.device_id = stmt.columnText(0);
            snapshot.device_type = stmt.columnText(1);
            snapshot.name = stmt.columnText(2);
            snapshot.manufacturer = stmt.columnText(3);
            snapshot.model = stmt.columnText(4);
            snapshot.sw_version = stmt.columnText(5);
            snapshot.state_json = stmt.columnText(6);
            snapshot.last_update = stmt.columnDouble(7);
            snapshot.online = stmt.columnInt64(8) != 0;
            states.emplace(snapshot.device_id, std::move(snapshot));
        }
        if (rc != SQLITE_DONE) {
            MBUS_LOGE(TAG, "Failed to load device states: %s", sqlite3_errmsg(m_db->get()));
        }
        MBUS_LOGI(TAG, "Loaded %zu device state(s)", states.size());
        return states;
    }

    std::optional<int64_t> StateStore::enqueue(const std::string& topic, const std::string& payload,
                                               const int qos, const bool retain) {
        std::lock_guard lock(m_db_mutex);
        if (!m_db) return std::nullopt;

        // Queued rows leave only through ack()
        if (m_max_queue_size > 0 && countRows("SELECT COUNT(*) FROM mqtt_queue") >= m_max_queue_size) {
            MBUS_LOGE(TAG, "Queue full (%zu), message for %s refused", m_max_queue_size, topic.c_str());
            return std::nullopt;
        }

        const utils::SqliteStatement stmt(m_db->get(),
            "INSERT INTO mqtt_queue (topic, payload, qos, retain, created_at) VALUES (?, ?, ?, ?, ?)");
        if (!stmt) return std::nullopt;
        stmt.bindText(1, topic);
        stmt.bindText(2, payload);
        stmt.bindInt64(3, qos);
        stmt.bindInt64(4, retain ? 1 : 0);
        stmt.bindDouble(5, unixNow());

        if (stmt.step() != SQLITE_DONE) {
            MBUS_LOGE(TAG, "Failed to queue message for %s: %s", topic.c_str(), sqlite3_errmsg(m_db->get()));
            return std::nullopt;
        }
        MBUS_LOGD(TAG, "Queued message for %s", topic.c_str());
        return sqlite3_last_insert_rowid(m_db->get());
    }

    std::vector<QueuedMessage> StateStore::dequeue(const size_t limit) const {
        std::lock_guard lock(m_db_mutex);
        std::vector<QueuedMessage> messages;
        if (!m_db || limit == 0) return messages;

        const utils::SqliteStatement stmt(m_db->get(),
            "SELECT id, topic, payload, qos, retain, created_at FROM mqtt_queue ORDER BY id ASC LIMIT ?");
        if (!stmt) return messages;
        stmt.bindInt64(1, static_cast<int64_t>(limit));

        while (stmt.step() == SQLITE_ROW) {
            QueuedMessage msg;
            msg.id = stmt.columnInt64(0);
            msg.topic = stmt.columnText(1);
            msg.payload = stmt.columnText(2);
            msg.qos = static_cast<int>(stmt.columnInt64(3));
            msg.retain = stmt.columnInt64(4) != 0;
            msg.created_at = stmt.columnDouble(5);
            messages.push_back(std::move(msg));
        }
        return messages;
    }

    gw_err_t StateStore::ack(const int64_t message_id) {
        std::lock_guard lock(m_db_mutex);
        if (!m_db) return GW_ERR_INVALID_STATE;

        const utils::SqliteStatement stmt(m_db->get(), "DELETE FROM mqtt_queue WHERE id = ?");
        if (!stmt) return GW_ERR_STORAGE;
        stmt.bindInt64(1, message_id);
        if (stmt.step() != SQLITE_DONE) {
            MBUS_LOGE(TAG, "Failed to ack message %lld", static_cast<long long>(message_id));
            return GW_ERR_STORAGE;
        }
        return sqlite3_changes(m_db->get()) > 0 ? GW_OK : GW_ERR_NOT_FOUND;
    }

    size_t StateStore::queueSize() const {
        std::lock_guard lock(m_db_mutex);
        if (!m_db) return 0;
        return countRows("SELECT COUNT(*) FROM mqtt_queue");
    }

    bool StateStore::queueFull() const {
        std::lock_guard lock(m_db_mutex);
        if (!m_db || m_max_queue_size == 0) return false;
        return countRows("SELECT COUNT(*) FROM mqtt_queue") >= m_max_queue_size;
    }

    size_t StateStore::clearQueue() {
        std::lock_guard lock(m_db_mutex);
        if (!m_db || exec("DELETE FROM mqtt_queue") != GW_OK) return 0;
        const auto count = static_cast<size_t>(sqlite3_changes(m_db->get()));
        MBUS_LOGI(TAG, "Cleared %zu queued message(s)", count);
        return count;
    }

    gw_err_t StateStore::appendHistory(const std::string& device_id, const std::string& attribute, const std::string& value) {
        std::lock_guard lock(m_db_mutex);
        if (!m_db) return GW_ERR_INVALID_STATE;

        const utils::SqliteStatement stmt(m_db->get(),
            "INSERT INTO state_history (device_id, attribute, value, timestamp) VALUES (?, ?, ?, ?)");
        if (!stmt) return GW_ERR_STORAGE;
        stmt.bindText(1, device_id);
        stmt.bindText(2, attribute);
        stmt.bindText(3, value);
        stmt.bindDouble(4, unixNow());
        return stmt.step() == SQLITE_DONE ? GW_OK : GW_ERR_STORAGE;
    }

    size_t StateStore::cleanupHistory(const uint32_t days) {
        std::lock_guard lock(m_db_mutex);
        if (!m_db) return 0;

        const utils::SqliteStatement stmt(m_db->get(), "DELETE FROM state_history WHERE timestamp < ?");
        if (!stmt) return 0;
        stmt.bindDouble(1, unixNow() - static_cast<double>(days) * 86400.0);
        if (stmt.step() != SQLITE_DONE) {
            MBUS_LOGE(TAG, "History cleanup failed: %s", sqlite3_errmsg(m_db->get()));
            return 0;
        }
        const auto removed = static_cast<size_t>(sqlite3_changes(m_db->get()));
        MBUS_LOGI(TAG, "Removed %zu history row(s) older than %u day(s)", removed, days);
        return removed;
    }

    size_t StateStore::historySize(const std::string& device_id) const {
        std::lock_guard lock(m_db_mutex);
        if (!m_db) return 0;
        return countRows("SELECT COUNT(*) FROM state_history WHERE device_id = ?", &device_id);
    }
} // mbusMQTT
