// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MBUSMQTT_SQLITEHANDLE_HXX
#define MBUSMQTT_SQLITEHANDLE_HXX
#include <sqlite3.h>
#include "system/Logger.hxx"

namespace mbusMQTT::utils {

static constexpr char TAG_SQLITE[] = "SQLite_Handler";

// RAII wrapper for sqlite3 connection
class SqliteHandle {
public:
    explicit SqliteHandle(const std::string& path) {
        const int rc = sqlite3_open_v2(path.c_str(), &m_db,
                                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                       nullptr);
        if (rc != SQLITE_OK) {
            MBUS_LOGE(TAG_SQLITE, "Error (%s) opening database '%s'!",
                      m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc), path.c_str());
            sqlite3_close_v2(m_db);
            m_db = nullptr;
        }
    }

    ~SqliteHandle() {
        if (m_db) {
            sqlite3_close_v2(m_db);
        }
    }

    [[nodiscard]] sqlite3* get() const { return m_db; }
    explicit operator bool() const { return m_db != nullptr; }

    SqliteHandle(const SqliteHandle&) = delete;
    SqliteHandle& operator=(const SqliteHandle&) = delete;

private:
    sqlite3* m_db{nullptr};
};

// RAII wrapper for prepared statement
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            MBUS_LOGE(TAG_SQLITE, "Failed to prepare statement: %s", sqlite3_errmsg(db));
            m_stmt = nullptr;
        }
    }

    ~SqliteStatement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    [[nodiscard]] sqlite3_stmt* get() const { return m_stmt; }
    explicit operator bool() const { return m_stmt != nullptr; }

    bool bindText(const int idx, std::string_view value) const {
        return sqlite3_bind_text(m_stmt, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) == SQLITE_OK;
    }
    bool bindInt64(const int idx, const int64_t value) const {
        return sqlite3_bind_int64(m_stmt, idx, value) == SQLITE_OK;
    }
    bool bindDouble(const int idx, const double value) const {
        return sqlite3_bind_double(m_stmt, idx, value) == SQLITE_OK;
    }

    [[nodiscard]] int step() const { return sqlite3_step(m_stmt); }

    [[nodiscard]] std::string columnText(const int col) const {
        const auto* text = sqlite3_column_text(m_stmt, col);
        if (!text) return {};
        return {reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(m_stmt, col))};
    }
    [[nodiscard]] int64_t columnInt64(const int col) const { return sqlite3_column_int64(m_stmt, col); }
    [[nodiscard]] double columnDouble(const int col) const { return sqlite3_column_double(m_stmt, col); }

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

private:
    sqlite3_stmt* m_stmt{nullptr};
};

} // mbusMQTT::utils

#endif //MBUSMQTT_SQLITEHANDLE_HXX
