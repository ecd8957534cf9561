/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "reggis_model.hpp"
#include "text_norm.hpp"
#include "entity_map.hpp"
#include <sqlite3.h>
#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace reggis {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ------------------------------------------------------------
// SQLite helpers
// ------------------------------------------------------------

struct Stmt {
    sqlite3_stmt* s{nullptr};
    Stmt() = default;
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
    ~Stmt() { if (s) sqlite3_finalize(s); }
};

inline void check_sql(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::ostringstream oss;
        oss << what << " failed: " << sqlite3_errmsg(db) << " (rc=" << rc << ")";
        throw StoreError(oss.str());
    }
}

inline void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("sqlite exec failed: " + msg);
    }
}

inline void begin_tx(sqlite3* db) { exec_sql(db, "BEGIN IMMEDIATE;"); }
inline void commit_tx(sqlite3* db){ exec_sql(db, "COMMIT;"); }
inline void rollback_tx(sqlite3* db) noexcept {
    // best effort; the original failure is what gets reported
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
}

inline std::string column_text(sqlite3_stmt* s, int col) {
    const unsigned char* t = sqlite3_column_text(s, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

// ------------------------------------------------------------
// Import rows / results
// ------------------------------------------------------------

struct MaterialRow {
    int row{0};               // source row number (1-based, header = 1)
    std::string code;         // CODIGO
    std::string description;  // DESCRIPCION
    std::string sociedad;     // SOCIEDAD as written
};

struct ClientRow {
    int row{0};
    std::string parentCode;   // Cód.Padre
    std::string name;         // Nombre Código Padre
    std::string nit;          // NIT as written
};

// Stored rows as read back for display
struct MaterialRecord {
    std::string code;
    std::string description;
    std::string entity;       // canonical tax id
    std::string createdAt;    // "YYYY-MM-DD HH:MM:SS" UTC
};

struct ClientRecord {
    std::string parentCode;
    std::string name;
    std::optional<std::string> nit;  // NULL for "nit"/empty
    std::string createdAt;
};

struct RowIssue {
    int row{0};
    std::string reason;
};

struct ImportResult {
    ErrorKind error = ErrorKind::None;  // FormatInvalid / InputUnreadable / StoreFailure
    std::string message;

    int inserted = 0;
    int already_existing = 0;
    int rejected = 0;
    int skipped = 0;
    std::vector<RowIssue> reasons;

    bool ok() const { return error == ErrorKind::None; }
};

// "no nit", "sin nit", "nonit": explicitly unregistered client, never stored
inline bool is_skip_nit(std::string_view nit) {
    const std::string k = fold_key(nit);
    return k == "no nit" || k == "sin nit" || k == "nonit";
}

// bare "nit" or empty: stored as NULL, never matches a lookup
inline bool is_null_nit(std::string_view nit) {
    const std::string k = fold_key(nit);
    return k.empty() || k == "nit";
}

// ------------------------------------------------------------
// Reference Store
// ------------------------------------------------------------

// Known materials (code + legal entity) and clients (parent code, looked up by NIT).
// Imports hold the lock exclusively; lookups share it. The sets mirror the tables
// so lookups never touch the connection.
class ReferenceStore {
public:
    // path may be ":memory:"
    explicit ReferenceStore(const std::string& path) {
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            throw StoreError("failed to open sqlite db '" + path + "': " + msg);
        }
        try {
            exec_sql(db_, "PRAGMA journal_mode = WAL;");
            exec_sql(db_, "PRAGMA synchronous = NORMAL;");
            init_schema();
            load_cache();
        } catch (...) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    ~ReferenceStore() {
        if (db_) sqlite3_close(db_);
    }

    ReferenceStore(const ReferenceStore&) = delete;
    ReferenceStore& operator=(const ReferenceStore&) = delete;

    // Insert-if-absent, one transaction. Throws StoreError (after rollback).
    ImportResult import_materials(const std::vector<MaterialRow>& rows) {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        ImportResult r;
        std::vector<std::pair<std::string, std::string>> added;

        begin_tx(db_);
        try {
            Stmt st;
            check_sql(sqlite3_prepare_v2(db_,
                "INSERT OR IGNORE INTO materials(code, entity, description) VALUES(?,?,?);",
                -1, &st.s, nullptr), db_, "material insert prepare");

            for (const auto& row : rows) {
                const std::string code = trim_copy(row.code);
                const std::string desc = trim_copy(row.description);
                const std::string soc  = trim_copy(row.sociedad);
                if (code.empty() || desc.empty() || soc.empty()) {
                    reject(r, row.row, "missing CODIGO, DESCRIPCION or SOCIEDAD");
                    continue;
                }
                const std::string entity = canonicalize_entity(soc);
                if (entity.empty()) {
                    reject(r, row.row, "unknown SOCIEDAD '" + soc + "'");
                    continue;
                }

                sqlite3_reset(st.s);
                sqlite3_bind_text(st.s, 1, code.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(st.s, 2, entity.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(st.s, 3, desc.c_str(), -1, SQLITE_TRANSIENT);
                check_sql(sqlite3_step(st.s), db_, "material insert step");

                if (sqlite3_changes(db_) > 0) {
                    r.inserted++;
                    added.emplace_back(code, entity);
                } else {
                    r.already_existing++;
                }
            }
            commit_tx(db_);
        } catch (...) {
            rollback_tx(db_);
            throw;
        }

        for (auto& m : added) materials_.insert(std::move(m));
        return r;
    }

    ImportResult import_clients(const std::vector<ClientRow>& rows) {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        ImportResult r;
        std::vector<std::string> addedNits;
        std::size_t addedCount = 0;

        begin_tx(db_);
        try {
            Stmt st;
            check_sql(sqlite3_prepare_v2(db_,
                "INSERT OR IGNORE INTO clients(parent_code, name, nit) VALUES(?,?,?);",
                -1, &st.s, nullptr), db_, "client insert prepare");

            for (const auto& row : rows) {
                if (is_skip_nit(row.nit)) {
                    r.skipped++;
                    continue;
                }
                const std::string code = trim_copy(row.parentCode);
                const std::string name = trim_copy(row.name);
                if (code.empty() || name.empty()) {
                    reject(r, row.row, "missing Cód.Padre or Nombre Código Padre");
                    continue;
                }
                const std::string nit = trim_copy(row.nit);

                sqlite3_reset(st.s);
                sqlite3_bind_text(st.s, 1, code.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(st.s, 2, name.c_str(), -1, SQLITE_TRANSIENT);
                if (is_null_nit(nit)) sqlite3_bind_null(st.s, 3);
                else sqlite3_bind_text(st.s, 3, nit.c_str(), -1, SQLITE_TRANSIENT);
                check_sql(sqlite3_step(st.s), db_, "client insert step");

                if (sqlite3_changes(db_) > 0) {
                    r.inserted++;
                    addedCount++;
                    if (!is_null_nit(nit)) addedNits.push_back(nit);
                } else {
                    r.already_existing++;
                }
            }
            commit_tx(db_);
        } catch (...) {
            rollback_tx(db_);
            throw;
        }

        for (auto& n : addedNits) clientNits_.insert(std::move(n));
        clientCount_ += addedCount;
        return r;
    }

    bool lookup_material(std::string_view code, std::string_view entity) const {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        return lookup_material_unlocked(code, entity);
    }

    bool lookup_client(std::string_view taxId) const {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        return lookup_client_unlocked(taxId);
    }

    // (materialCount, clientCount)
    std::pair<std::size_t, std::size_t> counts() const {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        return { materials_.size(), clientCount_ };
    }

    // Reads below go to the connection, so they take the lock exclusively.
    std::optional<MaterialRecord> get_material(std::string_view code, std::string_view entity) const {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        Stmt st;
        check_sql(sqlite3_prepare_v2(db_,
            "SELECT code, description, entity, created_at FROM materials WHERE code = ? AND entity = ?;",
            -1, &st.s, nullptr), db_, "material get prepare");
        const std::string c = trim_copy(code), e = trim_copy(entity);
        sqlite3_bind_text(st.s, 1, c.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(st.s, 2, e.c_str(), -1, SQLITE_TRANSIENT);
        const int rc = sqlite3_step(st.s);
        check_sql(rc, db_, "material get step");
        if (rc != SQLITE_ROW) return std::nullopt;
        return material_from(st.s);
    }

    std::optional<ClientRecord> get_client(std::string_view parentCode) const {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        Stmt st;
        check_sql(sqlite3_prepare_v2(db_,
            "SELECT parent_code, name, nit, created_at FROM clients WHERE parent_code = ?;",
            -1, &st.s, nullptr), db_, "client get prepare");
        const std::string c = trim_copy(parentCode);
        sqlite3_bind_text(st.s, 1, c.c_str(), -1, SQLITE_TRANSIENT);
        const int rc = sqlite3_step(st.s);
        check_sql(rc, db_, "client get step");
        if (rc != SQLITE_ROW) return std::nullopt;
        return client_from(st.s);
    }

    // Newest first; ties keep reverse insertion order.
    std::vector<MaterialRecord> list_materials(int limit = 100, int offset = 0) const {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        std::vector<MaterialRecord> out;
        if (limit <= 0) return out;
        Stmt st;
        check_sql(sqlite3_prepare_v2(db_,
            "SELECT code, description, entity, created_at FROM materials "
            "ORDER BY created_at DESC, rowid DESC LIMIT ? OFFSET ?;",
            -1, &st.s, nullptr), db_, "material list prepare");
        sqlite3_bind_int(st.s, 1, limit);
        sqlite3_bind_int(st.s, 2, offset < 0 ? 0 : offset);
        int rc;
        while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) out.push_back(material_from(st.s));
        check_sql(rc, db_, "material list step");
        return out;
    }

    std::vector<ClientRecord> list_clients(int limit = 100, int offset = 0) const {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        std::vector<ClientRecord> out;
        if (limit <= 0) return out;
        Stmt st;
        check_sql(sqlite3_prepare_v2(db_,
            "SELECT parent_code, name, nit, created_at FROM clients "
            "ORDER BY created_at DESC, rowid DESC LIMIT ? OFFSET ?;",
            -1, &st.s, nullptr), db_, "client list prepare");
        sqlite3_bind_int(st.s, 1, limit);
        sqlite3_bind_int(st.s, 2, offset < 0 ? 0 : offset);
        int rc;
        while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) out.push_back(client_from(st.s));
        check_sql(rc, db_, "client list step");
        return out;
    }

    // Holds the shared lock for its lifetime; no import can interleave.
    class ReadView {
    public:
        explicit ReadView(const ReferenceStore& s) : store_(&s), lock_(s.mtx_) {}

        bool lookup_material(std::string_view code, std::string_view entity) const {
            return store_->lookup_material_unlocked(code, entity);
        }
        bool lookup_client(std::string_view taxId) const {
            return store_->lookup_client_unlocked(taxId);
        }

    private:
        const ReferenceStore* store_;
        std::shared_lock<std::shared_mutex> lock_;
    };

    ReadView read_view() const { return ReadView(*this); }

private:
    sqlite3* db_{nullptr};
    mutable std::shared_mutex mtx_;

    std::set<std::pair<std::string, std::string>> materials_; // (code, entity)
    std::unordered_set<std::string> clientNits_;              // non-null NITs
    std::size_t clientCount_{0};

    static void reject(ImportResult& r, int row, std::string reason) {
        r.rejected++;
        r.reasons.push_back({ row, std::move(reason) });
    }

    static MaterialRecord material_from(sqlite3_stmt* s) {
        return MaterialRecord{ column_text(s, 0), column_text(s, 1), column_text(s, 2), column_text(s, 3) };
    }

    static ClientRecord client_from(sqlite3_stmt* s) {
        ClientRecord c;
        c.parentCode = column_text(s, 0);
        c.name = column_text(s, 1);
        if (sqlite3_column_type(s, 2) != SQLITE_NULL) c.nit = column_text(s, 2);
        c.createdAt = column_text(s, 3);
        return c;
    }

    bool lookup_material_unlocked(std::string_view code, std::string_view entity) const {
        std::pair<std::string, std::string> key{ trim_copy(code), trim_copy(entity) };
        if (key.first.empty() || key.second.empty()) return false;
        return materials_.count(key) > 0;
    }

    bool lookup_client_unlocked(std::string_view taxId) const {
        const std::string k = trim_copy(taxId);
        if (is_null_nit(k)) return false;
        return clientNits_.count(k) > 0;
    }

    void init_schema() {
        exec_sql(db_, R"SQL(
          CREATE TABLE IF NOT EXISTS materials (
            code         TEXT NOT NULL,
            entity       TEXT NOT NULL,
            description  TEXT NOT NULL,
            created_at   TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            PRIMARY KEY (code, entity)
          );
          CREATE TABLE IF NOT EXISTS clients (
            parent_code  TEXT PRIMARY KEY,
            name         TEXT NOT NULL,
            nit          TEXT,
            created_at   TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
          );
          CREATE INDEX IF NOT EXISTS idx_clients_nit ON clients(nit);
        )SQL");
    }

    void load_cache() {
        {
            Stmt st;
            check_sql(sqlite3_prepare_v2(db_, "SELECT code, entity FROM materials;", -1, &st.s, nullptr),
                      db_, "material select prepare");
            int rc;
            while ((rc = sqlite3_step(st.s)) == SQLITE_ROW)
                materials_.emplace(column_text(st.s, 0), column_text(st.s, 1));
            check_sql(rc, db_, "material select step");
        }
        {
            Stmt st;
            check_sql(sqlite3_prepare_v2(db_, "SELECT nit FROM clients;", -1, &st.s, nullptr),
                      db_, "client select prepare");
            int rc;
            while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
                clientCount_++;
                if (sqlite3_column_type(st.s, 0) != SQLITE_NULL)
                    clientNits_.insert(column_text(st.s, 0));
            }
            check_sql(rc, db_, "client select step");
        }
    }
};

} // namespace reggis
