#include "database/sqlite_tx.hpp"
#include "database/faceset_errors.hpp"
#include <spdlog/spdlog.h>

// ==================== HELPERS ====================

void throw_sqlite_error(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    spdlog::error("SQLite error ({}): {}", rc, msg);
    throw StorageIOError(msg, rc);
}

void sqlite_exec(sqlite3* db, const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        spdlog::error("SQL error: {} [{}]", msg, sql);
        throw StorageIOError("SQL error: " + msg, rc);
    }
}

// ==================== STATEMENT ====================

SqliteStatement::SqliteStatement(sqlite3* db, const char* sql)
    : db(db), stmt(nullptr), sql(sql)
{
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
        throw_sqlite_error(db, rc, "Failed to prepare statement");
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

void SqliteStatement::bind_uuid(int index, const Uuid& uuid) {
    bind_blob(index, uuid.data().data(), Uuid::SIZE);
}

void SqliteStatement::bind_uuid(int index, const std::optional<Uuid>& uuid) {
    if (uuid) {
        bind_uuid(index, *uuid);
        return;
    }
    int rc = sqlite3_bind_null(stmt, index);
    if (rc != SQLITE_OK) throw_sqlite_error(db, rc, "Failed to bind NULL");
}

void SqliteStatement::bind_blob(int index, const void* data, size_t size) {
    // Un BLOB vacio se guarda como zeroblob, nunca como NULL
    int rc = size == 0
        ? sqlite3_bind_zeroblob(stmt, index, 0)
        : sqlite3_bind_blob64(stmt, index, data, size, SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_sqlite_error(db, rc, "Failed to bind blob");
}

void SqliteStatement::bind_text(int index, const std::string& text) {
    int rc = sqlite3_bind_text64(stmt, index, text.data(), text.size(),
                                 SQLITE_TRANSIENT, SQLITE_UTF8);
    if (rc != SQLITE_OK) throw_sqlite_error(db, rc, "Failed to bind text");
}

void SqliteStatement::bind_double(int index, std::optional<double> value) {
    int rc = value ? sqlite3_bind_double(stmt, index, *value)
                   : sqlite3_bind_null(stmt, index);
    if (rc != SQLITE_OK) throw_sqlite_error(db, rc, "Failed to bind double");
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(db, rc, "Failed to execute '" + sql + "'");
}

void SqliteStatement::run() {
    while (step()) {}
}

bool SqliteStatement::column_is_null(int col) const {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

int64_t SqliteStatement::column_int64(int col) const {
    return sqlite3_column_int64(stmt, col);
}

double SqliteStatement::column_double(int col) const {
    return sqlite3_column_double(stmt, col);
}

std::string SqliteStatement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text), size);
}

std::vector<uint8_t> SqliteStatement::column_blob(int col) const {
    int size = 0;
    const void* data = column_blob_ptr(col, size);
    if (!data || size <= 0) return {};
    const uint8_t* p = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(p, p + size);
}

const void* SqliteStatement::column_blob_ptr(int col, int& size) const {
    const void* data = sqlite3_column_blob(stmt, col);
    size = sqlite3_column_bytes(stmt, col);
    return data;
}

// ==================== TRANSACTION ====================

SqliteTransaction::SqliteTransaction(sqlite3* db)
    : db(db), completed(false)
{
    // IMMEDIATE: toma el lock de escritura al empezar (espera busy_timeout)
    int rc = sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db, rc, "Failed to begin transaction");
    }
}

SqliteTransaction::~SqliteTransaction() {
    if (!completed) {
        int rc = sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            spdlog::error("ROLLBACK failed: {}", sqlite3_errmsg(db));
        } else {
            spdlog::debug("Transaction rolled back");
        }
    }
}

void SqliteTransaction::commit() {
    int rc = sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db, rc, "Failed to commit transaction");
    }
    completed = true;
}
