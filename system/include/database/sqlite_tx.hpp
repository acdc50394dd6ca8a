// ============= include/database/sqlite_tx.hpp =============
/*
 * Helpers RAII sobre la API C de SQLite
 *
 * - SqliteStatement: prepare/bind/step/finalize
 * - SqliteTransaction: BEGIN IMMEDIATE ... COMMIT, ROLLBACK si no se hizo commit
 *
 * Todos los errores se lanzan como StorageIOError.
 */

#pragma once
#include "facemeta/uuid.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Ejecuta SQL sin resultados; lanza StorageIOError si falla
void sqlite_exec(sqlite3* db, const std::string& sql);

[[noreturn]] void throw_sqlite_error(sqlite3* db, int rc, const std::string& what);

class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const char* sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    void bind_uuid(int index, const Uuid& uuid);
    void bind_uuid(int index, const std::optional<Uuid>& uuid);
    void bind_blob(int index, const void* data, size_t size);
    void bind_text(int index, const std::string& text);
    void bind_double(int index, std::optional<double> value);

    // true -> hay fila (SQLITE_ROW), false -> SQLITE_DONE
    bool step();

    // Para sentencias sin resultado
    void run();

    bool column_is_null(int col) const;
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    std::string column_text(int col) const;
    std::vector<uint8_t> column_blob(int col) const;
    const void* column_blob_ptr(int col, int& size) const;

    sqlite3_stmt* handle() const { return stmt; }

private:
    sqlite3* db;
    sqlite3_stmt* stmt;
    std::string sql;
};

class SqliteTransaction {
public:
    explicit SqliteTransaction(sqlite3* db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    sqlite3* db;
    bool completed;
};
