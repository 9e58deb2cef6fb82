#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/database.h — SQLite connection and catalog discovery
// ═══════════════════════════════════════════════════════════════════
//
//  db::Database sqlite("app.db");
//  auto cols = db::discoverColumns(sqlite, "sqlite");
//  auto schema = sdata::buildSchema(sdata::DBInfo(cols));
//
// ═══════════════════════════════════════════════════════════════════

#include "sdata/schema.h"
#include <string>
#include <unordered_map>
#include <vector>

// Forward-declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace graphjin::db {

// ── Query result row ──
using Row = std::unordered_map<std::string, std::string>;

// ── Query result ──
struct Result {
    std::vector<Row> rows;
    std::vector<std::string> columns;

    bool empty() const { return rows.empty(); }
    std::size_t size() const { return rows.size(); }
    const Row& first() const { return rows.front(); }
};

// ═══════════════════════════════════════════
//  SQLite Database Connection
// ═══════════════════════════════════════════
class Database {
public:
    explicit Database(const std::string& path = ":memory:");
    ~Database();

    // Non-copyable, movable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    Result exec(const std::string& sql);
    Result exec(const std::string& sql, const std::vector<std::string>& params);

    // ── Execute multiple statements (schema scripts, seeds) ──
    void execMulti(const std::string& sql);

    bool isOpen() const { return db_ != nullptr; }
    void close();

private:
    sqlite3* db_ = nullptr;
};

// Reads every user table and view into catalog rows tagged with
// `database`. The SQLite schema is always "main".
std::vector<sdata::DBColumn> discoverColumns(Database& db, const std::string& database);

} // namespace graphjin::db
