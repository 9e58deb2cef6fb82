// ═══════════════════════════════════════════════════════════════════
//  database.cpp — SQLite driver and catalog discovery
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/database.h"
#include "graphjin/console.h"
#include "graphjin/error.h"
#include <sqlite3.h>

namespace graphjin::db {

namespace {

const char* kColumnsQuery = R"SQL(
SELECT
  m.name AS "table",
  p.name AS "column",
  COALESCE(NULLIF(LOWER(p.type), ''), 'text') AS "type",
  (p."notnull" > 0) AS not_null,
  (p.pk > 0) AS primary_key,
  EXISTS (
    SELECT 1 FROM pragma_index_list(m.name) il
    JOIN pragma_index_info(il.name) ii
    WHERE il."unique" = 1 AND ii.name = p.name
      AND (SELECT COUNT(*) FROM pragma_index_info(il.name)) = 1
  ) AS unique_key,
  (LOWER(p.type) IN ('json', 'jsonb')) AS is_array,
  COALESCE(fk."table", '') AS foreignkey_table,
  COALESCE(fk."to", '') AS foreignkey_column
FROM sqlite_master m
JOIN pragma_table_info(m.name) p
LEFT JOIN pragma_foreign_key_list(m.name) fk ON fk."from" = p.name
WHERE (m.type = 'table' OR m.type = 'view')
  AND m.name NOT LIKE 'sqlite_%'
  AND m.name NOT LIKE '_gj_%'
ORDER BY m.name, p.cid
)SQL";

bool flag(const Row& row, const char* key) {
    auto it = row.find(key);
    return it != row.end() && it->second == "1";
}

} // namespace

Database::Database(const std::string& path) {
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw Error(ErrorKind::BackendError, "failed to open database: " + err);
    }
    exec("PRAGMA journal_mode=WAL");
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result Database::exec(const std::string& sql) {
    return exec(sql, {});
}

Result Database::exec(const std::string& sql, const std::vector<std::string>& params) {
    if (!db_) {
        throw Error(ErrorKind::BackendError, "database is closed");
    }
    Result result;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorKind::BackendError, "SQL error: " + std::string(sqlite3_errmsg(db_)));
    }

    // Bind parameters
    for (int i = 0; i < static_cast<int>(params.size()); i++) {
        sqlite3_bind_text(stmt, i + 1, params[i].c_str(),
                          static_cast<int>(params[i].size()), SQLITE_TRANSIENT);
    }

    int colCount = sqlite3_column_count(stmt);
    result.columns.reserve(colCount);
    for (int i = 0; i < colCount; i++) {
        result.columns.push_back(sqlite3_column_name(stmt, i));
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Row row;
        for (int i = 0; i < colCount; i++) {
            auto text = sqlite3_column_text(stmt, i);
            row[result.columns[i]] = text ? reinterpret_cast<const char*>(text) : "";
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        std::string err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw Error(ErrorKind::BackendError, "SQL step error: " + err);
    }

    sqlite3_finalize(stmt);
    return result;
}

void Database::execMulti(const std::string& sql) {
    if (!db_) {
        throw Error(ErrorKind::BackendError, "database is closed");
    }
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string err = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw Error(ErrorKind::BackendError, "SQL exec error: " + err);
    }
}

std::vector<sdata::DBColumn> discoverColumns(Database& db, const std::string& database) {
    auto result = db.exec(kColumnsQuery);

    std::vector<sdata::DBColumn> cols;
    cols.reserve(result.size());
    for (auto& row : result.rows) {
        sdata::DBColumn c;
        c.name = row.at("column");
        c.table = row.at("table");
        c.schema = "main";
        c.database = database;
        c.type = row.at("type");
        c.notNull = flag(row, "not_null");
        c.primaryKey = flag(row, "primary_key");
        c.uniqueKey = c.primaryKey || flag(row, "unique_key");
        c.array = flag(row, "is_array");
        c.fkeyTable = row.at("foreignkey_table");
        c.fkeyColumn = row.at("foreignkey_column");
        if (!c.fkeyTable.empty()) c.fkeySchema = "main";
        cols.push_back(std::move(c));
    }

    // REFERENCES without a column list points at the parent's primary key
    for (auto& c : cols) {
        if (c.fkeyTable.empty() || !c.fkeyColumn.empty()) continue;
        for (auto& p : cols) {
            if (p.table == c.fkeyTable && p.primaryKey) {
                c.fkeyColumn = p.name;
                break;
            }
        }
    }

    console::debug("sqlite catalog:", cols.size(), "columns in", database);
    return cols;
}

} // namespace graphjin::db
