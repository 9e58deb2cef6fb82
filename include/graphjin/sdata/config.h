#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/sdata/config.h — Multi-database table configuration
// ═══════════════════════════════════════════════════════════════════
//
//  {
//    "default_database": "postgres",
//    "databases": { "postgres": {"type": "postgres"},
//                   "mongodb":  {"type": "mongodb"} },
//    "tables": [
//      { "name": "users", "schema": "public", "database": "postgres" },
//      { "name": "events", "database": "mongodb",
//        "columns": [ { "name": "user_id", "foreign_key": "users.id" } ] }
//    ]
//  }
//
// ═══════════════════════════════════════════════════════════════════

#include "../json_utils.h"
#include "schema.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace graphjin::sdata {

struct DatabaseConfig {
    std::string type;
    std::string connection_string;
    std::string schema;
    GRAPHJIN_SERIALIZE(DatabaseConfig, type, connection_string, schema)
};

struct ColumnConfig {
    std::string name;
    std::string type;
    std::string foreign_key;
    GRAPHJIN_SERIALIZE(ColumnConfig, name, type, foreign_key)
};

struct TableConfig {
    std::string name;
    std::string schema;
    std::string database;
    std::vector<ColumnConfig> columns;
    GRAPHJIN_SERIALIZE(TableConfig, name, schema, database, columns)
};

struct Config {
    std::string default_database;
    std::map<std::string, DatabaseConfig> databases;
    std::vector<TableConfig> tables;
    GRAPHJIN_SERIALIZE(Config, default_database, databases, tables)

    // Throws MalformedInput for tables naming an undeclared database
    // or foreign keys that are not "table.column" / "schema.table.column"
    void validate() const;
};

// ── Parsed "schema.table.column" reference ──
struct ForeignKeyRef {
    std::string schema;
    std::string table;
    std::string column;
};

std::optional<ForeignKeyRef> parseForeignKey(const std::string& ref);

Config parseConfig(const std::string& jsonText);

// Applies the configuration to a schema under construction: adds
// configured tables missing from the catalog and the relations for
// configured foreign keys. Returns the number of foreign keys added.
std::size_t applyConfig(DBSchema& schema, const Config& config);

} // namespace graphjin::sdata
