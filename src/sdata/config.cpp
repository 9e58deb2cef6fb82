// ═══════════════════════════════════════════════════════════════════
//  sdata/config.cpp — Multi-database configuration
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/sdata/config.h"
#include "graphjin/sdata/dbinfo.h"
#include "graphjin/console.h"
#include "graphjin/error.h"
#include <sstream>

namespace graphjin::sdata {

std::optional<ForeignKeyRef> parseForeignKey(const std::string& ref) {
    std::vector<std::string> parts;
    std::stringstream ss(ref);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (part.empty()) return std::nullopt;
        parts.push_back(part);
    }
    if (!ref.empty() && ref.back() == '.') return std::nullopt;

    if (parts.size() == 2) return ForeignKeyRef{"", parts[0], parts[1]};
    if (parts.size() == 3) return ForeignKeyRef{parts[0], parts[1], parts[2]};
    return std::nullopt;
}

void Config::validate() const {
    if (!default_database.empty() && !databases.empty() &&
        databases.find(default_database) == databases.end()) {
        throw Error(ErrorKind::MalformedInput,
                    "default database '" + default_database + "' is not declared");
    }
    for (auto& t : tables) {
        if (t.name.empty()) {
            throw Error(ErrorKind::MalformedInput, "table entry without a name");
        }
        if (!t.database.empty() && databases.find(t.database) == databases.end()) {
            throw Error(ErrorKind::MalformedInput,
                        "table '" + t.name + "' uses undeclared database '" + t.database + "'");
        }
        for (auto& c : t.columns) {
            if (!c.foreign_key.empty() && !parseForeignKey(c.foreign_key)) {
                throw Error(ErrorKind::MalformedInput,
                            "invalid foreign key '" + c.foreign_key + "' on " +
                            t.name + "." + c.name);
            }
        }
    }
}

Config parseConfig(const std::string& jsonText) {
    Config config;
    try {
        config = nlohmann::json::parse(jsonText).get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorKind::MalformedInput, std::string("config: ") + e.what());
    }
    config.validate();
    return config;
}

std::size_t applyConfig(DBSchema& schema, const Config& config) {
    for (auto& t : config.tables) {
        schema.addTable({t.name, t.schema, t.database});
    }

    std::size_t added = 0;
    for (auto& t : config.tables) {
        for (auto& c : t.columns) {
            if (c.foreign_key.empty()) continue;
            auto ref = parseForeignKey(c.foreign_key);
            if (!ref) continue;

            DBColumn col;
            col.name = c.name;
            col.table = t.name;
            col.schema = t.schema;
            col.database = t.database;
            col.type = c.type;
            col.fkeySchema = ref->schema;
            col.fkeyTable = ref->table;
            col.fkeyColumn = ref->column;

            if (addForeignKey(schema, col)) {
                added++;
            }
        }
    }
    console::debug("config applied:", added, "foreign keys");
    return added;
}

} // namespace graphjin::sdata
