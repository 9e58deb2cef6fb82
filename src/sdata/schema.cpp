// ═══════════════════════════════════════════════════════════════════
//  sdata/schema.cpp — Schema graph implementation
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/sdata/schema.h"
#include <algorithm>

namespace graphjin::sdata {

std::string DBTable::qualifiedName() const {
    std::string out;
    for (const auto* part : {&database, &schema, &name}) {
        if (part->empty()) continue;
        if (!out.empty()) out += '.';
        out += *part;
    }
    return out;
}

const char* toString(RelType type) {
    switch (type) {
        case RelType::None:         return "RelNone";
        case RelType::OneToOne:     return "RelOneToOne";
        case RelType::OneToMany:    return "RelOneToMany";
        case RelType::Polymorphic:  return "RelPolymorphic";
        case RelType::Recursive:    return "RelRecursive";
        case RelType::Embedded:     return "RelEmbedded";
        case RelType::Remote:       return "RelRemote";
        case RelType::Skip:         return "RelSkip";
        case RelType::DatabaseJoin: return "RelDatabaseJoin";
    }
    return "RelUnknown";
}

bool DBSchema::addTable(const DBTable& table) {
    if (std::find(tables_.begin(), tables_.end(), table) != tables_.end()) {
        return false;
    }
    tables_.push_back(table);
    return true;
}

void DBSchema::addRelation(const DBRel& rel) {
    addTable(rel.left.table);
    addTable(rel.right.table);
    relations_.push_back(rel);
}

const DBTable* DBSchema::findTable(const std::string& database,
                                   const std::string& schema,
                                   const std::string& name) const {
    DBTable key{name, schema, database};
    auto it = std::find(tables_.begin(), tables_.end(), key);
    return it == tables_.end() ? nullptr : &*it;
}

std::vector<const DBTable*> DBSchema::findTablesByName(const std::string& name) const {
    std::vector<const DBTable*> out;
    for (auto& t : tables_) {
        if (t.name == name) out.push_back(&t);
    }
    return out;
}

std::vector<const DBRel*> DBSchema::relationsOf(const DBTable& table) const {
    std::vector<const DBRel*> out;
    for (auto& r : relations_) {
        if (r.left.table == table || r.right.table == table) {
            out.push_back(&r);
        }
    }
    return out;
}

std::vector<const DBRel*> DBSchema::relationsFrom(const DBTable& table) const {
    std::vector<const DBRel*> out;
    for (auto& r : relations_) {
        if (r.left.table == table) out.push_back(&r);
    }
    return out;
}

std::vector<std::string> DBSchema::databases() const {
    std::vector<std::string> out;
    for (auto& t : tables_) {
        if (t.database.empty()) continue;
        if (std::find(out.begin(), out.end(), t.database) == out.end()) {
            out.push_back(t.database);
        }
    }
    return out;
}

} // namespace graphjin::sdata
