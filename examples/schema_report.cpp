// ═══════════════════════════════════════════════════════════════════
//  schema_report.cpp — Print the relation graph of a SQLite database
// ═══════════════════════════════════════════════════════════════════
//
//  schema_report app.db [multidb.json]
//
// ═══════════════════════════════════════════════════════════════════

#include <graphjin/graphjin.h>
#include <iostream>

using namespace graphjin;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <sqlite-file> [config.json]\n";
        return 2;
    }

    try {
        db::Database database(argv[1]);
        auto schema = sdata::buildSchema(sdata::DBInfo(db::discoverColumns(database, "sqlite")));

        if (argc > 2) {
            auto config = loadJsonFile<sdata::Config>(argv[2]);
            config.validate();
            auto added = sdata::applyConfig(*schema, config);
            console::info("config added", added, "foreign keys");
        }

        sdata::SchemaStore store;
        store.publish(schema);

        auto snap = store.snapshot();
        for (auto& t : snap->tables()) {
            std::cout << t.qualifiedName() << "\n";
            for (auto* r : snap->relationsFrom(t)) {
                std::cout << "  " << sdata::toString(r->type) << " -> "
                          << r->right.table.qualifiedName()
                          << (r->isCrossDatabase() ? " (cross-database)" : "") << "\n";
            }
        }
    } catch (const std::exception& e) {
        console::error(e.what());
        return 1;
    }
    return 0;
}
