#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/graphjin.h — Umbrella header for graphjin-core
// ═══════════════════════════════════════════════════════════════════
//
//  #include "graphjin/graphjin.h"
//  using namespace graphjin;
//
//  This single include gives you:
//    • mongo::parseQuery(), substituteParams()
//    • mongo::buildSeekFilter(), encodeCursor(), CursorCache
//    • mongo::open(), Connection, Rows
//    • sdata::DBSchema, SchemaStore, buildSchema(), applyConfig()
//    • db::Database, discoverColumns()
//    • console::info(), warn(), error(), debug()
//
//  The mongocxx backend lives in "graphjin/mongo/mongo_client.h".
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "error.h"
#include "context.h"

// Document store driver
#include "mongo/query.h"
#include "mongo/cursor.h"
#include "mongo/store.h"
#include "mongo/rows.h"
#include "mongo/introspect.h"
#include "mongo/driver.h"

// Schema model
#include "sdata/schema.h"
#include "sdata/dbinfo.h"
#include "sdata/config.h"

// Catalog discovery
#include "database.h"
