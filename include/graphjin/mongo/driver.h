#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/mongo/driver.h — Executes DSL queries against a store
// ═══════════════════════════════════════════════════════════════════
//
//  auto conn = mongo::open(client, "app");
//  auto rows = conn.query(R"({"operation":"find","collection":"users",
//                             "filter":{"age":{"$gt":"$1"}}})", {30});
//  std::vector<mongo::Value> row;
//  while (rows->next(row)) { ... }
//
//  Document results use a single JSON column named "__root".
// ═══════════════════════════════════════════════════════════════════

#include "../context.h"
#include "../json_utils.h"
#include "query.h"
#include "rows.h"
#include "store.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace graphjin::mongo {

inline constexpr const char* kJsonColumn = "__root";

// ── Connection settings of a production client ──
struct ConnectorOptions {
    std::string uri = "mongodb://localhost:27017";
    std::string database;
    int64_t sample_size = IntrospectOptions::kDefaultSampleSize;
    std::string app_name = "graphjin";

    GRAPHJIN_SERIALIZE(ConnectorOptions, uri, database, sample_size, app_name)

    // Throws MalformedInput
    void validate() const;
};

// ═══════════════════════════════════════════
//  class Connection
// ═══════════════════════════════════════════
class Connection {
public:
    explicit Connection(std::shared_ptr<DocumentStore> store);

    DocumentStore& store() { return *store_; }

    // Runs an already substituted query
    std::unique_ptr<Rows> execute(const Query& query,
                                  const Context& ctx = Context::background());

    // Parse, substitute "$N" with args, apply the paging cursor, execute
    std::unique_ptr<Rows> query(const std::string& text,
                                const std::vector<Document>& args = {},
                                const Context& ctx = Context::background());

    // Same, with the whole result folded into one JSON row: an array,
    // or the first document (null if none) for a singular query
    std::unique_ptr<SingleValueRows> queryValue(const std::string& text,
                                                const std::vector<Document>& args = {},
                                                const Context& ctx = Context::background());

private:
    std::unique_ptr<DocumentRows> documents(const Query& query, const Context& ctx);
    Document collect(const Query& query, const Context& ctx);
    Query prepare(const std::string& text, const std::vector<Document>& args);

    std::shared_ptr<DocumentStore> store_;
};

// ═══════════════════════════════════════════
//  class Connector — hands out connections to one database
// ═══════════════════════════════════════════
class Connector {
public:
    Connector(std::shared_ptr<Client> client, std::string database);

    Connection connect();

    std::shared_ptr<Client> client() const { return client_; }
    const std::string& database() const { return database_; }

private:
    std::shared_ptr<Client> client_;
    std::string database_;
    std::mutex mutex_;
};

Connection open(const std::shared_ptr<Client>& client, const std::string& database);

} // namespace graphjin::mongo
