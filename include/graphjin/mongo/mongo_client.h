#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/mongo/mongo_client.h — DocumentStore over the MongoDB C++ driver
// ═══════════════════════════════════════════════════════════════════
//
//  mongo::ConnectorOptions opts;
//  opts.uri = "mongodb://localhost:27017";
//  opts.database = "app";
//  auto client = mongo::MongoClient::create(opts);
//  auto conn = mongo::open(client, opts.database);
//
//  Connections share a mongocxx::pool. Each operation takes its own
//  pooled client, and a cursor holds its client until it is closed.
// ═══════════════════════════════════════════════════════════════════

#include "driver.h"
#include "store.h"
#include <mongocxx/pool.hpp>
#include <memory>
#include <string>

namespace graphjin::mongo {

class MongoClient final : public Client {
public:
    // Throws MalformedInput for bad options, BackendError for a bad URI
    static std::shared_ptr<MongoClient> create(const ConnectorOptions& options);

    explicit MongoClient(const ConnectorOptions& options);
    ~MongoClient() override;

    std::shared_ptr<DocumentStore> database(const std::string& name) override;

private:
    std::shared_ptr<mongocxx::pool> pool_;
};

} // namespace graphjin::mongo
