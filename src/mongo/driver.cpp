// ═══════════════════════════════════════════════════════════════════
//  mongo/driver.cpp — Query dispatch onto a DocumentStore
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/mongo/driver.h"
#include "graphjin/console.h"
#include "graphjin/error.h"
#include "graphjin/mongo/cursor.h"
#include "graphjin/mongo/introspect.h"

namespace graphjin::mongo {

void ConnectorOptions::validate() const {
    if (uri.empty()) {
        throw Error(ErrorKind::MalformedInput, "connector uri is empty");
    }
    if (database.empty()) {
        throw Error(ErrorKind::MalformedInput, "connector database is empty");
    }
    if (sample_size <= 0) {
        throw Error(ErrorKind::MalformedInput, "sample_size must be positive");
    }
}

namespace {

// Aggregate options become trailing stages
Document withOptionStages(const Query& query) {
    auto opts = query.findOptions();
    Document pipeline = query.pipeline;
    if (opts.sort) pipeline.push_back({{"$sort", *opts.sort}});
    if (opts.skip) pipeline.push_back({{"$skip", *opts.skip}});
    if (opts.limit) pipeline.push_back({{"$limit", *opts.limit}});
    if (opts.projection) pipeline.push_back({{"$project", *opts.projection}});
    return pipeline;
}

std::string resultKey(const Query& sub) {
    return sub.fieldName.empty() ? sub.collection : sub.fieldName;
}

} // namespace

// ═══════════════════════════════════════════
//  Connection
// ═══════════════════════════════════════════

Connection::Connection(std::shared_ptr<DocumentStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("Connection requires a document store");
    }
}

std::unique_ptr<DocumentRows> Connection::documents(const Query& query, const Context& ctx) {
    ctx.throwIfCancelled();
    std::vector<std::string> columns{kJsonColumn};

    if (query.operation == Operation::Find) {
        auto opts = query.findOptions();
        console::debug("find", query.collection, query.filter);
        return std::make_unique<DocumentRows>(
            store_->find(query.collection, query.filter, opts, ctx), columns, ctx);
    }

    auto pipeline = withOptionStages(query);
    console::debug("aggregate", query.collection, pipeline);
    return std::make_unique<DocumentRows>(
        store_->aggregate(query.collection, pipeline, ctx), columns, ctx);
}

Document Connection::collect(const Query& query, const Context& ctx) {
    auto rows = documents(query, ctx);
    Document all = collectDocuments(*rows);
    if (!query.singular) return all;
    return all.empty() ? Document(nullptr) : all.front();
}

std::unique_ptr<Rows> Connection::execute(const Query& query, const Context& ctx) {
    switch (query.operation) {
        case Operation::Aggregate:
        case Operation::Find:
            return documents(query, ctx);

        case Operation::IntrospectColumns:
            return introspectRows(*store_, query.introspectOptions(), ctx);

        case Operation::MultiAggregate: {
            Document result = Document::object();
            for (auto& sub : query.queries) {
                result[resultKey(sub)] = collect(sub, ctx);
            }
            return std::make_unique<SingleValueRows>(
                result.dump(), std::vector<std::string>{kJsonColumn});
        }
    }
    throw Error(ErrorKind::UnsupportedOperation, toString(query.operation));
}

Query Connection::prepare(const std::string& text, const std::vector<Document>& args) {
    Query q = parseQuery(text);
    substituteParams(q, args);

    if (q.cursorInfo && q.cursorInfo->cursorParam > 0) {
        auto idx = static_cast<std::size_t>(q.cursorInfo->cursorParam);
        if (idx > args.size()) {
            throw Error(ErrorKind::MissingParameter,
                        "cursor parameter $" + std::to_string(idx) + " not supplied");
        }
        const Document& raw = args[idx - 1];
        if (raw.is_string() && !raw.get_ref<const std::string&>().empty()) {
            if (!applyCursor(q, raw.get<std::string>())) {
                console::debug("cursor ignored, scanning from the start");
            }
        } else if (!raw.is_null() && !raw.is_string()) {
            throw Error(ErrorKind::TypeMismatch, "cursor parameter must be a string");
        }
    }
    return q;
}

std::unique_ptr<Rows> Connection::query(const std::string& text,
                                        const std::vector<Document>& args,
                                        const Context& ctx) {
    return execute(prepare(text, args), ctx);
}

std::unique_ptr<SingleValueRows> Connection::queryValue(const std::string& text,
                                                        const std::vector<Document>& args,
                                                        const Context& ctx) {
    Query q = prepare(text, args);
    if (q.operation == Operation::Aggregate || q.operation == Operation::Find) {
        return std::make_unique<SingleValueRows>(
            collect(q, ctx).dump(), std::vector<std::string>{kJsonColumn});
    }

    // Other operations already yield a single payload or a table
    auto rows = execute(q, ctx);
    Document out = Document::array();
    std::vector<Value> row;
    while (rows->next(row)) {
        if (row.size() == 1) {
            out.push_back(Document::parse(toString(row[0])));
            continue;
        }
        Document obj = Document::object();
        auto& cols = rows->columns();
        for (std::size_t i = 0; i < row.size() && i < cols.size(); i++) {
            std::visit([&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) obj[cols[i]] = nullptr;
                else obj[cols[i]] = v;
            }, row[i]);
        }
        out.push_back(std::move(obj));
    }
    rows->close();
    if (q.operation == Operation::MultiAggregate && out.size() == 1) {
        return std::make_unique<SingleValueRows>(
            out.front().dump(), std::vector<std::string>{kJsonColumn});
    }
    return std::make_unique<SingleValueRows>(out.dump(), std::vector<std::string>{kJsonColumn});
}

// ═══════════════════════════════════════════
//  Connector
// ═══════════════════════════════════════════

Connector::Connector(std::shared_ptr<Client> client, std::string database)
    : client_(std::move(client)), database_(std::move(database)) {
    if (!client_) {
        throw std::invalid_argument("Connector requires a client");
    }
}

Connection Connector::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto store = client_->database(database_);
    console::debug("connected to database", database_);
    return Connection(std::move(store));
}

Connection open(const std::shared_ptr<Client>& client, const std::string& database) {
    Connector connector(client, database);
    return connector.connect();
}

} // namespace graphjin::mongo
