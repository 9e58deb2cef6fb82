// ═══════════════════════════════════════════════════════════════════
//  mongo/mongo_client.cpp — mongocxx implementation of the store seam
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/mongo/mongo_client.h"
#include "graphjin/console.h"
#include "graphjin/error.h"

#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <mongocxx/cursor.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/aggregate.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/pipeline.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>

#include <optional>

namespace graphjin::mongo {

namespace {

// One driver instance per process
void ensureInstance() {
    static mongocxx::instance instance{};
}

template <typename Fn>
auto guarded(const std::string& op, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const mongocxx::exception& e) {
        throw Error::backend(op, e);
    } catch (const bsoncxx::exception& e) {
        throw Error::backend(op, e);
    }
}

bsoncxx::document::value toBson(const Document& doc) {
    return bsoncxx::from_json(doc.dump());
}

Document fromBson(bsoncxx::document::view view) {
    return Document::parse(bsoncxx::to_json(view, bsoncxx::ExtendedJsonMode::k_relaxed));
}

std::string withAppName(const std::string& uri, const std::string& appName) {
    if (appName.empty() || uri.find("appName=") != std::string::npos ||
        uri.find("appname=") != std::string::npos) {
        return uri;
    }
    char sep = uri.find('?') == std::string::npos ? '?' : '&';
    // "mongodb://host" needs a path slash before the query
    std::string base = uri;
    if (sep == '?' && uri.find('/', uri.find("://") + 3) == std::string::npos) {
        base += '/';
    }
    return base + sep + "appName=" + appName;
}

template <typename Options>
void applyDeadline(Options& opts, const Context& ctx) {
    if (auto left = ctx.remaining()) {
        opts.max_time(*left);
    }
}

// ── Cursor ──
class MongoCursor final : public DocumentCursor {
public:
    MongoCursor(mongocxx::pool::entry client, mongocxx::cursor cursor)
        : client_(std::move(client)), cursor_(std::move(cursor)) {}

    bool next(Document& out, const Context& ctx) override {
        ctx.throwIfCancelled();
        if (!cursor_) return false;
        return guarded("cursor next", [&] {
            if (!it_) it_ = cursor_->begin();
            if (*it_ == cursor_->end()) return false;
            out = fromBson(**it_);
            ++*it_;
            return true;
        });
    }

    void close() override {
        it_.reset();
        cursor_.reset();
        client_.reset();
    }

private:
    // Declared first so the cursor is destroyed before its client
    mongocxx::pool::entry client_;
    std::optional<mongocxx::cursor> cursor_;
    std::optional<mongocxx::cursor::iterator> it_;
};

// ── Database ──
class MongoStore final : public DocumentStore {
public:
    MongoStore(std::shared_ptr<mongocxx::pool> pool, std::string name)
        : pool_(std::move(pool)), name_(std::move(name)) {}

    std::string name() const override { return name_; }

    std::vector<std::string> listCollections(const Context& ctx) override {
        ctx.throwIfCancelled();
        return guarded("listCollections", [&] {
            auto client = pool_->acquire();
            return (*client)[name_].list_collection_names();
        });
    }

    std::unique_ptr<DocumentCursor> find(const std::string& collection,
                                         const Document& filter,
                                         const FindOptions& options,
                                         const Context& ctx) override {
        ctx.throwIfCancelled();
        return guarded("find " + collection, [&]() -> std::unique_ptr<DocumentCursor> {
            mongocxx::options::find opts;
            if (options.limit) opts.limit(*options.limit);
            if (options.skip) opts.skip(*options.skip);
            if (options.sort) opts.sort(toBson(*options.sort));
            if (options.projection) opts.projection(toBson(*options.projection));
            applyDeadline(opts, ctx);

            auto client = pool_->acquire();
            auto coll = (*client)[name_][collection];
            auto cursor = coll.find(toBson(filter), opts);
            return std::make_unique<MongoCursor>(std::move(client), std::move(cursor));
        });
    }

    std::unique_ptr<DocumentCursor> aggregate(const std::string& collection,
                                              const Document& pipeline,
                                              const Context& ctx) override {
        ctx.throwIfCancelled();
        return guarded("aggregate " + collection, [&]() -> std::unique_ptr<DocumentCursor> {
            // from_json only accepts a top-level document
            Document wrapper = Document::object();
            wrapper["stages"] = pipeline;
            auto stages = toBson(wrapper);

            mongocxx::pipeline p;
            p.append_stages(stages.view()["stages"].get_array().value);

            mongocxx::options::aggregate opts;
            applyDeadline(opts, ctx);

            auto client = pool_->acquire();
            auto coll = (*client)[name_][collection];
            auto cursor = coll.aggregate(p, opts);
            return std::make_unique<MongoCursor>(std::move(client), std::move(cursor));
        });
    }

    std::unique_ptr<DocumentCursor> sample(const std::string& collection,
                                           int64_t limit,
                                           const Context& ctx) override {
        FindOptions opts;
        opts.limit = limit;
        return find(collection, Document::object(), opts, ctx);
    }

private:
    std::shared_ptr<mongocxx::pool> pool_;
    std::string name_;
};

} // namespace

// ═══════════════════════════════════════════
//  MongoClient
// ═══════════════════════════════════════════

std::shared_ptr<MongoClient> MongoClient::create(const ConnectorOptions& options) {
    return std::make_shared<MongoClient>(options);
}

MongoClient::MongoClient(const ConnectorOptions& options) {
    options.validate();
    ensureInstance();
    auto uri = withAppName(options.uri, options.app_name);
    pool_ = guarded("connect", [&] {
        return std::make_shared<mongocxx::pool>(mongocxx::uri{uri});
    });
    console::info("mongo client ready for", options.database);
}

MongoClient::~MongoClient() = default;

std::shared_ptr<DocumentStore> MongoClient::database(const std::string& name) {
    if (name.empty()) {
        throw Error(ErrorKind::MalformedInput, "database name is empty");
    }
    return std::make_shared<MongoStore>(pool_, name);
}

} // namespace graphjin::mongo
