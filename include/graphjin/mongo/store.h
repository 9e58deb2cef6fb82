#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/mongo/store.h — Document store seam
// ═══════════════════════════════════════════════════════════════════
//
//  The driver talks to the document database only through these
//  interfaces. Documents cross the seam as relaxed Extended JSON
//  ({"$oid": ...}, {"$date": ...}) so BSON type information survives.
//  Implementations wrap their own failures in Error(BackendError).
//
// ═══════════════════════════════════════════════════════════════════

#include "../context.h"
#include "../json_utils.h"
#include "query.h"
#include <memory>
#include <string>
#include <vector>

namespace graphjin::mongo {

// ── Server-side cursor over documents ──
class DocumentCursor {
public:
    virtual ~DocumentCursor() = default;

    // Fills `out` and returns true, or returns false at end of stream
    virtual bool next(Document& out, const Context& ctx) = 0;

    // Releases the server cursor. Called at most once by Rows.
    virtual void close() = 0;
};

// ── One database of the document store ──
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::string name() const = 0;

    virtual std::vector<std::string> listCollections(const Context& ctx) = 0;

    virtual std::unique_ptr<DocumentCursor> find(const std::string& collection,
                                                 const Document& filter,
                                                 const FindOptions& options,
                                                 const Context& ctx) = 0;

    virtual std::unique_ptr<DocumentCursor> aggregate(const std::string& collection,
                                                      const Document& pipeline,
                                                      const Context& ctx) = 0;

    // Up to `limit` documents in natural order
    virtual std::unique_ptr<DocumentCursor> sample(const std::string& collection,
                                                   int64_t limit,
                                                   const Context& ctx) = 0;
};

// ── Client handing out databases ──
class Client {
public:
    virtual ~Client() = default;

    virtual std::shared_ptr<DocumentStore> database(const std::string& name) = 0;
};

} // namespace graphjin::mongo
