#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/mongo/rows.h — Row iterators returned by the driver
// ═══════════════════════════════════════════════════════════════════
//
//  Three shapes share one surface {columns, next, close}:
//    DocumentRows     one JSON column per document, streamed from a cursor
//    SingleValueRows  exactly one row holding a pre-built JSON payload
//    ColumnRows       tabular rows with typed cells (introspection)
//
//  std::vector<mongo::Value> row;
//  while (rows->next(row)) { ... }
//  rows->close();
//
//  A Rows object has a single consumer.
// ═══════════════════════════════════════════════════════════════════

#include "../context.h"
#include "store.h"
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace graphjin::mongo {

// ── One cell ──
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

std::string toString(const Value& v);

class Rows {
public:
    virtual ~Rows() = default;

    virtual const std::vector<std::string>& columns() const = 0;

    // Fills `dest` with one row; false at end of stream or after close()
    virtual bool next(std::vector<Value>& dest) = 0;

    // Idempotent
    virtual void close() = 0;
};

// ═══════════════════════════════════════════
//  DocumentRows
// ═══════════════════════════════════════════
class DocumentRows final : public Rows {
public:
    DocumentRows(std::unique_ptr<DocumentCursor> cursor,
                 std::vector<std::string> columns,
                 Context ctx = Context::background());
    ~DocumentRows() override;

    DocumentRows(const DocumentRows&) = delete;
    DocumentRows& operator=(const DocumentRows&) = delete;

    const std::vector<std::string>& columns() const override { return columns_; }

    // Throws Cancelled or BackendError; the cursor is closed first
    bool next(std::vector<Value>& dest) override;

    // Raw document access, same contract as next()
    bool nextDocument(Document& out);

    void close() override;

    bool closed() const { return closed_; }

private:
    std::unique_ptr<DocumentCursor> cursor_;
    std::vector<std::string> columns_;
    Context ctx_;
    bool closed_ = false;
};

// ═══════════════════════════════════════════
//  SingleValueRows
// ═══════════════════════════════════════════
class SingleValueRows final : public Rows {
public:
    SingleValueRows(std::string value, std::vector<std::string> columns)
        : value_(std::move(value)), columns_(std::move(columns)) {}

    const std::vector<std::string>& columns() const override { return columns_; }
    bool next(std::vector<Value>& dest) override;
    void close() override { consumed_ = true; }

private:
    std::string value_;
    std::vector<std::string> columns_;
    bool consumed_ = false;
};

// ═══════════════════════════════════════════
//  ColumnRows
// ═══════════════════════════════════════════
class ColumnRows final : public Rows {
public:
    ColumnRows(std::vector<std::string> columns, std::vector<std::vector<Value>> data)
        : columns_(std::move(columns)), data_(std::move(data)) {}

    const std::vector<std::string>& columns() const override { return columns_; }
    bool next(std::vector<Value>& dest) override;
    void close() override { index_ = data_.size(); }

    std::size_t size() const { return data_.size(); }

private:
    std::vector<std::string> columns_;
    std::vector<std::vector<Value>> data_;
    std::size_t index_ = 0;
};

// Drains document rows into a JSON array. Closes the rows.
Document collectDocuments(DocumentRows& rows);

} // namespace graphjin::mongo
