// ═══════════════════════════════════════════════════════════════════
//  mongo/rows.cpp — Row iterator implementations
// ═══════════════════════════════════════════════════════════════════

#include "graphjin/mongo/rows.h"
#include "graphjin/console.h"
#include "graphjin/error.h"

namespace graphjin::mongo {

std::string toString(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, double>) {
            return Document(x).dump();
        } else {
            return std::to_string(x);
        }
    }, v);
}

// ── DocumentRows ──

DocumentRows::DocumentRows(std::unique_ptr<DocumentCursor> cursor,
                           std::vector<std::string> columns,
                           Context ctx)
    : cursor_(std::move(cursor)), columns_(std::move(columns)), ctx_(std::move(ctx)) {}

DocumentRows::~DocumentRows() {
    try {
        close();
    } catch (const std::exception& e) {
        console::warn("closing document cursor failed:", e.what());
    }
}

bool DocumentRows::nextDocument(Document& out) {
    if (closed_ || !cursor_) return false;

    if (ctx_.isCancelled()) {
        close();
        throw Error(ErrorKind::Cancelled, "row iteration cancelled");
    }

    bool more = false;
    try {
        more = cursor_->next(out, ctx_);
    } catch (...) {
        close();
        throw;
    }
    if (!more) {
        close();
    }
    return more;
}

bool DocumentRows::next(std::vector<Value>& dest) {
    Document doc;
    if (!nextDocument(doc)) return false;
    dest.assign(columns_.empty() ? 1 : columns_.size(), Value{});
    dest[0] = doc.dump();
    return true;
}

void DocumentRows::close() {
    if (closed_) return;
    closed_ = true;
    if (cursor_) {
        auto cursor = std::move(cursor_);
        cursor->close();
    }
}

// ── SingleValueRows ──

bool SingleValueRows::next(std::vector<Value>& dest) {
    if (consumed_) return false;
    consumed_ = true;
    dest.assign(columns_.empty() ? 1 : columns_.size(), Value{});
    dest[0] = value_;
    return true;
}

// ── ColumnRows ──

bool ColumnRows::next(std::vector<Value>& dest) {
    if (index_ >= data_.size()) return false;
    dest = data_[index_++];
    return true;
}

Document collectDocuments(DocumentRows& rows) {
    Document out = Document::array();
    Document doc;
    while (rows.nextDocument(doc)) {
        out.push_back(std::move(doc));
        doc = Document();
    }
    rows.close();
    return out;
}

} // namespace graphjin::mongo
