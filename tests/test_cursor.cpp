// ═══════════════════════════════════════════════════════════════════
//  test_cursor.cpp — Tests for cursor normalization, seek filters, cache
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <graphjin/console.h>
#include <graphjin/mongo/cursor.h>
#include "memory_store.h"
#include <sstream>
#include <thread>

using namespace graphjin;
using namespace graphjin::mongo;

namespace {

CursorInfo makeInfo(int64_t selectId, std::vector<CursorColumn> orderBy,
                    std::string prefix = "") {
    CursorInfo info;
    info.selectId = selectId;
    info.prefix = std::move(prefix);
    info.orderBy = std::move(orderBy);
    return info;
}

CursorColumn col(const std::string& name, CursorColumn::Direction dir,
                 CursorColumn::Type type = CursorColumn::Type::Auto) {
    return CursorColumn{name, dir, type};
}

constexpr auto Asc = CursorColumn::Direction::Asc;
constexpr auto Desc = CursorColumn::Direction::Desc;

} // namespace

// ── Normalization ──

TEST(NormalizeCursorTest, ExactPrefix) {
    auto info = makeInfo(12, {}, "gj-123:");
    EXPECT_EQ(normalizeCursor(info, "gj-123:12:100:99"), "12:100:99");
}

TEST(NormalizeCursorTest, FallbackPrefix) {
    auto info = makeInfo(12, {});
    EXPECT_EQ(normalizeCursor(info, "gj-65a8b3c0:12:100:99"), "12:100:99");
}

TEST(NormalizeCursorTest, TrimsAndKeepsEmpty) {
    auto info = makeInfo(1, {});
    EXPECT_EQ(normalizeCursor(info, ""), "");
    EXPECT_EQ(normalizeCursor(info, "   "), "");
    EXPECT_EQ(normalizeCursor(info, "  1:2 \n"), "1:2");
}

TEST(NormalizeCursorTest, NoFallbackWhenPrefixDeclared) {
    auto info = makeInfo(12, {}, "gj-123:");
    EXPECT_EQ(normalizeCursor(info, "gj-ffff:12:5"), "gj-ffff:12:5");
}

TEST(NormalizeCursorTest, StripsDeclaredPrefix) {
    for (std::string prefix : {"gj-1:", "cursor/", "x"}) {
        auto info = makeInfo(1, {}, prefix);
        for (std::string s : {"1:2", "abc", "7"}) {
            EXPECT_EQ(normalizeCursor(info, prefix + s), s) << prefix << s;
        }
    }
}

TEST(NormalizeCursorTest, StripsGeneratedPrefix) {
    auto info = makeInfo(1, {});
    for (std::string hex : {"", "0", "deadBEEF", "65a8b3c0"}) {
        for (std::string s : {"1:2", "9", "x:y"}) {
            EXPECT_EQ(normalizeCursor(info, "gj-" + hex + ":" + s), s) << hex << s;
        }
    }
}

// ── Seek filters ──

TEST(SeekFilterTest, TwoColumnDescending) {
    auto info = makeInfo(12, {col("price", Desc), col("id", Desc)});
    auto f = buildSeekFilter(info, "gj-65a8b3c0:12:100.5:99");
    ASSERT_TRUE(f.has_value());

    Document expected = Document::parse(R"({"$match":{"$or":[
        {"price":{"$lt":100.5}},
        {"$and":[{"price":100.5},{"_id":{"$lt":99}}]}]}})");
    EXPECT_EQ(*f, expected);
    EXPECT_EQ((*f)["$match"]["$or"].size(), 2u);
}

TEST(SeekFilterTest, SingleColumnAscending) {
    auto info = makeInfo(4, {col("id", Asc)});
    auto f = buildSeekFilter(info, "gj-abc:4:10");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(*f, Document::parse(R"({"$match":{"_id":{"$gt":10}}})"));
}

TEST(SeekFilterTest, ThreeColumnsMixedDirections) {
    auto info = makeInfo(2, {col("category", Asc), col("price", Desc), col("id", Asc)});
    auto f = buildSeekFilter(info, "2:books:7:31");
    ASSERT_TRUE(f.has_value());
    auto& clauses = (*f)["$match"]["$or"];
    ASSERT_EQ(clauses.size(), 3u);
    EXPECT_EQ(clauses[0], Document::parse(R"({"category":{"$gt":"books"}})"));
    EXPECT_EQ(clauses[1]["$and"].size(), 2u);
    EXPECT_EQ(clauses[1]["$and"][1], Document::parse(R"({"price":{"$lt":7}})"));
    EXPECT_EQ(clauses[2]["$and"].size(), 3u);
    EXPECT_EQ(clauses[2]["$and"][2], Document::parse(R"({"_id":{"$gt":31}})"));
}

TEST(SeekFilterTest, InvalidCursorsYieldNoFilter) {
    auto info = makeInfo(4, {col("id", Asc)});
    EXPECT_FALSE(buildSeekFilter(info, "gj-abc:").has_value());
    EXPECT_FALSE(buildSeekFilter(info, "").has_value());
    EXPECT_FALSE(buildSeekFilter(info, "5:10").has_value());
    EXPECT_FALSE(buildSeekFilter(info, "4:10:11").has_value());
    EXPECT_FALSE(buildSeekFilter(info, "four:10").has_value());
}

TEST(SeekFilterTest, IdentityMustBeInteger) {
    auto info = makeInfo(4, {col("id", Asc)});
    EXPECT_FALSE(buildSeekFilter(info, "4:abc").has_value());
}

TEST(SeekFilterTest, DeclaredTypes) {
    auto info = makeInfo(1, {col("code", Asc, CursorColumn::Type::String),
                             col("id", Asc, CursorColumn::Type::String)});
    auto f = buildSeekFilter(info, "1:007:65a8b3c0");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ((*f)["$match"]["$or"][0]["code"]["$gt"], "007");
    EXPECT_EQ((*f)["$match"]["$or"][1]["$and"][1]["_id"]["$gt"], "65a8b3c0");

    auto ints = makeInfo(1, {col("n", Asc, CursorColumn::Type::Integer)});
    EXPECT_FALSE(buildSeekFilter(ints, "1:2.5").has_value());
}

TEST(SeekFilterTest, TypeMismatchIsLogged) {
    std::ostringstream out;
    console::setStream(&out);
    console::setColors(false);

    auto info = makeInfo(1, {col("n", Asc, CursorColumn::Type::Float)});
    EXPECT_FALSE(buildSeekFilter(info, "1:abc").has_value());

    console::setStream(nullptr);
    console::setColors(true);
    EXPECT_NE(out.str().find("type-mismatch"), std::string::npos);
}

TEST(SeekFilterTest, IsStrictlyAfterCursorRow) {
    testing_support::MemoryStore store;
    for (int i = 1; i <= 6; i++) {
        store.insert("p", {{"_id", i}, {"price", i <= 3 ? 100.5 : 50.0}});
    }
    auto info = makeInfo(12, {col("price", Desc), col("id", Desc)});

    // Order: (100.5,3) (100.5,2) (100.5,1) (50,6) (50,5) (50,4)
    auto f = buildSeekFilter(info, "12:100.5:2");
    ASSERT_TRUE(f.has_value());
    Document pipeline = Document::array();
    pipeline.push_back(*f);
    pipeline.push_back({{"$sort", {{"price", -1}, {"_id", -1}}}});

    auto cursor = store.aggregate("p", pipeline, Context::background());
    std::vector<int> ids;
    Document doc;
    while (cursor->next(doc, Context::background())) ids.push_back(doc["_id"].get<int>());
    cursor->close();

    EXPECT_EQ(ids, (std::vector<int>{1, 6, 5, 4}));
}

// ── Encoding ──

TEST(EncodeCursorTest, RendersOrderValues) {
    auto info = makeInfo(12, {col("price", Desc), col("id", Desc)}, "gj-123:");
    Document row = {{"_id", 99}, {"price", 100.5}, {"name", "x"}};
    auto cursor = encodeCursor(info, row);
    EXPECT_EQ(cursor, "gj-123:12:100.5:99");

    auto f = buildSeekFilter(info, cursor);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ((*f)["$match"]["$or"][1]["$and"][1]["_id"]["$lt"], 99);
}

TEST(EncodeCursorTest, ExtendedJsonScalars) {
    auto info = makeInfo(3, {col("id", Asc, CursorColumn::Type::String)});
    Document row = {{"_id", {{"$oid", "65a8b3c0ffee"}}}};
    EXPECT_EQ(encodeCursor(info, row), "3:65a8b3c0ffee");
}

TEST(EncodeCursorTest, NumericStringsPageForward) {
    testing_support::MemoryStore store;
    store.insert("codes", {{"_id", 1}, {"code", "10"}});
    store.insert("codes", {{"_id", 2}, {"code", "20"}});
    store.insert("codes", {{"_id", 3}, {"code", "30"}});
    auto info = makeInfo(1, {col("code", Asc), col("id", Asc)});

    auto page = [&](const std::string& cursor) {
        Document pipeline = Document::array();
        if (auto f = buildSeekFilter(info, cursor)) pipeline.push_back(*f);
        pipeline.push_back({{"$sort", {{"code", 1}, {"_id", 1}}}});
        pipeline.push_back({{"$limit", 2}});
        auto it = store.aggregate("codes", pipeline, Context::background());
        std::vector<Document> rows;
        Document doc;
        while (it->next(doc, Context::background())) rows.push_back(doc);
        it->close();
        return rows;
    };

    auto first = page("");
    ASSERT_EQ(first.size(), 2u);
    auto cursor = encodeCursor(info, first.back());
    EXPECT_EQ(cursor, "1:'20:2");

    auto f = buildSeekFilter(info, cursor);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ((*f)["$match"]["$or"][0]["code"]["$gt"], "20");

    auto second = page(cursor);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0]["code"], "30");
}

TEST(EncodeCursorTest, EscapesSeparators) {
    auto info = makeInfo(1, {col("code", Asc), col("id", Asc)});
    Document row = {{"_id", 5}, {"code", "10:30 100% it's"}};
    auto cursor = encodeCursor(info, row);
    EXPECT_EQ(cursor, "1:10%3A30 100%25 it%27s:5");

    auto f = buildSeekFilter(info, cursor);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ((*f)["$match"]["$or"][0]["code"]["$gt"], "10:30 100% it's");
    EXPECT_EQ((*f)["$match"]["$or"][1]["$and"][1]["_id"]["$gt"], 5);
}

TEST(EncodeCursorTest, DeclaredStringColumnNeedsNoTag) {
    auto info = makeInfo(1, {col("code", Asc, CursorColumn::Type::String), col("id", Asc)});
    Document row = {{"_id", 2}, {"code", "20"}};
    auto cursor = encodeCursor(info, row);
    EXPECT_EQ(cursor, "1:20:2");
    auto f = buildSeekFilter(info, cursor);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ((*f)["$match"]["$or"][0]["code"]["$gt"], "20");
}

TEST(CursorPrefixTest, Shape) {
    auto p = cursorPrefix("query:products");
    ASSERT_EQ(p.size(), 12u);
    EXPECT_EQ(p.substr(0, 3), "gj-");
    EXPECT_EQ(p.back(), ':');
    EXPECT_EQ(p, cursorPrefix("query:products"));
    EXPECT_NE(p, cursorPrefix("query:users"));
}

TEST(CursorPrefixTest, KnownDigest) {
    // SHA-256("abc") = ba7816bf...
    EXPECT_EQ(cursorPrefix("abc"), "gj-ba7816bf:");
}

// ── applyCursor ──

TEST(ApplyCursorTest, PrependsMatchToPipeline) {
    auto q = parseQuery(R"({"operation":"aggregate","collection":"p",
        "pipeline":[{"$sort":{"_id":1}}],
        "cursor_info":{"select_id":4,"order_by":[{"column":"id","direction":"asc"}]}})");
    ASSERT_TRUE(applyCursor(q, "4:10"));
    ASSERT_EQ(q.pipeline.size(), 2u);
    EXPECT_EQ(q.pipeline[0], Document::parse(R"({"$match":{"_id":{"$gt":10}}})"));
}

TEST(ApplyCursorTest, CombinesFindFilter) {
    auto q = parseQuery(R"({"operation":"find","collection":"p","filter":{"active":true},
        "cursor_info":{"select_id":4,"order_by":[{"column":"id","direction":"asc"}]}})");
    ASSERT_TRUE(applyCursor(q, "4:10"));
    EXPECT_EQ(q.filter, Document::parse(R"({"$and":[{"active":true},{"_id":{"$gt":10}}]})"));

    auto bare = parseQuery(R"({"operation":"find","collection":"p",
        "cursor_info":{"select_id":4,"order_by":[{"column":"id","direction":"asc"}]}})");
    ASSERT_TRUE(applyCursor(bare, "4:10"));
    EXPECT_EQ(bare.filter, Document::parse(R"({"_id":{"$gt":10}})"));
}

TEST(ApplyCursorTest, LeavesQueryOnInvalidCursor) {
    auto q = parseQuery(R"({"operation":"aggregate","collection":"p","pipeline":[],
        "cursor_info":{"select_id":4,"order_by":[{"column":"id","direction":"asc"}]}})");
    auto before = q;
    EXPECT_FALSE(applyCursor(q, "9:10"));
    EXPECT_EQ(q, before);

    auto noInfo = parseQuery(R"({"operation":"aggregate","collection":"p"})");
    EXPECT_FALSE(applyCursor(noInfo, "4:10"));
}

// ── CursorCache ──

TEST(CursorCacheTest, SetAndGet) {
    CursorCache cache;
    auto id = cache.set("gj-1:4:10");
    auto v = cache.get(id);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "gj-1:4:10");
    EXPECT_FALSE(cache.get(id + 100).has_value());
}

TEST(CursorCacheTest, SameCursorSameId) {
    CursorCache cache;
    auto a = cache.set("4:10");
    auto b = cache.set("4:11");
    EXPECT_NE(a, b);
    EXPECT_EQ(cache.set("4:10"), a);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(CursorCacheTest, EvictsLeastRecentlyUsed) {
    CursorCache cache(2);
    auto a = cache.set("a");
    auto b = cache.set("b");
    cache.get(a);
    auto c = cache.set("c");

    EXPECT_TRUE(cache.get(a).has_value());
    EXPECT_FALSE(cache.get(b).has_value());
    EXPECT_TRUE(cache.get(c).has_value());
    EXPECT_EQ(cache.size(), 2u);
}

TEST(CursorCacheTest, Expiry) {
    CursorCache cache(10, std::chrono::milliseconds(50));
    auto id = cache.set("x");
    cache.set("y");
    EXPECT_TRUE(cache.get(id).has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(cache.get(id).has_value());
    EXPECT_EQ(cache.purgeExpired(), 1u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(CursorCacheTest, Clear) {
    CursorCache cache;
    cache.set("x");
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}
