// ═══════════════════════════════════════════════════════════════════
//  test_introspect.cpp — Tests for sampling-based column inference
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <graphjin/mongo/introspect.h>
#include "memory_store.h"

using namespace graphjin;
using namespace graphjin::mongo;
using testing_support::MemoryStore;

TEST(TypeClassTest, PlainJson) {
    EXPECT_EQ(typeClass(Document(nullptr)), "");
    EXPECT_EQ(typeClass(Document(true)), "boolean");
    EXPECT_EQ(typeClass(Document(3)), "integer");
    EXPECT_EQ(typeClass(Document(2.5)), "double");
    EXPECT_EQ(typeClass(Document("s")), "string");
    EXPECT_EQ(typeClass(Document::array()), "array");
    EXPECT_EQ(typeClass(Document::parse(R"({"a":1})")), "object");
}

TEST(TypeClassTest, ExtendedJson) {
    EXPECT_EQ(typeClass(Document::parse(R"({"$oid":"65a8b3c0ffee00112233aabb"})")), "objectid");
    EXPECT_EQ(typeClass(Document::parse(R"({"$date":"2024-01-01T00:00:00Z"})")), "timestamp");
    EXPECT_EQ(typeClass(Document::parse(R"({"$timestamp":{"t":1,"i":1}})")), "timestamp");
    EXPECT_EQ(typeClass(Document::parse(R"({"$binary":{"base64":"AA==","subType":"00"}})")), "binary");
    EXPECT_EQ(typeClass(Document::parse(R"({"$numberLong":"9007199254740993"})")), "integer");
    EXPECT_EQ(typeClass(Document::parse(R"({"$numberDecimal":"1.10"})")), "double");
}

class IntrospectTest : public ::testing::Test {
protected:
    MemoryStore store{"shop"};

    void SetUp() override {
        store.insert("users", Document::parse(
            R"({"_id":{"$oid":"65a8b3c0ffee00112233aab1"},"name":"Alice","age":30,"tags":["a"]})"));
        store.insert("users", Document::parse(
            R"({"_id":{"$oid":"65a8b3c0ffee00112233aab2"},"name":"Bob","age":"n/a","email":null})"));
        store.insert("users", Document::parse(
            R"({"_id":{"$oid":"65a8b3c0ffee00112233aab3"},"name":"Carol","age":41})"));
        store.insert("orders", Document::parse(R"({"_id":1,"total":9.5})"));
        store.createCollection("empty");
    }

    static const sdata::DBColumn& column(const std::vector<sdata::DBColumn>& cols,
                                         const std::string& table, const std::string& name) {
        for (auto& c : cols) {
            if (c.table == table && c.name == name) return c;
        }
        throw std::runtime_error("no column " + table + "." + name);
    }
};

TEST_F(IntrospectTest, CollectionsSortedAndIdFirst) {
    IntrospectOptions opts;
    auto cols = introspectCollections(store, opts, Context::background());

    ASSERT_FALSE(cols.empty());
    EXPECT_EQ(cols.front().table, "orders");
    EXPECT_EQ(cols.front().name, "_id");

    std::vector<std::string> userCols;
    for (auto& c : cols) {
        if (c.table == "users") userCols.push_back(c.name);
    }
    EXPECT_EQ(userCols, (std::vector<std::string>{"_id", "name", "age", "tags", "email"}));
}

TEST_F(IntrospectTest, InfersTypesAndNullability) {
    auto cols = introspectCollections(store, {}, Context::background());

    auto& id = column(cols, "users", "_id");
    EXPECT_EQ(id.type, "objectid");
    EXPECT_TRUE(id.primaryKey);
    EXPECT_TRUE(id.uniqueKey);
    EXPECT_TRUE(id.notNull);

    auto& name = column(cols, "users", "name");
    EXPECT_EQ(name.type, "string");
    EXPECT_TRUE(name.notNull);
    EXPECT_FALSE(name.primaryKey);

    // Two integers, one string
    auto& age = column(cols, "users", "age");
    EXPECT_EQ(age.type, "integer");
    EXPECT_FALSE(age.notNull);

    auto& tags = column(cols, "users", "tags");
    EXPECT_TRUE(tags.array);
    EXPECT_FALSE(tags.notNull);

    auto& email = column(cols, "users", "email");
    EXPECT_FALSE(email.notNull);

    EXPECT_EQ(column(cols, "orders", "total").type, "double");
    EXPECT_EQ(column(cols, "orders", "_id").schema, "shop");
}

TEST_F(IntrospectTest, TiesGoToFirstObserved) {
    ColumnSampler sampler("db", "c");
    sampler.observe(Document::parse(R"({"_id":1,"v":"x"})"));
    sampler.observe(Document::parse(R"({"_id":2,"v":5})"));
    auto cols = sampler.columns();
    ASSERT_EQ(cols.size(), 2u);
    EXPECT_EQ(cols[1].type, "string");
    EXPECT_FALSE(cols[1].notNull);
    EXPECT_EQ(sampler.sampled(), 2u);
}

TEST_F(IntrospectTest, CollectionFilterAndSampleSize) {
    IntrospectOptions opts;
    opts.collections = {"users", "missing"};
    opts.sampleSize = 1;
    auto cols = introspectCollections(store, opts, Context::background());
    for (auto& c : cols) EXPECT_EQ(c.table, "users");

    // Only Alice was sampled
    std::vector<std::string> names;
    for (auto& c : cols) names.push_back(c.name);
    EXPECT_EQ(names, (std::vector<std::string>{"_id", "name", "age", "tags"}));
    EXPECT_TRUE(column(cols, "users", "age").notNull);
}

TEST_F(IntrospectTest, EmptyCollectionHasNoRows) {
    IntrospectOptions opts;
    opts.collections = {"empty"};
    auto rows = introspectRows(store, opts, Context::background());
    EXPECT_EQ(rows->size(), 0u);
    ASSERT_EQ(rows->columns().size(), 11u);
    EXPECT_EQ(rows->columns().front(), "table_schema");
    EXPECT_EQ(rows->columns().back(), "fkey_column");
    std::vector<Value> row;
    EXPECT_FALSE(rows->next(row));
}

TEST_F(IntrospectTest, RowShape) {
    IntrospectOptions opts;
    opts.collections = {"orders"};
    auto rows = introspectRows(store, opts, Context::background());
    std::vector<Value> row;
    ASSERT_TRUE(rows->next(row));
    ASSERT_EQ(row.size(), 11u);
    EXPECT_EQ(std::get<std::string>(row[0]), "shop");
    EXPECT_EQ(std::get<std::string>(row[1]), "orders");
    EXPECT_EQ(std::get<std::string>(row[2]), "_id");
    EXPECT_EQ(std::get<std::string>(row[3]), "integer");
    EXPECT_FALSE(std::get<bool>(row[4]));
    EXPECT_TRUE(std::get<bool>(row[5]));
    EXPECT_TRUE(std::get<bool>(row[6]));
    EXPECT_FALSE(std::get<bool>(row[7]));
    EXPECT_EQ(std::get<std::string>(row[8]), "");
    EXPECT_EQ(std::get<std::string>(row[10]), "");
}

TEST_F(IntrospectTest, CancelledContext) {
    auto ctx = Context::background();
    ctx.cancel();
    EXPECT_THROW(introspectCollections(store, {}, ctx), Error);
}

TEST_F(IntrospectTest, SamplingCursorsAreClosed) {
    introspectCollections(store, {}, Context::background());
    EXPECT_EQ(store.stats().cursorsOpened, store.stats().cursorsClosed);
}
