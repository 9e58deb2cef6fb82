// ═══════════════════════════════════════════════════════════════════
//  test_rows.cpp — Tests for the row iterators
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <graphjin/mongo/rows.h>
#include "memory_store.h"

using namespace graphjin;
using namespace graphjin::mongo;
using testing_support::MemoryStore;

class DocumentRowsTest : public ::testing::Test {
protected:
    MemoryStore store;

    void SetUp() override {
        store.insert("users", {{"_id", 1}, {"name", "Alice"}});
        store.insert("users", {{"_id", 2}, {"name", "Bob"}});
    }

    std::unique_ptr<DocumentRows> open(Context ctx = Context::background()) {
        return std::make_unique<DocumentRows>(
            store.find("users", Document::object(), {}, ctx),
            std::vector<std::string>{"__root"}, ctx);
    }
};

TEST_F(DocumentRowsTest, StreamsOneJsonColumn) {
    auto rows = open();
    EXPECT_EQ(rows->columns(), std::vector<std::string>{"__root"});

    std::vector<Value> row;
    ASSERT_TRUE(rows->next(row));
    ASSERT_EQ(row.size(), 1u);
    auto doc = Document::parse(std::get<std::string>(row[0]));
    EXPECT_EQ(doc["name"], "Alice");

    ASSERT_TRUE(rows->next(row));
    EXPECT_FALSE(rows->next(row));
    EXPECT_FALSE(rows->next(row));
    EXPECT_EQ(store.stats().cursorsClosed, 1);
}

TEST_F(DocumentRowsTest, CloseIsIdempotent) {
    auto rows = open();
    rows->close();
    rows->close();
    std::vector<Value> row;
    EXPECT_FALSE(rows->next(row));
    rows.reset();
    EXPECT_EQ(store.stats().cursorsClosed, 1);
}

TEST_F(DocumentRowsTest, DestructorReleasesCursor) {
    {
        auto rows = open();
        std::vector<Value> row;
        rows->next(row);
    }
    EXPECT_EQ(store.stats().cursorsOpened, 1);
    EXPECT_EQ(store.stats().cursorsClosed, 1);
}

TEST_F(DocumentRowsTest, CancelClosesAndThrows) {
    auto ctx = Context::background();
    auto rows = open(ctx);
    std::vector<Value> row;
    ASSERT_TRUE(rows->next(row));

    ctx.cancel();
    try {
        rows->next(row);
        FAIL();
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_TRUE(rows->closed());
    EXPECT_EQ(store.stats().cursorsClosed, 1);
}

TEST_F(DocumentRowsTest, BackendErrorClosesCursor) {
    store.stats().failAfter = 1;
    auto rows = open();
    std::vector<Value> row;
    ASSERT_TRUE(rows->next(row));
    try {
        rows->next(row);
        FAIL();
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BackendError);
    }
    EXPECT_EQ(store.stats().cursorsClosed, 1);
    EXPECT_FALSE(rows->next(row));
}

TEST_F(DocumentRowsTest, CollectDocuments) {
    auto rows = open();
    auto all = collectDocuments(*rows);
    ASSERT_TRUE(all.is_array());
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1]["name"], "Bob");
    EXPECT_TRUE(rows->closed());
}

TEST(SingleValueRowsTest, ExactlyOneRow) {
    SingleValueRows rows(R"({"count":3})", {"__root"});
    std::vector<Value> row;
    ASSERT_TRUE(rows.next(row));
    EXPECT_EQ(std::get<std::string>(row[0]), R"({"count":3})");
    EXPECT_FALSE(rows.next(row));
}

TEST(SingleValueRowsTest, CloseBeforeRead) {
    SingleValueRows rows("[]", {"__root"});
    rows.close();
    rows.close();
    std::vector<Value> row;
    EXPECT_FALSE(rows.next(row));
}

TEST(ColumnRowsTest, Tabular) {
    ColumnRows rows({"a", "b"}, {{std::string("x"), true}, {int64_t(2), 1.5}});
    EXPECT_EQ(rows.size(), 2u);
    std::vector<Value> row;
    ASSERT_TRUE(rows.next(row));
    EXPECT_EQ(toString(row[0]), "x");
    EXPECT_EQ(toString(row[1]), "true");
    ASSERT_TRUE(rows.next(row));
    EXPECT_EQ(toString(row[0]), "2");
    EXPECT_EQ(toString(row[1]), "1.5");
    EXPECT_FALSE(rows.next(row));
}

TEST(ColumnRowsTest, CloseStopsIteration) {
    ColumnRows rows({"a"}, {{std::string("x")}, {std::string("y")}});
    rows.close();
    std::vector<Value> row;
    EXPECT_FALSE(rows.next(row));
}

TEST(ValueTest, ToString) {
    EXPECT_EQ(toString(Value{}), "");
    EXPECT_EQ(toString(Value{false}), "false");
    EXPECT_EQ(toString(Value{int64_t(-4)}), "-4");
}
