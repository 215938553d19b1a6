#include <gtest/gtest.h>

#include <cstdint>
#include <type_traits>

#include "database/result_cursor.hpp"
#include "fake_driver.hpp"

using namespace mydbd;
using namespace mydbd::database;
using mydbd::test::integer;
using mydbd::test::text;

namespace {

struct User {
    explicit User(const domain::AssocRow& row)
        : id(domain::toString(row.at("id")))
        , name(domain::toString(row.at("name"))) {}

    std::string id;
    std::string name;
};

} // namespace

class ResultCursorTest : public ::testing::Test {
protected:
    std::shared_ptr<QueryCursor> makeCursor() {
        return std::make_shared<QueryCursor>(std::make_unique<test::FakeResult>(
            std::vector<std::string>{"id", "name"},
            std::vector<domain::OrderedRow>{
                {text("1"), text("alice")},
                {text("2"), text("bob")},
                {text("3"), text("carol")}}));
    }
};

TEST_F(ResultCursorTest, NextReturnsEveryRowInEachMode) {
    for (auto mode : {FetchMode::Ordered, FetchMode::Assoc, FetchMode::Object, FetchMode::Column}) {
        auto cursor = makeCursor();
        cursor->setFetchMode(mode);

        std::size_t rows = 0;
        while (auto row = cursor->next()) {
            ++rows;
            EXPECT_EQ(cursor->rowCount(), 3u);
        }
        EXPECT_EQ(rows, 3u) << "mode " << static_cast<int>(mode);
        EXPECT_FALSE(cursor->next().has_value());
        EXPECT_EQ(cursor->rowCount(), 3u);
    }
}

TEST_F(ResultCursorTest, RowShapesFollowFetchMode) {
    auto cursor = makeCursor();

    auto ordered = cursor->next(FetchMode::Ordered);
    ASSERT_TRUE(ordered.has_value());
    EXPECT_EQ(std::get<domain::OrderedRow>(*ordered), (domain::OrderedRow{text("1"), text("alice")}));

    auto assoc = cursor->next(FetchMode::Assoc);
    ASSERT_TRUE(assoc.has_value());
    const auto& row = std::get<domain::AssocRow>(*assoc);
    EXPECT_EQ(row.at("id"), text("2"));
    EXPECT_EQ(row.at("name"), text("bob"));

    auto object = cursor->next(FetchMode::Object);
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(std::get<domain::ObjectRow>(*object).typeName, "stdClass");
    EXPECT_EQ(std::get<domain::ObjectRow>(*object).get("name"), text("carol"));
}

TEST_F(ResultCursorTest, ObjectModeUsesRequestedTypeName) {
    auto cursor = makeCursor();
    cursor->setFetchMode(FetchMode::Object, "User");

    auto row = cursor->next();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(std::get<domain::ObjectRow>(*row).typeName, "User");

    auto object = cursor->fetchObject();
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(object->typeName, "User");

    // 不带类型名时恢复为 stdClass
    cursor->setFetchMode(FetchMode::Object);
    object = cursor->fetchObject();
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(object->typeName, "stdClass");
}

TEST_F(ResultCursorTest, CurrentDoesNotConsume) {
    auto cursor = makeCursor();
    ASSERT_TRUE(cursor->next().has_value());

    auto peeked = cursor->current();
    auto fetched = cursor->next();
    ASSERT_TRUE(peeked.has_value());
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(std::get<domain::OrderedRow>(*peeked), std::get<domain::OrderedRow>(*fetched));
    EXPECT_EQ(std::get<domain::OrderedRow>(*fetched)[1], text("bob"));
}

TEST_F(ResultCursorTest, CurrentAtEndReturnsNothing) {
    auto cursor = makeCursor();
    cursor->fetchAll();
    long position = cursor->key();

    EXPECT_FALSE(cursor->current().has_value());
    EXPECT_EQ(cursor->key(), position);
}

TEST_F(ResultCursorTest, KeyStopsAtRowCountAfterDraining) {
    auto cursor = makeCursor();
    cursor->fetchAll();
    EXPECT_EQ(cursor->key(), 3);

    EXPECT_FALSE(cursor->next().has_value());
    EXPECT_FALSE(cursor->next().has_value());
    EXPECT_FALSE(cursor->fetchColumn().has_value());
    EXPECT_EQ(cursor->key(), 3);
    EXPECT_FALSE(cursor->valid());

    cursor->rewind();
    EXPECT_EQ(cursor->fetchColumn(1), text("alice"));
    EXPECT_EQ(cursor->key(), 1);
}

TEST_F(ResultCursorTest, SeekThenNextReturnsThatRow) {
    auto cursor = makeCursor();
    cursor->fetchAll();

    cursor->seek(2);
    auto row = cursor->fetchArray();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ((*row)[1], text("carol"));

    cursor->rewind();
    row = cursor->fetchArray();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ((*row)[1], text("alice"));
}

TEST_F(ResultCursorTest, SeekOutOfRangeThrows) {
    auto cursor = makeCursor();
    EXPECT_THROW(cursor->seek(-1), std::out_of_range);
    EXPECT_THROW(cursor->seek(3), std::out_of_range);
    EXPECT_NO_THROW(cursor->seek(0));
}

TEST_F(ResultCursorTest, EmptyResult) {
    auto cursor = std::make_shared<QueryCursor>(
        std::make_unique<test::FakeResult>(std::vector<std::string>{"id"}, std::vector<domain::OrderedRow>{}));

    EXPECT_EQ(cursor->rowCount(), 0u);
    EXPECT_EQ(cursor->fieldCount(), 1u);
    EXPECT_FALSE(cursor->next().has_value());
    EXPECT_TRUE(cursor->fetchAll().empty());
    EXPECT_THROW(cursor->seek(0), std::out_of_range);
}

TEST_F(ResultCursorTest, ColumnModeByIndexAndName) {
    auto cursor = makeCursor();
    cursor->setFetchMode(FetchMode::Column, 1);
    auto names = cursor->fetchAll();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(std::get<domain::Value>(names[0]), text("alice"));

    cursor = makeCursor();
    cursor->setFetchMode(FetchMode::Column, "id");
    auto ids = cursor->fetchAll();
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(std::get<domain::Value>(ids[2]), text("3"));
}

TEST_F(ResultCursorTest, ColumnModeUnknownColumnThrows) {
    auto cursor = makeCursor();
    cursor->setFetchMode(FetchMode::Column, 5);
    EXPECT_THROW(cursor->next(), std::out_of_range);

    cursor = makeCursor();
    EXPECT_THROW(cursor->fetchColumn("missing"), std::out_of_range);
}

TEST_F(ResultCursorTest, FetchColumnDefaultsToFirstColumn) {
    auto cursor = makeCursor();
    EXPECT_EQ(cursor->fetchColumn(), text("1"));
    EXPECT_EQ(cursor->fetchColumn("name"), text("bob"));
    EXPECT_EQ(cursor->fetchColumn(0), text("3"));
    EXPECT_FALSE(cursor->fetchColumn().has_value());
}

TEST_F(ResultCursorTest, DuplicateColumnNamesKeepLastValue) {
    auto cursor = std::make_shared<QueryCursor>(std::make_unique<test::FakeResult>(
        std::vector<std::string>{"id", "id"}, std::vector<domain::OrderedRow>{{text("1"), text("2")}}));

    auto row = cursor->fetchAssoc();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size(), 1u);
    EXPECT_EQ(row->at("id"), text("2"));

    cursor->rewind();
    EXPECT_EQ(cursor->fetchColumn("id"), text("2"));
}

TEST_F(ResultCursorTest, NullValuesAreMonostate) {
    auto cursor = std::make_shared<QueryCursor>(std::make_unique<test::FakeResult>(
        std::vector<std::string>{"a"}, std::vector<domain::OrderedRow>{{test::null()}}));

    auto value = cursor->fetchColumn();
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(domain::isNull(*value));
    EXPECT_EQ(domain::toString(*value), "");
}

TEST_F(ResultCursorTest, NextAsBuildsUserType) {
    auto cursor = makeCursor();
    auto user = cursor->nextAs<User>();
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->id, "1");
    EXPECT_EQ(user->name, "alice");

    auto object = cursor->fetchObject();
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(object->as<User>().name, "bob");
}

TEST_F(ResultCursorTest, FetchIntoAndFetchRow) {
    auto cursor = makeCursor();
    domain::Row row;

    EXPECT_TRUE(cursor->fetchInto(row, FetchMode::Assoc));
    EXPECT_EQ(std::get<domain::AssocRow>(row).at("name"), text("alice"));

    auto next = cursor->fetchRow();
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(std::holds_alternative<domain::OrderedRow>(*next));

    EXPECT_TRUE(cursor->fetchInto(row));
    EXPECT_FALSE(cursor->fetchInto(row));
}

TEST_F(ResultCursorTest, ColumnNamesAndCount) {
    auto cursor = makeCursor();
    EXPECT_EQ(cursor->columnNames(), (std::vector<std::string>{"id", "name"}));
    EXPECT_EQ(cursor->count(), 3u);
    EXPECT_EQ(cursor->fieldCount(), 2u);
    EXPECT_TRUE(cursor->valid());
}

TEST(FetchModeTest, InvalidModeCodeThrows) {
    EXPECT_EQ(fetchModeFromCode(2), FetchMode::Assoc);
    EXPECT_THROW(fetchModeFromCode(0), std::invalid_argument);
    EXPECT_THROW(fetchModeFromCode(9), std::invalid_argument);
}

TEST(FetchModeTest, BoolIsNotAColumnSelector) {
    static_assert(!std::is_constructible_v<ColumnSelector, bool>);
    static_assert(!std::is_convertible_v<bool, ColumnSelector>);
    static_assert(std::is_constructible_v<ColumnSelector, int>);
    static_assert(std::is_constructible_v<ColumnSelector, std::size_t>);
}

TEST(FetchModeTest, UnsignedValuesBeyondInt64StayExact) {
    EXPECT_EQ(domain::fromUnsigned(42), domain::Value(std::int64_t{42}));
    EXPECT_EQ(domain::fromUnsigned(9223372036854775807ULL), domain::Value(std::int64_t{INT64_MAX}));
    EXPECT_EQ(domain::fromUnsigned(18446744073709551615ULL), text("18446744073709551615"));
    EXPECT_EQ(domain::fromUnsigned(9223372036854775808ULL), text("9223372036854775808"));
}

TEST(FetchModeTest, NegativeColumnIndexThrows) {
    EXPECT_THROW(ColumnSelector(-1), std::invalid_argument);
    EXPECT_EQ(ColumnSelector(3).index(), 3u);
    EXPECT_EQ(ColumnSelector("name").name(), "name");
}

TEST(FetchModeTest, SetFetchModeRejectsUnknownMode) {
    QueryCursor cursor(std::make_unique<test::FakeResult>(std::vector<std::string>{"a"},
                                                          std::vector<domain::OrderedRow>{}));
    EXPECT_THROW(cursor.setFetchMode(static_cast<FetchMode>(7)), std::invalid_argument);
    EXPECT_EQ(cursor.getFetchMode(), FetchMode::Ordered);
}
