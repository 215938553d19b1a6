#include <gtest/gtest.h>

#include "core/error.hpp"
#include "database/prepared_statement.hpp"
#include "fake_driver.hpp"
#include "monitoring/query_log.hpp"

using namespace mydbd;
using namespace mydbd::database;
using mydbd::test::integer;
using mydbd::test::text;

class PreparedStatementTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<test::FakeServer>();
        monitoring::QueryLog::instance().clear();
    }

    void TearDown() override {
        monitoring::QueryLog::instance().clear();
    }

    std::unique_ptr<PreparedStatement> makeStatement(core::ConnectionOptions options = {}) {
        return std::make_unique<PreparedStatement>(std::make_unique<test::FakeStatement>(server), options);
    }

    std::shared_ptr<test::FakeServer> server;
};

TEST_F(PreparedStatementTest, TypeHintCountMustMatchPlaceholders) {
    auto sth = makeStatement();
    const std::string query = "SELECT * FROM orders WHERE a = ? AND b = ? AND c = ?";

    EXPECT_THROW(sth->prepare(query, std::vector<ParamType>{ParamType::Integer, ParamType::Integer}),
                 core::TypeMismatchError);

    EXPECT_NO_THROW(sth->prepare(query, std::vector<ParamType>{ParamType::Integer, ParamType::String,
                                                               ParamType::Double}));
    EXPECT_EQ(sth->paramCount(), 3u);

    EXPECT_THROW(sth->execute({integer(1), integer(2)}), core::MismatchError);
}

TEST_F(PreparedStatementTest, ExecuteBeforePrepareThrows) {
    auto sth = makeStatement();
    EXPECT_FALSE(sth->isPrepared());
    EXPECT_THROW(sth->execute(), core::NotPreparedError);
}

TEST_F(PreparedStatementTest, FrozenStatementCannotBePreparedAgain) {
    auto sth = makeStatement();
    sth->prepare("SELECT 1");
    sth->freeze();

    EXPECT_TRUE(sth->isFrozen());
    EXPECT_THROW(sth->prepare("SELECT 2"), core::FrozenStatementError);
    EXPECT_EQ(sth->query(), "SELECT 1");
}

TEST_F(PreparedStatementTest, ReexecuteReusesCursorWithoutBleedThrough) {
    server->on("SELECT id, name FROM users", [](const std::vector<domain::Value>& params) {
        if (params.at(0) == integer(1)) {
            return test::resultSet({"id", "name"}, {{integer(1), text("alice")}, {integer(2), text("bob")}});
        }
        return test::resultSet({"id", "name"}, {{integer(3), text("carol")}});
    });

    auto sth = makeStatement();
    sth->prepare("SELECT id, name FROM users WHERE group_id = ?");

    auto first = sth->execute({integer(1)});
    ASSERT_NE(first, nullptr);
    first->setFetchMode(FetchMode::Assoc);
    auto firstRows = first->fetchAll();
    ASSERT_EQ(firstRows.size(), 2u);
    EXPECT_EQ(std::get<domain::AssocRow>(firstRows[1]).at("name"), text("bob"));

    auto second = sth->execute({integer(2)});
    EXPECT_EQ(second.get(), first.get());
    EXPECT_EQ(second->key(), 0);
    EXPECT_EQ(second->getFetchMode(), FetchMode::Ordered);

    auto secondRows = second->fetchAll();
    ASSERT_EQ(secondRows.size(), 1u);
    EXPECT_EQ(std::get<domain::OrderedRow>(secondRows[0]),
              (domain::OrderedRow{integer(3), text("carol")}));
    EXPECT_EQ(second->rowCount(), 1u);
}

TEST_F(PreparedStatementTest, CursorReadsThroughBoundBuffer) {
    server->on("SELECT v FROM t", test::resultSet({"v"}, {{integer(10)}, {integer(20)}}));

    auto sth = makeStatement();
    sth->prepare("SELECT v FROM t");
    auto cursor = std::dynamic_pointer_cast<StatementCursor>(sth->execute());
    ASSERT_NE(cursor, nullptr);
    EXPECT_EQ(cursor->fieldCount(), 1u);

    ASSERT_TRUE(cursor->next().has_value());
    EXPECT_EQ(cursor->boundBuffer()[0], integer(10));
    ASSERT_TRUE(cursor->next().has_value());
    EXPECT_EQ(cursor->boundBuffer()[0], integer(20));

    EXPECT_EQ(cursor->columnNames(), (std::vector<std::string>{"v"}));
}

TEST_F(PreparedStatementTest, RePrepareRebuildsCursorForNewColumns) {
    server->on("SELECT id FROM t", test::resultSet({"id"}, {{integer(1)}}));
    server->on("SELECT id, name FROM t", test::resultSet({"id", "name"}, {{integer(1), text("alice")}}));

    auto sth = makeStatement();
    sth->prepare("SELECT id FROM t");
    auto first = sth->execute();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->fieldCount(), 1u);

    sth->prepare("SELECT id, name FROM t");
    auto second = std::dynamic_pointer_cast<StatementCursor>(sth->execute());
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second.get(), first.get());
    EXPECT_EQ(second->fieldCount(), 2u);

    auto row = second->fetchAssoc();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size(), 2u);
    ASSERT_NE(row->find("name"), nullptr);
    EXPECT_EQ(row->at("name"), text("alice"));
    EXPECT_EQ(second->boundBuffer(), (std::vector<domain::Value>{integer(1), text("alice")}));
}

TEST_F(PreparedStatementTest, FailedHintCheckLeavesStatementUnprepared) {
    auto sth = makeStatement();
    sth->prepare("SELECT a FROM t");
    ASSERT_TRUE(sth->isPrepared());

    EXPECT_THROW(sth->prepare("DELETE FROM t WHERE a = ? AND b = ?", std::vector<ParamType>{ParamType::Integer}),
                 core::TypeMismatchError);

    EXPECT_FALSE(sth->isPrepared());
    EXPECT_TRUE(sth->query().empty());
    EXPECT_TRUE(sth->paramTypes().empty());
    EXPECT_THROW(sth->execute(), core::NotPreparedError);
    EXPECT_TRUE(server->executed.empty());
}

TEST_F(PreparedStatementTest, FailedPrepareDropsPreviousQuery) {
    server->on("PREPARE SELEC", test::failure(1064, "You have an error in your SQL syntax", "42000"));

    auto sth = makeStatement();
    sth->prepare("SELECT 1");
    EXPECT_THROW(sth->prepare("SELEC 2"), core::SyntaxError);
    EXPECT_FALSE(sth->isPrepared());
    EXPECT_THROW(sth->execute(), core::NotPreparedError);
}

TEST_F(PreparedStatementTest, FieldNamesReadFromMetadataOnce) {
    server->on("SELECT id, name FROM users", test::resultSet({"id", "name"}, {{integer(1), text("alice")}}));

    auto sth = makeStatement();
    sth->prepare("SELECT id, name FROM users");

    auto cursor = sth->execute();
    ASSERT_TRUE(cursor->fetchAssoc().has_value());
    cursor = sth->execute();
    auto row = cursor->fetchAssoc();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->at("name"), text("alice"));

    EXPECT_EQ(server->metadataCalls, 1u);
}

TEST_F(PreparedStatementTest, CursorObjectAndColumnModes) {
    server->on("SELECT id, name FROM users",
               test::resultSet({"id", "name"}, {{integer(1), text("alice")}, {integer(2), text("bob")}}));

    auto sth = makeStatement();
    sth->prepare("SELECT id, name FROM users");

    auto cursor = sth->execute();
    cursor->setFetchMode(FetchMode::Object, "User");
    auto object = cursor->next();
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(std::get<domain::ObjectRow>(*object).typeName, "User");
    EXPECT_EQ(std::get<domain::ObjectRow>(*object).get("name"), text("alice"));

    cursor->setFetchMode(FetchMode::Column, "name");
    auto value = cursor->next();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(std::get<domain::Value>(*value), text("bob"));
    EXPECT_FALSE(cursor->next().has_value());

    // 重新执行后恢复默认模式
    cursor = sth->execute();
    EXPECT_EQ(cursor->getFetchMode(), FetchMode::Ordered);
    EXPECT_EQ(cursor->fetchColumn(1), text("alice"));
    EXPECT_EQ(cursor->fetchColumn(), integer(2));
}

TEST_F(PreparedStatementTest, ParamTypesInferredFromFirstExecute) {
    auto sth = makeStatement();
    sth->prepare("UPDATE stock SET qty = ? WHERE sku = ?");

    sth->execute({integer(5), text("A-1")});
    EXPECT_EQ(sth->paramTypes(), (std::vector<ParamType>{ParamType::Integer, ParamType::String}));

    // 类型已经固定，后续的值按固定类型转换
    sth->execute({text("7 units"), integer(42)});
    ASSERT_EQ(server->boundParams.size(), 2u);
    EXPECT_EQ(server->boundParams[1], (std::vector<domain::Value>{integer(7), text("42")}));
    EXPECT_EQ(server->boundTypes[1], server->boundTypes[0]);
}

TEST_F(PreparedStatementTest, TypeHintsCoerceValues) {
    auto sth = makeStatement();
    sth->prepare("INSERT INTO prices (amount) VALUES (?)", std::vector<ParamType>{ParamType::Double});

    sth->execute({integer(3)});
    ASSERT_EQ(server->boundParams.size(), 1u);
    EXPECT_EQ(server->boundParams[0][0], domain::Value(3.0));
    EXPECT_EQ(server->boundTypes[0][0], ParamType::Double);
}

TEST_F(PreparedStatementTest, NullParamsStayNull) {
    auto sth = makeStatement();
    sth->prepare("UPDATE t SET a = ?", std::vector<ParamType>{ParamType::Integer});
    sth->execute({test::null()});
    EXPECT_TRUE(domain::isNull(server->boundParams[0][0]));
}

TEST_F(PreparedStatementTest, StatementWithoutResultReturnsNull) {
    server->on("DELETE FROM sessions", test::affected(4));

    auto sth = makeStatement();
    sth->prepare("DELETE FROM sessions WHERE expired < ?");
    EXPECT_EQ(sth->execute({integer(100)}), nullptr);
    EXPECT_EQ(sth->getAffectedRows(), 4u);
    EXPECT_EQ(sth->affectedRows(), 4u);
}

TEST_F(PreparedStatementTest, DriverErrorsAreMapped) {
    server->on("INSERT INTO users", test::failure(1062, "Duplicate entry 'bob' for key 'name'", "23000"));

    auto sth = makeStatement();
    sth->prepare("INSERT INTO users (name) VALUES (?)");

    try {
        sth->execute({text("bob")});
        FAIL() << "expected AlreadyExistsError";
    } catch (const core::AlreadyExistsError& e) {
        EXPECT_EQ(e.code(), 1062u);
        EXPECT_EQ(e.sqlState(), "23000");
        EXPECT_EQ(e.query(), "INSERT INTO users (name) VALUES (?)");
    }
}

TEST_F(PreparedStatementTest, PrepareErrorsAreMapped) {
    server->on("PREPARE SELEC", test::failure(1064, "You have an error in your SQL syntax", "42000"));

    auto sth = makeStatement();
    EXPECT_THROW(sth->prepare("SELEC 1"), core::SyntaxError);
    EXPECT_FALSE(sth->isPrepared());
}

TEST_F(PreparedStatementTest, AffectedRowsTrackerFollowsExecute) {
    server->on("UPDATE", test::affected(3));

    auto tracker = std::make_shared<AffectedRowsTracker>();
    PreparedStatement sth(std::make_unique<test::FakeStatement>(server), {}, tracker);
    test::FakeLink link(server);

    EXPECT_EQ(tracker->affectedRows(link), 0u);

    sth.prepare("UPDATE t SET a = 1");
    EXPECT_EQ(tracker->affectedRows(link), 0u);    // 只有 execute 才算

    sth.execute();
    EXPECT_EQ(tracker->affectedRows(link), 3u);
}

TEST_F(PreparedStatementTest, QueryLogRecordsPrepareAndExecute) {
    core::ConnectionOptions options;
    options.queryLog = true;

    auto sth = makeStatement(options);
    sth->prepare("SELECT * FROM t WHERE id = ?");
    sth->execute({integer(9)});

    auto logs = monitoring::QueryLog::instance().getLogs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].command, "prepare");
    EXPECT_EQ(logs[0].query, "SELECT * FROM t WHERE id = ?");
    EXPECT_EQ(logs[1].command, "execute");
    EXPECT_EQ(logs[1].query, "SELECT * FROM t WHERE id = 9");
}

TEST_F(PreparedStatementTest, QueryLogDisabledByDefault) {
    auto sth = makeStatement();
    sth->prepare("SELECT 1");
    sth->execute();
    EXPECT_TRUE(monitoring::QueryLog::instance().getLogs().empty());
}

TEST(ParamCoercionTest, InferAndCoerce) {
    EXPECT_EQ(inferParamType(integer(1)), ParamType::Integer);
    EXPECT_EQ(inferParamType(domain::Value(1.5)), ParamType::Double);
    EXPECT_EQ(inferParamType(text("x")), ParamType::String);
    EXPECT_EQ(inferParamType(test::null()), ParamType::String);

    EXPECT_EQ(coerceParam(domain::Value(2.9), ParamType::Integer), integer(2));
    EXPECT_EQ(coerceParam(text("abc"), ParamType::Integer), integer(0));
    EXPECT_EQ(coerceParam(text("2.5"), ParamType::Double), domain::Value(2.5));
    EXPECT_EQ(coerceParam(integer(12), ParamType::String), text("12"));
}
