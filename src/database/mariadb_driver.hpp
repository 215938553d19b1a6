// MariaDB Connector/C 实现的驱动（DriverLink / DriverStatement / DriverResult）

#pragma once

#include <mariadb/mysql.h>

#include <memory>
#include <string>
#include <vector>

#include "database/driver.hpp"

// mysql API基础概念
// MYSQL* handle
//   ├─ 代表一个数据库连接的生命周期
//   ├─ mysql_init() 创建，mysql_real_connect() 建立真实连接
//   ├─ mysql_real_query() 执行 SQL，mysql_store_result() 获取结果
//   └─ mysql_close() 关闭连接
//
// MYSQL_STMT* 预处理语句
//   ├─ mysql_stmt_prepare() / mysql_stmt_bind_param() / mysql_stmt_execute()
//   ├─ mysql_stmt_bind_result() 绑定输出缓冲区（每个语句句柄只有一组）
//   └─ mysql_stmt_fetch() 把下一行写进绑定的缓冲区

namespace mydbd::database {

class MariaDbResult : public DriverResult {
public:
    explicit MariaDbResult(MYSQL_RES* result);
    ~MariaDbResult() override;

    MariaDbResult(const MariaDbResult&) = delete;
    MariaDbResult& operator=(const MariaDbResult&) = delete;

    std::size_t fieldCount() const override;
    std::size_t rowCount() const override;
    std::vector<std::string> fieldNames() const override;
    void dataSeek(std::size_t row) override;
    std::optional<domain::OrderedRow> fetchRow() override;

private:
    MYSQL_RES* result_{nullptr};
};

class MariaDbStatement : public DriverStatement {
public:
    explicit MariaDbStatement(MYSQL_STMT* stmt);
    ~MariaDbStatement() override;

    MariaDbStatement(const MariaDbStatement&) = delete;
    MariaDbStatement& operator=(const MariaDbStatement&) = delete;

    bool prepare(const std::string& query) override;
    std::size_t paramCount() const override;
    bool bindParams(const std::vector<ParamType>& types,
                    const std::vector<domain::Value>& values) override;
    bool execute() override;
    bool storeResult() override;
    std::optional<std::vector<std::string>> resultFieldNames() override;
    bool bindResult(std::vector<domain::Value>* buffer) override;
    bool fetch() override;
    void dataSeek(std::size_t row) override;
    std::size_t rowCount() const override;
    std::uint64_t affectedRows() const override;
    DriverError lastError() const override;

private:
    // 参数缓冲区：MYSQL_BIND 只保存指针，数据必须活到 execute() 之后
    struct ParamSlot {
        long long integer{0};
        double real{0.0};
        std::string text;
        unsigned long length{0};
        my_bool isNull{0};
    };

    // 结果列缓冲区
    struct ResultSlot {
        enum_field_types type{MYSQL_TYPE_STRING};
        bool isUnsigned{false};
        long long integer{0};
        double real{0.0};
        std::vector<char> text;
        unsigned long length{0};
        my_bool isNull{0};
        my_bool error{0};
    };

    MYSQL_STMT* stmt_{nullptr};
    std::vector<ParamSlot> params_;
    std::vector<MYSQL_BIND> paramBinds_;
    std::vector<ResultSlot> results_;
    std::vector<MYSQL_BIND> resultBinds_;
    std::vector<domain::Value>* output_{nullptr};
};

class MariaDbLink : public DriverLink {
public:
    MariaDbLink();
    ~MariaDbLink() override;

    MariaDbLink(const MariaDbLink&) = delete;
    MariaDbLink& operator=(const MariaDbLink&) = delete;

    void setConnectTimeout(unsigned seconds) override;
    bool connect(const core::ConnectionInfo& info, unsigned flags) override;
    bool ping() override;
    bool close() override;
    QueryOutcome query(const std::string& sql) override;
    std::unique_ptr<DriverStatement> createStatement() override;
    std::uint64_t affectedRows() const override;
    std::uint64_t insertId() const override;
    unsigned long threadId() const override;
    bool kill(unsigned long processId) override;
    bool autocommit(bool enabled) override;
    bool commit() override;
    bool rollback() override;
    DriverError lastError() const override;

private:
    bool initialize();  // 创建 MySQL 上下文（不建立真实连接）

    MYSQL* handle_{nullptr};
    unsigned connectTimeout_{0};
};

// 创建一个未连接的 MariaDB 驱动句柄，交给 Connection 管理
std::unique_ptr<DriverLink> createMariaDbLink();

} // namespace mydbd::database
