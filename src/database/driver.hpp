// 底层客户端库的抽象接口
//
// DriverLink
//   ├─ 一个数据库连接的生命周期（connect / ping / close）
//   ├─ query() 执行 SQL，有结果集时返回 DriverResult（已全部缓存到客户端）
//   └─ createStatement() 分配一个预处理语句句柄
//
// DriverResult
//   └─ 直接查询的结果集：行数、列数、列名、data_seek、逐行读取
//
// DriverStatement
//   ├─ prepare / bindParams / execute / storeResult
//   └─ bindResult() 绑定输出缓冲区，之后每次 fetch() 原地覆盖缓冲区内容

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/configuration.hpp"
#include "domain/row_models.hpp"

namespace mydbd::database {

// 客户端连接标志（由 ConnectionOptions 计算）
enum ClientFlag : unsigned {
    ClientCompress = 1u << 0,
    ClientSsl = 1u << 1,
    ClientFoundRows = 1u << 2,
    ClientIgnoreSpace = 1u << 3,
    ClientInteractive = 1u << 4
};

// 预处理语句参数类型
enum class ParamType {
    String,
    Integer,
    Double,
    Blob
};

// 错误状态（每次操作之后都可以读取）
struct DriverError {
    unsigned code{0};
    std::string message;
    std::string sqlState;
};

class DriverResult {
public:
    virtual ~DriverResult() = default;

    virtual std::size_t fieldCount() const = 0;
    virtual std::size_t rowCount() const = 0;
    virtual std::vector<std::string> fieldNames() const = 0;

    // 移动物理游标到指定行
    virtual void dataSeek(std::size_t row) = 0;

    // 读取下一行，没有更多行时返回 nullopt
    virtual std::optional<domain::OrderedRow> fetchRow() = 0;
};

class DriverStatement {
public:
    virtual ~DriverStatement() = default;

    virtual bool prepare(const std::string& query) = 0;
    virtual std::size_t paramCount() const = 0;

    // types 与 values 长度都等于 paramCount()
    virtual bool bindParams(const std::vector<ParamType>& types,
                            const std::vector<domain::Value>& values) = 0;

    virtual bool execute() = 0;
    virtual bool storeResult() = 0;

    // 结果集元数据：没有结果集时返回 nullopt
    virtual std::optional<std::vector<std::string>> resultFieldNames() = 0;

    // 绑定输出缓冲区：buffer 的生命周期由调用方保证，fetch() 会原地覆盖它
    virtual bool bindResult(std::vector<domain::Value>* buffer) = 0;

    // 读取下一行到绑定的缓冲区，没有更多行时返回 false
    virtual bool fetch() = 0;

    virtual void dataSeek(std::size_t row) = 0;
    virtual std::size_t rowCount() const = 0;
    virtual std::uint64_t affectedRows() const = 0;

    virtual DriverError lastError() const = 0;
};

class DriverLink {
public:
    virtual ~DriverLink() = default;

    virtual void setConnectTimeout(unsigned seconds) = 0;

    // 建立真实连接，失败返回 false，错误信息见 lastError()
    virtual bool connect(const core::ConnectionInfo& info, unsigned flags) = 0;
    virtual bool ping() = 0;
    virtual bool close() = 0;

    // 执行 SQL：出错时 ok 为 false；有结果集时 result 非空
    struct QueryOutcome {
        bool ok{false};
        std::unique_ptr<DriverResult> result;
    };
    virtual QueryOutcome query(const std::string& sql) = 0;

    virtual std::unique_ptr<DriverStatement> createStatement() = 0;

    virtual std::uint64_t affectedRows() const = 0;
    virtual std::uint64_t insertId() const = 0;
    virtual unsigned long threadId() const = 0;
    virtual bool kill(unsigned long processId) = 0;
    virtual bool autocommit(bool enabled) = 0;
    virtual bool commit() = 0;
    virtual bool rollback() = 0;

    virtual DriverError lastError() const = 0;
};

} // namespace mydbd::database
