#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/configuration.hpp"
#include "database/driver.hpp"
#include "database/statement_cursor.hpp"

namespace mydbd::database {

// 记录最近一次设置 affected rows 的句柄：连接本身或某个语句
// Connection 和它创建的所有语句共享同一个实例
class AffectedRowsTracker {
public:
    void markLink();
    void markStatement(std::shared_ptr<DriverStatement> stmt);

    // 还没有执行过任何语句时返回 0
    std::uint64_t affectedRows(const DriverLink& link) const;

private:
    enum class Source { None, Link, Statement };

    Source source_{Source::None};
    std::shared_ptr<DriverStatement> statement_;
};

class PreparedStatement {
public:
    // 由 Connection::prepare() 创建
    PreparedStatement(std::unique_ptr<DriverStatement> stmt, core::ConnectionOptions options,
                      std::shared_ptr<AffectedRowsTracker> tracker = nullptr);

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    // 预处理 SQL，占位符为 ?（合法位置由服务端检查）
    // typeHints 给出时个数必须等于占位符个数，否则抛 TypeMismatchError；
    // 不给时由第一次 execute() 的参数类型推断
    void prepare(const std::string& query,
                 std::optional<std::vector<ParamType>> typeHints = std::nullopt);

    // 执行：参数个数必须等于占位符个数
    // 有结果集时返回本语句唯一的游标（重复执行时复用并 reset），否则返回 nullptr
    std::shared_ptr<ResultCursor> execute(const std::vector<domain::Value>& params = {});

    // 冻结后不能再 prepare()，可以安全地放进缓存共享
    void freeze() { frozen_ = true; }
    bool isFrozen() const { return frozen_; }

    // 上一次 execute() 影响的行数（execute 之前是驱动的旧值）
    std::uint64_t getAffectedRows() const;
    std::uint64_t affectedRows() const { return getAffectedRows(); }

    bool isPrepared() const { return preparedQuery_.has_value(); }
    const std::string& query() const;
    std::size_t paramCount() const;
    const std::vector<ParamType>& paramTypes() const { return types_; }

private:
    void bindParams(const std::vector<domain::Value>& params);
    void handleErrors(const std::string& query);

    std::shared_ptr<DriverStatement> stmt_;
    core::ConnectionOptions options_;
    std::shared_ptr<AffectedRowsTracker> tracker_;

    std::optional<std::string> preparedQuery_;
    std::vector<ParamType> types_;
    bool typesFixed_{false};
    bool frozen_{false};

    std::shared_ptr<StatementCursor> cursor_;   // 最多一个
};

// 由参数的运行时类型推断绑定类型：整数 → Integer，浮点 → Double，其余 → String
ParamType inferParamType(const domain::Value& value);

// 按已经固定的绑定类型转换参数值（NULL 保持 NULL）
domain::Value coerceParam(const domain::Value& value, ParamType type);

} // namespace mydbd::database
