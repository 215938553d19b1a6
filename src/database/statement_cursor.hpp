// 预处理语句的结果游标
//
// 驱动把输出缓冲区直接绑定在语句句柄上（每个句柄只有一组），
// 所以同一个 PreparedStatement 任何时候最多只有一个 StatementCursor：
// 再次 execute() 时复用并 reset() 这个游标，而不是新建一个。
//
//   buffer_ ──bindResult()──> DriverStatement
//      ▲                           │
//      └──────── fetch() 原地覆盖 ──┘

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "database/result_cursor.hpp"

namespace mydbd::database {

class StatementCursor : public ResultCursor {
public:
    // fieldNames 只在构造时从结果集元数据读取一次；缓冲区长度等于列数，构造时绑定到语句上
    StatementCursor(std::shared_ptr<DriverStatement> stmt, std::vector<std::string> fieldNames);

    // 回到第 0 行，恢复默认取数模式（Ordered）和对象类型（stdClass）
    StatementCursor& reset();

    std::size_t fieldCount() const override { return buffer_.size(); }
    std::size_t rowCount() const override;

    const std::vector<domain::Value>& boundBuffer() const { return buffer_; }

protected:
    std::optional<domain::OrderedRow> fetchOrderedRow() override;
    const std::vector<std::string>& fieldNames() override;
    void physicalSeek(std::size_t row) override;

private:
    std::shared_ptr<DriverStatement> stmt_;
    std::vector<domain::Value> buffer_;
    std::vector<std::string> fieldNames_;
};

} // namespace mydbd::database
