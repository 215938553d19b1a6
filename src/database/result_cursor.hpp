// 结果集游标：一个查询结果上的单向（可 seek）视图，支持四种取数模式
//
// ResultCursor（抽象）
//   ├─ QueryCursor       直接查询的结果（DriverResult，结果已全部缓存在客户端）
//   └─ StatementCursor   预处理语句的结果（绑定缓冲区，见 statement_cursor.hpp）

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "database/driver.hpp"
#include "domain/row_models.hpp"

namespace mydbd::database {

// 取数模式（数值与旧接口的常量保持一致）
enum class FetchMode {
    Ordered = 1,    // 按列序号的数组
    Assoc = 2,  // 按列名的映射
    Object = 3, // 对象（字段集合 + 类型名）
    Column = 4  // 只取某一列的值
};

// 数值 → FetchMode，非法值抛 std::invalid_argument
FetchMode fetchModeFromCode(int code);

// 列选择器：列序号或列名
class ColumnSelector {
public:
    ColumnSelector() = default;

    // bool 不是列序号
    template <typename T, typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
    ColumnSelector(T index) {
        if constexpr (std::is_signed_v<T>) {
            if (index < 0) {
                throw std::invalid_argument("Invalid column index: " + std::to_string(index));
            }
        }
        value_ = static_cast<std::size_t>(index);
    }

    ColumnSelector(std::string name) : value_(std::move(name)) {}
    ColumnSelector(const char* name) : value_(std::string(name)) {}

    bool isIndex() const { return std::holds_alternative<std::size_t>(value_); }
    std::size_t index() const { return std::get<std::size_t>(value_); }
    const std::string& name() const { return std::get<std::string>(value_); }

    std::string describe() const { return isIndex() ? std::to_string(index()) : name(); }

private:
    std::variant<std::size_t, std::string> value_{std::size_t{0}};
};

class ResultCursor {
public:
    static constexpr const char* kDefaultObjectType = "stdClass";

    ResultCursor() = default;
    virtual ~ResultCursor() = default;

    ResultCursor(const ResultCursor&) = delete;
    ResultCursor& operator=(const ResultCursor&) = delete;

    // 设置 next()/fetchAll() 使用的默认取数模式
    // arg：Object 模式下是目标类型名（字符串），Column 模式下是列选择器（默认第 0 列）
    ResultCursor& setFetchMode(FetchMode mode, ColumnSelector arg = {});
    FetchMode getFetchMode() const { return mode_; }

    virtual std::size_t fieldCount() const = 0;
    virtual std::size_t rowCount() const = 0;
    std::size_t count() const { return rowCount(); }

    // 结果集的列名（按列顺序）
    std::vector<std::string> columnNames() { return fieldNames(); }

    // 当前位置（下一次 next() 读取的行号）
    long key() const { return position_; }
    bool valid() const;

    // 前进一行并按取数模式返回，已经没有行时返回 nullopt
    std::optional<domain::Row> next();
    std::optional<domain::Row> next(FetchMode mode);

    // 查看当前行但不消费（next() 之后再 seek 回去）
    std::optional<domain::Row> current();

    // position < 0 或 > rowCount()-1 时抛 std::out_of_range
    void seek(long position);
    void rewind() { seek(0); }

    // 从当前位置读到末尾
    std::vector<domain::Row> fetchAll();

    // 读取下一行中的一个字段：列不存在抛 std::out_of_range，没有下一行返回 nullopt
    std::optional<domain::Value> fetchColumn(const ColumnSelector& column = {});

    std::optional<domain::OrderedRow> fetchArray();
    std::optional<domain::AssocRow> fetchAssoc();
    std::optional<domain::ObjectRow> fetchObject();

    // 下一行构造为用户类型 T（要求 T(const AssocRow&)）
    template <typename T>
    std::optional<T> nextAs() {
        auto row = fetchAssoc();
        if (!row) {
            return std::nullopt;
        }
        return T(*row);
    }

    // PEAR::Db 兼容
    std::optional<domain::Row> fetchRow(std::optional<FetchMode> mode = std::nullopt);
    bool fetchInto(domain::Row& row, std::optional<FetchMode> mode = std::nullopt);

protected:
    // 物理读取下一行（按列顺序），没有更多行时返回 nullopt
    virtual std::optional<domain::OrderedRow> fetchOrderedRow() = 0;
    virtual const std::vector<std::string>& fieldNames() = 0;
    virtual void physicalSeek(std::size_t row) = 0;

    // 回到第 0 行，恢复默认取数模式和对象类型
    void resetState();

private:
    std::optional<domain::Row> fetchAs(FetchMode mode);
    domain::Value extractColumn(const domain::OrderedRow& row, const ColumnSelector& column);

    long position_{0};
    FetchMode mode_{FetchMode::Ordered};
    ColumnSelector column_;
    std::string objectType_{kDefaultObjectType};
};

// 直接查询（mysql_query + mysql_store_result）的结果
class QueryCursor : public ResultCursor {
public:
    explicit QueryCursor(std::unique_ptr<DriverResult> result);

    std::size_t fieldCount() const override;
    std::size_t rowCount() const override;

protected:
    std::optional<domain::OrderedRow> fetchOrderedRow() override;
    const std::vector<std::string>& fieldNames() override;
    void physicalSeek(std::size_t row) override;

private:
    std::unique_ptr<DriverResult> result_;
    std::optional<std::vector<std::string>> fieldNames_;
};

} // namespace mydbd::database
