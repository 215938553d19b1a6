// PEAR::Db 兼容层：用新接口（query + 游标）组合出旧库的调用方式和返回形态，
// 方便旧代码迁移。Connection 继承这个基类，每个旧接口都是一个具名方法。

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "database/prepared_statement.hpp"
#include "database/result_cursor.hpp"
#include "domain/row_models.hpp"

namespace mydbd::compat {

// 旧接口的取数模式：Default 表示使用连接上 setFetchMode() 设置的值，没设置过则为 Ordered
enum class LegacyFetchMode {
    Default,
    Ordered,
    Assoc,
    Object
};

// getAssoc 的值：不分组时是一行（或两列结果时的单个值），分组时是一组行
using AssocValue = std::variant<domain::Row, std::vector<domain::Row>>;
using AssocResult = domain::OrderedMap<AssocValue>;

class PearConnection {
public:
    virtual ~PearConnection() = default;

    virtual std::shared_ptr<database::ResultCursor> query(const std::string& text,
                                                          const std::vector<domain::Value>& params = {}) = 0;
    virtual bool begin() = 0;
    virtual std::uint64_t getAffectedRows() const = 0;

    void setFetchMode(LegacyFetchMode mode) { defaultFetchMode_ = mode; }
    database::FetchMode resolveFetchMode(LegacyFetchMode mode) const;

    bool isError() const { return false; }

    // 只支持 autoCommit(false)（开始事务）
    void autoCommit(bool state);

    std::uint64_t affectedRows() const { return getAffectedRows(); }

    std::shared_ptr<database::ResultCursor> execute(database::PreparedStatement& statement,
                                                    const std::vector<domain::Value>& params = {});

    // 第一行没有该列时抛 NoSuchFieldError
    std::vector<domain::Value> getCol(const std::string& text, const database::ColumnSelector& column = {},
                                      const std::vector<domain::Value>& params = {});

    std::optional<domain::Value> getOne(const std::string& text, const std::vector<domain::Value>& params = {});

    std::optional<domain::Row> getRow(const std::string& text, const std::vector<domain::Value>& params = {},
                                      LegacyFetchMode mode = LegacyFetchMode::Default);

    std::vector<domain::Row> getAll(const std::string& text, const std::vector<domain::Value>& params = {},
                                    LegacyFetchMode mode = LegacyFetchMode::Default);

    // 以第一列为键组织结果：
    //  - 少于两列抛 TruncatedError
    //  - 两列且不强制数组：键 → 第二列的值
    //  - 多于两列或 forceArray：键 → 去掉第一列后的行（形态由 mode 决定）
    //  - group 为 true 时同一个键的值收集成列表，否则后出现的覆盖先出现的
    AssocResult getAssoc(const std::string& text, bool forceArray = false,
                         const std::vector<domain::Value>& params = {},
                         LegacyFetchMode mode = LegacyFetchMode::Default, bool group = false);

private:
    std::shared_ptr<database::ResultCursor> queryResult(const std::string& text,
                                                        const std::vector<domain::Value>& params);

    std::optional<LegacyFetchMode> defaultFetchMode_;
};

} // namespace mydbd::compat
