// 数据库连接
//
// Connection
//   ├─ 持有 DriverLink，第一次需要时才真正连接（连接断开后也会自动重连）
//   ├─ query()：没有参数时直接执行，有参数时走预处理语句
//   ├─ 只读模式：拒绝写语句（norepli_ 表和临时表除外）
//   ├─ 在 SQL 末尾追加注释形式的附加信息，方便 DBA 定位来源
//   └─ 预处理语句缓存（按 SQL 文本）

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "compat/pear_compat.hpp"
#include "core/configuration.hpp"
#include "database/driver.hpp"
#include "database/prepared_statement.hpp"
#include "database/result_cursor.hpp"

namespace mydbd::database {

class Connection : public compat::PearConnection {
public:
    // 构造时不连接
    explicit Connection(std::unique_ptr<DriverLink> link, core::ConnectionInfo info = {},
                        core::ConnectionOptions options = {});
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // 建立连接，失败抛 ConnectFailedError
    Connection& connect();

    // 执行 SQL：没有结果集的语句返回 nullptr
    std::shared_ptr<ResultCursor> query(const std::string& text,
                                        const std::vector<domain::Value>& params = {}) override;

    std::shared_ptr<PreparedStatement> prepare(const std::string& text,
                                               std::optional<std::vector<ParamType>> typeHints = std::nullopt);

    // 同一段 SQL 返回同一个已冻结的语句，调用方不能再对它 prepare()
    std::shared_ptr<PreparedStatement> prepareCached(const std::string& text,
                                                     std::optional<std::vector<ParamType>> typeHints = std::nullopt);

    // 事务
    bool begin() override;
    bool commit();
    bool rollback();

    bool kill(unsigned long processId);
    unsigned long threadId();

    // 没有连接时返回 false 而不是抛异常
    bool ping();

    // 已经断开时返回 nullopt
    std::optional<bool> disconnect();

    std::uint64_t getInsertId();

    // 最近一次直接查询或语句执行影响的行数
    std::uint64_t getAffectedRows() const override;

    // 附加信息：value 为 nullopt 时删除该键
    // 查询级的信息只对下一次 query() 有效，连接级的一直保留
    Connection& setExtendedQueryInfo(const std::string& key, std::optional<std::string> value);
    void flushExtendedQueryInfo();
    Connection& setExtendedConnectionInfo(const std::string& key, std::optional<std::string> value = std::nullopt);
    void flushExtendedConnectionInfo();

    Connection& setReadOnly(bool readonly);
    bool isReadOnly() const { return options_.readonly; }

    // 空闲多少秒后服务端断开连接，0 表示恢复默认的 28800
    Connection& setAutoDisconnect(unsigned seconds);

    // 只读连接（从库）的复制延迟，主库返回 0，未知返回 nullopt
    std::optional<std::int64_t> getReplicationDelay();
    bool isRealtime();

    // 服务端是否支持某个存储引擎（不区分大小写）
    bool hasEngine(const std::string& engine);

    bool isConnected() const { return connected_; }
    const core::ConnectionOptions& options() const { return options_; }

private:
    // 返回可用的连接；未连接时 autoconnect 为 false 则抛 NotConnectedError
    DriverLink& link(bool autoconnect = true);
    void handleErrors(const std::string& query = "");

    unsigned clientFlags() const;
    void injectExtendedInfo(std::string& query);
    void checkReadonlyQuery(const std::string& query) const;

    std::unique_ptr<DriverLink> link_;
    core::ConnectionInfo info_;
    core::ConnectionOptions options_;
    bool connected_{false};

    std::shared_ptr<AffectedRowsTracker> tracker_;
    std::unordered_map<std::string, std::shared_ptr<PreparedStatement>> statementCache_;

    domain::OrderedMap<std::string> extendedQueryInfo_;
    domain::OrderedMap<std::string> extendedConnectionInfo_;

    std::optional<std::optional<std::int64_t>> replicationDelay_;
    std::optional<bool> realtime_;
    std::optional<std::set<std::string>> engines_;
};

} // namespace mydbd::database
