// 进程级的 SQL 命令日志（只追加），记录耗时和调用路径，并提供简单的统计
//
// 调用路径由应用代码通过 MYDBD_CALL_SITE() 压入的帧组成（外层在前），
// 库内部不压帧，所以日志里只会出现调用方的位置。

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/row_models.hpp"

namespace mydbd::monitoring {

// 单条日志
struct QueryLogEntry {
    std::string command;    // "query"、"prepare" 或 "execute"
    std::string query;  // 占位符已替换为参数值（仅用于展示）
    double duration{0.0};   // 毫秒
    std::vector<std::string> callPath;  // "frame:line"，外层在前
};

struct QueryStats {
    double totalTime{0.0};  // 所有命令的总耗时（毫秒）
    std::size_t totalQueries{0};    // 除 prepare 之外的命令数
    double maxTime{0.0};    // 最慢的一条命令
};

// 调用帧（RAII）：构造时压栈，析构时出栈，每个线程一个栈
class CallSite {
public:
    CallSite(std::string frame, int line);
    ~CallSite();

    CallSite(const CallSite&) = delete;
    CallSite& operator=(const CallSite&) = delete;

    static std::vector<std::string> currentPath();
};

class QueryLog {
public:
    static QueryLog& instance();

    // 记录一条命令；params 只用于替换展示文本中的 ?，不影响实际执行的 SQL
    void log(const std::string& command, const std::string& query,
             const std::optional<std::vector<domain::Value>>& params, double durationMs);

    // sortByDuration 为 true 时按耗时降序（耗时相同保持原顺序）
    std::vector<QueryLogEntry> getLogs(bool sortByDuration = false) const;

    QueryStats getGlobalStats() const;

    void clear();

    // 日志和统计的 JSON 快照
    nlohmann::json toJson() const;

    // 按位置把 ? 替换成参数值，参数不够时保留剩下的 ?
    static std::string resolvePlaceholders(const std::string& query,
                                           const std::vector<domain::Value>& params);

private:
    QueryLog() = default;

    mutable std::mutex mutex_;
    std::vector<QueryLogEntry> logs_;
};

// 从 start 到现在经过的毫秒数
inline double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace mydbd::monitoring

#define MYDBD_CONCAT_INNER(a, b) a##b
#define MYDBD_CONCAT(a, b) MYDBD_CONCAT_INNER(a, b)
#define MYDBD_CALL_SITE() ::mydbd::monitoring::CallSite MYDBD_CONCAT(mydbdCallSite_, __LINE__)(__func__, __LINE__)
