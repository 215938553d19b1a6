#include "monitoring/query_log.hpp"

#include <algorithm>

#include "core/logger.hpp"

namespace mydbd::monitoring {
namespace {

thread_local std::vector<std::string> t_callStack;

} // namespace

CallSite::CallSite(std::string frame, int line) {
    t_callStack.push_back(std::move(frame) + ":" + std::to_string(line));
}

CallSite::~CallSite() {
    t_callStack.pop_back();
}

std::vector<std::string> CallSite::currentPath() {
    return t_callStack;
}

QueryLog& QueryLog::instance() {
    static QueryLog instance;
    return instance;
}

void QueryLog::log(const std::string& command, const std::string& query,
                   const std::optional<std::vector<domain::Value>>& params, double durationMs) {
    QueryLogEntry entry;
    entry.command = command;
    entry.query = params ? resolvePlaceholders(query, *params) : query;
    entry.duration = durationMs;
    entry.callPath = CallSite::currentPath();

    MYDBD_LOG_DEBUG("query_log", entry.command, " ", entry.query, " (", durationMs, " ms)");

    std::lock_guard<std::mutex> lk(mutex_);
    logs_.push_back(std::move(entry));
}

std::vector<QueryLogEntry> QueryLog::getLogs(bool sortByDuration) const {
    std::vector<QueryLogEntry> copy;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        copy = logs_;
    }

    if (sortByDuration) {
        std::stable_sort(copy.begin(), copy.end(),
                         [](const QueryLogEntry& a, const QueryLogEntry& b) { return a.duration > b.duration; });
    }
    return copy;
}

QueryStats QueryLog::getGlobalStats() const {
    std::lock_guard<std::mutex> lk(mutex_);

    QueryStats stats;
    for (const auto& entry : logs_) {
        if (entry.command != "prepare") {
            ++stats.totalQueries;
        }
        stats.totalTime += entry.duration;
        stats.maxTime = std::max(stats.maxTime, entry.duration);
    }
    return stats;
}

void QueryLog::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    logs_.clear();
}

nlohmann::json QueryLog::toJson() const {
    auto stats = getGlobalStats();
    nlohmann::json json;
    json["stats"] = {
        {"totalTime", stats.totalTime},
        {"totalQueries", stats.totalQueries},
        {"maxTime", stats.maxTime}
    };

    json["logs"] = nlohmann::json::array();
    for (const auto& entry : getLogs()) {
        json["logs"].push_back({
            {"command", entry.command},
            {"query", entry.query},
            {"duration", entry.duration},
            {"callpath", entry.callPath}
        });
    }
    return json;
}

std::string QueryLog::resolvePlaceholders(const std::string& query,
                                          const std::vector<domain::Value>& params) {
    std::string resolved;
    resolved.reserve(query.size());

    std::size_t next = 0;
    for (char c : query) {
        if (c == '?' && next < params.size()) {
            resolved += domain::toString(params[next++]);
        } else {
            resolved += c;
        }
    }
    return resolved;
}

} // namespace mydbd::monitoring
