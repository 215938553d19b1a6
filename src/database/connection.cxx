#include "database/connection.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <regex>

#include "core/error.hpp"
#include "core/logger.hpp"
#include "monitoring/query_log.hpp"

namespace mydbd::database {
namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// 把注释结束符 */ 替换为 *\/，避免附加信息提前结束注释
std::string escapeCommentEnd(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '*' && i + 1 < text.size() && text[i + 1] == '/') {
            escaped += "*\\/";
            ++i;
        } else {
            escaped += text[i];
        }
    }
    return escaped;
}

std::optional<std::int64_t> toInteger(const domain::Value& value) {
    if (auto i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    if (auto d = std::get_if<double>(&value)) {
        return static_cast<std::int64_t>(*d);
    }
    if (auto s = std::get_if<std::string>(&value)) {
        return static_cast<std::int64_t>(std::strtoll(s->c_str(), nullptr, 10));
    }
    return std::nullopt;
}

} // namespace

Connection::Connection(std::unique_ptr<DriverLink> link, core::ConnectionInfo info, core::ConnectionOptions options)
    : link_(std::move(link))
    , info_(std::move(info))
    , options_(options)
    , tracker_(std::make_shared<AffectedRowsTracker>()) {
}

Connection::~Connection() {
    statementCache_.clear();
    if (connected_) {
        link_->close();
    }
}

Connection& Connection::connect() {
    // 连接已经失效：释放旧句柄，缓存的语句属于旧连接，一起丢掉
    if (connected_) {
        link_->close();
        connected_ = false;
        statementCache_.clear();
    }

    if (options_.connectTimeout > 0) {
        link_->setConnectTimeout(options_.connectTimeout);
    }

    if (!link_->connect(info_, clientFlags())) {
        auto err = link_->lastError();
        MYDBD_LOG_ERROR("database", "Connect to ", info_.hostname, ":", info_.port, " failed: ", err.message);
        throw core::ConnectFailedError(err.message, err.code, err.sqlState);
    }

    if (options_.waitTimeout > 0) {
        std::string sql = "SET wait_timeout=" + std::to_string(options_.waitTimeout);
        if (!link_->query(sql).ok) {
            handleErrors(sql);
        }
    }

    connected_ = true;
    MYDBD_LOG_INFO("database", "Connected to ", info_.hostname.empty() ? "localhost" : info_.hostname,
                   ":", info_.port, ", thread ", link_->threadId());
    return *this;
}

DriverLink& Connection::link(bool autoconnect) {
    if (!connected_ || !link_->ping()) {
        if (!autoconnect) {
            throw core::NotConnectedError("Not connected to the database");
        }
        connect();
    }
    return *link_;
}

void Connection::handleErrors(const std::string& query) {
    auto err = link_->lastError();
    core::throwDriverError(err.code, err.message, err.sqlState, query);
}

unsigned Connection::clientFlags() const {
    unsigned flags = 0;
    if (options_.compression) flags |= ClientCompress;
    if (options_.ssl) flags |= ClientSsl;
    if (options_.foundRows) flags |= ClientFoundRows;
    if (options_.ignoreSpace) flags |= ClientIgnoreSpace;
    if (options_.clientInteractive) flags |= ClientInteractive;
    return flags;
}

std::shared_ptr<ResultCursor> Connection::query(const std::string& text, const std::vector<domain::Value>& params) {
    std::string sql = text;
    injectExtendedInfo(sql);

    if (options_.readonly) {
        checkReadonlyQuery(sql);
    }

    if (!params.empty()) {
        auto sth = options_.queryPrepareCache ? prepareCached(sql) : prepare(sql);
        return sth->execute(params);
    }

    auto start = std::chrono::steady_clock::now();

    auto outcome = link().query(sql);
    if (!outcome.ok) {
        handleErrors(sql);
        throw core::SqlError(core::ErrorKind::Generic, "Query failed", 0, "", sql);
    }
    tracker_->markLink();

    if (options_.queryLog) {
        monitoring::QueryLog::instance().log("query", sql, std::nullopt, monitoring::elapsedMs(start));
    }

    if (!outcome.result) {
        return nullptr;
    }
    return std::make_shared<QueryCursor>(std::move(outcome.result));
}

std::shared_ptr<PreparedStatement> Connection::prepare(const std::string& text,
                                                       std::optional<std::vector<ParamType>> typeHints) {
    auto stmt = link().createStatement();
    if (!stmt) {
        handleErrors(text);
        throw core::SqlError(core::ErrorKind::Generic, "Cannot allocate a statement handle", 0, "", text);
    }

    auto sth = std::make_shared<PreparedStatement>(std::move(stmt), options_, tracker_);
    sth->prepare(text, std::move(typeHints));
    return sth;
}

std::shared_ptr<PreparedStatement> Connection::prepareCached(const std::string& text,
                                                             std::optional<std::vector<ParamType>> typeHints) {
    if (auto it = statementCache_.find(text); it != statementCache_.end()) {
        return it->second;
    }

    auto sth = prepare(text, std::move(typeHints));
    sth->freeze();
    statementCache_.emplace(text, sth);
    return sth;
}

bool Connection::begin() {
    bool result = link().autocommit(false);
    if (!result) {
        handleErrors();
    }
    return result;
}

bool Connection::commit() {
    bool result = link(false).commit();
    handleErrors();
    return result;
}

bool Connection::rollback() {
    bool result = link(false).rollback();
    handleErrors();
    return result;
}

bool Connection::kill(unsigned long processId) {
    bool result = link().kill(processId);
    handleErrors();
    return result;
}

unsigned long Connection::threadId() {
    return link().threadId();
}

bool Connection::ping() {
    try {
        return link(false).ping();
    } catch (const core::NotConnectedError&) {
        return false;
    }
}

std::optional<bool> Connection::disconnect() {
    std::optional<bool> result;
    try {
        result = link(false).close();
    } catch (const core::NotConnectedError&) {
        result = std::nullopt;
    }

    connected_ = false;
    statementCache_.clear();
    return result;
}

std::uint64_t Connection::getInsertId() {
    return link().insertId();
}

std::uint64_t Connection::getAffectedRows() const {
    return tracker_->affectedRows(*link_);
}

Connection& Connection::setExtendedQueryInfo(const std::string& key, std::optional<std::string> value) {
    if (value) {
        extendedQueryInfo_.set(key, std::move(*value));
    } else {
        extendedQueryInfo_.erase(key);
    }
    return *this;
}

void Connection::flushExtendedQueryInfo() {
    extendedQueryInfo_.clear();
}

Connection& Connection::setExtendedConnectionInfo(const std::string& key, std::optional<std::string> value) {
    if (value) {
        extendedConnectionInfo_.set(key, std::move(*value));
    } else {
        extendedConnectionInfo_.erase(key);
    }
    return *this;
}

void Connection::flushExtendedConnectionInfo() {
    extendedConnectionInfo_.clear();
}

// 连接级在前，查询级覆盖同名的键；查询级信息用完即清空
void Connection::injectExtendedInfo(std::string& query) {
    domain::OrderedMap<std::string> merged = extendedConnectionInfo_;
    for (const auto& [key, value] : extendedQueryInfo_) {
        merged.set(key, value);
    }
    extendedQueryInfo_.clear();

    if (merged.empty()) {
        return;
    }

    std::string comment;
    for (const auto& [key, value] : merged) {
        if (!comment.empty()) {
            comment += ", ";
        }
        comment += key + ":" + value;
    }
    query += " /* " + escapeCommentEnd(comment) + " */";
}

Connection& Connection::setReadOnly(bool readonly) {
    options_.readonly = readonly;
    return *this;
}

void Connection::checkReadonlyQuery(const std::string& query) const {
    static const std::regex writeVerb(R"(^\s*(insert|delete|update|replace|create)\s)", std::regex::icase);
    static const std::regex noReplicationTable(
        R"(^\s*(insert|delete|update|replace|create)\s+(from|into|table)\s+norepli_\w+)", std::regex::icase);
    static const std::regex temporaryTable(R"(^\s*create\s+temporary\s+)", std::regex::icase);

    if (!std::regex_search(query, writeVerb)) {
        return;
    }
    // 只允许写 norepli_ 表和临时表
    if (std::regex_search(query, noReplicationTable) || std::regex_search(query, temporaryTable)) {
        return;
    }

    MYDBD_LOG_WARN("database", "Rejected write query on read-only connection: ", query);
    throw core::ReadOnlyError("Can't send write queries on a read-only connection: " + query, 0, "", query);
}

Connection& Connection::setAutoDisconnect(unsigned seconds) {
    query("SET wait_timeout=" + std::to_string(seconds > 0 ? seconds : 28800u));
    return *this;
}

std::optional<std::int64_t> Connection::getReplicationDelay() {
    if (!isReadOnly()) {
        return 0; // 可写连接视为主库
    }

    if (!replicationDelay_) {
        std::optional<std::int64_t> delay;
        if (auto res = query("SHOW SLAVE STATUS")) {
            if (auto status = res->fetchAssoc()) {
                if (const auto* seconds = status->find("Seconds_Behind_Master")) {
                    delay = toInteger(*seconds);
                }
            }
        }
        replicationDelay_ = delay;
    }
    return *replicationDelay_;
}

bool Connection::isRealtime() {
    if (!realtime_) {
        std::optional<std::int64_t> delay;
        try {
            delay = getReplicationDelay();
        } catch (const core::SqlError& e) {
            // 查不到复制状态时认为复制已经中断
            MYDBD_LOG_WARN("database", "Error while checking real-time slave status, assuming it's not RT: ",
                           e.what());
        }
        realtime_ = delay.has_value() && *delay == 0;
    }
    return *realtime_;
}

bool Connection::hasEngine(const std::string& engine) {
    if (!engines_) {
        std::set<std::string> engines;
        if (auto res = query("SHOW ENGINES")) {
            while (auto row = res->fetchArray()) {
                if (row->size() < 2) {
                    continue;
                }
                auto support = domain::toString((*row)[1]);
                if (support == "YES" || support == "DEFAULT") {
                    engines.insert(toLower(domain::toString((*row)[0])));
                }
            }
        }
        engines_ = std::move(engines);
    }
    return engines_->count(toLower(engine)) != 0;
}

} // namespace mydbd::database
