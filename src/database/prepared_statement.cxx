#include "database/prepared_statement.hpp"

#include <chrono>
#include <cstdlib>

#include "core/error.hpp"
#include "core/logger.hpp"
#include "monitoring/query_log.hpp"

namespace mydbd::database {

// ---------------------------------------------------------------------------
// AffectedRowsTracker

void AffectedRowsTracker::markLink() {
    source_ = Source::Link;
    statement_.reset();
}

void AffectedRowsTracker::markStatement(std::shared_ptr<DriverStatement> stmt) {
    source_ = Source::Statement;
    statement_ = std::move(stmt);
}

std::uint64_t AffectedRowsTracker::affectedRows(const DriverLink& link) const {
    switch (source_) {
    case Source::Link: return link.affectedRows();
    case Source::Statement: return statement_->affectedRows();
    default: return 0;
    }
}

// ---------------------------------------------------------------------------
// 参数类型

ParamType inferParamType(const domain::Value& value) {
    if (std::holds_alternative<std::int64_t>(value)) {
        return ParamType::Integer;
    }
    if (std::holds_alternative<double>(value)) {
        return ParamType::Double;
    }
    return ParamType::String;
}

domain::Value coerceParam(const domain::Value& value, ParamType type) {
    if (domain::isNull(value)) {
        return value;
    }

    switch (type) {
    case ParamType::Integer:
        if (auto d = std::get_if<double>(&value)) {
            return static_cast<std::int64_t>(*d);
        }
        if (auto s = std::get_if<std::string>(&value)) {
            // 与数据库的隐式转换一致：取前导数字，没有则为 0
            return static_cast<std::int64_t>(std::strtoll(s->c_str(), nullptr, 10));
        }
        return value;
    case ParamType::Double:
        if (auto i = std::get_if<std::int64_t>(&value)) {
            return static_cast<double>(*i);
        }
        if (auto s = std::get_if<std::string>(&value)) {
            return std::strtod(s->c_str(), nullptr);
        }
        return value;
    case ParamType::String:
    case ParamType::Blob:
    default:
        return domain::toString(value);
    }
}

// ---------------------------------------------------------------------------
// PreparedStatement

PreparedStatement::PreparedStatement(std::unique_ptr<DriverStatement> stmt, core::ConnectionOptions options,
                                     std::shared_ptr<AffectedRowsTracker> tracker)
    : stmt_(std::move(stmt))
    , options_(options)
    , tracker_(std::move(tracker)) {
}

void PreparedStatement::prepare(const std::string& query, std::optional<std::vector<ParamType>> typeHints) {
    if (frozen_) {
        throw core::FrozenStatementError("Cannot prepare a frozen statement", 0, "", query);
    }

    auto start = std::chrono::steady_clock::now();

    // 驱动重新预处理后旧的查询和输出绑定都已失效，任何失败都要让语句回到未预处理状态
    preparedQuery_.reset();
    types_.clear();
    typesFixed_ = false;
    cursor_.reset();

    if (!stmt_->prepare(query)) {
        handleErrors(query);
        throw core::SqlError(core::ErrorKind::Generic, "Statement prepare failed", 0, "", query);
    }

    if (typeHints && typeHints->size() != stmt_->paramCount()) {
        throw core::TypeMismatchError(
            "Wrong type hint count for prepared statement: " + std::to_string(stmt_->paramCount()) +
                " expected, " + std::to_string(typeHints->size()) + " given.",
            0, "", query);
    }

    if (options_.queryLog) {
        monitoring::QueryLog::instance().log("prepare", query, std::nullopt, monitoring::elapsedMs(start));
    }

    preparedQuery_ = query;
    if (typeHints) {
        types_ = std::move(*typeHints);
        typesFixed_ = true;
    } else {
        types_.clear();
        typesFixed_ = false;
    }
    MYDBD_LOG_TRACE("statement", "Prepared: ", query);
}

std::shared_ptr<ResultCursor> PreparedStatement::execute(const std::vector<domain::Value>& params) {
    if (!preparedQuery_) {
        throw core::NotPreparedError("Cannot execute an not prepared statement.");
    }

    auto start = std::chrono::steady_clock::now();

    if (params.size() != stmt_->paramCount()) {
        throw core::MismatchError(
            "Wrong parameter count for prepared statement: " + std::to_string(stmt_->paramCount()) +
                " expected, " + std::to_string(params.size()) + " given.",
            0, "", *preparedQuery_);
    }

    if (!params.empty()) {
        bindParams(params);
    }

    if (!stmt_->execute() || !stmt_->storeResult()) {
        handleErrors(*preparedQuery_);
        throw core::SqlError(core::ErrorKind::Generic, "Statement execution failed", 0, "", *preparedQuery_);
    }

    if (tracker_) {
        tracker_->markStatement(stmt_);
    }

    if (options_.queryLog) {
        monitoring::QueryLog::instance().log("execute", *preparedQuery_,
                                             params.empty() ? std::nullopt : std::make_optional(params),
                                             monitoring::elapsedMs(start));
    }

    // 驱动的输出绑定只有一组：复用已有的游标，列名也不再重新读取
    if (cursor_) {
        cursor_->reset();
        return cursor_;
    }

    auto names = stmt_->resultFieldNames();
    if (!names) {
        return nullptr; // INSERT/UPDATE 等不产生结果集
    }
    cursor_ = std::make_shared<StatementCursor>(stmt_, std::move(*names));
    return cursor_;
}

std::uint64_t PreparedStatement::getAffectedRows() const {
    return stmt_->affectedRows();
}

const std::string& PreparedStatement::query() const {
    static const std::string empty;
    return preparedQuery_ ? *preparedQuery_ : empty;
}

std::size_t PreparedStatement::paramCount() const {
    return stmt_->paramCount();
}

// 第一次绑定时确定参数类型，之后的值都按这个类型转换
void PreparedStatement::bindParams(const std::vector<domain::Value>& params) {
    if (!typesFixed_) {
        types_.clear();
        for (const auto& param : params) {
            types_.push_back(inferParamType(param));
        }
        typesFixed_ = true;
    }

    std::vector<domain::Value> values;
    values.reserve(params.size());
    for (std::size_t i = 0; i < params.size(); ++i) {
        values.push_back(coerceParam(params[i], types_[i]));
    }

    if (!stmt_->bindParams(types_, values)) {
        handleErrors(query());
        throw core::SqlError(core::ErrorKind::Generic, "Cannot bind statement parameters", 0, "", query());
    }
}

void PreparedStatement::handleErrors(const std::string& query) {
    auto err = stmt_->lastError();
    if (err.code != 0) {
        MYDBD_LOG_DEBUG("statement", "Driver error ", err.code, ": ", err.message);
    }
    core::throwDriverError(err.code, err.message, err.sqlState, query);
}

} // namespace mydbd::database
