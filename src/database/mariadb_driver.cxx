#include "database/mariadb_driver.hpp"

#include <cstring>

#include "core/logger.hpp"

namespace mydbd::database {
namespace {

// 结果列的初始文本缓冲区大小，更长的值用 mysql_stmt_fetch_column 重新读取
constexpr unsigned long kInitialTextBuffer = 256;

const char* orNull(const std::string& value) {
    return value.empty() ? nullptr : value.c_str();
}

bool isIntegerType(enum_field_types type) {
    switch (type) {
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_LONGLONG:
    case MYSQL_TYPE_YEAR:
        return true;
    default:
        return false;
    }
}

bool isRealType(enum_field_types type) {
    return type == MYSQL_TYPE_FLOAT || type == MYSQL_TYPE_DOUBLE;
}

} // namespace

// ---------------------------------------------------------------------------
// MariaDbResult

MariaDbResult::MariaDbResult(MYSQL_RES* result)
    : result_(result) {
}

MariaDbResult::~MariaDbResult() {
    if (result_ != nullptr) {
        mysql_free_result(result_);
    }
}

std::size_t MariaDbResult::fieldCount() const {
    return mysql_num_fields(result_);
}

std::size_t MariaDbResult::rowCount() const {
    return static_cast<std::size_t>(mysql_num_rows(result_));
}

std::vector<std::string> MariaDbResult::fieldNames() const {
    std::vector<std::string> names;
    MYSQL_FIELD* fields = mysql_fetch_fields(result_);
    unsigned count = mysql_num_fields(result_);
    names.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        names.emplace_back(fields[i].name);
    }
    return names;
}

void MariaDbResult::dataSeek(std::size_t row) {
    mysql_data_seek(result_, row);
}

std::optional<domain::OrderedRow> MariaDbResult::fetchRow() {
    MYSQL_ROW row = mysql_fetch_row(result_);
    if (row == nullptr) {
        return std::nullopt;
    }

    // 文本值可能包含 \0，按长度拷贝
    unsigned long* lengths = mysql_fetch_lengths(result_);
    unsigned count = mysql_num_fields(result_);

    domain::OrderedRow values;
    values.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        if (row[i] == nullptr) {
            values.emplace_back(std::monostate{});
        } else {
            values.emplace_back(std::string(row[i], lengths[i]));
        }
    }
    return values;
}

// ---------------------------------------------------------------------------
// MariaDbStatement

MariaDbStatement::MariaDbStatement(MYSQL_STMT* stmt)
    : stmt_(stmt) {
}

MariaDbStatement::~MariaDbStatement() {
    if (stmt_ != nullptr) {
        mysql_stmt_close(stmt_);
    }
}

bool MariaDbStatement::prepare(const std::string& query) {
    // mysql_stmt_prepare 会丢弃之前的结果绑定
    output_ = nullptr;
    results_.clear();
    resultBinds_.clear();
    return mysql_stmt_prepare(stmt_, query.c_str(), query.size()) == 0;
}

std::size_t MariaDbStatement::paramCount() const {
    return mysql_stmt_param_count(stmt_);
}

bool MariaDbStatement::bindParams(const std::vector<ParamType>& types,
                                  const std::vector<domain::Value>& values) {
    params_.assign(values.size(), ParamSlot{});
    paramBinds_.assign(values.size(), MYSQL_BIND{});

    for (std::size_t i = 0; i < values.size(); ++i) {
        ParamSlot& slot = params_[i];
        MYSQL_BIND& bind = paramBinds_[i];
        std::memset(&bind, 0, sizeof(bind));

        bind.is_null = &slot.isNull;
        if (domain::isNull(values[i])) {
            slot.isNull = 1;
            bind.buffer_type = MYSQL_TYPE_NULL;
            continue;
        }

        switch (types[i]) {
        case ParamType::Integer:
            slot.integer = std::get<std::int64_t>(values[i]);
            bind.buffer_type = MYSQL_TYPE_LONGLONG;
            bind.buffer = &slot.integer;
            break;
        case ParamType::Double:
            slot.real = std::get<double>(values[i]);
            bind.buffer_type = MYSQL_TYPE_DOUBLE;
            bind.buffer = &slot.real;
            break;
        case ParamType::String:
        case ParamType::Blob:
            slot.text = domain::toString(values[i]);
            slot.length = static_cast<unsigned long>(slot.text.size());
            bind.buffer_type = types[i] == ParamType::Blob ? MYSQL_TYPE_BLOB : MYSQL_TYPE_STRING;
            bind.buffer = slot.text.data();
            bind.buffer_length = slot.length;
            bind.length = &slot.length;
            break;
        }
    }

    return mysql_stmt_bind_param(stmt_, paramBinds_.data()) == 0;
}

bool MariaDbStatement::execute() {
    return mysql_stmt_execute(stmt_) == 0;
}

bool MariaDbStatement::storeResult() {
    return mysql_stmt_store_result(stmt_) == 0;
}

std::optional<std::vector<std::string>> MariaDbStatement::resultFieldNames() {
    MYSQL_RES* metadata = mysql_stmt_result_metadata(stmt_);
    if (metadata == nullptr) {
        return std::nullopt;    // 语句不产生结果集（INSERT/UPDATE...）
    }

    MariaDbResult holder(metadata); // 自动释放元数据
    return holder.fieldNames();
}

bool MariaDbStatement::bindResult(std::vector<domain::Value>* buffer) {
    MYSQL_RES* metadata = mysql_stmt_result_metadata(stmt_);
    if (metadata == nullptr) {
        return false;
    }

    unsigned count = mysql_num_fields(metadata);
    MYSQL_FIELD* fields = mysql_fetch_fields(metadata);

    results_.assign(count, ResultSlot{});
    resultBinds_.assign(count, MYSQL_BIND{});

    for (unsigned i = 0; i < count; ++i) {
        ResultSlot& slot = results_[i];
        MYSQL_BIND& bind = resultBinds_[i];
        std::memset(&bind, 0, sizeof(bind));

        bind.is_null = &slot.isNull;
        bind.error = &slot.error;
        bind.length = &slot.length;

        if (isIntegerType(fields[i].type)) {
            slot.type = MYSQL_TYPE_LONGLONG;
            slot.isUnsigned = (fields[i].flags & UNSIGNED_FLAG) != 0;
            bind.buffer = &slot.integer;
            bind.is_unsigned = slot.isUnsigned;
        } else if (isRealType(fields[i].type)) {
            slot.type = MYSQL_TYPE_DOUBLE;
            bind.buffer = &slot.real;
        } else {
            slot.type = MYSQL_TYPE_STRING;
            slot.text.resize(kInitialTextBuffer);
            bind.buffer = slot.text.data();
            bind.buffer_length = kInitialTextBuffer;
        }
        bind.buffer_type = slot.type;
    }
    mysql_free_result(metadata);

    output_ = buffer;
    return mysql_stmt_bind_result(stmt_, resultBinds_.data()) == 0;
}

bool MariaDbStatement::fetch() {
    if (output_ == nullptr) {
        return false;
    }

    int rc = mysql_stmt_fetch(stmt_);
    if (rc == 1 || rc == MYSQL_NO_DATA) {
        return false;   // 出错或者没有更多行（出错时 lastError() 有错误码）
    }

    bool rebind = false;
    for (std::size_t i = 0; i < results_.size(); ++i) {
        ResultSlot& slot = results_[i];
        domain::Value& out = (*output_)[i];

        if (slot.isNull) {
            out = std::monostate{};
            continue;
        }

        switch (slot.type) {
        case MYSQL_TYPE_LONGLONG:
            if (slot.isUnsigned) {
                out = domain::fromUnsigned(static_cast<std::uint64_t>(slot.integer));
            } else {
                out = static_cast<std::int64_t>(slot.integer);
            }
            break;
        case MYSQL_TYPE_DOUBLE:
            out = slot.real;
            break;
        default:
            // 值被截断：扩大缓冲区后单独读取这一列
            if (slot.length > slot.text.size()) {
                slot.text.resize(slot.length);
                MYSQL_BIND& bind = resultBinds_[i];
                bind.buffer = slot.text.data();
                bind.buffer_length = slot.length;
                mysql_stmt_fetch_column(stmt_, &bind, static_cast<unsigned>(i), 0);
                rebind = true;
            }
            out = std::string(slot.text.data(), slot.length);
            break;
        }
    }

    // 缓冲区地址变了，需要重新绑定，供下一次 fetch 使用
    if (rebind) {
        mysql_stmt_bind_result(stmt_, resultBinds_.data());
    }
    return true;
}

void MariaDbStatement::dataSeek(std::size_t row) {
    mysql_stmt_data_seek(stmt_, row);
}

std::size_t MariaDbStatement::rowCount() const {
    return static_cast<std::size_t>(mysql_stmt_num_rows(stmt_));
}

std::uint64_t MariaDbStatement::affectedRows() const {
    return mysql_stmt_affected_rows(stmt_);
}

DriverError MariaDbStatement::lastError() const {
    return DriverError{mysql_stmt_errno(stmt_), mysql_stmt_error(stmt_), mysql_stmt_sqlstate(stmt_)};
}

// ---------------------------------------------------------------------------
// MariaDbLink

MariaDbLink::MariaDbLink() {
    initialize();
}

// 析构函数：确保连接被关闭，避免资源泄漏
MariaDbLink::~MariaDbLink() {
    close();
}

bool MariaDbLink::initialize() {
    handle_ = mysql_init(nullptr);
    if (handle_ == nullptr) {
        MYDBD_LOG_ERROR("mariadb", "mysql_init() failed");
        return false;
    }
    if (connectTimeout_ > 0) {
        mysql_options(handle_, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout_);
    }
    return true;
}

void MariaDbLink::setConnectTimeout(unsigned seconds) {
    connectTimeout_ = seconds;
    if (handle_ != nullptr && seconds > 0) {
        mysql_options(handle_, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout_);
    }
}

bool MariaDbLink::connect(const core::ConnectionInfo& info, unsigned flags) {
    // close() 之后句柄已释放，重新初始化
    if (handle_ == nullptr && !initialize()) {
        return false;
    }

    unsigned long clientFlags = 0;
    if (flags & ClientCompress) clientFlags |= CLIENT_COMPRESS;
    if (flags & ClientSsl) clientFlags |= CLIENT_SSL;
    if (flags & ClientFoundRows) clientFlags |= CLIENT_FOUND_ROWS;
    if (flags & ClientIgnoreSpace) clientFlags |= CLIENT_IGNORE_SPACE;
    if (flags & ClientInteractive) clientFlags |= CLIENT_INTERACTIVE;

    MYSQL* result = mysql_real_connect(
        handle_,
        orNull(info.hostname),
        orNull(info.username),
        orNull(info.password),
        orNull(info.database),
        info.port,
        orNull(info.socket),
        clientFlags);

    return result != nullptr;
}

// 返回 0 表示成功，非 0 表示失败（连接断开、超时等）
bool MariaDbLink::ping() {
    if (handle_ == nullptr) {
        return false;
    }
    return mysql_ping(handle_) == 0;
}

bool MariaDbLink::close() {
    if (handle_ == nullptr) {
        return false;
    }
    mysql_close(handle_);
    handle_ = nullptr;
    return true;
}

DriverLink::QueryOutcome MariaDbLink::query(const std::string& sql) {
    QueryOutcome outcome;
    if (handle_ == nullptr) {
        return outcome;
    }

    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return outcome;
    }

    // 从服务器获取完整的结果集并存储在内存中
    MYSQL_RES* res = mysql_store_result(handle_);
    if (res == nullptr) {
        // 没有结果集：要么语句本身不返回行，要么读取结果出错
        outcome.ok = mysql_field_count(handle_) == 0;
        return outcome;
    }

    outcome.ok = true;
    outcome.result = std::make_unique<MariaDbResult>(res);
    return outcome;
}

std::unique_ptr<DriverStatement> MariaDbLink::createStatement() {
    if (handle_ == nullptr) {
        return nullptr;
    }
    MYSQL_STMT* stmt = mysql_stmt_init(handle_);
    if (stmt == nullptr) {
        return nullptr;
    }
    return std::make_unique<MariaDbStatement>(stmt);
}

std::uint64_t MariaDbLink::affectedRows() const {
    return handle_ == nullptr ? 0 : mysql_affected_rows(handle_);
}

std::uint64_t MariaDbLink::insertId() const {
    return handle_ == nullptr ? 0 : mysql_insert_id(handle_);
}

unsigned long MariaDbLink::threadId() const {
    return handle_ == nullptr ? 0 : mysql_thread_id(handle_);
}

bool MariaDbLink::kill(unsigned long processId) {
    if (handle_ == nullptr) {
        return false;
    }
    std::string sql = "KILL " + std::to_string(processId);
    return mysql_real_query(handle_, sql.c_str(), sql.size()) == 0;
}

bool MariaDbLink::autocommit(bool enabled) {
    return handle_ != nullptr && mysql_autocommit(handle_, enabled ? 1 : 0) == 0;
}

bool MariaDbLink::commit() {
    return handle_ != nullptr && mysql_commit(handle_) == 0;
}

bool MariaDbLink::rollback() {
    return handle_ != nullptr && mysql_rollback(handle_) == 0;
}

DriverError MariaDbLink::lastError() const {
    if (handle_ == nullptr) {
        return DriverError{};
    }
    return DriverError{mysql_errno(handle_), mysql_error(handle_), mysql_sqlstate(handle_)};
}

std::unique_ptr<DriverLink> createMariaDbLink() {
    return std::make_unique<MariaDbLink>();
}

} // namespace mydbd::database
