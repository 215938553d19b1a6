#pragma once

#include <stdexcept>
#include <string>

namespace mydbd::core {

// 错误种类（驱动错误码映射 + 本库自身的错误）
enum class ErrorKind {
    Generic,    // 未映射的驱动错误
    Syntax,
    Constraint,
    NotFound,
    AlreadyExists,
    Unsupported,
    Mismatch,   // execute() 参数个数与占位符个数不一致
    TypeMismatch,   // prepare() 类型提示个数与占位符个数不一致
    Invalid,
    Truncated,
    DivZero,
    NoDbSelected,
    CannotCreate,
    CannotDrop,
    NoSuchTable,
    NoSuchField,
    NotLocked,
    ValueCountOnRow,
    ConnectFailed,
    AccessViolation,
    NoSuchDb,
    ReadOnly,
    NotConnected,
    NotPrepared,
    FrozenStatement
};

std::string errorKindName(ErrorKind kind);

// 所有 SQL 相关异常的基类
class SqlError : public std::runtime_error {
public:
    SqlError(ErrorKind kind, const std::string& message, unsigned code = 0,
             std::string sqlState = "", std::string query = "");

    ErrorKind kind() const noexcept { return kind_; }
    unsigned code() const noexcept { return code_; }
    const std::string& sqlState() const noexcept { return sqlState_; }
    const std::string& query() const noexcept { return query_; }

    // 多行诊断信息：[kind] (code/sqlstate) message + 出错的 SQL
    std::string formatDiagnostics() const;

private:
    ErrorKind kind_;
    unsigned code_;
    std::string sqlState_;
    std::string query_;
};

// 每种错误一个独立的类型，方便调用方按类型 catch
template <ErrorKind K>
class SqlErrorOf : public SqlError {
public:
    explicit SqlErrorOf(const std::string& message, unsigned code = 0,
                        std::string sqlState = "", std::string query = "")
        : SqlError(K, message, code, std::move(sqlState), std::move(query)) {}
};

using SyntaxError = SqlErrorOf<ErrorKind::Syntax>;
using ConstraintError = SqlErrorOf<ErrorKind::Constraint>;
using NotFoundError = SqlErrorOf<ErrorKind::NotFound>;
using AlreadyExistsError = SqlErrorOf<ErrorKind::AlreadyExists>;
using UnsupportedError = SqlErrorOf<ErrorKind::Unsupported>;
using MismatchError = SqlErrorOf<ErrorKind::Mismatch>;
using TypeMismatchError = SqlErrorOf<ErrorKind::TypeMismatch>;
using InvalidError = SqlErrorOf<ErrorKind::Invalid>;
using TruncatedError = SqlErrorOf<ErrorKind::Truncated>;
using DivZeroError = SqlErrorOf<ErrorKind::DivZero>;
using NoDbSelectedError = SqlErrorOf<ErrorKind::NoDbSelected>;
using CannotCreateError = SqlErrorOf<ErrorKind::CannotCreate>;
using CannotDropError = SqlErrorOf<ErrorKind::CannotDrop>;
using NoSuchTableError = SqlErrorOf<ErrorKind::NoSuchTable>;
using NoSuchFieldError = SqlErrorOf<ErrorKind::NoSuchField>;
using NotLockedError = SqlErrorOf<ErrorKind::NotLocked>;
using ValueCountOnRowError = SqlErrorOf<ErrorKind::ValueCountOnRow>;
using ConnectFailedError = SqlErrorOf<ErrorKind::ConnectFailed>;
using AccessViolationError = SqlErrorOf<ErrorKind::AccessViolation>;
using NoSuchDbError = SqlErrorOf<ErrorKind::NoSuchDb>;
using ReadOnlyError = SqlErrorOf<ErrorKind::ReadOnly>;
using NotConnectedError = SqlErrorOf<ErrorKind::NotConnected>;
using NotPreparedError = SqlErrorOf<ErrorKind::NotPrepared>;
using FrozenStatementError = SqlErrorOf<ErrorKind::FrozenStatement>;

// 驱动错误码 -> 错误种类，未映射返回 ErrorKind::Generic
ErrorKind kindForDriverCode(unsigned code);

// 驱动报告了错误时抛出对应类型的异常；code 为 0 时什么都不做
void throwDriverError(unsigned code, const std::string& message,
                      const std::string& sqlState = "", const std::string& query = "");

} // namespace mydbd::core
