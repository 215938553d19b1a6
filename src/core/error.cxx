#include "core/error.hpp"

#include <sstream>
#include <unordered_map>

namespace mydbd::core {
namespace {

// MySQL/MariaDB 服务端与客户端错误码映射
const std::unordered_map<unsigned, ErrorKind>& driverErrorMap() {
    static const std::unordered_map<unsigned, ErrorKind> map{
        {1004, ErrorKind::CannotCreate},
        {1005, ErrorKind::CannotCreate},
        {1006, ErrorKind::CannotCreate},
        {1007, ErrorKind::AlreadyExists},
        {1008, ErrorKind::CannotDrop},
        {1022, ErrorKind::AlreadyExists},
        {1044, ErrorKind::AccessViolation},
        {1046, ErrorKind::NoDbSelected},
        {1048, ErrorKind::Constraint},
        {1049, ErrorKind::NoSuchDb},
        {1050, ErrorKind::AlreadyExists},
        {1051, ErrorKind::NoSuchTable},
        {1054, ErrorKind::NoSuchField},
        {1061, ErrorKind::AlreadyExists},
        {1062, ErrorKind::AlreadyExists},
        {1064, ErrorKind::Syntax},
        {1091, ErrorKind::NotFound},
        {1100, ErrorKind::NotLocked},
        {1136, ErrorKind::ValueCountOnRow},
        {1142, ErrorKind::AccessViolation},
        {1146, ErrorKind::NoSuchTable},
        {1205, ErrorKind::NotLocked},   // lock wait timeout
        {1216, ErrorKind::Constraint},
        {1217, ErrorKind::Constraint},
        {1356, ErrorKind::DivZero},
        {1451, ErrorKind::Constraint},
        {1452, ErrorKind::Constraint},
        {2030, ErrorKind::NotPrepared},
    };
    return map;
}

} // namespace

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Generic: return "SqlError";
    case ErrorKind::Syntax: return "Syntax";
    case ErrorKind::Constraint: return "Constraint";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::AlreadyExists: return "AlreadyExists";
    case ErrorKind::Unsupported: return "Unsupported";
    case ErrorKind::Mismatch: return "Mismatch";
    case ErrorKind::TypeMismatch: return "TypeMismatch";
    case ErrorKind::Invalid: return "Invalid";
    case ErrorKind::Truncated: return "Truncated";
    case ErrorKind::DivZero: return "DivZero";
    case ErrorKind::NoDbSelected: return "NoDbSelected";
    case ErrorKind::CannotCreate: return "CannotCreate";
    case ErrorKind::CannotDrop: return "CannotDrop";
    case ErrorKind::NoSuchTable: return "NoSuchTable";
    case ErrorKind::NoSuchField: return "NoSuchField";
    case ErrorKind::NotLocked: return "NotLocked";
    case ErrorKind::ValueCountOnRow: return "ValueCountOnRow";
    case ErrorKind::ConnectFailed: return "ConnectFailed";
    case ErrorKind::AccessViolation: return "AccessViolation";
    case ErrorKind::NoSuchDb: return "NoSuchDb";
    case ErrorKind::ReadOnly: return "ReadOnly";
    case ErrorKind::NotConnected: return "NotConnected";
    case ErrorKind::NotPrepared: return "NotPrepared";
    case ErrorKind::FrozenStatement: return "FrozenStatement";
    default: return "Unknown";
    }
}

SqlError::SqlError(ErrorKind kind, const std::string& message, unsigned code,
                   std::string sqlState, std::string query)
    : std::runtime_error(message)
    , kind_(kind)
    , code_(code)
    , sqlState_(std::move(sqlState))
    , query_(std::move(query)) {
}

std::string SqlError::formatDiagnostics() const {
    std::ostringstream oss;
    oss << "[" << errorKindName(kind_) << "]";
    if (code_ != 0) {
        oss << " (" << code_;
        if (!sqlState_.empty()) {
            oss << "/" << sqlState_;
        }
        oss << ")";
    }
    oss << " " << what();
    if (!query_.empty()) {
        oss << "\n  query: " << query_;
    }
    return oss.str();
}

ErrorKind kindForDriverCode(unsigned code) {
    const auto& map = driverErrorMap();
    if (auto it = map.find(code); it != map.end()) {
        return it->second;
    }
    return ErrorKind::Generic;
}

void throwDriverError(unsigned code, const std::string& message,
                      const std::string& sqlState, const std::string& query) {
    if (code == 0) {
        return;
    }

    switch (kindForDriverCode(code)) {
    case ErrorKind::CannotCreate: throw CannotCreateError(message, code, sqlState, query);
    case ErrorKind::AlreadyExists: throw AlreadyExistsError(message, code, sqlState, query);
    case ErrorKind::CannotDrop: throw CannotDropError(message, code, sqlState, query);
    case ErrorKind::AccessViolation: throw AccessViolationError(message, code, sqlState, query);
    case ErrorKind::NoDbSelected: throw NoDbSelectedError(message, code, sqlState, query);
    case ErrorKind::Constraint: throw ConstraintError(message, code, sqlState, query);
    case ErrorKind::NoSuchDb: throw NoSuchDbError(message, code, sqlState, query);
    case ErrorKind::NoSuchTable: throw NoSuchTableError(message, code, sqlState, query);
    case ErrorKind::NoSuchField: throw NoSuchFieldError(message, code, sqlState, query);
    case ErrorKind::Syntax: throw SyntaxError(message, code, sqlState, query);
    case ErrorKind::NotFound: throw NotFoundError(message, code, sqlState, query);
    case ErrorKind::NotLocked: throw NotLockedError(message, code, sqlState, query);
    case ErrorKind::ValueCountOnRow: throw ValueCountOnRowError(message, code, sqlState, query);
    case ErrorKind::DivZero: throw DivZeroError(message, code, sqlState, query);
    case ErrorKind::NotPrepared: throw NotPreparedError(message, code, sqlState, query);
    default: throw SqlError(ErrorKind::Generic, message, code, sqlState, query);
    }
}

} // namespace mydbd::core
