#include "database/statement_cursor.hpp"

#include "core/error.hpp"

namespace mydbd::database {

StatementCursor::StatementCursor(std::shared_ptr<DriverStatement> stmt, std::vector<std::string> fieldNames)
    : stmt_(std::move(stmt))
    , buffer_(fieldNames.size())
    , fieldNames_(std::move(fieldNames)) {
    // buffer_ 的地址交给驱动，之后不能再改变它的大小
    if (!stmt_->bindResult(&buffer_)) {
        auto err = stmt_->lastError();
        core::throwDriverError(err.code, err.message, err.sqlState);
        throw core::SqlError(core::ErrorKind::Generic, "Cannot bind statement result buffer");
    }
}

StatementCursor& StatementCursor::reset() {
    resetState();
    if (rowCount() > 0) {
        physicalSeek(0);
    }
    return *this;
}

std::size_t StatementCursor::rowCount() const {
    return stmt_->rowCount();
}

std::optional<domain::OrderedRow> StatementCursor::fetchOrderedRow() {
    if (!stmt_->fetch()) {
        auto err = stmt_->lastError();
        core::throwDriverError(err.code, err.message, err.sqlState);
        return std::nullopt;
    }
    return buffer_;
}

const std::vector<std::string>& StatementCursor::fieldNames() {
    return fieldNames_;
}

void StatementCursor::physicalSeek(std::size_t row) {
    stmt_->dataSeek(row);
}

} // namespace mydbd::database
