#include "database/result_cursor.hpp"

#include <algorithm>

namespace mydbd::database {

FetchMode fetchModeFromCode(int code) {
    switch (code) {
    case 1: return FetchMode::Ordered;
    case 2: return FetchMode::Assoc;
    case 3: return FetchMode::Object;
    case 4: return FetchMode::Column;
    default:
        throw std::invalid_argument("Invalid fetch mode: " + std::to_string(code));
    }
}

// ---------------------------------------------------------------------------
// ResultCursor

ResultCursor& ResultCursor::setFetchMode(FetchMode mode, ColumnSelector arg) {
    switch (mode) {
    case FetchMode::Ordered:
    case FetchMode::Assoc:
        break;
    case FetchMode::Object:
        // 没给类型名时用 stdClass
        objectType_ = arg.isIndex() ? kDefaultObjectType : arg.name();
        break;
    case FetchMode::Column:
        column_ = std::move(arg);
        break;
    default:
        throw std::invalid_argument("Invalid fetch mode: " + std::to_string(static_cast<int>(mode)));
    }

    mode_ = mode;
    return *this;
}

bool ResultCursor::valid() const {
    return position_ >= 0 && position_ < static_cast<long>(rowCount());
}

std::optional<domain::Row> ResultCursor::next() {
    return next(mode_);
}

// 只有真正读到一行时位置才前进
std::optional<domain::Row> ResultCursor::next(FetchMode mode) {
    auto row = fetchAs(mode);
    if (row) {
        ++position_;
    }
    return row;
}

std::optional<domain::Row> ResultCursor::current() {
    auto row = next();
    if (row) {
        seek(position_ - 1);
    }
    return row;
}

void ResultCursor::seek(long position) {
    if (position < 0 || position > static_cast<long>(rowCount()) - 1) {
        throw std::out_of_range("Invalid seek position: " + std::to_string(position));
    }

    physicalSeek(static_cast<std::size_t>(position));
    position_ = position;
}

std::vector<domain::Row> ResultCursor::fetchAll() {
    std::vector<domain::Row> rows;
    while (auto row = next()) {
        rows.push_back(std::move(*row));
    }
    return rows;
}

std::optional<domain::Value> ResultCursor::fetchColumn(const ColumnSelector& column) {
    auto row = fetchOrderedRow();
    if (!row) {
        return std::nullopt;
    }
    ++position_;
    return extractColumn(*row, column);
}

std::optional<domain::OrderedRow> ResultCursor::fetchArray() {
    auto row = next(FetchMode::Ordered);
    if (!row) {
        return std::nullopt;
    }
    return std::get<domain::OrderedRow>(std::move(*row));
}

std::optional<domain::AssocRow> ResultCursor::fetchAssoc() {
    auto row = next(FetchMode::Assoc);
    if (!row) {
        return std::nullopt;
    }
    return std::get<domain::AssocRow>(std::move(*row));
}

std::optional<domain::ObjectRow> ResultCursor::fetchObject() {
    auto row = next(FetchMode::Object);
    if (!row) {
        return std::nullopt;
    }
    return std::get<domain::ObjectRow>(std::move(*row));
}

std::optional<domain::Row> ResultCursor::fetchRow(std::optional<FetchMode> mode) {
    return mode ? next(*mode) : next();
}

bool ResultCursor::fetchInto(domain::Row& row, std::optional<FetchMode> mode) {
    auto fetched = fetchRow(mode);
    if (!fetched) {
        return false;
    }
    row = std::move(*fetched);
    return true;
}

void ResultCursor::resetState() {
    position_ = 0;
    mode_ = FetchMode::Ordered;
    column_ = ColumnSelector{};
    objectType_ = kDefaultObjectType;
}

// 物理读取一行，再按模式投影成对应的形态
std::optional<domain::Row> ResultCursor::fetchAs(FetchMode mode) {
    auto row = fetchOrderedRow();
    if (!row) {
        return std::nullopt;
    }

    switch (mode) {
    case FetchMode::Ordered:
        return domain::Row(std::in_place_type<domain::OrderedRow>, std::move(*row));
    case FetchMode::Assoc:
        return domain::Row(std::in_place_type<domain::AssocRow>, domain::makeAssoc(fieldNames(), *row));
    case FetchMode::Object:
        return domain::Row(std::in_place_type<domain::ObjectRow>,
                           domain::ObjectRow{objectType_, domain::makeAssoc(fieldNames(), *row)});
    case FetchMode::Column:
        return domain::Row(std::in_place_type<domain::Value>, extractColumn(*row, column_));
    default:
        throw std::invalid_argument("Invalid fetch mode: " + std::to_string(static_cast<int>(mode)));
    }
}

domain::Value ResultCursor::extractColumn(const domain::OrderedRow& row, const ColumnSelector& column) {
    if (column.isIndex()) {
        if (column.index() >= row.size()) {
            throw std::out_of_range("No such column: " + column.describe());
        }
        return row[column.index()];
    }

    // 按列名取值，重名列以最后一个为准（与关联行一致）
    const auto& names = fieldNames();
    auto it = std::find(names.rbegin(), names.rend(), column.name());
    if (it == names.rend()) {
        throw std::out_of_range("No such column: " + column.name());
    }
    auto index = static_cast<std::size_t>(std::distance(it, names.rend()) - 1);
    if (index >= row.size()) {
        throw std::out_of_range("No such column: " + column.name());
    }
    return row[index];
}

// ---------------------------------------------------------------------------
// QueryCursor

QueryCursor::QueryCursor(std::unique_ptr<DriverResult> result)
    : result_(std::move(result)) {
}

std::size_t QueryCursor::fieldCount() const {
    return result_->fieldCount();
}

std::size_t QueryCursor::rowCount() const {
    return result_->rowCount();
}

std::optional<domain::OrderedRow> QueryCursor::fetchOrderedRow() {
    return result_->fetchRow();
}

const std::vector<std::string>& QueryCursor::fieldNames() {
    if (!fieldNames_) {
        fieldNames_ = result_->fieldNames();
    }
    return *fieldNames_;
}

void QueryCursor::physicalSeek(std::size_t row) {
    result_->dataSeek(row);
}

} // namespace mydbd::database
