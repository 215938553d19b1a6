#include "compat/pear_compat.hpp"

#include <algorithm>

#include "core/error.hpp"

namespace mydbd::compat {
namespace {

database::FetchMode toFetchMode(LegacyFetchMode mode) {
    switch (mode) {
    case LegacyFetchMode::Assoc: return database::FetchMode::Assoc;
    case LegacyFetchMode::Object: return database::FetchMode::Object;
    default: return database::FetchMode::Ordered;
    }
}

void store(AssocResult& results, const std::string& key, domain::Row row, bool group) {
    if (!group) {
        results.set(key, AssocValue(std::in_place_type<domain::Row>, std::move(row)));
        return;
    }

    AssocValue& slot = results[key];
    if (!std::holds_alternative<std::vector<domain::Row>>(slot)) {
        slot = std::vector<domain::Row>{};
    }
    std::get<std::vector<domain::Row>>(slot).push_back(std::move(row));
}

} // namespace

database::FetchMode PearConnection::resolveFetchMode(LegacyFetchMode mode) const {
    if (mode == LegacyFetchMode::Default) {
        return defaultFetchMode_ ? toFetchMode(*defaultFetchMode_) : database::FetchMode::Ordered;
    }
    return toFetchMode(mode);
}

void PearConnection::autoCommit(bool state) {
    if (!state) {
        begin();
        return;
    }
    throw core::UnsupportedError("The autoCommit(true) method is not implemented.");
}

std::shared_ptr<database::ResultCursor> PearConnection::execute(database::PreparedStatement& statement,
                                                                const std::vector<domain::Value>& params) {
    return statement.execute(params);
}

std::vector<domain::Value> PearConnection::getCol(const std::string& text, const database::ColumnSelector& column,
                                                  const std::vector<domain::Value>& params) {
    auto res = queryResult(text, params);

    if (res->rowCount() > 0) {
        bool present = column.isIndex() ? column.index() < res->fieldCount()
                                        : [&] {
                                              auto names = res->columnNames();
                                              return std::find(names.begin(), names.end(), column.name()) != names.end();
                                          }();
        if (!present) {
            throw core::NoSuchFieldError("No such field: " + column.describe(), 0, "", text);
        }
    }

    res->setFetchMode(database::FetchMode::Column, column);

    std::vector<domain::Value> values;
    for (auto& row : res->fetchAll()) {
        values.push_back(std::get<domain::Value>(std::move(row)));
    }
    return values;
}

std::optional<domain::Value> PearConnection::getOne(const std::string& text,
                                                    const std::vector<domain::Value>& params) {
    return queryResult(text, params)->fetchColumn(0);
}

std::optional<domain::Row> PearConnection::getRow(const std::string& text, const std::vector<domain::Value>& params,
                                                  LegacyFetchMode mode) {
    return queryResult(text, params)->next(resolveFetchMode(mode));
}

std::vector<domain::Row> PearConnection::getAll(const std::string& text, const std::vector<domain::Value>& params,
                                                LegacyFetchMode mode) {
    return queryResult(text, params)->setFetchMode(resolveFetchMode(mode)).fetchAll();
}

AssocResult PearConnection::getAssoc(const std::string& text, bool forceArray,
                                     const std::vector<domain::Value>& params, LegacyFetchMode mode, bool group) {
    auto res = queryResult(text, params);

    if (res->fieldCount() < 2) {
        throw core::TruncatedError("getAssoc() needs at least two columns", 0, "", text);
    }

    AssocResult results;

    if (res->fieldCount() == 2 && !forceArray) {
        // 两列：键 → 第二列的标量值
        while (auto row = res->fetchArray()) {
            store(results, domain::toString((*row)[0]),
                  domain::Row(std::in_place_type<domain::Value>, (*row)[1]), group);
        }
        return results;
    }

    switch (resolveFetchMode(mode)) {
    case database::FetchMode::Assoc:
        while (auto row = res->fetchAssoc()) {
            std::string key = domain::toString(row->front().second);
            row->popFront();
            store(results, key, domain::Row(std::in_place_type<domain::AssocRow>, std::move(*row)), group);
        }
        break;

    case database::FetchMode::Object:
        while (auto object = res->fetchObject()) {
            std::string key = domain::toString(object->fields.front().second);
            object->fields.popFront();
            store(results, key, domain::Row(std::in_place_type<domain::ObjectRow>, std::move(*object)), group);
        }
        break;

    default:
        while (auto row = res->fetchArray()) {
            // 去掉第一个元素，剩下的下标重新从 0 开始
            std::string key = domain::toString(row->front());
            row->erase(row->begin());
            store(results, key, domain::Row(std::in_place_type<domain::OrderedRow>, std::move(*row)), group);
        }
        break;
    }

    return results;
}

std::shared_ptr<database::ResultCursor> PearConnection::queryResult(const std::string& text,
                                                                    const std::vector<domain::Value>& params) {
    auto res = query(text, params);
    if (!res) {
        throw core::InvalidError("Query did not return a result set", 0, "", text);
    }
    return res;
}

} // namespace mydbd::compat
