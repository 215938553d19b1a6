// 结果集的行模型：字段值、有序映射、四种取数模式对应的行形态

#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mydbd::domain {

// 单个字段值：monostate 表示 SQL NULL
// 直接查询返回的都是字符串（C API 给的就是文本），预处理语句的绑定结果是带类型的
using Value = std::variant<std::monostate, std::int64_t, double, std::string>;

inline bool isNull(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

// 无符号整数列（BIGINT UNSIGNED）：超出 int64 范围的值保留为十进制字符串
inline Value fromUnsigned(std::uint64_t value) {
    if (value > static_cast<std::uint64_t>(INT64_MAX)) {
        return std::to_string(value);
    }
    return static_cast<std::int64_t>(value);
}

// 字段值 → 显示用字符串（NULL 为空串）
inline std::string toString(const Value& value) {
    if (auto i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (auto d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << std::setprecision(15) << *d;
        return oss.str();
    }
    if (auto s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return {};
}

// 保持插入顺序的字符串键映射（键唯一）
// 对已存在的键赋值会原地覆盖，位置不变
template <typename V>
class OrderedMap {
public:
    using value_type = std::pair<std::string, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    // 写入键值，已存在则覆盖
    void set(const std::string& key, V value) {
        (*this)[key] = std::move(value);
    }

    // 取键对应的值，不存在时在末尾插入默认值
    V& operator[](const std::string& key) {
        if (auto it = index_.find(key); it != index_.end()) {
            return items_[it->second].second;
        }
        index_.emplace(key, items_.size());
        items_.emplace_back(key, V{});
        return items_.back().second;
    }

    const V* find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &items_[it->second].second;
    }

    const V& at(const std::string& key) const {
        if (const V* value = find(key)) {
            return *value;
        }
        throw std::out_of_range("No such key: " + key);
    }

    bool contains(const std::string& key) const { return index_.count(key) != 0; }

    void erase(const std::string& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return;
        }
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(it->second));
        reindex();
    }

    void clear() {
        items_.clear();
        index_.clear();
    }

    // 删除第一个元素（getAssoc 用第一列当键时需要去掉它）
    void popFront() {
        if (items_.empty()) {
            return;
        }
        items_.erase(items_.begin());
        reindex();
    }

    const value_type& front() const { return items_.front(); }

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    bool operator==(const OrderedMap& other) const { return items_ == other.items_; }
    bool operator!=(const OrderedMap& other) const { return !(*this == other); }

private:
    void reindex() {
        index_.clear();
        for (std::size_t i = 0; i < items_.size(); ++i) {
            index_.emplace(items_[i].first, i);
        }
    }

    std::vector<value_type> items_;
    std::unordered_map<std::string, std::size_t> index_;
};

// 按列序号索引的行
using OrderedRow = std::vector<Value>;

// 按列名索引的行（重名列只保留最后一个的值）
using AssocRow = OrderedMap<Value>;

// 对象模式的行：字段集合 + 目标类型名
// as<T>() 通过 T(const AssocRow&) 构造用户自己的类型
struct ObjectRow {
    std::string typeName{"stdClass"};
    AssocRow fields;

    const Value& get(const std::string& name) const { return fields.at(name); }

    template <typename T>
    T as() const { return T(fields); }

    bool operator==(const ObjectRow& other) const {
        return typeName == other.typeName && fields == other.fields;
    }
};

// 四种取数模式对应的行形态：Ordered / Assoc / Object / Column（单个值）
using Row = std::variant<OrderedRow, AssocRow, ObjectRow, Value>;

// 由列名和有序行拼出关联行
inline AssocRow makeAssoc(const std::vector<std::string>& names, const OrderedRow& row) {
    AssocRow assoc;
    for (std::size_t i = 0; i < names.size() && i < row.size(); ++i) {
        assoc.set(names[i], row[i]);
    }
    return assoc;
}

// Value → JSON 序列化
inline nlohmann::json toJson(const Value& value) {
    if (auto i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    if (auto d = std::get_if<double>(&value)) {
        return *d;
    }
    if (auto s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return nullptr;
}

inline nlohmann::json toJson(const AssocRow& row) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [name, value] : row) {
        json[name] = toJson(value);
    }
    return json;
}

// Row → JSON 序列化（Ordered 为数组，Assoc/Object 为对象，Column 为标量）
inline nlohmann::json toJson(const Row& row) {
    if (auto ordered = std::get_if<OrderedRow>(&row)) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& value : *ordered) {
            json.push_back(toJson(value));
        }
        return json;
    }
    if (auto assoc = std::get_if<AssocRow>(&row)) {
        return toJson(*assoc);
    }
    if (auto object = std::get_if<ObjectRow>(&row)) {
        return toJson(object->fields);
    }
    return toJson(std::get<Value>(row));
}

} // namespace mydbd::domain
