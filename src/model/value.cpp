#include <statblock/model/value.h>

#include <cmath>
#include <sstream>

namespace statblock::model {

namespace {

const std::string& empty_string() {
    static const std::string s;
    return s;
}

const Value::List& empty_list() {
    static const Value::List l;
    return l;
}

const Value::Map& empty_map() {
    static const Value::Map m;
    return m;
}

} // anonymous namespace

const char* value_kind_name(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::Null:   return "null";
        case Value::Kind::Bool:   return "bool";
        case Value::Kind::Number: return "number";
        case Value::Kind::String: return "string";
        case Value::Kind::List:   return "list";
        case Value::Kind::Map:    return "map";
    }
    return "unknown";
}

std::string format_number(double number) {
    if (std::isfinite(number) && number == std::floor(number) && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
    }
    std::ostringstream oss;
    oss << number;
    return oss.str();
}

const std::string& Value::as_string() const {
    return kind_ == Kind::String ? string_ : empty_string();
}

const Value::List& Value::as_list() const {
    return kind_ == Kind::List ? list_ : empty_list();
}

const Value::Map& Value::as_map() const {
    return kind_ == Kind::Map ? map_ : empty_map();
}

const Value* Value::find(const std::string& key) const {
    if (kind_ != Kind::Map) return nullptr;
    for (const auto& [k, v] : map_) {
        if (k == key) return &v;
    }
    return nullptr;
}

void Value::set(const std::string& key, Value value) {
    if (kind_ == Kind::Null) kind_ = Kind::Map;
    if (kind_ != Kind::Map) return;
    for (auto& entry : map_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    map_.emplace_back(key, std::move(value));
}

void Value::push_back(Value value) {
    if (kind_ == Kind::Null) kind_ = Kind::List;
    if (kind_ != Kind::List) return;
    list_.push_back(std::move(value));
}

std::size_t Value::size() const {
    switch (kind_) {
        case Kind::String: return string_.size();
        case Kind::List:   return list_.size();
        case Kind::Map:    return map_.size();
        default:           return 0;
    }
}

std::string Value::to_display_string() const {
    switch (kind_) {
        case Kind::Bool:
            return bool_ ? "true" : "false";
        case Kind::Number:
            return format_number(number_);
        case Kind::String:
            return string_;
        case Kind::List: {
            std::string out;
            for (const auto& item : list_) {
                std::string part = item.to_display_string();
                if (part.empty()) continue;
                if (!out.empty()) out += ", ";
                out += part;
            }
            return out;
        }
        default:
            return "";
    }
}

bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::Null:   return true;
        case Kind::Bool:   return bool_ == other.bool_;
        case Kind::Number: return number_ == other.number_;
        case Kind::String: return string_ == other.string_;
        case Kind::List:   return list_ == other.list_;
        case Kind::Map:    return map_ == other.map_;
    }
    return false;
}

std::string DataRecord::name() const {
    auto n = string("name");
    return n ? *n : "";
}

std::optional<double> DataRecord::number(const std::string& field) const {
    const Value* v = get(field);
    if (!v || !v->is_number()) return std::nullopt;
    return v->as_number();
}

std::optional<std::string> DataRecord::string(const std::string& field) const {
    const Value* v = get(field);
    if (!v || !v->is_string()) return std::nullopt;
    return v->as_string();
}

} // namespace statblock::model
