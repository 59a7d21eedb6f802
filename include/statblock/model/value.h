#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statblock::model {

// Dynamic value as found in a creature record: scalars, ordered lists and
// ordered key/value maps. Map entries keep insertion order.
class Value {
public:
    enum class Kind { Null, Bool, Number, String, List, Map };

    using List = std::vector<Value>;
    using Entry = std::pair<std::string, Value>;
    using Map = std::vector<Entry>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : kind_(Kind::Bool), bool_(b) {}
    Value(int n) : kind_(Kind::Number), number_(n) {}
    Value(double n) : kind_(Kind::Number), number_(n) {}
    Value(const char* s) : kind_(Kind::String), string_(s ? s : "") {}
    Value(std::string s) : kind_(Kind::String), string_(std::move(s)) {}
    Value(List items) : kind_(Kind::List), list_(std::move(items)) {}
    Value(Map entries) : kind_(Kind::Map), map_(std::move(entries)) {}

    static Value list(List items = {}) { return Value(std::move(items)); }
    static Value map(Map entries = {}) { return Value(std::move(entries)); }

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Kind::Null; }
    bool is_bool() const { return kind_ == Kind::Bool; }
    bool is_number() const { return kind_ == Kind::Number; }
    bool is_string() const { return kind_ == Kind::String; }
    bool is_list() const { return kind_ == Kind::List; }
    bool is_map() const { return kind_ == Kind::Map; }

    // Accessors return a neutral value when the kind does not match.
    bool as_bool() const { return kind_ == Kind::Bool && bool_; }
    double as_number() const { return kind_ == Kind::Number ? number_ : 0.0; }
    const std::string& as_string() const;
    const List& as_list() const;
    const Map& as_map() const;

    // Map lookup; nullptr for a missing key or a non-map value.
    const Value* find(const std::string& key) const;

    // Inserts or replaces a map entry. Turns a null value into a map.
    void set(const std::string& key, Value value);

    // Appends to a list. Turns a null value into a list.
    void push_back(Value value);

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    // Text form used for display strings: numbers without trailing zeros,
    // lists joined with ", ". Maps and null give "".
    std::string to_display_string() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    List list_;
    Map map_;
};

const char* value_kind_name(Value::Kind kind);

// Formats a number the way record text shows it: 3 -> "3", 2.5 -> "2.5".
std::string format_number(double number);

// The creature record handed to a render pass. Field names are record keys
// ("name", "traits", "spells", "columns", ...).
class DataRecord {
public:
    DataRecord() : fields_(Value::map()) {}
    explicit DataRecord(Value::Map fields) : fields_(std::move(fields)) {}

    const Value* get(const std::string& field) const { return fields_.find(field); }
    void set(const std::string& field, Value value) { fields_.set(field, std::move(value)); }
    bool has(const std::string& field) const { return get(field) != nullptr; }

    // Display name, "" when the record has none.
    std::string name() const;

    std::optional<double> number(const std::string& field) const;
    std::optional<std::string> string(const std::string& field) const;

    // The whole record as a map value, used to bind it into scripts.
    const Value& as_value() const { return fields_; }

private:
    Value fields_;
};

} // namespace statblock::model
