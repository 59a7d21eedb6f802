#include <statblock/model/statblock_item.h>

#include <cctype>

namespace statblock::model {

namespace {

struct TypeName {
    ItemType type;
    const char* name;
};

constexpr TypeName kTypeNames[] = {
    {ItemType::Group, "group"},
    {ItemType::Inline, "inline"},
    {ItemType::Collapse, "collapse"},
    {ItemType::Heading, "heading"},
    {ItemType::Subheading, "subheading"},
    {ItemType::Property, "property"},
    {ItemType::Saves, "saves"},
    {ItemType::Table, "table"},
    {ItemType::Text, "text"},
    {ItemType::Image, "image"},
    {ItemType::Action, "action"},
    {ItemType::Javascript, "javascript"},
    {ItemType::Traits, "traits"},
    {ItemType::Spells, "spells"},
    {ItemType::Layout, "layout"},
    {ItemType::IfElse, "ifelse"},
};

} // anonymous namespace

const char* item_type_name(ItemType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

std::optional<ItemType> item_type_from_string(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (const auto& entry : kTypeNames) {
        if (lower == entry.name) return entry.type;
    }
    return std::nullopt;
}

bool is_composite(ItemType type) {
    return type == ItemType::Group || type == ItemType::Inline ||
           type == ItemType::Collapse || type == ItemType::IfElse ||
           type == ItemType::Layout;
}

const std::string& StatblockItem::first_property() const {
    static const std::string none;
    return properties.empty() ? none : properties.front();
}

const std::string* StatblockItem::option(const std::string& key) const {
    for (const auto& [k, v] : options) {
        if (k == key) return &v;
    }
    return nullptr;
}

std::string slugify(const std::string& name) {
    std::string slug;
    bool pending_dash = false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pending_dash && !slug.empty()) slug += '-';
            pending_dash = false;
            slug += static_cast<char>(std::tolower(uc));
        } else {
            pending_dash = true;
        }
    }
    return slug;
}

} // namespace statblock::model
