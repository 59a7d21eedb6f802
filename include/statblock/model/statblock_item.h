#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statblock::model {

enum class ItemType {
    Group,
    Inline,
    Collapse,
    Heading,
    Subheading,
    Property,
    Saves,
    Table,
    Text,
    Image,
    Action,
    Javascript,
    Traits,
    Spells,
    Layout,
    IfElse,
};

// Declared name of the type as it appears in layout files ("ifelse", "traits").
const char* item_type_name(ItemType type);
std::optional<ItemType> item_type_from_string(const std::string& name);

// Types whose output is built from nested items rather than the record.
bool is_composite(ItemType type);

struct ConditionalBranch;

// One declared node of a statblock layout. Variant-specific fields are only
// read for the matching type; everything in `options` goes to the block
// producer untouched.
struct StatblockItem {
    ItemType type = ItemType::Text;
    std::string id;
    std::string heading;
    std::vector<std::string> properties;
    bool conditioned = false;
    std::string cls;
    bool has_rule = false;
    std::vector<StatblockItem> nested;

    std::vector<ConditionalBranch> branches;   // ifelse
    std::string layout;                        // layout: referenced layout name
    std::string subheading_text;               // traits
    std::string text;                          // text body / javascript code
    std::vector<std::pair<std::string, std::string>> options;

    // First declared property, "" when there is none.
    const std::string& first_property() const;
    const std::string* option(const std::string& key) const;
};

struct ConditionalBranch {
    std::string condition;
    std::vector<StatblockItem> nested;
};

// A named, reusable layout tree.
struct Layout {
    std::string name;
    std::vector<StatblockItem> blocks;
    std::optional<std::string> column_width;
};

// Lower-case, dash separated form of a layout name ("Basic 5e Layout" ->
// "basic-5e-layout"), used for class names.
std::string slugify(const std::string& name);

} // namespace statblock::model
