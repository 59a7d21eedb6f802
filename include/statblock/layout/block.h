#pragma once
#include <statblock/model/statblock_item.h>
#include <statblock/model/value.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace statblock::layout {

enum class BlockKind {
    Item,           // leaf item rendered straight from (record, item)
    SectionHeading, // heading of a group, inline or traits item
    Subheading,     // traits subheading text
    Trait,          // one {name, desc} entry, also used for spell headers
    SpellEntry,     // one line of a spell group
    Separator,      // rule appended after a has_rule item
    Collapse,       // collapsible container around its children
    Inline,         // children laid out side by side
};

const char* block_kind_name(BlockKind kind);

// Opaque result of the rendering collaborator.
class BlockHandle {
public:
    virtual ~BlockHandle() = default;

    // True when the producer rendered nothing.
    virtual bool empty() const = 0;

    // Stable description of the rendered content, used to compare passes.
    virtual std::string describe() const = 0;
};

struct RenderedBlock {
    BlockKind kind = BlockKind::Item;
    model::ItemType source = model::ItemType::Text;
    std::string item_id;
    std::vector<std::string> classes;
    std::shared_ptr<BlockHandle> handle;
    std::vector<RenderedBlock> children;
    bool first = false;
    bool last = false;

    // No rendered content of its own and none in any child.
    bool is_empty() const;
};

// Equality of everything except handle identity.
bool same_structure(const RenderedBlock& a, const RenderedBlock& b);
bool same_structure(const std::vector<RenderedBlock>& a, const std::vector<RenderedBlock>& b);

// Everything the producer needs to render one block. Which fields are set
// depends on kind.
struct BlockRequest {
    BlockKind kind = BlockKind::Item;
    const model::StatblockItem* item = nullptr;
    const model::DataRecord* record = nullptr;
    std::vector<std::string> classes;
    std::string heading;   // section heading, trait or spell header name
    std::string text;      // trait desc, subheading text, spell text
    std::string level;     // spell entry level
    bool first = false;
    bool last = false;
    const std::vector<RenderedBlock>* children = nullptr; // Collapse, Inline
};

class BlockProducer {
public:
    virtual ~BlockProducer() = default;

    // Returns nullptr or an empty handle when there is nothing to draw.
    virtual std::shared_ptr<BlockHandle> produce(const BlockRequest& request) = 0;
};

// Resolves cross references in free text ("fireball" -> a link).
using Linkifier = std::function<std::string(const std::string& text, const std::string& context_id)>;

Linkifier identity_linkifier();

// Finds a named layout; nullptr when unknown.
using LayoutLookup = std::function<const model::Layout*(const std::string& name)>;

} // namespace statblock::layout
