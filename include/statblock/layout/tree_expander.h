#pragma once
#include <statblock/core/diagnostics.h>
#include <statblock/layout/block.h>
#include <statblock/layout/condition_evaluator.h>
#include <statblock/layout/spell_grouper.h>
#include <statblock/model/statblock_item.h>
#include <statblock/model/value.h>

#include <string>
#include <vector>

namespace statblock::layout {

// State threaded through one expansion. Copied, never shared, on the way
// down so siblings never see each other's classes or layout chain.
struct ExpandContext {
    std::string context_id;                // passed to the linkifier
    std::vector<std::string> classes;      // accumulated from enclosing items
    const model::Value* plugin = nullptr;  // bound as `plugin` in ifelse scripts
    std::vector<std::string> layout_chain; // layouts currently being expanded
};

// Turns a declared layout tree into the flat, ordered block sequence that
// gets measured and split into columns.
class TreeExpander {
public:
    TreeExpander(BlockProducer& producer, ConditionEvaluator& conditions,
                 const SpellGrouper& spells, LayoutLookup layouts,
                 core::DiagnosticEmitter& diagnostics);

    // Never throws for a malformed item: the item is logged and skipped.
    std::vector<RenderedBlock> expand(const std::vector<model::StatblockItem>& items,
                                      const model::DataRecord& record,
                                      const ExpandContext& ctx);

private:
    void expand_into(const std::vector<model::StatblockItem>& items,
                     const model::DataRecord& record, const ExpandContext& ctx,
                     std::vector<RenderedBlock>& out);
    void expand_item(const model::StatblockItem& item, const model::DataRecord& record,
                     const ExpandContext& ctx, std::vector<RenderedBlock>& out);

    void expand_by_type(const model::StatblockItem& item, const model::DataRecord& record,
                        const ExpandContext& ctx, std::vector<RenderedBlock>& produced);

    void expand_group(const model::StatblockItem& item, const model::DataRecord& record,
                      const ExpandContext& ctx, std::vector<RenderedBlock>& out);
    void expand_inline(const model::StatblockItem& item, const model::DataRecord& record,
                       const ExpandContext& ctx, std::vector<RenderedBlock>& out);
    void expand_collapse(const model::StatblockItem& item, const model::DataRecord& record,
                         const ExpandContext& ctx, std::vector<RenderedBlock>& out);
    void expand_ifelse(const model::StatblockItem& item, const model::DataRecord& record,
                       const ExpandContext& ctx, std::vector<RenderedBlock>& out);
    void expand_layout(const model::StatblockItem& item, const model::DataRecord& record,
                       const ExpandContext& ctx, std::vector<RenderedBlock>& out);
    void expand_spells(const model::StatblockItem& item, const model::DataRecord& record,
                       const ExpandContext& ctx, std::vector<RenderedBlock>& out);
    void expand_traits(const model::StatblockItem& item, const model::DataRecord& record,
                       const ExpandContext& ctx, std::vector<RenderedBlock>& out);
    void expand_leaf(const model::StatblockItem& item, const model::DataRecord& record,
                     const ExpandContext& ctx, std::vector<RenderedBlock>& out);

    // Asks the producer for one block and appends it unless it came back empty.
    void emit(BlockRequest request, const model::StatblockItem& item,
              std::vector<RenderedBlock>& out, std::vector<RenderedBlock> children = {});

    BlockRequest request_for(BlockKind kind, const model::StatblockItem& item,
                             const model::DataRecord& record, const ExpandContext& ctx) const;

    BlockProducer& producer_;
    ConditionEvaluator& conditions_;
    const SpellGrouper& spells_;
    LayoutLookup layouts_;
    core::DiagnosticEmitter& diagnostics_;
};

// Replaces every "{{monster}}" in text with the creature name.
std::string substitute_monster_name(const std::string& text, const std::string& name);

} // namespace statblock::layout
