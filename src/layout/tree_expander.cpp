#include <statblock/layout/tree_expander.h>

#include <statblock/core/config.h>
#include <statblock/model/trait.h>

#include <algorithm>
#include <exception>

namespace statblock::layout {

namespace {

const model::Value& null_value() {
    static const model::Value v;
    return v;
}

std::string describe_item(const model::StatblockItem& item) {
    std::string s = model::item_type_name(item.type);
    if (!item.id.empty()) s += " '" + item.id + "'";
    return s;
}

// Context for the children of `item`: its own class joins the list.
ExpandContext child_context(const ExpandContext& ctx, const model::StatblockItem& item) {
    ExpandContext child = ctx;
    if (!item.cls.empty()) child.classes.push_back(item.cls);
    return child;
}

} // anonymous namespace

std::string substitute_monster_name(const std::string& text, const std::string& name) {
    static const std::string placeholder = "{{monster}}";
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (true) {
        auto found = text.find(placeholder, pos);
        if (found == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, found - pos);
        out += name;
        pos = found + placeholder.size();
    }
    return out;
}

TreeExpander::TreeExpander(BlockProducer& producer, ConditionEvaluator& conditions,
                           const SpellGrouper& spells, LayoutLookup layouts,
                           core::DiagnosticEmitter& diagnostics)
    : producer_(producer),
      conditions_(conditions),
      spells_(spells),
      layouts_(std::move(layouts)),
      diagnostics_(diagnostics) {}

std::vector<RenderedBlock> TreeExpander::expand(const std::vector<model::StatblockItem>& items,
                                                const model::DataRecord& record,
                                                const ExpandContext& ctx) {
    std::vector<RenderedBlock> out;
    expand_into(items, record, ctx, out);
    return out;
}

void TreeExpander::expand_into(const std::vector<model::StatblockItem>& items,
                               const model::DataRecord& record, const ExpandContext& ctx,
                               std::vector<RenderedBlock>& out) {
    for (const auto& item : items) {
        expand_item(item, record, ctx, out);
    }
}

void TreeExpander::expand_item(const model::StatblockItem& item, const model::DataRecord& record,
                               const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    if (!conditions_.is_visible(item, record)) return;

    std::vector<RenderedBlock> produced;
    try {
        expand_by_type(item, record, ctx, produced);
        if (item.has_rule && !produced.empty()) {
            emit(request_for(BlockKind::Separator, item, record, ctx), item, produced);
        }
    } catch (const std::exception& e) {
        diagnostics_.error("expand", model::item_type_name(item.type),
                           describe_item(item) + ": " + e.what());
        return;
    }

    for (auto& block : produced) {
        out.push_back(std::move(block));
    }
}

void TreeExpander::expand_by_type(const model::StatblockItem& item, const model::DataRecord& record,
                                  const ExpandContext& ctx, std::vector<RenderedBlock>& produced) {
    switch (item.type) {
        case model::ItemType::Group:
            expand_group(item, record, ctx, produced);
            break;
        case model::ItemType::Inline:
            expand_inline(item, record, ctx, produced);
            break;
        case model::ItemType::Collapse:
            expand_collapse(item, record, ctx, produced);
            break;
        case model::ItemType::IfElse:
            expand_ifelse(item, record, ctx, produced);
            break;
        case model::ItemType::Layout:
            expand_layout(item, record, ctx, produced);
            break;
        case model::ItemType::Spells:
            expand_spells(item, record, ctx, produced);
            break;
        case model::ItemType::Traits:
            expand_traits(item, record, ctx, produced);
            break;
        case model::ItemType::Heading:
        case model::ItemType::Subheading:
        case model::ItemType::Property:
        case model::ItemType::Saves:
        case model::ItemType::Table:
        case model::ItemType::Text:
        case model::ItemType::Image:
        case model::ItemType::Action:
        case model::ItemType::Javascript:
            expand_leaf(item, record, ctx, produced);
            break;
    }
}

BlockRequest TreeExpander::request_for(BlockKind kind, const model::StatblockItem& item,
                                       const model::DataRecord& record,
                                       const ExpandContext& ctx) const {
    BlockRequest request;
    request.kind = kind;
    request.item = &item;
    request.record = &record;
    request.classes = ctx.classes;
    if (!item.cls.empty()) request.classes.push_back(item.cls);
    return request;
}

void TreeExpander::emit(BlockRequest request, const model::StatblockItem& item,
                        std::vector<RenderedBlock>& out, std::vector<RenderedBlock> children) {
    if (request.kind == BlockKind::Collapse || request.kind == BlockKind::Inline) {
        request.children = &children;
    }

    RenderedBlock block;
    block.kind = request.kind;
    block.source = item.type;
    block.item_id = item.id;
    block.classes = request.classes;
    block.first = request.first;
    block.last = request.last;
    block.handle = producer_.produce(request);
    block.children = std::move(children);

    if (block.is_empty()) return;
    out.push_back(std::move(block));
}

void TreeExpander::expand_group(const model::StatblockItem& item, const model::DataRecord& record,
                                const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    if (!item.heading.empty()) {
        auto request = request_for(BlockKind::SectionHeading, item, record, ctx);
        request.heading = item.heading;
        emit(std::move(request), item, out);
    }
    expand_into(item.nested, record, child_context(ctx, item), out);
}

void TreeExpander::expand_inline(const model::StatblockItem& item, const model::DataRecord& record,
                                 const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    if (!item.heading.empty()) {
        auto request = request_for(BlockKind::SectionHeading, item, record, ctx);
        request.heading = item.heading;
        emit(std::move(request), item, out);
    }

    std::vector<RenderedBlock> inner;
    expand_into(item.nested, record, child_context(ctx, item), inner);
    if (inner.empty()) return;

    emit(request_for(BlockKind::Inline, item, record, ctx), item, out, std::move(inner));
}

void TreeExpander::expand_collapse(const model::StatblockItem& item, const model::DataRecord& record,
                                   const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    std::vector<RenderedBlock> inner;
    expand_into(item.nested, record, child_context(ctx, item), inner);

    auto request = request_for(BlockKind::Collapse, item, record, ctx);
    request.heading = item.heading;
    emit(std::move(request), item, out, std::move(inner));
}

void TreeExpander::expand_ifelse(const model::StatblockItem& item, const model::DataRecord& record,
                                 const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    const model::Value& plugin = ctx.plugin ? *ctx.plugin : null_value();
    const model::ConditionalBranch* branch = conditions_.select_branch(item, record, plugin);
    if (!branch) return;
    expand_into(branch->nested, record, child_context(ctx, item), out);
}

void TreeExpander::expand_layout(const model::StatblockItem& item, const model::DataRecord& record,
                                 const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    const std::string& name = item.layout;
    if (name.empty()) {
        diagnostics_.info("expand", "layout", describe_item(item) + " names no layout");
        return;
    }
    if (std::find(ctx.layout_chain.begin(), ctx.layout_chain.end(), name) != ctx.layout_chain.end()) {
        diagnostics_.warn("expand", "layout", "layout '" + name + "' references itself");
        return;
    }
    if (static_cast<int>(ctx.layout_chain.size()) >= core::config::kMaxLayoutDepth) {
        diagnostics_.warn("expand", "layout", "layout '" + name + "' nested too deeply");
        return;
    }

    const model::Layout* layout = layouts_ ? layouts_(name) : nullptr;
    if (!layout || layout->blocks.empty()) {
        diagnostics_.info("expand", "layout", "layout '" + name + "' not found or empty");
        return;
    }

    ExpandContext child = child_context(ctx, item);
    child.classes.push_back("layout-" + model::slugify(layout->name));
    child.layout_chain.push_back(name);
    expand_into(layout->blocks, record, child, out);
}

void TreeExpander::expand_spells(const model::StatblockItem& item, const model::DataRecord& record,
                                 const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    const std::string& field = item.first_property();
    const model::Value* raw = field.empty() ? nullptr : record.get(field);
    if (!raw || raw->is_null()) return;
    if (!raw->is_list()) {
        diagnostics_.error("expand", "spells",
                           describe_item(item) + " field '" + field + "': expected a list, got " +
                           model::value_kind_name(raw->kind()));
        return;
    }
    if (raw->empty()) return;

    auto groups = spells_.group(*raw, record.name(), ctx.context_id);
    std::string heading = item.heading.empty()
        ? std::string(core::config::kDefaultSpellcastingHeading)
        : item.heading;

    for (std::size_t g = 0; g < groups.size(); ++g) {
        const auto& group = groups[g];
        if (!group.header.empty()) {
            auto request = request_for(BlockKind::Trait, item, record, ctx);
            if (g == 0) request.heading = heading;
            request.text = group.header;
            emit(std::move(request), item, out);
        }
        for (std::size_t i = 0; i < group.spells.size(); ++i) {
            const auto& spell = group.spells[i];
            auto request = request_for(BlockKind::SpellEntry, item, record, ctx);
            request.level = spell.level.value_or("");
            request.text = spell.spells;
            request.first = i == 0;
            request.last = i + 1 == group.spells.size();
            emit(std::move(request), item, out);
        }
    }
}

void TreeExpander::expand_traits(const model::StatblockItem& item, const model::DataRecord& record,
                                 const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    const std::string& field = item.first_property();
    const model::Value* raw = field.empty() ? nullptr : record.get(field);
    if (!raw || raw->is_null()) return;
    if (raw->is_list() && raw->empty()) return;

    auto parsed = model::parse_traits(*raw);
    if (!parsed.ok) {
        diagnostics_.error("expand", "traits",
                           describe_item(item) + " field '" + field + "': " + parsed.message);
        return;
    }

    if (!item.heading.empty()) {
        auto request = request_for(BlockKind::SectionHeading, item, record, ctx);
        request.heading = item.heading;
        emit(std::move(request), item, out);
    }
    if (!item.subheading_text.empty()) {
        auto request = request_for(BlockKind::Subheading, item, record, ctx);
        request.text = substitute_monster_name(item.subheading_text, record.name());
        emit(std::move(request), item, out);
    }

    const auto& traits = parsed.traits;
    auto renders = [&](std::size_t i) { return i == 0 || !traits[i].desc.empty(); };
    std::size_t last = 0;
    for (std::size_t i = 0; i < traits.size(); ++i) {
        if (renders(i)) last = i;
    }

    for (std::size_t i = 0; i < traits.size(); ++i) {
        if (!renders(i)) continue;
        auto request = request_for(BlockKind::Trait, item, record, ctx);
        request.heading = traits[i].name;
        request.text = traits[i].desc;
        request.first = i == 0;
        request.last = i == last;
        emit(std::move(request), item, out);
    }
}

void TreeExpander::expand_leaf(const model::StatblockItem& item, const model::DataRecord& record,
                               const ExpandContext& ctx, std::vector<RenderedBlock>& out) {
    emit(request_for(BlockKind::Item, item, record, ctx), item, out);
}

} // namespace statblock::layout
