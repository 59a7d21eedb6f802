#include <statblock/layout/block.h>

namespace statblock::layout {

const char* block_kind_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Item:           return "item";
        case BlockKind::SectionHeading: return "section-heading";
        case BlockKind::Subheading:     return "subheading";
        case BlockKind::Trait:          return "trait";
        case BlockKind::SpellEntry:     return "spell-entry";
        case BlockKind::Separator:      return "separator";
        case BlockKind::Collapse:       return "collapse";
        case BlockKind::Inline:         return "inline";
    }
    return "unknown";
}

bool RenderedBlock::is_empty() const {
    if (handle && !handle->empty()) return false;
    for (const auto& child : children) {
        if (!child.is_empty()) return false;
    }
    return true;
}

bool same_structure(const RenderedBlock& a, const RenderedBlock& b) {
    if (a.kind != b.kind || a.source != b.source) return false;
    if (a.item_id != b.item_id || a.classes != b.classes) return false;
    if (a.first != b.first || a.last != b.last) return false;

    bool a_has = a.handle && !a.handle->empty();
    bool b_has = b.handle && !b.handle->empty();
    if (a_has != b_has) return false;
    if (a_has && a.handle->describe() != b.handle->describe()) return false;

    return same_structure(a.children, b.children);
}

bool same_structure(const std::vector<RenderedBlock>& a, const std::vector<RenderedBlock>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!same_structure(a[i], b[i])) return false;
    }
    return true;
}

Linkifier identity_linkifier() {
    return [](const std::string& text, const std::string& /*context_id*/) { return text; };
}

} // namespace statblock::layout
