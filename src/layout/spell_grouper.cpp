#include <statblock/layout/spell_grouper.h>

namespace statblock::layout {

bool is_spell_header(const std::string& text) {
    if (text.empty()) return false;
    return text.back() == ':' || text.find(':') == std::string::npos;
}

SpellGrouper::SpellGrouper(Linkifier linkifier, core::DiagnosticEmitter* diagnostics)
    : linkifier_(linkifier ? std::move(linkifier) : identity_linkifier()),
      diagnostics_(diagnostics) {}

std::optional<SpellEntry> SpellGrouper::map_entry(const model::Value& entry,
                                                  const std::string& context_id) const {
    const auto& entries = entry.as_map();
    if (entries.empty()) return std::nullopt;

    const auto& [level, spells] = entries.front();
    std::string text;
    if (spells.is_string() || spells.is_number()) {
        text = spells.to_display_string();
    } else if (spells.is_list()) {
        for (const auto& item : spells.as_list()) {
            if (!item.is_string()) return std::nullopt;
        }
        text = spells.to_display_string();
    } else {
        return std::nullopt;
    }

    SpellEntry result;
    result.level = level;
    result.spells = linkifier_(text, context_id);
    return result;
}

std::vector<SpellBlock> SpellGrouper::group(const model::Value& raw,
                                            const std::string& creature_name,
                                            const std::string& context_id) const {
    std::vector<SpellBlock> groups;
    if (!raw.is_list()) return groups;

    auto current = [&]() -> SpellBlock& {
        if (groups.empty()) {
            groups.push_back({creature_name + " knows the following spells:", {}});
        }
        return groups.back();
    };

    const auto& items = raw.as_list();
    for (std::size_t i = 0; i < items.size(); ++i) {
        const model::Value& item = items[i];

        if (item.is_string()) {
            const std::string& text = item.as_string();
            if (text.empty()) continue;
            if (is_spell_header(text)) {
                SpellBlock block;
                block.header = text.back() == ':' ? text : text + ":";
                groups.push_back(std::move(block));
                continue;
            }
            current().spells.push_back({std::nullopt, linkifier_(text, context_id)});
            continue;
        }

        if (item.is_map()) {
            auto entry = map_entry(item, context_id);
            if (!entry) {
                if (diagnostics_) {
                    diagnostics_->info("spells", "group",
                                       "dropped spell entry " + std::to_string(i) +
                                       ": no level/spells pair");
                }
                continue;
            }
            current().spells.push_back(std::move(*entry));
            continue;
        }

        if (diagnostics_) {
            diagnostics_->info("spells", "group",
                               std::string("dropped spell entry ") + std::to_string(i) +
                               " of kind " + model::value_kind_name(item.kind()));
        }
    }

    return groups;
}

} // namespace statblock::layout
