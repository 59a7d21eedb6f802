#pragma once
#include <statblock/core/diagnostics.h>
#include <statblock/layout/block.h>
#include <statblock/model/value.h>

#include <optional>
#include <string>
#include <vector>

namespace statblock::layout {

struct SpellEntry {
    std::optional<std::string> level;
    std::string spells;
};

struct SpellBlock {
    std::string header;
    std::vector<SpellEntry> spells;
};

// A string is a header when it ends with ':' or has no ':' at all.
bool is_spell_header(const std::string& text);

// Folds a raw spell list (header strings, "level: spells" strings and
// {level: spells} maps) into groups. Entries before the first header go into
// a group headed "<name> knows the following spells:".
class SpellGrouper {
public:
    explicit SpellGrouper(Linkifier linkifier = identity_linkifier(),
                          core::DiagnosticEmitter* diagnostics = nullptr);

    std::vector<SpellBlock> group(const model::Value& raw, const std::string& creature_name,
                                  const std::string& context_id) const;

private:
    std::optional<SpellEntry> map_entry(const model::Value& entry, const std::string& context_id) const;

    Linkifier linkifier_;
    core::DiagnosticEmitter* diagnostics_;
};

} // namespace statblock::layout
