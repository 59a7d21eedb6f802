#include <statblock/model/trait.h>

namespace statblock::model {

namespace {

bool is_scalar(const Value& v) {
    return v.is_string() || v.is_number() || v.is_bool();
}

} // anonymous namespace

TraitListResult parse_traits(const Value& field) {
    TraitListResult result;
    if (!field.is_list()) {
        result.message = std::string("expected a list of traits, got ") +
                         value_kind_name(field.kind());
        return result;
    }

    const auto& entries = field.as_list();
    result.traits.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Value& entry = entries[i];
        if (!entry.is_map()) {
            result.traits.clear();
            result.message = "trait " + std::to_string(i) + " is a " +
                             value_kind_name(entry.kind()) + ", expected a map";
            return result;
        }

        Trait trait;
        const Value* name = entry.find("name");
        const Value* desc = entry.find("desc");
        if ((name && !name->is_null() && !is_scalar(*name)) ||
            (desc && !desc->is_null() && !is_scalar(*desc))) {
            result.traits.clear();
            result.message = "trait " + std::to_string(i) + " has a non-text name or desc";
            return result;
        }
        if (name) trait.name = name->to_display_string();
        if (desc) trait.desc = desc->to_display_string();
        result.traits.push_back(std::move(trait));
    }

    result.ok = true;
    return result;
}

} // namespace statblock::model
