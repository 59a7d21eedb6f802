#pragma once
#include <statblock/model/value.h>

#include <string>
#include <vector>

namespace statblock::model {

struct Trait {
    std::string name;
    std::string desc;
};

struct TraitListResult {
    bool ok = false;
    std::string message;
    std::vector<Trait> traits;
};

// Reads a record field holding a list of {name, desc} maps. Scalar name and
// desc values are converted to text; anything else in the list fails the
// whole field.
TraitListResult parse_traits(const Value& field);

} // namespace statblock::model
