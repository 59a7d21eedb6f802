#pragma once
#include <statblock/layout/block.h>
#include <statblock/model/statblock_item.h>

#include <map>
#include <string>
#include <vector>

namespace statblock::layout {

// Named layouts available to `layout` items and to records that name their
// own layout. Names compare exactly.
class LayoutRegistry {
public:
    // Adds or replaces the layout stored under layout.name.
    void add(model::Layout layout);
    bool remove(const std::string& name);

    const model::Layout* find(const std::string& name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return layouts_.size(); }

    // Lookup bound to this registry; the registry must outlive it.
    LayoutLookup lookup() const;

private:
    std::map<std::string, model::Layout> layouts_;
};

} // namespace statblock::layout
