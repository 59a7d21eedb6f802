#include <statblock/layout/layout_registry.h>

namespace statblock::layout {

void LayoutRegistry::add(model::Layout layout) {
    std::string name = layout.name;
    layouts_[name] = std::move(layout);
}

bool LayoutRegistry::remove(const std::string& name) {
    return layouts_.erase(name) > 0;
}

const model::Layout* LayoutRegistry::find(const std::string& name) const {
    auto it = layouts_.find(name);
    return it == layouts_.end() ? nullptr : &it->second;
}

std::vector<std::string> LayoutRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(layouts_.size());
    for (const auto& [name, layout] : layouts_) {
        result.push_back(name);
    }
    return result;
}

LayoutLookup LayoutRegistry::lookup() const {
    return [this](const std::string& name) { return find(name); };
}

} // namespace statblock::layout
