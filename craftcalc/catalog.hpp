#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "craftcalc/component.hpp"

namespace craftcalc {

// Registry of component definitions keyed by name.
//
// Ingredients must be registered before the components that use them, so the
// ingredient graph is acyclic by construction. Populate the catalog first, then
// query it; nothing here is synchronized.
class Catalog {
public:
    // Strict registration. Throws DuplicateName, UnknownIngredient or
    // InvalidComponent; the catalog is unchanged on failure.
    const Component& add(Component component);

    // Registers or replaces a definition. Throws CycleDetected if an ingredient
    // of the new definition already depends on it.
    const Component& upsert(Component component);

    // Throws UnknownComponent.
    const Component& get(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::size_t size() const { return components_.size(); }
    bool empty() const { return components_.empty(); }

    // Names in registration order.
    const std::vector<std::string>& names() const { return order_; }

    // Incremented on every successful add or upsert.
    std::uint64_t revision() const { return revision_; }

private:
    void validate(const Component& component) const;
    void check_no_cycle(const Component& component) const;
    const Component& store(Component component);

    std::map<std::string, Component> components_;
    std::vector<std::string> order_;
    std::uint64_t revision_ = 0;
};

} // namespace craftcalc
