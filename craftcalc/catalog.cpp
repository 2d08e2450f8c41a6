#include "craftcalc/catalog.hpp"

#include <cmath>
#include <set>
#include <utility>

#include "craftcalc/errors.hpp"

namespace craftcalc {

const Component& Catalog::add(Component component) {
    validate(component);
    if (contains(component.name)) {
        throw DuplicateName(component.name);
    }
    return store(std::move(component));
}

const Component& Catalog::upsert(Component component) {
    validate(component);
    if (contains(component.name)) {
        check_no_cycle(component);
    }
    return store(std::move(component));
}

const Component& Catalog::get(const std::string& name) const {
    auto it = components_.find(name);
    if (it == components_.end()) {
        throw UnknownComponent(name);
    }
    return it->second;
}

bool Catalog::contains(const std::string& name) const {
    return components_.find(name) != components_.end();
}

void Catalog::validate(const Component& component) const {
    if (component.name.empty()) {
        throw InvalidComponent("component name must not be empty");
    }
    if (component.craft_seconds &&
        (!std::isfinite(*component.craft_seconds) || *component.craft_seconds < 0.0)) {
        throw InvalidComponent("component '" + component.name +
                               "' has invalid craft time " + std::to_string(*component.craft_seconds));
    }
    for (const auto& [ingredient, qty] : component.ingredients) {
        if (ingredient == component.name) {
            throw InvalidComponent("component '" + component.name + "' lists itself as an ingredient");
        }
        if (!std::isfinite(qty) || qty < 0.0) {
            throw InvalidComponent("component '" + component.name + "' has invalid quantity " +
                                   std::to_string(qty) + " of '" + ingredient + "'");
        }
        if (!contains(ingredient)) {
            throw UnknownIngredient(component.name, ingredient);
        }
    }
}

// Walks everything reachable from the new ingredients using the current
// definitions; reaching the component itself means the replacement closes a loop.
void Catalog::check_no_cycle(const Component& component) const {
    for (const auto& [root, qty] : component.ingredients) {
        std::vector<std::string> pending{root};
        std::set<std::string> seen;
        while (!pending.empty()) {
            std::string current = std::move(pending.back());
            pending.pop_back();
            if (current == component.name) {
                throw CycleDetected(component.name, root);
            }
            if (!seen.insert(current).second) {
                continue;
            }
            for (const auto& [next, next_qty] : get(current).ingredients) {
                pending.push_back(next);
            }
        }
    }
}

const Component& Catalog::store(Component component) {
    auto it = components_.find(component.name);
    if (it == components_.end()) {
        std::string name = component.name;
        it = components_.emplace(name, std::move(component)).first;
        order_.push_back(std::move(name));
    } else {
        it->second = std::move(component);
    }
    ++revision_;
    return it->second;
}

} // namespace craftcalc
