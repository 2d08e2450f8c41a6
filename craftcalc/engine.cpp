#include "craftcalc/engine.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "craftcalc/errors.hpp"

namespace craftcalc {

namespace {

void accumulate(Totals& totals, const std::string& name, double amount) {
    auto it = totals.find(name);
    if (it == totals.end()) {
        it = totals.emplace(name, 0.0).first;
    }
    it->second += amount;
}

void check_period(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        throw InvalidRate("production period must be positive, got " + std::to_string(seconds));
    }
}

void check_units(const std::string& name, double units) {
    if (!std::isfinite(units) || units < 0.0) {
        throw InvalidRate("target units for '" + name + "' must be non-negative, got " + std::to_string(units));
    }
}

} // namespace

Engine::Engine(const Catalog& catalog, EngineOptions options)
    : catalog_(catalog), options_(options) {}

Totals Engine::summarize(const std::string& name) const {
    const Component& root = catalog_.get(name);

    if (!options_.memoize) {
        SummaryMap memo;
        return resolve(root, memo).totals;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_revision_ != catalog_.revision()) {
        cache_.clear();
        cache_revision_ = catalog_.revision();
    }
    return resolve(root, cache_).totals;
}

// Post-order walk on an explicit stack: a component is summed once all of its
// ingredients have a summary in `memo`.
const Engine::Summary& Engine::resolve(const Component& root, SummaryMap& memo) const {
    struct Frame {
        const Component* component;
        std::size_t depth;
        bool expanded;
    };

    std::vector<Frame> stack;
    stack.push_back({&root, 0, false});

    while (!stack.empty()) {
        const Component& current = *stack.back().component;
        if (memo.find(current.name) != memo.end()) {
            stack.pop_back();
            continue;
        }

        if (!stack.back().expanded) {
            const std::size_t depth = stack.back().depth;
            if (depth > options_.max_depth) {
                throw DepthLimitExceeded(root.name, options_.max_depth);
            }
            stack.back().expanded = true;
            for (const auto& [ingredient, qty] : current.ingredients) {
                if (qty > 0.0 && memo.find(ingredient) == memo.end()) {
                    stack.push_back({&catalog_.get(ingredient), depth + 1, false});
                }
            }
            continue;
        }

        Summary summary;
        accumulate(summary.totals, current.name, 1.0);
        for (const auto& [ingredient, qty] : current.ingredients) {
            if (qty <= 0.0) {
                continue;
            }
            const Summary& sub = memo.at(ingredient);
            summary.height = std::max(summary.height, sub.height + 1);
            for (const auto& [sub_name, sub_qty] : sub.totals) {
                accumulate(summary.totals, sub_name, qty * sub_qty);
            }
        }
        memo.emplace(current.name, std::move(summary));
        stack.pop_back();
    }

    const Summary& result = memo.at(root.name);
    if (result.height > options_.max_depth) {
        throw DepthLimitExceeded(root.name, options_.max_depth);
    }
    return result;
}

Totals Engine::combined_summary(const std::map<std::string, double>& targets) const {
    for (const auto& [name, units] : targets) {
        catalog_.get(name);
        check_units(name, units);
    }

    Totals combined;
    for (const auto& [name, units] : targets) {
        for (const auto& [component, qty] : summarize(name)) {
            accumulate(combined, component, qty * units);
        }
    }
    return combined;
}

Totals Engine::producers_needed(const std::string& name, double units, double seconds,
                                const SpeedTable& speeds) const {
    check_period(seconds);
    check_units(name, units);
    return producers_at_rate(name, units / seconds, speeds);
}

Totals Engine::producers_at_rate(const std::string& name, double units_per_second,
                                 const SpeedTable& speeds) const {
    Totals producers;
    for (const auto& [component_name, quantity] : summarize(name)) {
        const Component& component = catalog_.get(component_name);
        if (component.is_raw()) {
            continue;
        }

        const double produced_per_second = component.units_per_second() * speeds.multiplier(component.producer);
        const double required_per_second = quantity * units_per_second;
        producers[component_name] = required_per_second / produced_per_second;
    }
    return producers;
}

Totals Engine::combined_producers_needed(const std::map<std::string, double>& targets, double seconds,
                                         const SpeedTable& speeds) const {
    check_period(seconds);
    for (const auto& [name, units] : targets) {
        catalog_.get(name);
        check_units(name, units);
    }

    Totals combined;
    for (const auto& [name, units] : targets) {
        for (const auto& [component, count] : producers_at_rate(name, units / seconds, speeds)) {
            accumulate(combined, component, count);
        }
    }
    return combined;
}

} // namespace craftcalc
