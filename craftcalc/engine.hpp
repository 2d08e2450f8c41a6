#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "craftcalc/catalog.hpp"
#include "craftcalc/producer.hpp"

namespace craftcalc {

// Component name -> quantity (units, or producers for rate queries).
using Totals = std::map<std::string, double>;

struct EngineOptions {
    // Longest ingredient chain a query may walk.
    std::size_t max_depth = 256;
    // Cache per-component summaries across queries.
    bool memoize = true;
};

// Resolves transitive ingredient totals and producer counts over a catalog.
// The catalog must outlive the engine and must not change while a query runs.
class Engine {
public:
    explicit Engine(const Catalog& catalog, EngineOptions options = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Quantity of every component needed to build one unit of `name`, the
    // component itself included with quantity 1.
    // Throws UnknownComponent or DepthLimitExceeded.
    Totals summarize(const std::string& name) const;

    // Sum of summarize(name) * units over all targets.
    Totals combined_summary(const std::map<std::string, double>& targets) const;

    // Producers of each manufactured component needed to output `units` of
    // `name` every `seconds`. Counts are fractional; raw components are omitted.
    // Throws InvalidRate unless seconds > 0 and units >= 0.
    Totals producers_needed(const std::string& name, double units = 1.0, double seconds = 1.0,
                            const SpeedTable& speeds = {}) const;

    // Element-wise sum of producers_needed over every (name, units) target.
    // All targets are validated before any is resolved.
    Totals combined_producers_needed(const std::map<std::string, double>& targets, double seconds,
                                     const SpeedTable& speeds = {}) const;

    const Catalog& catalog() const { return catalog_; }
    const EngineOptions& options() const { return options_; }

private:
    struct Summary {
        Totals totals;
        std::size_t height = 0;
    };
    using SummaryMap = std::map<std::string, Summary>;

    const Summary& resolve(const Component& root, SummaryMap& memo) const;
    Totals producers_at_rate(const std::string& name, double units_per_second, const SpeedTable& speeds) const;

    const Catalog& catalog_;
    EngineOptions options_;

    mutable std::mutex cache_mutex_;
    mutable SummaryMap cache_;
    mutable std::uint64_t cache_revision_ = 0;
};

} // namespace craftcalc
