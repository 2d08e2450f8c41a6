#pragma once

#include <map>
#include <string>

namespace craftcalc {

// Class of building or process that produces a component.
// `Infinite` marks raw resources that never need a producer.
enum class ProducerCategory {
    Machine,
    ChemPlant,
    Furnace,
    RocketSilo,
    Infinite
};

const char* to_string(ProducerCategory category);

// Parses the lowercase name ("machine", "chem_plant", ...). Throws InvalidComponent.
ProducerCategory parse_producer_category(const std::string& name);

// Per-category throughput multipliers. Missing categories run at 1.0.
class SpeedTable {
public:
    SpeedTable() = default;

    // Throws InvalidRate unless multiplier is finite and positive.
    SpeedTable& set(ProducerCategory category, double multiplier);

    double multiplier(ProducerCategory category) const;

    bool empty() const { return multipliers_.empty(); }
    const std::map<ProducerCategory, double>& entries() const { return multipliers_; }

private:
    std::map<ProducerCategory, double> multipliers_;
};

} // namespace craftcalc
