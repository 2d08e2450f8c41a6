#include "craftcalc/producer.hpp"

#include <cmath>

#include "craftcalc/errors.hpp"

namespace craftcalc {

const char* to_string(ProducerCategory category) {
    switch (category) {
        case ProducerCategory::Machine: return "machine";
        case ProducerCategory::ChemPlant: return "chem_plant";
        case ProducerCategory::Furnace: return "furnace";
        case ProducerCategory::RocketSilo: return "rocket_silo";
        case ProducerCategory::Infinite: return "infinite";
    }
    return "infinite";
}

ProducerCategory parse_producer_category(const std::string& name) {
    static const std::map<std::string, ProducerCategory> by_name = {
        {"machine", ProducerCategory::Machine},
        {"chem_plant", ProducerCategory::ChemPlant},
        {"furnace", ProducerCategory::Furnace},
        {"rocket_silo", ProducerCategory::RocketSilo},
        {"infinite", ProducerCategory::Infinite},
    };
    auto it = by_name.find(name);
    if (it == by_name.end()) {
        throw InvalidComponent("unknown producer category: " + name);
    }
    return it->second;
}

SpeedTable& SpeedTable::set(ProducerCategory category, double multiplier) {
    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        throw InvalidRate(std::string("speed multiplier for ") + to_string(category) +
                          " must be positive, got " + std::to_string(multiplier));
    }
    multipliers_[category] = multiplier;
    return *this;
}

double SpeedTable::multiplier(ProducerCategory category) const {
    auto it = multipliers_.find(category);
    return it == multipliers_.end() ? 1.0 : it->second;
}

} // namespace craftcalc
