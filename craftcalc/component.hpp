#pragma once

#include <map>
#include <optional>
#include <string>

#include "craftcalc/producer.hpp"

namespace craftcalc {

// A named item in the production graph.
// The ingredients map holds the quantity of each ingredient consumed per unit produced.
struct Component {
    std::string name;
    std::optional<double> craft_seconds;
    std::map<std::string, double> ingredients;
    ProducerCategory producer = ProducerCategory::Infinite;

    // Raw components have no craft time or an unlimited producer and never need producers.
    bool is_raw() const;

    // Units one producer outputs per second at base speed. Throws InvalidRate for raw components.
    double units_per_second() const;
};

} // namespace craftcalc
