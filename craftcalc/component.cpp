#include "craftcalc/component.hpp"

#include "craftcalc/errors.hpp"

namespace craftcalc {

bool Component::is_raw() const {
    return !craft_seconds || *craft_seconds == 0.0 || producer == ProducerCategory::Infinite;
}

double Component::units_per_second() const {
    if (is_raw()) {
        throw InvalidRate("component '" + name + "' is raw and has no production rate");
    }
    return 1.0 / *craft_seconds;
}

} // namespace craftcalc
