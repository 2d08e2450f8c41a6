#pragma once

#include <map>
#include <ostream>
#include <string>

#include "craftcalc/engine.hpp"

namespace craftcalc {

// Whole producers or components covering `value`: 2.01 -> 3, 2.0 -> 2.
// Throws InvalidRate for values a long long cannot hold.
long long round_up(double value);

std::map<std::string, long long> round_up(const Totals& totals);

// Writes "name : count" per entry, counts rounded up, in name order.
void humanize(std::ostream& out, const Totals& totals);

} // namespace craftcalc
