#include "craftcalc/humanize.hpp"

#include <algorithm>
#include <cmath>

#include "craftcalc/errors.hpp"

namespace craftcalc {

namespace {

// Relative to the magnitude of the value. Absorbs floating-point noise left by
// chains of divisions, e.g. 2.0000000000004, but not real fractional demand.
constexpr double kRelativeTolerance = 1e-12;

// 2^63, the first double a long long cannot hold.
constexpr double kLongLongLimit = 9223372036854775808.0;

} // namespace

long long round_up(double value) {
    if (!std::isfinite(value) || std::fabs(value) >= kLongLongLimit) {
        throw InvalidRate("count " + std::to_string(value) + " is too large to round");
    }
    const double nearest = std::round(value);
    if (std::fabs(value - nearest) <= kRelativeTolerance * std::max(1.0, std::fabs(value))) {
        return static_cast<long long>(nearest);
    }
    return static_cast<long long>(std::ceil(value));
}

std::map<std::string, long long> round_up(const Totals& totals) {
    std::map<std::string, long long> rounded;
    for (const auto& [name, total] : totals) {
        rounded[name] = round_up(total);
    }
    return rounded;
}

void humanize(std::ostream& out, const Totals& totals) {
    for (const auto& [name, total] : totals) {
        out << name << " : " << round_up(total) << '\n';
    }
}

} // namespace craftcalc
