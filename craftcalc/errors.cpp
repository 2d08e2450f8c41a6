#include "craftcalc/errors.hpp"

namespace craftcalc {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownComponent: return "unknown_component";
        case ErrorKind::UnknownIngredient: return "unknown_ingredient";
        case ErrorKind::DuplicateName: return "duplicate_name";
        case ErrorKind::InvalidRate: return "invalid_rate";
        case ErrorKind::InvalidComponent: return "invalid_component";
        case ErrorKind::CycleDetected: return "cycle_detected";
        case ErrorKind::DepthLimitExceeded: return "depth_limit_exceeded";
        case ErrorKind::CatalogFormatError: return "catalog_format_error";
    }
    return "unknown";
}

} // namespace craftcalc
