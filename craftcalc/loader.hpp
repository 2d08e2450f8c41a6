#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "craftcalc/catalog.hpp"
#include "craftcalc/component.hpp"
#include "craftcalc/producer.hpp"

namespace craftcalc {

using json = nlohmann::json;

// {"name": ..., "seconds": ..., "ingredients": {...}, "producer": ...}
// Throws CatalogFormatError on wrong types, InvalidComponent on an unknown producer.
Component parse_component(const json& data);

// Accepts {"components": [...]} or a bare array, preserving order.
std::vector<Component> parse_components(const json& document);

// Registers every component of `document` into `catalog` in document order.
void load_catalog(Catalog& catalog, const json& document);

// Reads and parses a catalog file. Throws CatalogFormatError if it cannot be read or parsed.
json read_json_file(const std::string& path);
Catalog load_catalog_file(const std::string& path);

// {"machine": 1.25, ...}. Throws InvalidComponent or InvalidRate.
SpeedTable parse_speed_table(const json& data);

} // namespace craftcalc
