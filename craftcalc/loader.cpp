#include "craftcalc/loader.hpp"

#include <fstream>

#include "craftcalc/errors.hpp"

namespace craftcalc {

Component parse_component(const json& data) {
    if (!data.is_object()) {
        throw CatalogFormatError("component entry must be an object");
    }
    if (!data.contains("name") || !data["name"].is_string()) {
        throw CatalogFormatError("component entry needs a string \"name\"");
    }

    Component component;
    component.name = data["name"].get<std::string>();

    if (data.contains("seconds") && !data["seconds"].is_null()) {
        if (!data["seconds"].is_number()) {
            throw CatalogFormatError("\"seconds\" of '" + component.name + "' must be a number");
        }
        component.craft_seconds = data["seconds"].get<double>();
    }

    if (data.contains("ingredients")) {
        if (!data["ingredients"].is_object()) {
            throw CatalogFormatError("\"ingredients\" of '" + component.name + "' must be an object");
        }
        for (auto const& [item, qty] : data["ingredients"].items()) {
            if (!qty.is_number()) {
                throw CatalogFormatError("quantity of '" + item + "' in '" + component.name + "' must be a number");
            }
            component.ingredients[item] = qty.get<double>();
        }
    }

    if (data.contains("producer")) {
        if (!data["producer"].is_string()) {
            throw CatalogFormatError("\"producer\" of '" + component.name + "' must be a string");
        }
        component.producer = parse_producer_category(data["producer"].get<std::string>());
    }

    return component;
}

std::vector<Component> parse_components(const json& document) {
    const json* entries = &document;
    if (document.is_object()) {
        if (!document.contains("components")) {
            throw CatalogFormatError("catalog document has no \"components\" array");
        }
        entries = &document["components"];
    }
    if (!entries->is_array()) {
        throw CatalogFormatError("catalog components must be an array");
    }

    std::vector<Component> components;
    components.reserve(entries->size());
    for (std::size_t i = 0; i < entries->size(); ++i) {
        try {
            components.push_back(parse_component((*entries)[i]));
        } catch (const CatalogFormatError& e) {
            throw CatalogFormatError("components[" + std::to_string(i) + "]: " + e.what());
        }
    }
    return components;
}

void load_catalog(Catalog& catalog, const json& document) {
    for (auto& component : parse_components(document)) {
        catalog.add(std::move(component));
    }
}

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw CatalogFormatError("cannot open " + path);
    }
    try {
        json document;
        in >> document;
        return document;
    } catch (json::parse_error& e) {
        throw CatalogFormatError(path + ": " + e.what());
    }
}

Catalog load_catalog_file(const std::string& path) {
    Catalog catalog;
    load_catalog(catalog, read_json_file(path));
    return catalog;
}

SpeedTable parse_speed_table(const json& data) {
    SpeedTable speeds;
    if (data.is_null()) {
        return speeds;
    }
    if (!data.is_object()) {
        throw CatalogFormatError("speed table must be an object");
    }
    for (auto const& [category, multiplier] : data.items()) {
        if (!multiplier.is_number()) {
            throw CatalogFormatError("speed multiplier for '" + category + "' must be a number");
        }
        speeds.set(parse_producer_category(category), multiplier.get<double>());
    }
    return speeds;
}

} // namespace craftcalc
