#include "craftcalc/request.hpp"

#include "craftcalc/errors.hpp"
#include "craftcalc/humanize.hpp"

namespace craftcalc {

namespace {

double number_field(const json& input, const char* key, double fallback) {
    if (!input.contains(key) || input[key].is_null()) {
        return fallback;
    }
    if (!input[key].is_number()) {
        throw CatalogFormatError(std::string("\"") + key + "\" must be a number");
    }
    return input[key].get<double>();
}

std::string string_field(const json& input, const char* key, const std::string& fallback) {
    if (!input.contains(key) || input[key].is_null()) {
        return fallback;
    }
    if (!input[key].is_string()) {
        throw CatalogFormatError(std::string("\"") + key + "\" must be a string");
    }
    return input[key].get<std::string>();
}

} // namespace

Request parse_request(const json& input) {
    if (!input.is_object()) {
        throw CatalogFormatError("request must be a JSON object");
    }

    Request request;

    if (input.contains("catalog")) {
        request.catalog = input["catalog"];
    }

    if (!input.contains("targets") || !input["targets"].is_object()) {
        throw CatalogFormatError("request needs a \"targets\" object");
    }
    for (auto const& [name, units] : input["targets"].items()) {
        if (!units.is_number()) {
            throw CatalogFormatError("units of target '" + name + "' must be a number");
        }
        request.targets[name] = units.get<double>();
    }

    request.seconds = number_field(input, "seconds", 1.0);

    if (input.contains("speeds")) {
        request.speeds = parse_speed_table(input["speeds"]);
    }

    const std::string report = string_field(input, "report", "producers");
    if (report == "producers") {
        request.report = ReportKind::Producers;
    } else if (report == "summary") {
        request.report = ReportKind::Summary;
    } else {
        throw CatalogFormatError("unknown report kind: " + report);
    }

    const std::string format = string_field(input, "format", "json");
    if (format == "json") {
        request.format = OutputFormat::Json;
    } else if (format == "text") {
        request.format = OutputFormat::Text;
    } else {
        throw CatalogFormatError("unknown output format: " + format);
    }

    if (input.contains("engine")) {
        const json& engine = input["engine"];
        if (!engine.is_object()) {
            throw CatalogFormatError("\"engine\" must be an object");
        }
        if (engine.contains("max_depth")) {
            if (!engine["max_depth"].is_number_integer() || engine["max_depth"].get<long long>() < 0) {
                throw CatalogFormatError("\"max_depth\" must be a non-negative integer");
            }
            request.engine.max_depth = engine["max_depth"].get<std::size_t>();
        }
        if (engine.contains("memoize")) {
            if (!engine["memoize"].is_boolean()) {
                throw CatalogFormatError("\"memoize\" must be a boolean");
            }
            request.engine.memoize = engine["memoize"].get<bool>();
        }
    }

    return request;
}

Catalog load_request_catalog(const Request& request, const std::string& default_path) {
    if (request.catalog.is_string()) {
        return load_catalog_file(request.catalog.get<std::string>());
    }
    if (request.catalog.is_object() || request.catalog.is_array()) {
        Catalog catalog;
        load_catalog(catalog, request.catalog);
        return catalog;
    }
    if (!request.catalog.is_null()) {
        throw CatalogFormatError("\"catalog\" must be a path or a catalog document");
    }
    if (default_path.empty()) {
        throw CatalogFormatError("no catalog given in the request or on the command line");
    }
    return load_catalog_file(default_path);
}

Totals run_request(const Request& request, const Catalog& catalog) {
    Engine engine(catalog, request.engine);
    if (request.report == ReportKind::Summary) {
        return engine.combined_summary(request.targets);
    }
    return engine.combined_producers_needed(request.targets, request.seconds, request.speeds);
}

json make_report(const Request& request, const Totals& totals) {
    json result;
    result["status"] = "ok";
    result["report"] = request.report == ReportKind::Summary ? "summary" : "producers";
    if (request.report == ReportKind::Producers) {
        result["seconds"] = request.seconds;
    }
    result["totals"] = totals;
    result["rounded"] = round_up(totals);
    return result;
}

} // namespace craftcalc
