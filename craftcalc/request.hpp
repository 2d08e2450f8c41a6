#pragma once

#include <map>
#include <string>

#include "craftcalc/engine.hpp"
#include "craftcalc/loader.hpp"
#include "craftcalc/producer.hpp"

namespace craftcalc {

enum class ReportKind { Producers, Summary };
enum class OutputFormat { Json, Text };

// One calculation request, as read by the factory tool from stdin.
struct Request {
    json catalog;  // path string, inline catalog document, or null
    std::map<std::string, double> targets;
    double seconds = 1.0;
    SpeedTable speeds;
    ReportKind report = ReportKind::Producers;
    OutputFormat format = OutputFormat::Json;
    EngineOptions engine;
};

// Throws CatalogFormatError on structural problems, InvalidRate/InvalidComponent
// on bad speed table entries.
Request parse_request(const json& input);

// Resolves request.catalog, falling back to `default_path` when it is null.
Catalog load_request_catalog(const Request& request, const std::string& default_path);

// Producer counts or combined summary, depending on request.report.
Totals run_request(const Request& request, const Catalog& catalog);

// {"status": "ok", "report": ..., "totals": {...}, "rounded": {...}}
json make_report(const Request& request, const Totals& totals);

} // namespace craftcalc
