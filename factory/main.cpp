#include <iostream>
#include <string>
#include "nlohmann/json.hpp"

#include "craftcalc/errors.hpp"
#include "craftcalc/humanize.hpp"
#include "craftcalc/request.hpp"

// Use nlohmann::json for convenience
using json = nlohmann::json;

namespace craftcalc {

// Reads one request from stdin and reports producer counts or ingredient totals.
// Returns the process exit status.
int run_factory(const std::string& default_catalog) {
    json input;
    try {
        // Read all stdin into the json object
        std::cin >> input;
    } catch (json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return 1;
    }

    try {
        // --- 1. Request and catalog ---
        const Request request = parse_request(input);
        const Catalog catalog = load_request_catalog(request, default_catalog);

        // --- 2. Resolve ---
        const Totals totals = run_request(request, catalog);

        // --- 3. Format output ---
        if (request.format == OutputFormat::Text) {
            humanize(std::cout, totals);
            std::cout.flush();
        } else {
            std::cout << make_report(request, totals).dump(2) << std::endl;
        }
    } catch (const Error& e) {
        json result = {
            {"status", "error"},
            {"kind", to_string(e.kind())},
            {"message", e.what()}
        };
        std::cout << result.dump(2) << std::endl;
        return 1;
    }
    return 0;
}

} // namespace craftcalc

int main(int argc, char** argv) {
    try {
        return craftcalc::run_factory(argc > 1 ? argv[1] : "");
    } catch (const std::exception& e) {
        std::cerr << "Unhandled exception: " << e.what() << std::endl;
        return 1;
    }
}
