#include <gtest/gtest.h>

#include "craftcalc/errors.hpp"
#include "craftcalc/request.hpp"

using namespace craftcalc;

namespace {

const std::string kVanilla = std::string(CRAFTCALC_DATA_DIR) + "/vanilla.json";

json inline_catalog() {
    return json::parse(R"({"components": [
        {"name": "iron"},
        {"name": "gear", "seconds": 0.5, "ingredients": {"iron": 2}, "producer": "machine"},
        {"name": "steel", "seconds": 8, "ingredients": {"iron": 5}, "producer": "furnace"}
    ]})");
}

} // namespace

TEST(RequestTest, Defaults) {
    Request request = parse_request(json::parse(R"({"targets": {"gear": 2}})"));
    EXPECT_TRUE(request.catalog.is_null());
    EXPECT_DOUBLE_EQ(request.targets.at("gear"), 2.0);
    EXPECT_DOUBLE_EQ(request.seconds, 1.0);
    EXPECT_TRUE(request.speeds.empty());
    EXPECT_EQ(request.report, ReportKind::Producers);
    EXPECT_EQ(request.format, OutputFormat::Json);
    EXPECT_EQ(request.engine.max_depth, 256u);
    EXPECT_TRUE(request.engine.memoize);
}

TEST(RequestTest, ParsesAllFields) {
    Request request = parse_request(json::parse(R"({
        "catalog": "catalog.json",
        "targets": {"gear": 1, "steel": 3},
        "seconds": 60,
        "speeds": {"furnace": 2},
        "report": "summary",
        "format": "text",
        "engine": {"max_depth": 16, "memoize": false}
    })"));
    EXPECT_EQ(request.catalog.get<std::string>(), "catalog.json");
    EXPECT_EQ(request.targets.size(), 2u);
    EXPECT_DOUBLE_EQ(request.seconds, 60.0);
    EXPECT_DOUBLE_EQ(request.speeds.multiplier(ProducerCategory::Furnace), 2.0);
    EXPECT_EQ(request.report, ReportKind::Summary);
    EXPECT_EQ(request.format, OutputFormat::Text);
    EXPECT_EQ(request.engine.max_depth, 16u);
    EXPECT_FALSE(request.engine.memoize);
}

TEST(RequestTest, RejectsMalformedRequests) {
    EXPECT_THROW(parse_request(json::array()), CatalogFormatError);
    EXPECT_THROW(parse_request(json::parse(R"({})")), CatalogFormatError);
    EXPECT_THROW(parse_request(json::parse(R"({"targets": {"gear": "one"}})")), CatalogFormatError);
    EXPECT_THROW(parse_request(json::parse(R"({"targets": {}, "seconds": "1"})")), CatalogFormatError);
    EXPECT_THROW(parse_request(json::parse(R"({"targets": {}, "report": "cost"})")), CatalogFormatError);
    EXPECT_THROW(parse_request(json::parse(R"({"targets": {}, "format": "xml"})")), CatalogFormatError);
    EXPECT_THROW(parse_request(json::parse(R"({"targets": {}, "engine": {"max_depth": -1}})")), CatalogFormatError);
    EXPECT_THROW(parse_request(json::parse(R"({"targets": {}, "speeds": {"machine": 0}})")), InvalidRate);
}

TEST(RequestTest, CatalogSources) {
    Request inline_request = parse_request(json{{"targets", {{"gear", 1}}}, {"catalog", inline_catalog()}});
    EXPECT_EQ(load_request_catalog(inline_request, "").size(), 3u);

    Request path_request = parse_request(json{{"targets", {{"gear", 1}}}, {"catalog", kVanilla}});
    EXPECT_EQ(load_request_catalog(path_request, "").size(), 50u);

    Request bare = parse_request(json{{"targets", {{"gear", 1}}}});
    EXPECT_EQ(load_request_catalog(bare, kVanilla).size(), 50u);
    EXPECT_THROW(load_request_catalog(bare, ""), CatalogFormatError);

    Request bad = parse_request(json{{"targets", {{"gear", 1}}}, {"catalog", 42}});
    EXPECT_THROW(load_request_catalog(bad, kVanilla), CatalogFormatError);
}

TEST(RequestTest, ProducerReport) {
    Request request = parse_request(json{
        {"targets", {{"gear", 4}, {"steel", 1}}},
        {"seconds", 2},
        {"speeds", {{"furnace", 2}}}
    });
    Catalog catalog = load_request_catalog(parse_request(json{{"targets", json::object()}, {"catalog", inline_catalog()}}), "");
    Totals totals = run_request(request, catalog);

    // gear: 2/s at 2/s per producer; steel: 0.5/s at 0.25/s per furnace.
    EXPECT_NEAR(totals.at("gear"), 1.0, 1e-9);
    EXPECT_NEAR(totals.at("steel"), 2.0, 1e-9);
    EXPECT_EQ(totals.count("iron"), 0u);

    json report = make_report(request, totals);
    EXPECT_EQ(report["status"], "ok");
    EXPECT_EQ(report["report"], "producers");
    EXPECT_DOUBLE_EQ(report["seconds"].get<double>(), 2.0);
    EXPECT_EQ(report["rounded"]["steel"].get<long long>(), 2);
    EXPECT_EQ(report["rounded"]["gear"].get<long long>(), 1);
}

TEST(RequestTest, SummaryReport) {
    Request request = parse_request(json{
        {"targets", {{"gear", 3}, {"steel", 1}}},
        {"report", "summary"},
        {"catalog", inline_catalog()}
    });
    Catalog catalog = load_request_catalog(request, "");
    Totals totals = run_request(request, catalog);
    EXPECT_DOUBLE_EQ(totals.at("gear"), 3.0);
    EXPECT_DOUBLE_EQ(totals.at("steel"), 1.0);
    EXPECT_DOUBLE_EQ(totals.at("iron"), 11.0);

    json report = make_report(request, totals);
    EXPECT_EQ(report["report"], "summary");
    EXPECT_FALSE(report.contains("seconds"));
}

TEST(RequestTest, EngineOptionsApply) {
    Request request = parse_request(json{
        {"targets", {{"gear", 1}}},
        {"engine", {{"max_depth", 0}}}
    });
    Catalog catalog = load_request_catalog(parse_request(json{{"targets", json::object()}, {"catalog", inline_catalog()}}), "");
    EXPECT_THROW(run_request(request, catalog), DepthLimitExceeded);
}
