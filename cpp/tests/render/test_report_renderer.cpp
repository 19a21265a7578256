/**
 * @file test_report_renderer.cpp
 * @brief Canonical JSON, flat tree and narrative output.
 */

#include <catch2/catch_test_macros.hpp>
#include <valinfo/render/report_renderer.h>
#include <valinfo/types/schema/validator_schema.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/string_utils.h>

#include "support/sample_records.h"

#include <algorithm>

using namespace valinfo;
using namespace valinfo::render;
using namespace valinfo::schema;

namespace {

    bool contains_line(const std::vector<std::string>& lines, std::string_view line) {
        return std::ranges::find(lines, line) != lines.end();
    }

    bool has_marker(const std::vector<std::string>& lines) {
        return std::ranges::any_of(lines, [](const std::string& l) { return l.find('#') != std::string::npos; });
    }

    json sample_with_time() {
        auto raw = testing::sample_record();
        raw["Update_time"] = "2023-11-14 22:13:20 (1700000000)";
        return raw;
    }

}  // namespace

// ============================================================================
// Verbosity filter
// ============================================================================

TEST_CASE("filter_marked_lines - non verbose drops marked lines", "[render][verbose]") {
    std::vector<std::string> lines{"plain one", "#hidden", "plain two", "#    alias"};

    auto out = filter_marked_lines(lines, false);
    CHECK(out == std::vector<std::string>{"plain one", "plain two"});
    CHECK_FALSE(has_marker(out));
}

TEST_CASE("filter_marked_lines - verbose keeps all lines unmarked", "[render][verbose]") {
    std::vector<std::string> lines{"plain one", "#hidden", "plain two", "#    alias"};

    auto out = filter_marked_lines(lines, true);
    CHECK(out == std::vector<std::string>{"plain one", "hidden", "plain two", "    alias"});
    CHECK_FALSE(has_marker(out));
}

// ============================================================================
// Narrative
// ============================================================================

TEST_CASE("Narrative - non verbose report", "[render][narrative]") {
    ValidatorInfoSchema schema;
    auto tree = SchemaValue::build(sample_with_time(), schema.root(), false);
    auto lines = split_lines(render_narrative(tree));

    CHECK(lines[0] == "Validator Node1 is running");
    CHECK(lines[1] == "Update time:     2023-11-14 22:13:20 (1700000000)");
    CHECK(contains_line(lines, "Node Port:        10.0.0.2/24 9701/tcp"));
    CHECK(contains_line(lines, "Client Port:      0.0.0.0/0 9702/tcp"));
    CHECK(contains_line(lines, "  Uptime: 1 day, 1 hour, 1 minute, 1 second"));
    CHECK(contains_line(lines, "  Total Ledger Transactions:  12"));
    CHECK(contains_line(lines, "  Read Transactions/Seconds:  0.50"));
    CHECK(contains_line(lines, "  Write Transactions/Seconds: 1.25"));
    CHECK(contains_line(lines, "Reachable Hosts:   3/4"));
    CHECK(contains_line(lines, "Unreachable Hosts: 1/4"));

    CHECK_FALSE(contains_line(lines, "    Node2"));
    CHECK_FALSE(contains_line(lines, "Software Versions:"));
    CHECK_FALSE(has_marker(lines));
    CHECK(std::ranges::none_of(lines, [](const std::string& l) { return l.starts_with("BLS Key"); }));
}

TEST_CASE("Narrative - verbose report", "[render][narrative]") {
    ValidatorInfoSchema schema;
    auto tree = SchemaValue::build(sample_with_time(), schema.root(), true);
    auto lines = split_lines(render_narrative(tree));

    CHECK(contains_line(lines, "  Total Config Transactions:  0"));
    CHECK(contains_line(lines, "  Total Audit Transactions:   30"));
    CHECK(contains_line(lines, "Software Versions:"));
    CHECK(contains_line(lines, "  indy-node: 1.12.6"));
    CHECK(contains_line(lines, "  sovrin: 1.1.89"));
    CHECK_FALSE(has_marker(lines));

    // Alias lines follow their host count line
    auto reachable = std::ranges::find(lines, "Reachable Hosts:   3/4");
    REQUIRE(std::distance(reachable, lines.end()) > 3);
    CHECK(*(reachable + 1) == "    Node1");
    CHECK(*(reachable + 2) == "    Node2");
    CHECK(*(reachable + 3) == "    Node3");
    auto unreachable = std::ranges::find(lines, "Unreachable Hosts: 1/4");
    REQUIRE(unreachable != lines.end());
    CHECK(*(unreachable + 1) == "    Node4");
}

TEST_CASE("Narrative - missing sub-tree prints placeholders", "[render][narrative]") {
    ValidatorInfoSchema schema;
    auto raw = sample_with_time();
    raw.erase("Node_info");
    raw.erase("Pool_info");
    raw.erase("state");

    auto tree = SchemaValue::build(raw, schema.root(), true);
    std::vector<std::string> lines;
    REQUIRE_NOTHROW(lines = split_lines(render_narrative(tree)));

    CHECK(lines[0] == "Validator Unknown is in unknown state");
    CHECK(contains_line(lines, "Validator DID:    Unknown"));
    CHECK(contains_line(lines, "BLS Key:          Unknown"));
    CHECK(contains_line(lines, "  Uptime: Unknown"));
    CHECK(contains_line(lines, "  Total Audit Transactions:   Unknown"));
    CHECK(contains_line(lines, "Reachable Hosts:   Unknown/Unknown"));
}

TEST_CASE("Narrative - raw lines carry markers", "[render][narrative]") {
    ValidatorInfoSchema schema;
    auto tree = SchemaValue::build(sample_with_time(), schema.root(), false);
    auto lines = narrative_lines(tree);

    CHECK(contains_line(lines, "#BLS Key:          4N8aUNHSgjQVgkpm8nhNEfDf6txHznoYREg9kirmJrkivgL4oSEimFF6nsQ6M41QvhM2Z33nves5vfSn9n1UwNFJBYtWVnHYMATn76vLuL3zU88KyeAYcHfsih3He6UHcXDxcaecHVz6jhCYz1P2UZn2bDVruL5wXpehgBfBaLKm3Ba"));
    CHECK(contains_line(lines, "#    Node4"));
    CHECK(contains_line(lines, "#Software Versions:"));
}

// ============================================================================
// Flat tree
// ============================================================================

TEST_CASE("render_tree - keys, nesting and list items", "[render][tree]") {
    auto doc = json::parse(R"({"a": 1, "b": {"c": "x", "d": [1, 2]}, "e": {}, "f": []})");
    auto lines = render_tree(doc);

    CHECK(lines == std::vector<std::string>{
        "\"a\": 1",
        "\"b\":",
        "    \"c\": x",
        "    \"d\":",
        "        1",
        "        2",
        "\"e\": n/a",
        "\"f\": n/a",
    });
}

TEST_CASE("render_tree - objects inside lists open with a dash", "[render][tree]") {
    auto doc = json::parse(R"({"ports": [{"port": 1}, {"port": 2}]})");
    CHECK(render_tree(doc) == std::vector<std::string>{
        "\"ports\":",
        "    -",
        "        \"port\": 1",
        "    -",
        "        \"port\": 2",
    });
}

TEST_CASE("render_tree - empty document", "[render][tree]") {
    CHECK(render_tree(json::object()) == std::vector<std::string>{"n/a"});
}

// ============================================================================
// JSON and selected fields
// ============================================================================

TEST_CASE("render_json - four space indent, unknown as null", "[render][json]") {
    ValidatorInfoSchema schema;
    auto tree = SchemaValue::build(json(), schema.root(), false);
    auto text = render_json(tree);

    CHECK(text.starts_with("{\n    \"response-version\": null"));
    auto decoded = json::parse(text);
    CHECK(decoded["Node_info"]["Metrics"]["uptime"].is_null());
}

TEST_CASE("render - dispatches on mode", "[render]") {
    ValidatorInfoSchema schema;
    auto tree = SchemaValue::build(sample_with_time(), schema.root(), false);

    CHECK(render(tree, OutputMode::Json) == render_json(tree));
    CHECK(render(tree, OutputMode::Narrative) == render_narrative(tree));
    CHECK(render(tree, OutputMode::Tree).starts_with("\"response-version\": 0.0.1\n"));
}

TEST_CASE("render_field - prints the selected value under its path", "[render][field]") {
    ValidatorInfoSchema schema;
    auto canonical = SchemaValue::build(sample_with_time(), schema.root(), false).to_json();

    CHECK(render_field(canonical, "Node_info.Metrics.uptime") == "\"Node_info.Metrics.uptime\": 90061");
    CHECK(render_field(canonical, "Pool_info.Unreachable_nodes") ==
          "\"Pool_info.Unreachable_nodes\":\n    -\n        Node4\n        Unknown");
    CHECK_THROWS_AS(render_field(canonical, "Node_info.nothing"), MissingPath);
    CHECK_THROWS_AS(render_field(canonical, "Node_info..Name"), InvalidPath);
}
