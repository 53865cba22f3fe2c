// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "screenbind/common/config.h"
#include "screenbind/common/yaml_json.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace screenbind;

// Test 1: Limits under a `limits:` section
TEST_CASE("Load Nested Limits", "[config]") {
    auto limits = load_engine_limits(R"(
limits:
  max_tokens: 200
  max_parse_depth: 6
)");
    REQUIRE(limits.max_tokens == 200);
    REQUIRE(limits.max_parse_depth == 6);
    REQUIRE(limits.max_eval_depth == kMaxEvalDepth);
    REQUIRE(limits.max_array_size == kMaxArraySize);
}

// Test 2: Flat keys and JSON input
TEST_CASE("Load Flat Limits", "[config]") {
    auto limits = load_engine_limits("max_eval_depth: 4\nmax_array_size: 50\n");
    REQUIRE(limits.max_eval_depth == 4);
    REQUIRE(limits.max_array_size == 50);

    auto json = load_engine_limits(R"({"limits": {"max_tokens": 64}})");
    REQUIRE(json.max_tokens == 64);

    auto defaults = load_engine_limits("");
    REQUIRE(defaults.max_tokens == kMaxTokens);
    REQUIRE(defaults.max_parse_depth == kMaxParseDepth);
}

// Test 3: Bad values name the offending key
TEST_CASE("Reject Invalid Limits", "[config][errors]") {
    REQUIRE_THROWS_AS(load_engine_limits("max_tokens: 0"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_limits("max_tokens: -3"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_limits("max_tokens: 2.5"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_limits("max_tokens: lots"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_limits("max_parse_depth: 99999999999"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_limits("limits: [1, 2]"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_limits("- just\n- a list\n"), std::runtime_error);
    REQUIRE_THROWS_AS(load_engine_limits("limits: {max_tokens: 1"), std::runtime_error);

    try {
        load_engine_limits("limits:\n  max_eval_depth: \"10\"\n");
        FAIL("expected std::runtime_error");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).starts_with("Invalid value for limits.max_eval_depth"));
    }
}

// Test 4: Unknown keys are ignored
TEST_CASE("Ignore Unknown Limits", "[config]") {
    auto limits = load_engine_limits("limits:\n  max_tokens: 10\n  max_widgets: 3\n");
    REQUIRE(limits.max_tokens == 10);
}

// Test 5: Engine-level options
TEST_CASE("Load Engine Config", "[config]") {
    auto config = load_engine_config("log_render_failures: true\nlimits:\n  max_tokens: 42\n");
    REQUIRE(config.log_render_failures);
    REQUIRE(config.limits.max_tokens == 42);

    auto flat = load_engine_config("log_render_failures: false\nmax_eval_depth: 3\n");
    REQUIRE_FALSE(flat.log_render_failures);
    REQUIRE(flat.limits.max_eval_depth == 3);

    REQUIRE_FALSE(load_engine_config("").log_render_failures);
    REQUIRE_THROWS_AS(load_engine_config("log_render_failures: sometimes"), std::runtime_error);
}

// Test 6: Reading from disk
TEST_CASE("Load Config From File", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "screenbind_test_limits.yaml";
    {
        std::ofstream out(path);
        out << "limits:\n  max_array_size: 123\n";
    }
    REQUIRE(load_engine_limits_from_file(path.string()).max_array_size == 123);
    REQUIRE(load_engine_config_from_file(path.string()).limits.max_array_size == 123);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(load_engine_limits_from_file("/nonexistent/screenbind.yaml"), std::runtime_error);
}

// Test 7: YAML scalars map onto JSON types
TEST_CASE("YAML To JSON Scalars", "[config][yaml]") {
    auto doc = load_document(R"(
count: 3
ratio: 0.5
on: true
off: False
nothing: ~
quoted: "42"
name: screen
list: [1, two]
)");
    REQUIRE(doc["count"] == 3);
    REQUIRE(doc["count"].is_number_integer());
    REQUIRE(doc["ratio"] == 0.5);
    REQUIRE(doc["on"] == true);
    REQUIRE(doc["off"] == false);
    REQUIRE(doc["nothing"].is_null());
    REQUIRE(doc["quoted"] == "42");
    REQUIRE(doc["name"] == "screen");
    REQUIRE(doc["list"] == Value::array({1, "two"}));

    std::vector<std::string> keys;
    for (auto it = doc.begin(); it != doc.end(); ++it) keys.push_back(it.key());
    REQUIRE(keys.front() == "count");
    REQUIRE(keys.back() == "list");
}
