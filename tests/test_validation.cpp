// tests/test_validation.cpp
#include <catch2/catch_test_macros.hpp>
#include "screenbind/binding/validation.h"
#include <string>

using namespace screenbind;

using Messages = std::vector<std::string>;

// Test 1: A well-formed template has no findings
TEST_CASE("Validate Clean Template", "[validation]") {
    Value tmpl = {
        {"title", "{{state.title}}"},
        {"summary", "{{ sum(state.items, 'value') > 25 ? 'high' : 'low' }}"},
        {"rows", Value::array({"{{inputs.q}}", "{{context.user}} / {{trace_id}}", 3})}
    };
    REQUIRE(validate_template(tmpl).empty());
    REQUIRE(validate_template("no bindings here").empty());
}

// Test 2: Each offending block is reported with its source text
TEST_CASE("Validate Reports Problems", "[validation][errors]") {
    SECTION("unknown root on a plain path") {
        REQUIRE(validate_template("{{window.location}}") ==
                Messages{"Unknown binding root: window (in window.location)"});
    }
    SECTION("empty block") {
        REQUIRE(validate_template("a {{ }} b") == Messages{"Empty binding: {{ }}"});
    }
    SECTION("parse failure") {
        auto errors = validate_template("{{state.x +}}");
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].starts_with("SyntaxError: "));
        REQUIRE(errors[0].ends_with("(in state.x +)"));
    }
    SECTION("unknown function and root inside an expression") {
        REQUIRE(validate_template("{{ doEval(foo.x) + doEval(foo.y) }}") == Messages{
            "Unknown binding root: foo (in doEval(foo.x) + doEval(foo.y))",
            "Unknown function: doEval (in doEval(foo.x) + doEval(foo.y))"
        });
    }
    SECTION("nesting too deep") {
        std::string parens = "1";
        for (int i = 0; i < 12; ++i) parens = "(" + parens + ")";
        auto errors = validate_template("{{" + parens + "}}");
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].starts_with("ComplexityError: "));
    }
    SECTION("findings from nested values accumulate") {
        Value tmpl = {{"a", "{{bad.x}}"}, {"b", Value::array({"{{upper(state.x)}}"})}};
        REQUIRE(validate_template(tmpl) == Messages{
            "Unknown binding root: bad (in bad.x)",
            "Unknown function: upper (in upper(state.x))"
        });
    }
}

// Test 3: Function checks follow the table passed in
TEST_CASE("Validate Against Custom Registry", "[validation]") {
    auto empty = FunctionRegistry::empty();
    REQUIRE(validate_template("{{uppercase(state.x)}}", empty) ==
            Messages{"Unknown function: uppercase (in uppercase(state.x))"});
    REQUIRE(validate_template("{{uppercase(state.x)}}").empty());
}

// Test 4: Simple bindings in a template
TEST_CASE("Extract Bindings", "[validation]") {
    Value tmpl = {
        {"a", "{{state.user.name}} and {{inputs.q}}"},
        {"b", Value::array({"{{state.user.name}}", "{{ 1 + 2 }}", "{{context}}"})}
    };
    REQUIRE(extract_bindings(tmpl) == Messages{"{{state.user.name}}", "{{inputs.q}}", "{{context}}"});
}

// Test 5: Binding expression parsing and formatting
TEST_CASE("Parse Binding Expression", "[validation]") {
    auto parsed = parse_binding_expression("{{state.user.name}}");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->source == "state");
    REQUIRE(parsed->path == "user.name");

    auto bare = parse_binding_expression("{{inputs}}");
    REQUIRE(bare.has_value());
    REQUIRE(bare->path.empty());

    REQUIRE_FALSE(parse_binding_expression("state.x").has_value());
    REQUIRE_FALSE(parse_binding_expression("{{ state.x }}").has_value());
    REQUIRE_FALSE(parse_binding_expression("{{state.items[0]}}").has_value());
    REQUIRE_FALSE(parse_binding_expression("").has_value());

    REQUIRE(format_binding_expression("state", "user.name") == "{{state.user.name}}");
    REQUIRE(format_binding_expression("trace_id", "") == "{{trace_id}}");

    REQUIRE(referenced_paths("{{state.a.b.c}}") == Messages{"state.a", "state.a.b", "state.a.b.c"});
    REQUIRE(referenced_paths("{{inputs}}") == Messages{"inputs"});
    REQUIRE(referenced_paths("not a binding").empty());
}

// Test 6: Cycles in target -> source maps
TEST_CASE("Detect Circular Bindings", "[validation]") {
    REQUIRE(detect_circular_bindings({{"a", "b"}, {"b", "c"}}).empty());
    REQUIRE(detect_circular_bindings({{"a", "b"}, {"b", "a"}}) == Messages{"a → b → a"});
    REQUIRE(detect_circular_bindings({{"x", "x"}}) == Messages{"x → x"});

    auto cycles = detect_circular_bindings({{"a", "b"}, {"b", "c"}, {"c", "a"}, {"p", "q"}, {"q", "p"}});
    REQUIRE(cycles == Messages{"a → b → c → a", "p → q → p"});

    REQUIRE(detect_circular_bindings(Value::array()).empty());
}

// Test 7: Masking inputs for logs
TEST_CASE("Mask Sensitive Inputs", "[validation][security]") {
    Value inputs = {
        {"username", "ada"},
        {"Password", "hunter2"},
        {"api_key", 12345},
        {"userEmail", "ada@example.com"},
        {"profile", {{"nickname", "lovelace"}, {"pin", "1234"}, {"age", 36}}},
        {"list", Value::array({"visible-in-arrays"})}
    };

    Value masked = mask_sensitive_inputs(inputs);
    REQUIRE(masked["username"] == "ada");
    REQUIRE(masked["Password"] == "***MASKED***");
    REQUIRE(masked["api_key"] == "***MASKED***");
    REQUIRE(masked["userEmail"] == "***MASKED***");
    REQUIRE(masked["profile"]["nickname"] == "lov***e");
    REQUIRE(masked["profile"]["pin"] == "***MASKED***");
    REQUIRE(masked["profile"]["age"] == 36);
    REQUIRE(masked["list"] == inputs["list"]);

    // the input is not modified
    REQUIRE(inputs["Password"] == "hunter2");
    REQUIRE(mask_sensitive_inputs(Value::object()) == Value::object());
    REQUIRE(mask_sensitive_inputs("plain") == "plain");
}
