// tests/test_template_renderer.cpp
#include <catch2/catch_test_macros.hpp>
#include "screenbind/binding/template_renderer.h"
#include <iostream>
#include <sstream>
#include <string>

using namespace screenbind;

namespace {

BindingContext screen_context() {
    Value state = {
        {"x", 5},
        {"title", "Orders"},
        {"items", Value::array({
            {{"name", "widget"}, {"value", 10}},
            {{"name", "gadget"}, {"value", 20}}
        })},
        {"tags", Value::array({"a", "b"})},
        {"user", {{"name", "Ada"}}}
    };
    return BindingContext(state, {{"query", "lamps"}}, {{"locale", "en"}}, "trace-42");
}

// Redirects std::cerr for the lifetime of the object
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }
private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

} // namespace

// Test 1: A string that is exactly one binding keeps the value's type
TEST_CASE("Render Whole Binding Keeps Type", "[renderer]") {
    auto ctx = screen_context();
    REQUIRE(render_template("{{state.x}}", ctx) == 5);
    REQUIRE(render_template("{{ state.x }}", ctx) == 5);
    REQUIRE(render_template("{{state.tags}}", ctx) == Value::array({"a", "b"}));
    REQUIRE(render_template("{{state.user}}", ctx) == Value{{"name", "Ada"}});
    REQUIRE(render_template("{{trace_id}}", ctx) == "trace-42");
    REQUIRE(render_template("{{state.x * 2}}", ctx) == 10);
    REQUIRE(render_template("{{state.x > 3}}", ctx) == true);
}

// Test 2: Inline bindings are interpolated as text
TEST_CASE("Render Inline Interpolation", "[renderer]") {
    auto ctx = screen_context();
    REQUIRE(render_template("v={{state.x}}", ctx) == "v=5");
    REQUIRE(render_template("{{state.title}} for {{inputs.query}}", ctx) == "Orders for lamps");
    REQUIRE(render_template("tags: {{state.tags}}", ctx) == "tags: a,b");
    REQUIRE(render_template("user: {{state.user}}", ctx) == "user: [object Object]");
    REQUIRE(render_template("total {{sum(state.items, 'value')}}!", ctx) == "total 30!");
}

// Test 3: Plain paths go through the path resolver, so numeric dot segments work
TEST_CASE("Render Plain Path Lookup", "[renderer]") {
    auto ctx = screen_context();
    REQUIRE(render_template("{{state.items.0.name}}", ctx) == "widget");
    REQUIRE(render_template("{{state.items[1].name}}", ctx) == "gadget");
    REQUIRE(render_template("{{context.locale}}", ctx) == "en");
}

// Test 4: Missing data and unknown roots
TEST_CASE("Render Missing Values", "[renderer]") {
    auto ctx = screen_context();
    REQUIRE(render_template("{{foo.bar}}", ctx).is_null());
    REQUIRE(render_template("[{{foo.bar}}]", ctx) == "[]");
    REQUIRE(render_template("{{state.nope.deeper}}", ctx).is_null());
    REQUIRE(render_template("{{window.location}}", ctx).is_null());
}

// Test 5: Failures never escape the renderer
TEST_CASE("Render Soft Failure", "[renderer][errors]") {
    auto ctx = screen_context();
    REQUIRE(render_template("{{state.x +}}", ctx).is_null());
    REQUIRE(render_template("a{{state.x +}}b", ctx) == "ab");
    REQUIRE(render_template("{{doEval('1')}}", ctx).is_null());
    REQUIRE(render_template("{{constructor(state)}}", ctx).is_null());
    REQUIRE(render_template("{{state.items.0 + 1}}", ctx).is_null());

    std::string big = "1";
    for (int i = 0; i < 300; ++i) big += "+1";
    REQUIRE(render_template("{{" + big + "}}", ctx).is_null());
}

// Test 6: Conditional bindings
TEST_CASE("Render Expression Binding", "[renderer]") {
    auto ctx = screen_context();
    REQUIRE(render_template("{{ sum(state.items,'value') > 25 ? 'high' : 'low' }}", ctx) == "high");
    REQUIRE(render_template("{{ count(state.items) == 0 ? 'empty' : 'has ' + count(state.items) }}", ctx) == "has 2");
    REQUIRE(render_template("Hi {{ state.user.name || 'guest' }}", ctx) == "Hi Ada");
}

// Test 7: Structure is walked recursively and order is preserved
TEST_CASE("Render Nested Template", "[renderer]") {
    auto ctx = screen_context();
    Value tmpl = {
        {"type", "Table"},
        {"props", {
            {"title", "{{state.title}}"},
            {"rows", "{{state.items}}"},
            {"count", 3},
            {"visible", true},
            {"empty", nullptr},
            {"columns", Value::array({"{{state.items.0.name}}", "static", 7})}
        }},
        {"z", "last"},
        {"a", "{{state.x}}"}
    };

    Value out = render_template(tmpl, ctx);
    REQUIRE(out["props"]["title"] == "Orders");
    REQUIRE(out["props"]["rows"] == ctx.state["items"]);
    REQUIRE(out["props"]["count"] == 3);
    REQUIRE(out["props"]["visible"] == true);
    REQUIRE(out["props"]["empty"].is_null());
    REQUIRE(out["props"]["columns"] == Value::array({"widget", "static", 7}));
    REQUIRE(out["a"] == 5);

    std::vector<std::string> keys;
    for (auto it = out.begin(); it != out.end(); ++it) keys.push_back(it.key());
    REQUIRE(keys == std::vector<std::string>{"type", "props", "z", "a"});

    // the input template is untouched
    REQUIRE(tmpl["a"] == "{{state.x}}");
}

// Test 8: Strings without a complete block pass through
TEST_CASE("Render Passes Through Plain Text", "[renderer]") {
    auto ctx = screen_context();
    REQUIRE(render_template("hello", ctx) == "hello");
    REQUIRE(render_template("{{state.x", ctx) == "{{state.x");
    REQUIRE(render_template("a {{state.x}} {{state.x", ctx) == "a 5 {{state.x");
    REQUIRE(render_template(42, ctx) == 42);
    REQUIRE(render_template(nullptr, ctx).is_null());
}

// Test 9: Classification helpers
TEST_CASE("Binding Classification", "[renderer]") {
    REQUIRE(is_whole_binding("{{state.x}}"));
    REQUIRE_FALSE(is_whole_binding("{{a}} {{b}}"));
    REQUIRE_FALSE(is_whole_binding("x{{a}}"));
    REQUIRE_FALSE(is_whole_binding("{{a"));

    REQUIRE(is_expression("a + b"));
    REQUIRE(is_expression("fn(x)"));
    REQUIRE(is_expression("!flag"));
    REQUIRE_FALSE(is_expression("state.items[0].name"));
    REQUIRE_FALSE(is_expression("trace_id"));
}

// Test 10: Per-instance limits and failure logging
TEST_CASE("Renderer Configuration", "[renderer][config]") {
    auto ctx = screen_context();

    EngineConfig tight;
    tight.limits.max_tokens = 3;
    TemplateRenderer renderer(tight);
    REQUIRE(renderer.render_with_env("{{state.x + 1}}", ctx).is_null());
    REQUIRE(renderer.render_with_env("{{state.x}}", ctx) == 5);
    REQUIRE(TemplateRenderer::render("{{state.x + 1}}", ctx) == 6);

    SECTION("quiet by default") {
        CerrCapture capture;
        TemplateRenderer quiet;
        REQUIRE(quiet.render_with_env("{{nope(1)}}", ctx).is_null());
        REQUIRE(capture.str().empty());
    }
    SECTION("warns when enabled") {
        EngineConfig noisy;
        noisy.log_render_failures = true;
        CerrCapture capture;
        TemplateRenderer loud(noisy);
        REQUIRE(loud.render_with_env("{{nope(1)}}", ctx).is_null());
        REQUIRE(capture.str().find("[WARNING]") != std::string::npos);
        REQUIRE(capture.str().find("Unknown function: nope") != std::string::npos);
    }
}
