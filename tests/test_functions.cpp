// tests/test_functions.cpp
#include <catch2/catch_test_macros.hpp>
#include "screenbind/functions/registry.h"
#include "screenbind/common/errors.h"
#include <algorithm>
#include <string>

using namespace screenbind;

namespace {

Value call(const std::string& name, const std::vector<Value>& args = {}) {
    return FunctionRegistry::defaults().call_function(name, args);
}

Value array_of(std::size_t n, const Value& v) {
    Value out = Value::array();
    for (std::size_t i = 0; i < n; ++i) out.push_back(v);
    return out;
}

Value rows() {
    return Value::array({
        {{"name", "a"}, {"value", 10}, {"group", "x"}},
        {{"name", "b"}, {"value", "20"}, {"group", "y"}},
        {{"name", "c"}, {"value", "n/a"}, {"group", "x"}}
    });
}

} // namespace

// Test 1: The table holds exactly the published functions
TEST_CASE("Registry Contents", "[functions][registry]") {
    const auto& reg = FunctionRegistry::defaults();
    auto names = reg.list_functions();
    REQUIRE(names.size() == 32);
    REQUIRE(std::is_sorted(names.begin(), names.end()));
    REQUIRE(reg.has_function("formatDate"));
    REQUIRE_FALSE(reg.has_function("eval"));
    REQUIRE(reg.signature("eval") == nullptr);

    const auto* sig = reg.signature("substring");
    REQUIRE(sig != nullptr);
    REQUIRE(sig->params == std::vector<std::string>{"string", "start", "end?"});
    REQUIRE(sig->return_type == "string");

    auto meta = reg.signatures_json();
    REQUIRE(meta.size() == 32);
    REQUIRE(meta["sum"]["params"] == Value::array({"array", "field?"}));
    REQUIRE(meta["sum"]["returnType"] == "number");
    REQUIRE(meta["coalesce"]["description"] == "First non-null value");

    REQUIRE_THROWS_AS(reg.call_function("nope", {}), UnknownFunctionError);
    REQUIRE(FunctionRegistry::empty().list_functions().empty());
}

// Test 2: String functions stringify their inputs
TEST_CASE("String Functions", "[functions][string]") {
    REQUIRE(call("uppercase", {"abc"}) == "ABC");
    REQUIRE(call("lowercase", {"AbC"}) == "abc");
    REQUIRE(call("uppercase", {nullptr}) == "");
    REQUIRE(call("uppercase", {}) == "");
    REQUIRE(call("trim", {"  hi \n"}) == "hi");
    REQUIRE(call("length", {12345}) == 5);
    REQUIRE(call("length", {Value::array({1, 2, 3})}) == 3);
    REQUIRE(call("length", {nullptr}) == 0);

    SECTION("substring clamps and swaps") {
        REQUIRE(call("substring", {"hello", 1, 3}) == "el");
        REQUIRE(call("substring", {"hello", 2}) == "llo");
        REQUIRE(call("substring", {"hello", 3, 1}) == "el");
        REQUIRE(call("substring", {"hello", -5, 99}) == "hello");
        REQUIRE(call("substring", {"hello", "x"}) == "hello");
    }

    SECTION("search") {
        REQUIRE(call("includes", {"hello", "ell"}) == true);
        REQUIRE(call("includes", {"hello", "z"}) == false);
        REQUIRE(call("startsWith", {"hello", "he"}) == true);
        REQUIRE(call("endsWith", {"hello", "lo"}) == true);
        REQUIRE(call("endsWith", {"hello", "he"}) == false);
    }

    SECTION("replace first occurrence only") {
        REQUIRE(call("replace", {"a-b-c", "-", "+"}) == "a+b-c");
        REQUIRE(call("replace", {"abc", "z", "+"}) == "abc");
    }

    SECTION("split and join") {
        REQUIRE(call("split", {"a,b,,c", ","}) == Value::array({"a", "b", "", "c"}));
        REQUIRE(call("split", {"abc", ""}) == Value::array({"a", "b", "c"}));
        REQUIRE(call("split", {"", ","}) == Value::array({""}));
        REQUIRE(call("join", {Value::array({1, "b", nullptr}), "-"}) == "1-b-");
        REQUIRE(call("join", {"not an array", ","}) == "");
    }
}

// Test 3: Number functions coerce non-numbers to zero
TEST_CASE("Number Functions", "[functions][number]") {
    REQUIRE(call("round", {2.5}) == 3);
    REQUIRE(call("round", {-2.5}) == -2);
    REQUIRE(call("round", {3.14159, 2}) == 3.14);
    REQUIRE(call("round", {"abc"}) == 0);
    REQUIRE(call("ceil", {1.2}) == 2);
    REQUIRE(call("floor", {"1.8"}) == 1);
    REQUIRE(call("abs", {-7}) == 7);
    REQUIRE(call("abs", {Value::object()}) == 0);
}

// Test 4: Date parsing and formatting
TEST_CASE("Date Functions", "[functions][date]") {
    std::string now = call("now").get<std::string>();
    REQUIRE(now.size() == 24);
    REQUIRE(now[10] == 'T');
    REQUIRE(now.back() == 'Z');

    REQUIRE(call("formatDate", {"2024-03-05T07:08:09Z", "YYYY-MM-DD HH:mm:ss"}) == "2024-03-05 07:08:09");
    REQUIRE(call("formatDate", {"2024-03-05", "DD/MM/YYYY"}) == "05/03/2024");
    REQUIRE(call("formatDate", {"2024-03-05T23:30:00-02:00", "YYYY-MM-DD HH:mm"}) == "2024-03-06 01:30");
    REQUIRE(call("formatDate", {"2024-03-05 10:00", "HH:mm"}) == "10:00");

    // each token is replaced once
    REQUIRE(call("formatDate", {"2024-03-05", "YYYY YYYY"}) == "2024 YYYY");

    // unparseable input comes back stringified
    REQUIRE(call("formatDate", {"not a date", "YYYY"}) == "not a date");
    REQUIRE(call("formatDate", {"2024-13-01", "YYYY"}) == "2024-13-01");
    REQUIRE(call("formatDate", {nullptr, "YYYY"}) == "");
}

// Test 5: Aggregations
TEST_CASE("Collection Aggregates", "[functions][collection]") {
    Value data = rows();
    REQUIRE(call("sum", {data, "value"}) == 30);
    REQUIRE(call("avg", {data, "value"}) == 10);
    REQUIRE(call("min", {data, "value"}) == 0);
    REQUIRE(call("max", {data, "value"}) == 20);
    REQUIRE(call("sum", {Value::array({1, "2", true, "x"})}) == 4);
    REQUIRE(call("count", {data}) == 3);

    SECTION("empty and non-array inputs yield zero") {
        REQUIRE(call("sum", {Value::array()}) == 0);
        REQUIRE(call("avg", {Value::array()}) == 0);
        REQUIRE(call("min", {Value::array()}) == 0);
        REQUIRE(call("max", {"abc"}) == 0);
        REQUIRE(call("count", {nullptr}) == 0);
    }
}

// Test 6: Inputs beyond the element cap are ignored
TEST_CASE("Collection Array Cap", "[functions][collection][limits]") {
    Value big = array_of(20000, 1);
    Value capped = array_of(10000, 1);
    REQUIRE(call("sum", {big}) == call("sum", {capped}));
    REQUIRE(call("sum", {big}) == 10000);
    REQUIRE(call("count", {big}) == 10000);
    REQUIRE(call("map", {array_of(20000, Value{{"a", 1}}), "a"}).size() == 10000);

    FunctionRegistry small(5);
    REQUIRE(small.call_function("sum", {array_of(8, 2)}) == 10);
    REQUIRE(small.max_array_size() == 5);
}

// Test 7: Element access and reshaping
TEST_CASE("Collection Transforms", "[functions][collection]") {
    Value data = rows();
    REQUIRE(call("first", {data})["name"] == "a");
    REQUIRE(call("last", {data})["name"] == "c");
    REQUIRE(call("first", {Value::array()}).is_null());
    REQUIRE(call("map", {data, "name"}) == Value::array({"a", "b", "c"}));
    REQUIRE(call("map", {Value::array({1, {{"name", "z"}}}), "name"}) == Value::array({nullptr, "z"}));

    SECTION("unique") {
        REQUIRE(call("unique", {Value::array({1, "1", 2, 1})}) == Value::array({"1", "2"}));
        auto by_group = call("unique", {data, "group"});
        REQUIRE(by_group.size() == 2);
        REQUIRE(by_group[0]["name"] == "a");
        REQUIRE(by_group[1]["name"] == "b");
    }

    SECTION("filter") {
        REQUIRE(call("filter", {data, "group", "eq", "x"}).size() == 2);
        REQUIRE(call("filter", {data, "group", "!=", "x"}).size() == 1);
        REQUIRE(call("filter", {data, "value", "gt", 5}).size() == 2);
        REQUIRE(call("filter", {data, "value", ">=", 20}).size() == 1);
        REQUIRE(call("filter", {data, "value", "lt", 15}).size() == 2);
        REQUIRE(call("filter", {data, "value", "eq", 20}).size() == 1);
        REQUIRE(call("filter", {data, "name", "contains", "b"}).size() == 1);
        REQUIRE(call("filter", {Value::array({1, 5, 9}), "", "lte", 5}) == Value::array({1, 5}));
        REQUIRE(call("filter", {data, "value", "matches", ".*"}) == Value::array());
    }
}

// Test 8: Utility functions
TEST_CASE("Utility Functions", "[functions][utility]") {
    REQUIRE(call("coalesce", {nullptr, "", "x", "y"}) == "x");
    REQUIRE(call("coalesce", {nullptr, 0}) == 0);
    REQUIRE(call("coalesce", {nullptr, ""}).is_null());
    REQUIRE(call("coalesce").is_null());

    REQUIRE(call("ifElse", {true, "a", "b"}) == "a");
    REQUIRE(call("ifElse", {"", "a", "b"}) == "b");

    REQUIRE(call("toString", {12.5}) == "12.5");
    REQUIRE(call("toString", {nullptr}) == "");
    REQUIRE(call("toString", {Value::array({1, 2})}) == "1,2");
    REQUIRE(call("toNumber", {"42"}) == 42);
    REQUIRE(call("toNumber", {"4x"}) == 0);

    REQUIRE(call("formatNumber", {3.14159, 2}) == "3.14");
    REQUIRE(call("formatNumber", {7}) == "7");
    REQUIRE(call("formatNumber", {"abc", 1}) == "0.0");
}
