// src/functions/collection_functions.cpp
#include "screenbind/functions/registry.h"
#include "screenbind/common/coerce.h"
#include <algorithm>
#include <set>

namespace screenbind {

namespace {

using fn::arg;

// Numeric readings of each element (or of element[field]); non-numeric values count as 0.
std::vector<double> numbers_of(const Value& items, const std::vector<Value>& args) {
    std::vector<double> out;
    out.reserve(items.size());
    bool pluck = fn::has_arg(args, 1);
    std::string field = pluck ? to_display_string(arg(args, 1)) : std::string();
    for (const auto& item : items) {
        out.push_back(to_number_or_zero(pluck ? fn::pluck_field(item, field) : item));
    }
    return out;
}

double total(const std::vector<double>& values) {
    double acc = 0.0;
    for (double v : values) acc += v;
    return acc;
}

bool matches(const Value& v, const std::string& op, const Value& operand) {
    if (op == "eq" || op == "==") return loose_equals(v, operand);
    if (op == "ne" || op == "!=") return !loose_equals(v, operand);
    if (op == "gt" || op == ">") return to_number_or_zero(v) > to_number_or_zero(operand);
    if (op == "gte" || op == ">=") return to_number_or_zero(v) >= to_number_or_zero(operand);
    if (op == "lt" || op == "<") return to_number_or_zero(v) < to_number_or_zero(operand);
    if (op == "lte" || op == "<=") return to_number_or_zero(v) <= to_number_or_zero(operand);
    if (op == "contains") {
        return to_display_string(v).find(to_display_string(operand)) != std::string::npos;
    }
    return false;
}

} // namespace

void FunctionRegistry::register_collection_functions() {
    const std::size_t cap = max_array_size_;

    register_function("sum", {{"array", "field?"}, "number", "Sum of array values"},
        [cap](const std::vector<Value>& args) -> Value {
            Value items = fn::to_array(arg(args, 0), cap);
            return make_number(total(numbers_of(items, args)));
        });

    register_function("avg", {{"array", "field?"}, "number", "Average of array values"},
        [cap](const std::vector<Value>& args) -> Value {
            Value items = fn::to_array(arg(args, 0), cap);
            if (items.empty()) return 0;
            return make_number(total(numbers_of(items, args)) / static_cast<double>(items.size()));
        });

    register_function("min", {{"array", "field?"}, "number", "Minimum value"},
        [cap](const std::vector<Value>& args) -> Value {
            auto values = numbers_of(fn::to_array(arg(args, 0), cap), args);
            if (values.empty()) return 0;
            return make_number(*std::min_element(values.begin(), values.end()));
        });

    register_function("max", {{"array", "field?"}, "number", "Maximum value"},
        [cap](const std::vector<Value>& args) -> Value {
            auto values = numbers_of(fn::to_array(arg(args, 0), cap), args);
            if (values.empty()) return 0;
            return make_number(*std::max_element(values.begin(), values.end()));
        });

    register_function("count", {{"array"}, "number", "Count of array elements"},
        [cap](const std::vector<Value>& args) -> Value {
            return fn::to_array(arg(args, 0), cap).size();
        });

    register_function("first", {{"array"}, "unknown", "First element"},
        [](const std::vector<Value>& args) -> Value {
            const Value& v = arg(args, 0);
            return v.is_array() && !v.empty() ? v.front() : Value(nullptr);
        });

    register_function("last", {{"array"}, "unknown", "Last element"},
        [cap](const std::vector<Value>& args) -> Value {
            Value items = fn::to_array(arg(args, 0), cap);
            return items.empty() ? Value(nullptr) : items.back();
        });

    register_function("unique", {{"array", "field?"}, "array", "Unique elements"},
        [cap](const std::vector<Value>& args) -> Value {
            Value items = fn::to_array(arg(args, 0), cap);
            std::set<std::string> seen;
            Value out = Value::array();
            if (fn::has_arg(args, 1)) {
                std::string field = to_display_string(arg(args, 1));
                for (const auto& item : items) {
                    if (seen.insert(to_display_string(fn::pluck_field(item, field))).second) {
                        out.push_back(item);
                    }
                }
                return out;
            }
            for (const auto& item : items) {
                std::string key = to_display_string(item);
                if (seen.insert(key).second) out.push_back(std::move(key));
            }
            return out;
        });

    register_function("filter", {{"array", "field", "operator", "value"}, "array",
                                 "Filter array (eq,ne,gt,gte,lt,lte,contains)"},
        [cap](const std::vector<Value>& args) -> Value {
            Value items = fn::to_array(arg(args, 0), cap);
            std::string field = to_display_string(arg(args, 1));
            std::string op = to_display_string(arg(args, 2));
            const Value& operand = arg(args, 3);
            Value out = Value::array();
            for (const auto& item : items) {
                // scalars are compared as themselves
                const Value v = item.is_structured() ? fn::pluck_field(item, field) : item;
                if (matches(v, op, operand)) out.push_back(item);
            }
            return out;
        });

    register_function("map", {{"array", "field"}, "array", "Extract field from array objects"},
        [cap](const std::vector<Value>& args) -> Value {
            Value items = fn::to_array(arg(args, 0), cap);
            std::string field = to_display_string(arg(args, 1));
            Value out = Value::array();
            for (const auto& item : items) out.push_back(fn::pluck_field(item, field));
            return out;
        });
}

} // namespace screenbind
