// src/functions/string_functions.cpp
#include "screenbind/functions/registry.h"
#include "screenbind/common/coerce.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace screenbind {

namespace {

using fn::arg;

std::string str(const std::vector<Value>& args, std::size_t i) {
    return to_display_string(arg(args, i));
}

// JS-style index clamp: NaN -> 0, then into [0, len]
std::size_t clamp_index(const Value& v, std::size_t len) {
    double d = to_number_or_zero(v);
    if (d <= 0) return 0;
    if (d >= static_cast<double>(len)) return len;
    return static_cast<std::size_t>(d);
}

std::string trim_whitespace(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

void FunctionRegistry::register_string_functions() {
    register_function("uppercase", {{"string"}, "string", "Convert to uppercase"},
        [](const std::vector<Value>& args) -> Value {
            std::string s = str(args, 0);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        });

    register_function("lowercase", {{"string"}, "string", "Convert to lowercase"},
        [](const std::vector<Value>& args) -> Value {
            std::string s = str(args, 0);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        });

    register_function("trim", {{"string"}, "string", "Trim whitespace"},
        [](const std::vector<Value>& args) -> Value {
            return trim_whitespace(str(args, 0));
        });

    register_function("substring", {{"string", "start", "end?"}, "string", "Extract substring"},
        [](const std::vector<Value>& args) -> Value {
            std::string s = str(args, 0);
            std::size_t start = clamp_index(arg(args, 1), s.size());
            std::size_t end = fn::has_arg(args, 2) ? clamp_index(arg(args, 2), s.size()) : s.size();
            if (start > end) std::swap(start, end);
            return s.substr(start, end - start);
        });

    register_function("includes", {{"string", "search"}, "boolean", "Check if string includes"},
        [](const std::vector<Value>& args) -> Value {
            return str(args, 0).find(str(args, 1)) != std::string::npos;
        });

    register_function("startsWith", {{"string", "prefix"}, "boolean", "Check prefix"},
        [](const std::vector<Value>& args) -> Value {
            return std::string_view(str(args, 0)).starts_with(str(args, 1));
        });

    register_function("endsWith", {{"string", "suffix"}, "boolean", "Check suffix"},
        [](const std::vector<Value>& args) -> Value {
            return std::string_view(str(args, 0)).ends_with(str(args, 1));
        });

    register_function("replace", {{"string", "search", "replacement"}, "string", "Replace first occurrence"},
        [](const std::vector<Value>& args) -> Value {
            std::string s = str(args, 0);
            std::string search = str(args, 1);
            auto pos = s.find(search);
            if (pos != std::string::npos) {
                s.replace(pos, search.size(), str(args, 2));
            }
            return s;
        });

    register_function("split", {{"string", "separator"}, "string[]", "Split string"},
        [](const std::vector<Value>& args) -> Value {
            std::string s = str(args, 0);
            std::string sep = str(args, 1);
            Value out = Value::array();
            if (sep.empty()) {
                for (char c : s) out.push_back(std::string(1, c));
                return out;
            }
            std::size_t start = 0;
            std::size_t pos;
            while ((pos = s.find(sep, start)) != std::string::npos) {
                out.push_back(s.substr(start, pos - start));
                start = pos + sep.size();
            }
            out.push_back(s.substr(start));
            return out;
        });

    const std::size_t cap = max_array_size_;
    register_function("join", {{"array", "separator"}, "string", "Join array to string"},
        [cap](const std::vector<Value>& args) -> Value {
            Value items = fn::to_array(arg(args, 0), cap);
            std::string sep = str(args, 1);
            std::string out;
            bool first = true;
            for (const auto& item : items) {
                if (!first) out += sep;
                out += to_display_string(item);
                first = false;
            }
            return out;
        });

    register_function("length", {{"value"}, "number", "Length of string or array"},
        [](const std::vector<Value>& args) -> Value {
            const Value& v = arg(args, 0);
            if (v.is_array()) return v.size();
            return to_display_string(v).size();
        });
}

} // namespace screenbind
