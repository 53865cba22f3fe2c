// src/common/coerce.cpp
#include "screenbind/common/coerce.h"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace screenbind {

namespace {

constexpr double kMaxSafeInteger = 9007199254740992.0; // 2^53

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

double string_to_number(std::string_view text) {
    std::string_view s = trim_view(text);
    if (s.empty()) return 0.0;

    bool negative = false;
    std::string_view body = s;
    if (body.front() == '+' || body.front() == '-') {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    if (body == "Infinity") {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    // Hex literals are unsigned only
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        std::uint64_t u = 0;
        auto res = std::from_chars(s.data() + 2, s.data() + s.size(), u, 16);
        if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return static_cast<double>(u);
    }
    if (body.empty() || !(std::isdigit(static_cast<unsigned char>(body.front())) || body.front() == '.')) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double d = 0.0;
    auto res = std::from_chars(body.data(), body.data() + body.size(), d);
    if (res.ec != std::errc() || res.ptr != body.data() + body.size()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return negative ? -d : d;
}

// "1e-07" -> "1e-7", "1e21" -> "1e+21"
std::string normalize_exponent(std::string s) {
    auto e = s.find('e');
    if (e == std::string::npos) return s;
    std::string mantissa = s.substr(0, e);
    std::string exp = s.substr(e + 1);
    char sign = '+';
    if (!exp.empty() && (exp[0] == '+' || exp[0] == '-')) {
        sign = exp[0];
        exp.erase(0, 1);
    }
    auto nz = exp.find_first_not_of('0');
    exp = (nz == std::string::npos) ? "0" : exp.substr(nz);
    return mantissa + "e" + sign + exp;
}

} // namespace

std::string format_number(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0.0) return "0";

    double abs_d = std::fabs(d);
    if (abs_d < 1e21 && std::trunc(d) == d) {
        if (abs_d < 9.2e18) {
            return std::to_string(static_cast<long long>(d));
        }
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.0f", d);
        return buf;
    }

    char buf[64];
    std::to_chars_result res;
    if (abs_d >= 1e-6 && abs_d < 1e21) {
        res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed);
    } else {
        res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    }
    if (res.ec != std::errc()) {
        std::snprintf(buf, sizeof(buf), "%.17g", d);
        return buf;
    }
    return normalize_exponent(std::string(buf, res.ptr));
}

std::string to_display_string(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
            return "";
        case Value::value_t::string:
            return v.get_ref<const std::string&>();
        case Value::value_t::boolean:
            return v.get<bool>() ? "true" : "false";
        case Value::value_t::number_integer:
            return std::to_string(v.get<std::int64_t>());
        case Value::value_t::number_unsigned:
            return std::to_string(v.get<std::uint64_t>());
        case Value::value_t::number_float:
            return format_number(v.get<double>());
        case Value::value_t::array: {
            std::string out;
            bool first = true;
            for (const auto& item : v) {
                if (!first) out += ',';
                first = false;
                out += to_display_string(item);
            }
            return out;
        }
        case Value::value_t::object:
            return "[object Object]";
        default:
            return "";
    }
}

double to_number(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
            return 0.0;
        case Value::value_t::boolean:
            return v.get<bool>() ? 1.0 : 0.0;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return v.get<double>();
        case Value::value_t::string:
            return string_to_number(v.get_ref<const std::string&>());
        case Value::value_t::array:
            if (v.empty()) return 0.0;
            if (v.size() == 1) return string_to_number(to_display_string(v[0]));
            return std::numeric_limits<double>::quiet_NaN();
        default:
            return std::numeric_limits<double>::quiet_NaN();
    }
}

double to_number_or_zero(const Value& v) {
    double d = to_number(v);
    return std::isnan(d) ? 0.0 : d;
}

bool is_truthy(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
            return false;
        case Value::value_t::boolean:
            return v.get<bool>();
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float: {
            double d = v.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case Value::value_t::string:
            return !v.get_ref<const std::string&>().empty();
        case Value::value_t::array:
        case Value::value_t::object:
            return true;
        default:
            return false;
    }
}

bool strict_equals(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        return a.get<double>() == b.get<double>();
    }
    if (a.type() != b.type()) return false;
    return a == b;
}

bool loose_equals(const Value& a, const Value& b) {
    if (a.is_null() || b.is_null()) {
        return a.is_null() && b.is_null();
    }
    if (a.is_number() && b.is_number()) {
        return a.get<double>() == b.get<double>();
    }
    if (a.type() == b.type()) {
        return a == b;
    }
    if (a.is_boolean()) return loose_equals(Value(a.get<bool>() ? 1 : 0), b);
    if (b.is_boolean()) return loose_equals(a, Value(b.get<bool>() ? 1 : 0));

    if ((a.is_number() && b.is_string()) || (a.is_string() && b.is_number())) {
        return to_number(a) == to_number(b);
    }

    bool a_structured = a.is_structured();
    bool b_structured = b.is_structured();
    if (a_structured && !b_structured) return loose_equals(Value(to_display_string(a)), b);
    if (b_structured && !a_structured) return loose_equals(a, Value(to_display_string(b)));
    // array vs object
    return false;
}

Value make_number(double d) {
    if (!std::isfinite(d)) return 0;
    if (std::trunc(d) == d && std::fabs(d) <= kMaxSafeInteger) {
        return static_cast<std::int64_t>(d);
    }
    return d;
}

std::optional<std::size_t> parse_index(std::string_view segment) {
    if (segment.empty() || segment.size() > 18) return std::nullopt;
    std::size_t index = 0;
    auto res = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (res.ec != std::errc() || res.ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return index;
}

} // namespace screenbind
