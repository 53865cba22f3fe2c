// src/functions/utility_functions.cpp
#include "screenbind/functions/registry.h"
#include "screenbind/common/coerce.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace screenbind {

void FunctionRegistry::register_utility_functions() {
    using fn::arg;

    register_function("coalesce", {{"...values"}, "unknown", "First non-null value"},
        [](const std::vector<Value>& args) -> Value {
            for (const auto& v : args) {
                if (!v.is_null() && !(v.is_string() && v.get_ref<const std::string&>().empty())) {
                    return v;
                }
            }
            return nullptr;
        });

    register_function("ifElse", {{"condition", "trueValue", "falseValue"}, "unknown", "Conditional value"},
        [](const std::vector<Value>& args) -> Value {
            return is_truthy(arg(args, 0)) ? arg(args, 1) : arg(args, 2);
        });

    register_function("toString", {{"value"}, "string", "Convert to string"},
        [](const std::vector<Value>& args) -> Value {
            return to_display_string(arg(args, 0));
        });

    register_function("toNumber", {{"value"}, "number", "Convert to number"},
        [](const std::vector<Value>& args) -> Value {
            return make_number(to_number_or_zero(arg(args, 0)));
        });

    register_function("formatNumber", {{"number", "decimals?"}, "string", "Format number with decimals"},
        [](const std::vector<Value>& args) -> Value {
            double n = to_number_or_zero(arg(args, 0));
            double d = fn::has_arg(args, 1) ? to_number_or_zero(arg(args, 1)) : 0.0;
            int decimals = static_cast<int>(std::clamp(std::trunc(d), 0.0, 100.0));
            if (std::fabs(n) >= 1e21) {
                return format_number(n);
            }
            char buf[160];
            std::snprintf(buf, sizeof(buf), "%.*f", decimals, n);
            return std::string(buf);
        });
}

} // namespace screenbind
