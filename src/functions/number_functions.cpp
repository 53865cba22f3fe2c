// src/functions/number_functions.cpp
#include "screenbind/functions/registry.h"
#include "screenbind/common/coerce.h"
#include <cmath>

namespace screenbind {

void FunctionRegistry::register_number_functions() {
    using fn::arg;

    register_function("round", {{"number", "decimals?"}, "number", "Round number"},
        [](const std::vector<Value>& args) -> Value {
            double decimals = fn::has_arg(args, 1) ? to_number_or_zero(arg(args, 1)) : 0.0;
            double factor = std::pow(10.0, decimals);
            // half-up, as Math.round: round(-2.5) == -2
            return make_number(std::floor(to_number_or_zero(arg(args, 0)) * factor + 0.5) / factor);
        });

    register_function("ceil", {{"number"}, "number", "Round up"},
        [](const std::vector<Value>& args) -> Value {
            return make_number(std::ceil(to_number_or_zero(arg(args, 0))));
        });

    register_function("floor", {{"number"}, "number", "Round down"},
        [](const std::vector<Value>& args) -> Value {
            return make_number(std::floor(to_number_or_zero(arg(args, 0))));
        });

    register_function("abs", {{"number"}, "number", "Absolute value"},
        [](const std::vector<Value>& args) -> Value {
            return make_number(std::fabs(to_number_or_zero(arg(args, 0))));
        });
}

} // namespace screenbind
