#ifndef SCREENBIND_COMMON_TYPES_H
#define SCREENBIND_COMMON_TYPES_H

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace screenbind {

// ordered_json keeps object keys in insertion order, which rendered props rely on
using Value = nlohmann::ordered_json;

// Default ceilings. Each one is enforced at its own layer.
inline constexpr std::size_t kMaxTokens = 500;
inline constexpr int kMaxParseDepth = 10;
inline constexpr int kMaxEvalDepth = 10;
inline constexpr std::size_t kMaxArraySize = 10000;

struct EngineLimits {
    std::size_t max_tokens = kMaxTokens;         // tokenizer
    int max_parse_depth = kMaxParseDepth;        // parser nesting
    int max_eval_depth = kMaxEvalDepth;          // evaluator nesting
    std::size_t max_array_size = kMaxArraySize;  // collection functions, set() index cap
};

struct EngineConfig {
    EngineLimits limits;
    bool log_render_failures = false;
};

// The read-only view a binding resolves against.
struct BindingContext {
    Value state = Value::object();
    Value inputs = Value::object();
    Value context = Value::object();
    Value trace_id = nullptr;

    BindingContext() = default;
    BindingContext(Value state_value,
                   Value inputs_value = Value::object(),
                   Value context_value = Value::object(),
                   Value trace = nullptr)
        : state(std::move(state_value)),
          inputs(std::move(inputs_value)),
          context(std::move(context_value)),
          trace_id(std::move(trace)) {}

    // Builds a context from {"state":..., "inputs":..., "context":..., "trace_id":...}.
    // Missing keys keep their defaults, other keys are ignored.
    static BindingContext from_value(const Value& doc);

    // nullptr for anything other than state / inputs / context / trace_id
    const Value* root(std::string_view name) const;
};

bool is_sanctioned_root(std::string_view name);

} // namespace screenbind

#endif // SCREENBIND_COMMON_TYPES_H
