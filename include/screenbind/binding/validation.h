// screenbind/binding/validation.h
#ifndef SCREENBIND_BINDING_VALIDATION_H
#define SCREENBIND_BINDING_VALIDATION_H

#include "screenbind/common/types.h"
#include "screenbind/functions/registry.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace screenbind {

// Authoring-time checks over a template. Nothing here evaluates a binding.

// One message per offending {{...}} block: parse failures, roots outside
// state/inputs/context/trace_id, and calls to functions missing from `functions`.
// Empty when the template is valid.
std::vector<std::string> validate_template(const Value& tmpl,
                                           const FunctionRegistry& functions = FunctionRegistry::defaults(),
                                           const EngineLimits& limits = {});

// Distinct "{{root.path}}" blocks in first-seen order. Expression blocks are skipped.
std::vector<std::string> extract_bindings(const Value& tmpl);

struct BindingExpression {
    std::string source; // "state"
    std::string path;   // "a.b", empty for a bare root
};

// "{{state.a.b}}" -> {"state", "a.b"}; nullopt for anything else
std::optional<BindingExpression> parse_binding_expression(std::string_view expr);
std::string format_binding_expression(const std::string& source, const std::string& path);

// "{{state.a.b}}" -> {"state.a", "state.a.b"}
std::vector<std::string> referenced_paths(std::string_view binding);

// bindings: {target: source}. One "a → b → a" line per cycle found.
std::vector<std::string> detect_circular_bindings(const Value& bindings);

// Copy of inputs with sensitive keys replaced by "***MASKED***" and the strings
// of nested objects and arrays partially hidden.
Value mask_sensitive_inputs(const Value& inputs);

} // namespace screenbind

#endif // SCREENBIND_BINDING_VALIDATION_H
