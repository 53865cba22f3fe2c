// screenbind/binding/template_renderer.h
#ifndef SCREENBIND_BINDING_TEMPLATE_RENDERER_H
#define SCREENBIND_BINDING_TEMPLATE_RENDERER_H

#include "screenbind/common/types.h"
#include "screenbind/functions/registry.h"
#include <string>
#include <string_view>

namespace screenbind {

// Applies a BindingContext to a schema fragment. Rendering is total: a binding that
// fails to tokenize, parse or evaluate renders as null (whole-string) or "" (inline).
class TemplateRenderer {
public:
    explicit TemplateRenderer(EngineConfig config = {});

    // Renders with a shared default-configured instance
    static Value render(const Value& tmpl, const BindingContext& ctx);

    // Renders with this instance's limits and function table
    Value render_with_env(const Value& tmpl, const BindingContext& ctx) const;

    const EngineConfig& config() const { return config_; }
    const FunctionRegistry& functions() const { return functions_; }

private:
    EngineConfig config_;
    FunctionRegistry functions_;

    Value render_string(const std::string& s, const BindingContext& ctx) const;
    Value resolve_binding(std::string_view inner, const BindingContext& ctx) const;
};

Value render_template(const Value& tmpl, const BindingContext& ctx);

// True when the text inside {{ }} contains any of ( ) ! ? : + - * / < > = | &.
// Everything else is looked up as a plain path.
bool is_expression(std::string_view inner);

// "{{ x }}" with nothing outside the single block.
bool is_whole_binding(std::string_view s);

} // namespace screenbind

#endif // SCREENBIND_BINDING_TEMPLATE_RENDERER_H
