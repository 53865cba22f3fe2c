// src/binding/template_renderer.cpp
#include "screenbind/binding/template_renderer.h"
#include "screenbind/binding/path_resolver.h"
#include "screenbind/expr/evaluator.h"
#include "screenbind/common/coerce.h"
#include <iostream>

namespace screenbind {

namespace {

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

} // namespace

bool is_expression(std::string_view inner) {
    return inner.find_first_of("()!?:+-*/<>=|&") != std::string_view::npos;
}

bool is_whole_binding(std::string_view s) {
    return s.size() >= 4 && s.starts_with("{{") && s.ends_with("}}") &&
           s.find("}}", 2) == s.size() - 2;
}

TemplateRenderer::TemplateRenderer(EngineConfig config)
    : config_(config), functions_(config.limits.max_array_size) {}

Value TemplateRenderer::render(const Value& tmpl, const BindingContext& ctx) {
    static const TemplateRenderer renderer;
    return renderer.render_with_env(tmpl, ctx);
}

Value TemplateRenderer::render_with_env(const Value& tmpl, const BindingContext& ctx) const {
    if (tmpl.is_string()) {
        return render_string(tmpl.get_ref<const std::string&>(), ctx);
    }
    if (tmpl.is_array()) {
        Value out = Value::array();
        for (const auto& item : tmpl) out.push_back(render_with_env(item, ctx));
        return out;
    }
    if (tmpl.is_object()) {
        Value out = Value::object();
        for (auto it = tmpl.begin(); it != tmpl.end(); ++it) {
            out[it.key()] = render_with_env(it.value(), ctx);
        }
        return out;
    }
    return tmpl;
}

Value TemplateRenderer::render_string(const std::string& s, const BindingContext& ctx) const {
    if (is_whole_binding(s)) {
        return resolve_binding(trim(std::string_view(s).substr(2, s.size() - 4)), ctx);
    }

    std::string out;
    std::size_t pos = 0;
    while (pos < s.size()) {
        auto open = s.find("{{", pos);
        if (open == std::string::npos) break;
        auto close = s.find("}}", open + 2);
        if (close == std::string::npos) break;

        out.append(s, pos, open - pos);
        std::string_view inner = trim(std::string_view(s).substr(open + 2, close - open - 2));
        out += to_display_string(resolve_binding(inner, ctx));
        pos = close + 2;
    }
    if (pos == 0) {
        return s;
    }
    out.append(s, pos, std::string::npos);
    return out;
}

Value TemplateRenderer::resolve_binding(std::string_view inner, const BindingContext& ctx) const {
    if (!is_expression(inner)) {
        const Value* v = get(ctx, inner);
        return v ? *v : Value(nullptr);
    }
    try {
        return evaluate_expression(inner, ctx, config_.limits, &functions_);
    } catch (const std::exception& e) {
        if (config_.log_render_failures) {
            std::cerr << "[WARNING] Binding '{{" << inner << "}}' failed: " << e.what() << std::endl;
        }
        return nullptr;
    }
}

Value render_template(const Value& tmpl, const BindingContext& ctx) {
    return TemplateRenderer::render(tmpl, ctx);
}

} // namespace screenbind
