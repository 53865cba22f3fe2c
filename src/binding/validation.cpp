// src/binding/validation.cpp
#include "screenbind/binding/validation.h"
#include "screenbind/binding/path_resolver.h"
#include "screenbind/binding/template_renderer.h"
#include "screenbind/expr/parser.h"
#include "screenbind/common/errors.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <regex>
#include <set>

namespace screenbind {

namespace {

const char* const kMasked = "***MASKED***";

const std::vector<std::string>& sensitive_patterns() {
    static const std::vector<std::string> patterns = {
        "password", "secret", "token", "api_key", "api_secret",
        "credit_card", "cc_", "ssn", "phone", "email"
    };
    return patterns;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Every "{{...}}" block of s, braces included.
std::vector<std::string_view> binding_blocks(std::string_view s) {
    std::vector<std::string_view> blocks;
    std::size_t pos = 0;
    while (true) {
        auto open = s.find("{{", pos);
        if (open == std::string_view::npos) break;
        auto close = s.find("}}", open + 2);
        if (close == std::string_view::npos) break;
        blocks.push_back(s.substr(open, close + 2 - open));
        pos = close + 2;
    }
    return blocks;
}

// Calls visit for every string leaf of a template.
void for_each_string(const Value& v, const std::function<void(const std::string&)>& visit) {
    if (v.is_string()) {
        visit(v.get_ref<const std::string&>());
    } else if (v.is_structured()) {
        for (const auto& child : v) for_each_string(child, visit);
    }
}

std::string root_of(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

void check_block(std::string_view block, const FunctionRegistry& functions,
                 const EngineLimits& limits, std::vector<std::string>& errors) {
    std::string inner(trim(block.substr(2, block.size() - 4)));

    if (!is_expression(inner)) {
        auto segments = parse_path(inner);
        if (segments.empty()) {
            errors.push_back("Empty binding: " + std::string(block));
        } else if (!is_sanctioned_root(segments.front())) {
            errors.push_back("Unknown binding root: " + segments.front() + " (in " + inner + ")");
        }
        return;
    }

    NodePtr ast;
    try {
        ast = parse_expression(inner, limits);
    } catch (const ExpressionError& e) {
        errors.push_back(std::string(error_kind_name(e.kind())) + ": " + e.what() + " (in " + inner + ")");
        return;
    }

    std::set<std::string> reported;
    for (const auto& path : collect_paths(*ast)) {
        std::string root = root_of(path);
        if (!is_sanctioned_root(root) && reported.insert("root:" + root).second) {
            errors.push_back("Unknown binding root: " + root + " (in " + inner + ")");
        }
    }
    for (const auto& name : collect_functions(*ast)) {
        if (!functions.has_function(name) && reported.insert("fn:" + name).second) {
            errors.push_back("Unknown function: " + name + " (in " + inner + ")");
        }
    }
}

Value mask_value(const Value& v) {
    if (v.is_object()) {
        Value out = Value::object();
        for (auto it = v.begin(); it != v.end(); ++it) out[it.key()] = mask_value(it.value());
        return out;
    }
    if (v.is_array()) {
        Value out = Value::array();
        for (const auto& item : v) out.push_back(mask_value(item));
        return out;
    }
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.empty()) return v;
        if (s.size() <= 4) return kMasked;
        return s.substr(0, 3) + "***" + s.back();
    }
    return v;
}

bool is_sensitive_key(std::string key) {
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto& patterns = sensitive_patterns();
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return key.find(p) != std::string::npos; });
}

} // namespace

std::vector<std::string> validate_template(const Value& tmpl, const FunctionRegistry& functions,
                                           const EngineLimits& limits) {
    std::vector<std::string> errors;
    for_each_string(tmpl, [&](const std::string& s) {
        for (auto block : binding_blocks(s)) {
            check_block(block, functions, limits, errors);
        }
    });
    return errors;
}

std::vector<std::string> extract_bindings(const Value& tmpl) {
    std::vector<std::string> found;
    std::set<std::string> seen;
    for_each_string(tmpl, [&](const std::string& s) {
        for (auto block : binding_blocks(s)) {
            std::string text(block);
            if (parse_binding_expression(text) && seen.insert(text).second) {
                found.push_back(std::move(text));
            }
        }
    });
    return found;
}

std::optional<BindingExpression> parse_binding_expression(std::string_view expr) {
    static const std::regex pattern(R"(^\{\{(\w+)(\.[\w.]+)?\}\}$)");
    std::match_results<std::string_view::const_iterator> m;
    if (expr.empty() || !std::regex_match(expr.begin(), expr.end(), m, pattern)) {
        return std::nullopt;
    }
    BindingExpression out;
    out.source = m[1].str();
    if (m[2].matched) out.path = m[2].str().substr(1);
    return out;
}

std::string format_binding_expression(const std::string& source, const std::string& path) {
    if (path.empty()) return "{{" + source + "}}";
    return "{{" + source + "." + path + "}}";
}

std::vector<std::string> referenced_paths(std::string_view binding) {
    auto parsed = parse_binding_expression(binding);
    if (!parsed) return {};
    if (parsed->path.empty()) return {parsed->source};

    std::vector<std::string> paths;
    std::string prefix = parsed->source;
    std::size_t start = 0;
    const std::string& path = parsed->path;
    while (start <= path.size()) {
        auto dot = path.find('.', start);
        std::size_t end = dot == std::string::npos ? path.size() : dot;
        prefix += "." + path.substr(start, end - start);
        paths.push_back(prefix);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return paths;
}

std::vector<std::string> detect_circular_bindings(const Value& bindings) {
    std::vector<std::string> order;                          // first-seen node order
    std::map<std::string, std::vector<std::string>> graph;   // target -> sources

    auto add_node = [&](const std::string& n) {
        if (graph.emplace(n, std::vector<std::string>{}).second) order.push_back(n);
    };

    if (bindings.is_object()) {
        for (auto it = bindings.begin(); it != bindings.end(); ++it) {
            if (!it.value().is_string()) continue;
            const std::string& target = it.key();
            const std::string& source = it.value().get_ref<const std::string&>();
            add_node(target);
            add_node(source);
            auto& edges = graph[target];
            if (std::find(edges.begin(), edges.end(), source) == edges.end()) edges.push_back(source);
        }
    }

    std::set<std::string> visited;
    std::set<std::string> on_stack;
    std::vector<std::string> path;
    std::vector<std::string> cycles;

    std::function<bool(const std::string&)> has_cycle = [&](const std::string& node) {
        visited.insert(node);
        on_stack.insert(node);
        path.push_back(node);
        for (const auto& next : graph[node]) {
            if (!visited.count(next)) {
                if (has_cycle(next)) return true;
            } else if (on_stack.count(next)) {
                std::string line;
                for (const auto& p : path) line += p + " → ";
                cycles.push_back(line + next);
                return true;
            }
        }
        on_stack.erase(node);
        path.pop_back();
        return false;
    };

    for (const auto& node : order) {
        if (!visited.count(node)) {
            path.clear();
            on_stack.clear();
            has_cycle(node);
        }
    }
    return cycles;
}

Value mask_sensitive_inputs(const Value& inputs) {
    if (!inputs.is_object() || inputs.empty()) return inputs;

    Value masked = inputs;
    for (auto it = masked.begin(); it != masked.end(); ++it) {
        if (is_sensitive_key(it.key())) {
            it.value() = kMasked;
        } else if (it.value().is_object()) {
            it.value() = mask_value(it.value());
        }
    }
    return masked;
}

} // namespace screenbind
