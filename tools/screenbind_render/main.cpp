// tools/screenbind_render/main.cpp
#include "screenbind/binding/template_renderer.h"
#include "screenbind/binding/validation.h"
#include "screenbind/common/config.h"
#include "screenbind/common/yaml_json.h"
#include "screenbind/expr/evaluator.h"
#include "screenbind/expr/parser.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--limits FILE] [--ast EXPR] [--eval EXPR] [--validate] [--functions]"
                 " TEMPLATE_FILE CONTEXT_FILE\n"
              << "  --limits FILE   engine limits (YAML or JSON)\n"
              << "  --ast EXPR      print the parsed AST of EXPR\n"
              << "  --eval EXPR     evaluate EXPR against CONTEXT_FILE\n"
              << "  --validate      report binding errors in TEMPLATE_FILE\n"
              << "  --functions     print the function table\n";
}

struct Options {
    std::string limits_file;
    std::string ast_expr;
    std::string eval_expr;
    bool validate = false;
    bool functions = false;
    std::vector<std::string> positional;
};

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    bool has_ast = false;
    bool has_eval = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string("Missing value for ") + flag);
            }
            return argv[++i];
        };
        try {
            if (arg == "--limits") {
                opts.limits_file = next("--limits");
            } else if (arg == "--ast") {
                opts.ast_expr = next("--ast");
                has_ast = true;
            } else if (arg == "--eval") {
                opts.eval_expr = next("--eval");
                has_eval = true;
            } else if (arg == "--validate") {
                opts.validate = true;
            } else if (arg == "--functions") {
                opts.functions = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg.starts_with("--")) {
                std::cerr << "[ERROR] Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            } else {
                opts.positional.push_back(arg);
            }
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << e.what() << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        screenbind::EngineConfig config;
        if (!opts.limits_file.empty()) {
            config = screenbind::load_engine_config_from_file(opts.limits_file);
        }
        screenbind::TemplateRenderer renderer(config);

        if (opts.functions) {
            std::cout << renderer.functions().signatures_json().dump(2) << std::endl;
            return 0;
        }

        if (has_ast) {
            auto ast = screenbind::parse_expression(opts.ast_expr, config.limits);
            std::cout << screenbind::ast_to_json(*ast).dump(2) << std::endl;
            return 0;
        }

        if (has_eval) {
            screenbind::BindingContext ctx;
            if (!opts.positional.empty()) {
                ctx = screenbind::BindingContext::from_value(
                    screenbind::load_document_from_file(opts.positional.back()));
            }
            auto result = screenbind::try_evaluate_expression(opts.eval_expr, ctx, config.limits,
                                                              &renderer.functions());
            if (!result.success) {
                std::cerr << "[ERROR] " << screenbind::error_kind_name(result.kind) << ": "
                          << result.message << "\n";
                return 1;
            }
            std::cout << result.value.dump(2) << std::endl;
            return 0;
        }

        if (opts.validate) {
            if (opts.positional.empty()) {
                print_usage(argv[0]);
                return 1;
            }
            auto tmpl = screenbind::load_document_from_file(opts.positional.front());
            auto errors = screenbind::validate_template(tmpl, renderer.functions(), config.limits);
            for (const auto& err : errors) {
                std::cout << err << "\n";
            }
            return errors.empty() ? 0 : 1;
        }

        if (opts.positional.size() != 2) {
            print_usage(argv[0]);
            return 1;
        }
        auto tmpl = screenbind::load_document_from_file(opts.positional[0]);
        auto ctx = screenbind::BindingContext::from_value(
            screenbind::load_document_from_file(opts.positional[1]));
        std::cout << renderer.render_with_env(tmpl, ctx).dump(2) << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
