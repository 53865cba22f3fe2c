// screenbind/expr/evaluator.h
#ifndef SCREENBIND_EXPR_EVALUATOR_H
#define SCREENBIND_EXPR_EVALUATOR_H

#include "screenbind/common/errors.h"
#include "screenbind/common/types.h"
#include "screenbind/expr/ast.h"
#include "screenbind/functions/registry.h"
#include <string>
#include <string_view>

namespace screenbind {

struct EvalOptions {
    int max_depth = kMaxEvalDepth;
    const FunctionRegistry* functions = nullptr; // nullptr: FunctionRegistry::defaults()
};

// Walks an AST against a read-only BindingContext. Holds no state between calls.
class Evaluator {
public:
    explicit Evaluator(const BindingContext& ctx, EvalOptions options = {});

    // Throws DepthExceededError or UnknownFunctionError.
    Value evaluate(const Node& node) const;

private:
    const BindingContext& ctx_;
    const FunctionRegistry& functions_;
    int max_depth_;

    Value eval(const Node& node, int depth) const;
    Value eval_path(const PathNode& node) const;
    Value eval_call(const CallNode& node, int depth) const;
    Value eval_binary(const BinaryNode& node, int depth) const;
};

Value evaluate(const Node& node, const BindingContext& ctx, EvalOptions options = {});

// tokenize + parse + evaluate; every ExpressionError propagates
Value evaluate_expression(std::string_view source, const BindingContext& ctx,
                          const EngineLimits& limits = {},
                          const FunctionRegistry* functions = nullptr);

struct EvaluationResult {
    bool success = false;
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    Value value = nullptr;
};

// Same pipeline as evaluate_expression, with failures returned instead of thrown.
EvaluationResult try_evaluate_expression(std::string_view source, const BindingContext& ctx,
                                         const EngineLimits& limits = {},
                                         const FunctionRegistry* functions = nullptr);

} // namespace screenbind

#endif // SCREENBIND_EXPR_EVALUATOR_H
