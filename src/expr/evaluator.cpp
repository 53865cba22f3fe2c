// src/expr/evaluator.cpp
#include "screenbind/expr/evaluator.h"
#include "screenbind/expr/parser.h"
#include "screenbind/common/coerce.h"
#include <cmath>

namespace screenbind {

namespace {

bool concatenates(const Value& v) {
    return v.is_string() || v.is_structured();
}

bool compare(BinaryOp op, double a, double b) {
    // NaN on either side compares false
    switch (op) {
        case BinaryOp::GT: return a > b;
        case BinaryOp::GE: return a >= b;
        case BinaryOp::LT: return a < b;
        case BinaryOp::LE: return a <= b;
        default: return false;
    }
}

} // namespace

Evaluator::Evaluator(const BindingContext& ctx, EvalOptions options)
    : ctx_(ctx),
      functions_(options.functions ? *options.functions : FunctionRegistry::defaults()),
      max_depth_(options.max_depth) {}

Value Evaluator::evaluate(const Node& node) const {
    return eval(node, 1);
}

Value Evaluator::eval(const Node& node, int depth) const {
    if (depth > max_depth_) {
        throw DepthExceededError("Evaluation depth exceeded (>" + std::to_string(max_depth_) + " levels)", depth);
    }

    switch (node.type) {
        case NodeType::LITERAL:
            return static_cast<const LiteralNode&>(node).value;
        case NodeType::PATH:
            return eval_path(static_cast<const PathNode&>(node));
        case NodeType::CALL:
            return eval_call(static_cast<const CallNode&>(node), depth);
        case NodeType::BINARY:
            return eval_binary(static_cast<const BinaryNode&>(node), depth);
        case NodeType::UNARY: {
            const auto& u = static_cast<const UnaryNode&>(node);
            Value operand = eval(*u.operand, depth);
            if (u.op == UnaryOp::NOT) return !is_truthy(operand);
            return make_number(-to_number_or_zero(operand));
        }
        case NodeType::TERNARY: {
            const auto& t = static_cast<const TernaryNode&>(node);
            // only the chosen branch is evaluated
            return is_truthy(eval(*t.condition, depth)) ? eval(*t.consequent, depth + 1)
                                                        : eval(*t.alternate, depth + 1);
        }
        case NodeType::ARRAY: {
            Value out = Value::array();
            for (const auto& e : static_cast<const ArrayNode&>(node).elements) {
                out.push_back(eval(*e, depth + 1));
            }
            return out;
        }
    }
    return nullptr;
}

// Unknown roots and missing segments read as null.
Value Evaluator::eval_path(const PathNode& node) const {
    if (node.segments.empty()) return nullptr;
    const Value* current = ctx_.root(node.segments.front());
    for (std::size_t i = 1; current && i < node.segments.size(); ++i) {
        const std::string& seg = node.segments[i];
        if (current->is_object()) {
            auto it = current->find(seg);
            current = it != current->end() ? &*it : nullptr;
        } else if (current->is_array()) {
            auto index = parse_index(seg);
            current = (index && *index < current->size()) ? &(*current)[*index] : nullptr;
        } else {
            current = nullptr;
        }
    }
    return current ? *current : Value(nullptr);
}

Value Evaluator::eval_call(const CallNode& node, int depth) const {
    if (!functions_.has_function(node.name)) {
        throw UnknownFunctionError(node.name);
    }
    std::vector<Value> args;
    args.reserve(node.args.size());
    for (const auto& a : node.args) {
        args.push_back(eval(*a, depth + 1));
    }
    return functions_.call_function(node.name, args);
}

Value Evaluator::eval_binary(const BinaryNode& node, int depth) const {
    // both sides are always evaluated, left first
    Value left = eval(*node.left, depth);
    Value right = eval(*node.right, depth);

    switch (node.op) {
        case BinaryOp::ADD:
            if (concatenates(left) || concatenates(right)) {
                return to_display_string(left) + to_display_string(right);
            }
            return make_number(to_number(left) + to_number(right));
        case BinaryOp::SUB:
            return make_number(to_number(left) - to_number(right));
        case BinaryOp::MUL:
            return make_number(to_number(left) * to_number(right));
        case BinaryOp::DIV: {
            double divisor = to_number(right);
            if (divisor == 0) return 0;
            return make_number(to_number(left) / divisor);
        }
        case BinaryOp::MOD: {
            double divisor = to_number(right);
            if (divisor == 0) return 0;
            return make_number(std::fmod(to_number(left), divisor));
        }
        case BinaryOp::EQ: return loose_equals(left, right);
        case BinaryOp::NE: return !loose_equals(left, right);
        case BinaryOp::STRICT_EQ: return strict_equals(left, right);
        case BinaryOp::STRICT_NE: return !strict_equals(left, right);
        case BinaryOp::GT:
        case BinaryOp::GE:
        case BinaryOp::LT:
        case BinaryOp::LE:
            return compare(node.op, to_number(left), to_number(right));
        case BinaryOp::AND: return is_truthy(left) ? right : left;
        case BinaryOp::OR: return is_truthy(left) ? left : right;
    }
    return nullptr;
}

Value evaluate(const Node& node, const BindingContext& ctx, EvalOptions options) {
    return Evaluator(ctx, options).evaluate(node);
}

Value evaluate_expression(std::string_view source, const BindingContext& ctx,
                          const EngineLimits& limits, const FunctionRegistry* functions) {
    NodePtr ast = parse_expression(source, limits);
    return evaluate(*ast, ctx, EvalOptions{limits.max_eval_depth, functions});
}

EvaluationResult try_evaluate_expression(std::string_view source, const BindingContext& ctx,
                                         const EngineLimits& limits, const FunctionRegistry* functions) {
    EvaluationResult result;
    try {
        result.value = evaluate_expression(source, ctx, limits, functions);
        result.success = true;
    } catch (const ExpressionError& e) {
        result.kind = e.kind();
        result.message = e.what();
    } catch (const std::exception& e) {
        result.kind = ErrorKind::INTERNAL;
        result.message = e.what();
    }
    return result;
}

} // namespace screenbind
