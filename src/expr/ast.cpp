// src/expr/ast.cpp
#include "screenbind/expr/ast.h"

namespace screenbind {

namespace {

std::vector<NodePtr> clone_all(const std::vector<NodePtr>& nodes) {
    std::vector<NodePtr> out;
    out.reserve(nodes.size());
    for (const auto& n : nodes) {
        out.push_back(n->clone());
    }
    return out;
}

void visit_paths(const Node& n, std::vector<std::string>& out) {
    switch (n.type) {
        case NodeType::PATH:
            out.push_back(static_cast<const PathNode&>(n).dotted());
            break;
        case NodeType::CALL:
            for (const auto& arg : static_cast<const CallNode&>(n).args) visit_paths(*arg, out);
            break;
        case NodeType::BINARY: {
            const auto& b = static_cast<const BinaryNode&>(n);
            visit_paths(*b.left, out);
            visit_paths(*b.right, out);
            break;
        }
        case NodeType::UNARY:
            visit_paths(*static_cast<const UnaryNode&>(n).operand, out);
            break;
        case NodeType::TERNARY: {
            const auto& t = static_cast<const TernaryNode&>(n);
            visit_paths(*t.condition, out);
            visit_paths(*t.consequent, out);
            visit_paths(*t.alternate, out);
            break;
        }
        case NodeType::ARRAY:
            for (const auto& e : static_cast<const ArrayNode&>(n).elements) visit_paths(*e, out);
            break;
        case NodeType::LITERAL:
            break;
    }
}

void visit_functions(const Node& n, std::vector<std::string>& out) {
    switch (n.type) {
        case NodeType::CALL: {
            const auto& c = static_cast<const CallNode&>(n);
            out.push_back(c.name);
            for (const auto& arg : c.args) visit_functions(*arg, out);
            break;
        }
        case NodeType::BINARY: {
            const auto& b = static_cast<const BinaryNode&>(n);
            visit_functions(*b.left, out);
            visit_functions(*b.right, out);
            break;
        }
        case NodeType::UNARY:
            visit_functions(*static_cast<const UnaryNode&>(n).operand, out);
            break;
        case NodeType::TERNARY: {
            const auto& t = static_cast<const TernaryNode&>(n);
            visit_functions(*t.condition, out);
            visit_functions(*t.consequent, out);
            visit_functions(*t.alternate, out);
            break;
        }
        case NodeType::ARRAY:
            for (const auto& e : static_cast<const ArrayNode&>(n).elements) visit_functions(*e, out);
            break;
        case NodeType::LITERAL:
        case NodeType::PATH:
            break;
    }
}

} // namespace

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::LITERAL: return "literal";
        case NodeType::PATH: return "path";
        case NodeType::CALL: return "call";
        case NodeType::BINARY: return "binary";
        case NodeType::UNARY: return "unary";
        case NodeType::TERNARY: return "ternary";
        case NodeType::ARRAY: return "array";
    }
    return "unknown";
}

const char* binary_op_symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::ADD: return "+";
        case BinaryOp::SUB: return "-";
        case BinaryOp::MUL: return "*";
        case BinaryOp::DIV: return "/";
        case BinaryOp::MOD: return "%";
        case BinaryOp::EQ: return "==";
        case BinaryOp::NE: return "!=";
        case BinaryOp::STRICT_EQ: return "===";
        case BinaryOp::STRICT_NE: return "!==";
        case BinaryOp::GT: return ">";
        case BinaryOp::GE: return ">=";
        case BinaryOp::LT: return "<";
        case BinaryOp::LE: return "<=";
        case BinaryOp::AND: return "&&";
        case BinaryOp::OR: return "||";
    }
    return "?";
}

const char* unary_op_symbol(UnaryOp op) {
    return op == UnaryOp::NOT ? "!" : "-";
}

LiteralNode::LiteralNode(Value value)
    : Node(NodeType::LITERAL), value(std::move(value)) {}

NodePtr LiteralNode::clone() const {
    return std::make_unique<LiteralNode>(value);
}

PathNode::PathNode(std::vector<std::string> segments)
    : Node(NodeType::PATH), segments(std::move(segments)) {}

NodePtr PathNode::clone() const {
    return std::make_unique<PathNode>(segments);
}

std::string PathNode::dotted() const {
    std::string out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '.';
        out += segments[i];
    }
    return out;
}

CallNode::CallNode(std::string name, std::vector<NodePtr> args)
    : Node(NodeType::CALL), name(std::move(name)), args(std::move(args)) {}

NodePtr CallNode::clone() const {
    return std::make_unique<CallNode>(name, clone_all(args));
}

BinaryNode::BinaryNode(BinaryOp op, NodePtr left, NodePtr right)
    : Node(NodeType::BINARY), op(op), left(std::move(left)), right(std::move(right)) {}

NodePtr BinaryNode::clone() const {
    return std::make_unique<BinaryNode>(op, left->clone(), right->clone());
}

UnaryNode::UnaryNode(UnaryOp op, NodePtr operand)
    : Node(NodeType::UNARY), op(op), operand(std::move(operand)) {}

NodePtr UnaryNode::clone() const {
    return std::make_unique<UnaryNode>(op, operand->clone());
}

TernaryNode::TernaryNode(NodePtr condition, NodePtr consequent, NodePtr alternate)
    : Node(NodeType::TERNARY),
      condition(std::move(condition)),
      consequent(std::move(consequent)),
      alternate(std::move(alternate)) {}

NodePtr TernaryNode::clone() const {
    return std::make_unique<TernaryNode>(condition->clone(), consequent->clone(), alternate->clone());
}

ArrayNode::ArrayNode(std::vector<NodePtr> elements)
    : Node(NodeType::ARRAY), elements(std::move(elements)) {}

NodePtr ArrayNode::clone() const {
    return std::make_unique<ArrayNode>(clone_all(elements));
}

std::vector<std::string> collect_paths(const Node& node) {
    std::vector<std::string> paths;
    visit_paths(node, paths);
    return paths;
}

std::vector<std::string> collect_functions(const Node& node) {
    std::vector<std::string> fns;
    visit_functions(node, fns);
    return fns;
}

Value ast_to_json(const Node& node) {
    Value j = Value::object();
    j["type"] = node_type_name(node.type);
    switch (node.type) {
        case NodeType::LITERAL:
            j["value"] = static_cast<const LiteralNode&>(node).value;
            break;
        case NodeType::PATH:
            j["segments"] = static_cast<const PathNode&>(node).segments;
            break;
        case NodeType::CALL: {
            const auto& c = static_cast<const CallNode&>(node);
            j["name"] = c.name;
            j["args"] = Value::array();
            for (const auto& arg : c.args) j["args"].push_back(ast_to_json(*arg));
            break;
        }
        case NodeType::BINARY: {
            const auto& b = static_cast<const BinaryNode&>(node);
            j["op"] = binary_op_symbol(b.op);
            j["left"] = ast_to_json(*b.left);
            j["right"] = ast_to_json(*b.right);
            break;
        }
        case NodeType::UNARY: {
            const auto& u = static_cast<const UnaryNode&>(node);
            j["op"] = unary_op_symbol(u.op);
            j["operand"] = ast_to_json(*u.operand);
            break;
        }
        case NodeType::TERNARY: {
            const auto& t = static_cast<const TernaryNode&>(node);
            j["condition"] = ast_to_json(*t.condition);
            j["consequent"] = ast_to_json(*t.consequent);
            j["alternate"] = ast_to_json(*t.alternate);
            break;
        }
        case NodeType::ARRAY: {
            j["elements"] = Value::array();
            for (const auto& e : static_cast<const ArrayNode&>(node).elements) {
                j["elements"].push_back(ast_to_json(*e));
            }
            break;
        }
    }
    return j;
}

} // namespace screenbind
