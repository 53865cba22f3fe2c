// screenbind/expr/ast.h
#ifndef SCREENBIND_EXPR_AST_H
#define SCREENBIND_EXPR_AST_H

#include "screenbind/common/types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace screenbind {

enum class NodeType : uint8_t {
    LITERAL,
    PATH,
    CALL,
    BINARY,
    UNARY,
    TERNARY,
    ARRAY
};

enum class BinaryOp : uint8_t {
    ADD, SUB, MUL, DIV, MOD,
    EQ, NE, STRICT_EQ, STRICT_NE,
    GT, GE, LT, LE,
    AND, OR
};

enum class UnaryOp : uint8_t {
    NOT,
    NEGATE
};

const char* node_type_name(NodeType type);
const char* binary_op_symbol(BinaryOp op);
const char* unary_op_symbol(UnaryOp op);

struct Node;
using NodePtr = std::unique_ptr<Node>;

// Base node. The set of node types is closed; consumers switch on `type`.
struct Node {
    NodeType type;

    explicit Node(NodeType type) : type(type) {}
    virtual ~Node() = default;

    virtual NodePtr clone() const = 0;
};

struct LiteralNode : public Node {
    Value value; // number, string, bool or null

    explicit LiteralNode(Value value);
    NodePtr clone() const override;
};

struct PathNode : public Node {
    std::vector<std::string> segments;

    explicit PathNode(std::vector<std::string> segments);
    NodePtr clone() const override;

    // "state.items.0"
    std::string dotted() const;
};

struct CallNode : public Node {
    std::string name;
    std::vector<NodePtr> args;

    CallNode(std::string name, std::vector<NodePtr> args);
    NodePtr clone() const override;
};

struct BinaryNode : public Node {
    BinaryOp op;
    NodePtr left;
    NodePtr right;

    BinaryNode(BinaryOp op, NodePtr left, NodePtr right);
    NodePtr clone() const override;
};

struct UnaryNode : public Node {
    UnaryOp op;
    NodePtr operand;

    UnaryNode(UnaryOp op, NodePtr operand);
    NodePtr clone() const override;
};

struct TernaryNode : public Node {
    NodePtr condition;
    NodePtr consequent;
    NodePtr alternate;

    TernaryNode(NodePtr condition, NodePtr consequent, NodePtr alternate);
    NodePtr clone() const override;
};

struct ArrayNode : public Node {
    std::vector<NodePtr> elements;

    explicit ArrayNode(std::vector<NodePtr> elements);
    NodePtr clone() const override;
};

// Static analysis used to check an expression against an allow-list before it is stored.

// Dotted string of every path node, in source order (duplicates kept).
std::vector<std::string> collect_paths(const Node& node);

// Name of every call node, outer calls before the calls in their arguments.
std::vector<std::string> collect_functions(const Node& node);

// {"type":"binary","op":"+","left":{...},"right":{...}}
Value ast_to_json(const Node& node);

} // namespace screenbind

#endif // SCREENBIND_EXPR_AST_H
