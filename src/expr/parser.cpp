// src/expr/parser.cpp
#include "screenbind/expr/parser.h"
#include "screenbind/expr/tokenizer.h"
#include "screenbind/common/coerce.h"
#include "screenbind/common/errors.h"
#include <string>

namespace screenbind {

namespace {

std::string describe(const Token& t) {
    if (t.kind == TokenKind::IDENTIFIER || t.kind == TokenKind::NUMBER) {
        return to_display_string(t.value);
    }
    if (t.kind == TokenKind::STRING) {
        return "'" + t.value.get<std::string>() + "'";
    }
    return token_kind_name(t.kind);
}

bool comparison_op(TokenKind kind, BinaryOp& op) {
    switch (kind) {
        case TokenKind::EQ: op = BinaryOp::EQ; return true;
        case TokenKind::NE: op = BinaryOp::NE; return true;
        case TokenKind::STRICT_EQ: op = BinaryOp::STRICT_EQ; return true;
        case TokenKind::STRICT_NE: op = BinaryOp::STRICT_NE; return true;
        case TokenKind::GT: op = BinaryOp::GT; return true;
        case TokenKind::GE: op = BinaryOp::GE; return true;
        case TokenKind::LT: op = BinaryOp::LT; return true;
        case TokenKind::LE: op = BinaryOp::LE; return true;
        default: return false;
    }
}

} // namespace

Parser::Parser(std::vector<Token> tokens, int max_depth)
    : tokens_(std::move(tokens)), max_depth_(max_depth) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::END_OF_INPUT) {
        std::size_t end = tokens_.empty() ? 0 : tokens_.back().position;
        tokens_.emplace_back(TokenKind::END_OF_INPUT, nullptr, end);
    }
}

const Token& Parser::peek() const {
    return pos_ < tokens_.size() ? tokens_[pos_] : tokens_.back();
}

const Token& Parser::advance() {
    const Token& t = peek();
    if (pos_ < tokens_.size() - 1) ++pos_;
    return t;
}

const Token& Parser::expect(TokenKind kind) {
    const Token& t = peek();
    if (t.kind != kind) {
        throw SyntaxError(std::string("Expected '") + token_kind_name(kind) + "' but got '" +
                          describe(t) + "' at position " + std::to_string(t.position), t.position);
    }
    return advance();
}

NodePtr Parser::parse() {
    pos_ = 0;
    depth_ = 0;
    NodePtr result = parse_expression();
    if (!check(TokenKind::END_OF_INPUT)) {
        const Token& t = peek();
        throw SyntaxError("Unexpected token '" + describe(t) + "' after expression at position " +
                          std::to_string(t.position), t.position);
    }
    return result;
}

NodePtr Parser::parse_expression() {
    struct DepthGuard {
        int& depth;
        explicit DepthGuard(int& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    } guard(depth_);

    if (depth_ > max_depth_) {
        throw ComplexityError("Expression nesting too deep (>" + std::to_string(max_depth_) + " levels)");
    }
    return parse_ternary();
}

NodePtr Parser::parse_ternary() {
    NodePtr node = parse_or();
    if (check(TokenKind::QUESTION)) {
        advance();
        NodePtr consequent = parse_expression();
        expect(TokenKind::COLON);
        NodePtr alternate = parse_expression();
        node = std::make_unique<TernaryNode>(std::move(node), std::move(consequent), std::move(alternate));
    }
    return node;
}

NodePtr Parser::parse_or() {
    NodePtr left = parse_and();
    while (check(TokenKind::OR_OR)) {
        advance();
        left = std::make_unique<BinaryNode>(BinaryOp::OR, std::move(left), parse_and());
    }
    return left;
}

NodePtr Parser::parse_and() {
    NodePtr left = parse_comparison();
    while (check(TokenKind::AND_AND)) {
        advance();
        left = std::make_unique<BinaryNode>(BinaryOp::AND, std::move(left), parse_comparison());
    }
    return left;
}

NodePtr Parser::parse_comparison() {
    NodePtr left = parse_additive();
    BinaryOp op = BinaryOp::EQ;
    while (comparison_op(peek().kind, op)) {
        advance();
        left = std::make_unique<BinaryNode>(op, std::move(left), parse_additive());
    }
    return left;
}

NodePtr Parser::parse_additive() {
    NodePtr left = parse_multiplicative();
    while (check(TokenKind::PLUS) || check(TokenKind::MINUS)) {
        BinaryOp op = advance().kind == TokenKind::PLUS ? BinaryOp::ADD : BinaryOp::SUB;
        left = std::make_unique<BinaryNode>(op, std::move(left), parse_multiplicative());
    }
    return left;
}

NodePtr Parser::parse_multiplicative() {
    NodePtr left = parse_unary();
    while (check(TokenKind::STAR) || check(TokenKind::SLASH) || check(TokenKind::PERCENT)) {
        TokenKind kind = advance().kind;
        BinaryOp op = kind == TokenKind::STAR ? BinaryOp::MUL
                    : kind == TokenKind::SLASH ? BinaryOp::DIV
                    : BinaryOp::MOD;
        left = std::make_unique<BinaryNode>(op, std::move(left), parse_unary());
    }
    return left;
}

NodePtr Parser::parse_unary() {
    if (check(TokenKind::BANG)) {
        advance();
        return std::make_unique<UnaryNode>(UnaryOp::NOT, parse_unary());
    }
    if (check(TokenKind::MINUS)) {
        advance();
        return std::make_unique<UnaryNode>(UnaryOp::NEGATE, parse_unary());
    }
    return parse_call_or_access();
}

NodePtr Parser::parse_call_or_access() {
    NodePtr node = parse_primary();

    while (true) {
        if (check(TokenKind::LPAREN)) {
            // only a path can be called; anything else falls through to the trailing-token check
            if (node->type != NodeType::PATH) break;
            std::string name = static_cast<PathNode&>(*node).dotted();
            advance();
            node = std::make_unique<CallNode>(std::move(name), parse_list(TokenKind::RPAREN));
        } else if (check(TokenKind::DOT)) {
            advance();
            std::string prop = expect(TokenKind::IDENTIFIER).value.get<std::string>();
            if (node->type == NodeType::PATH) {
                static_cast<PathNode&>(*node).segments.push_back(std::move(prop));
            } else {
                // Forgiving: a property on a non-path becomes a two-segment path.
                std::string head;
                if (node->type == NodeType::LITERAL) {
                    const Value& v = static_cast<LiteralNode&>(*node).value;
                    if (is_truthy(v)) head = to_display_string(v);
                }
                node = std::make_unique<PathNode>(std::vector<std::string>{std::move(head), std::move(prop)});
            }
        } else if (check(TokenKind::LBRACKET)) {
            advance();
            NodePtr index = parse_expression();
            expect(TokenKind::RBRACKET);
            if (node->type == NodeType::PATH && index->type == NodeType::LITERAL) {
                static_cast<PathNode&>(*node).segments.push_back(
                    to_display_string(static_cast<LiteralNode&>(*index).value));
            }
        } else {
            break;
        }
    }
    return node;
}

NodePtr Parser::parse_primary() {
    const Token& t = peek();

    switch (t.kind) {
        case TokenKind::NUMBER:
        case TokenKind::STRING:
        case TokenKind::BOOLEAN:
        case TokenKind::NULL_LITERAL: {
            Value v = advance().value;
            return std::make_unique<LiteralNode>(std::move(v));
        }
        case TokenKind::IDENTIFIER: {
            std::string name = advance().value.get<std::string>();
            return std::make_unique<PathNode>(std::vector<std::string>{std::move(name)});
        }
        case TokenKind::LPAREN: {
            advance();
            NodePtr inner = parse_expression();
            expect(TokenKind::RPAREN);
            return inner;
        }
        case TokenKind::LBRACKET: {
            advance();
            return std::make_unique<ArrayNode>(parse_list(TokenKind::RBRACKET));
        }
        default:
            throw SyntaxError("Unexpected token '" + describe(t) + "' at position " +
                              std::to_string(t.position), t.position);
    }
}

// Comma-separated expressions up to and including `close`.
std::vector<NodePtr> Parser::parse_list(TokenKind close) {
    std::vector<NodePtr> items;
    if (!check(close)) {
        items.push_back(parse_expression());
        while (check(TokenKind::COMMA)) {
            advance();
            items.push_back(parse_expression());
        }
    }
    expect(close);
    return items;
}

NodePtr parse(std::vector<Token> tokens, int max_depth) {
    Parser parser(std::move(tokens), max_depth);
    return parser.parse();
}

NodePtr parse_expression(std::string_view source, const EngineLimits& limits) {
    return parse(tokenize(source, limits.max_tokens), limits.max_parse_depth);
}

} // namespace screenbind
