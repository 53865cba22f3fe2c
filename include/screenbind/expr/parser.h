#ifndef SCREENBIND_EXPR_PARSER_H
#define SCREENBIND_EXPR_PARSER_H

#include "screenbind/expr/ast.h"
#include "screenbind/expr/token.h"
#include <string_view>
#include <vector>

namespace screenbind {

// Recursive-descent parser over the token stream produced by Tokenizer.
//
// Precedence, lowest first:
//   ternary ?: (right-assoc)  ||  &&  comparison  + -  * / %  unary ! -  call/member  primary
//
// Every sub-expression that starts a new nesting level (parenthesised group, ternary
// branch, call argument, array element, index) counts against max_depth.
class Parser {
public:
    Parser(std::vector<Token> tokens, int max_depth = kMaxParseDepth);

    // Throws SyntaxError on a grammar violation or trailing tokens,
    // ComplexityError when nesting exceeds max_depth.
    NodePtr parse();

private:
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    int depth_ = 0;
    int max_depth_;

    const Token& peek() const;
    const Token& advance();
    const Token& expect(TokenKind kind);
    bool check(TokenKind kind) const { return peek().kind == kind; }

    NodePtr parse_expression();
    NodePtr parse_ternary();
    NodePtr parse_or();
    NodePtr parse_and();
    NodePtr parse_comparison();
    NodePtr parse_additive();
    NodePtr parse_multiplicative();
    NodePtr parse_unary();
    NodePtr parse_call_or_access();
    NodePtr parse_primary();

    std::vector<NodePtr> parse_list(TokenKind close);
};

NodePtr parse(std::vector<Token> tokens, int max_depth = kMaxParseDepth);

// tokenize + parse with the given ceilings
NodePtr parse_expression(std::string_view source, const EngineLimits& limits = {});

} // namespace screenbind

#endif // SCREENBIND_EXPR_PARSER_H
