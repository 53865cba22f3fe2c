#ifndef SCREENBIND_EXPR_TOKENIZER_H
#define SCREENBIND_EXPR_TOKENIZER_H

#include "screenbind/expr/token.h"
#include <string_view>
#include <vector>

namespace screenbind {

class Tokenizer {
public:
    explicit Tokenizer(std::string_view source, std::size_t max_tokens = kMaxTokens);

    // Always ends with an END_OF_INPUT token (not counted against max_tokens).
    // Throws SyntaxError on a character that starts no token, ComplexityError past max_tokens.
    std::vector<Token> tokenize();

private:
    std::string_view source_;
    std::size_t max_tokens_;
    std::size_t pos_ = 0;
    std::vector<Token> tokens_;

    void push(TokenKind kind, Value value, std::size_t start);
    void lex_number();
    void lex_string();
    void lex_identifier();
    bool lex_operator();
};

std::vector<Token> tokenize(std::string_view source, std::size_t max_tokens = kMaxTokens);

} // namespace screenbind

#endif // SCREENBIND_EXPR_TOKENIZER_H
