// src/expr/tokenizer.cpp
#include "screenbind/expr/tokenizer.h"
#include "screenbind/common/coerce.h"
#include "screenbind/common/errors.h"
#include <cctype>
#include <charconv>
#include <string>

namespace screenbind {

namespace {

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

inline bool is_ident_char(char c) {
    return is_ident_start(c) || is_digit(c);
}

struct OperatorSpelling {
    const char* text;
    TokenKind kind;
};

// Longest spellings first so "===" wins over "==" and "=="/"!=" over "!"
constexpr OperatorSpelling kOperators[] = {
    {"===", TokenKind::STRICT_EQ},
    {"!==", TokenKind::STRICT_NE},
    {"==", TokenKind::EQ},
    {"!=", TokenKind::NE},
    {">=", TokenKind::GE},
    {"<=", TokenKind::LE},
    {"&&", TokenKind::AND_AND},
    {"||", TokenKind::OR_OR},
    {"(", TokenKind::LPAREN},
    {")", TokenKind::RPAREN},
    {"[", TokenKind::LBRACKET},
    {"]", TokenKind::RBRACKET},
    {",", TokenKind::COMMA},
    {".", TokenKind::DOT},
    {"?", TokenKind::QUESTION},
    {":", TokenKind::COLON},
    {"+", TokenKind::PLUS},
    {"-", TokenKind::MINUS},
    {"*", TokenKind::STAR},
    {"/", TokenKind::SLASH},
    {"%", TokenKind::PERCENT},
    {">", TokenKind::GT},
    {"<", TokenKind::LT},
    {"!", TokenKind::BANG},
};

} // namespace

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::NUMBER: return "number";
        case TokenKind::STRING: return "string";
        case TokenKind::IDENTIFIER: return "identifier";
        case TokenKind::BOOLEAN: return "boolean";
        case TokenKind::NULL_LITERAL: return "null";
        case TokenKind::LPAREN: return "(";
        case TokenKind::RPAREN: return ")";
        case TokenKind::LBRACKET: return "[";
        case TokenKind::RBRACKET: return "]";
        case TokenKind::COMMA: return ",";
        case TokenKind::DOT: return ".";
        case TokenKind::QUESTION: return "?";
        case TokenKind::COLON: return ":";
        case TokenKind::PLUS: return "+";
        case TokenKind::MINUS: return "-";
        case TokenKind::STAR: return "*";
        case TokenKind::SLASH: return "/";
        case TokenKind::PERCENT: return "%";
        case TokenKind::GT: return ">";
        case TokenKind::GE: return ">=";
        case TokenKind::LT: return "<";
        case TokenKind::LE: return "<=";
        case TokenKind::EQ: return "==";
        case TokenKind::NE: return "!=";
        case TokenKind::STRICT_EQ: return "===";
        case TokenKind::STRICT_NE: return "!==";
        case TokenKind::AND_AND: return "&&";
        case TokenKind::OR_OR: return "||";
        case TokenKind::BANG: return "!";
        case TokenKind::END_OF_INPUT: return "end of input";
    }
    return "?";
}

Tokenizer::Tokenizer(std::string_view source, std::size_t max_tokens)
    : source_(source), max_tokens_(max_tokens) {}

std::vector<Token> Tokenizer::tokenize() {
    tokens_.clear();
    pos_ = 0;

    while (pos_ < source_.size()) {
        char ch = source_[pos_];

        if (std::isspace(static_cast<unsigned char>(ch))) {
            ++pos_;
            continue;
        }

        if (is_digit(ch) || (ch == '.' && pos_ + 1 < source_.size() && is_digit(source_[pos_ + 1]))) {
            lex_number();
            continue;
        }

        if (ch == '\'' || ch == '"') {
            lex_string();
            continue;
        }

        if (is_ident_start(ch)) {
            lex_identifier();
            continue;
        }

        if (lex_operator()) {
            continue;
        }

        throw SyntaxError("Unexpected character '" + std::string(1, ch) + "' at position " +
                          std::to_string(pos_), pos_);
    }

    tokens_.emplace_back(TokenKind::END_OF_INPUT, nullptr, pos_);
    return std::move(tokens_);
}

void Tokenizer::push(TokenKind kind, Value value, std::size_t start) {
    if (tokens_.size() >= max_tokens_) {
        throw ComplexityError("Expression too complex (>" + std::to_string(max_tokens_) + " tokens)");
    }
    tokens_.emplace_back(kind, std::move(value), start);
}

void Tokenizer::lex_number() {
    // digits and dots are consumed greedily; the value is the longest numeric
    // prefix, so "1.2.3" reads as 1.2 and "1." as 1
    std::size_t start = pos_;
    while (pos_ < source_.size() && (is_digit(source_[pos_]) || source_[pos_] == '.')) {
        ++pos_;
    }

    std::string_view text = source_.substr(start, pos_ - start);
    double d = 0.0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), d, std::chars_format::fixed);
    if (res.ec != std::errc()) {
        throw SyntaxError("Invalid number '" + std::string(text) + "' at position " + std::to_string(start), start);
    }
    push(TokenKind::NUMBER, make_number(d), start);
}

void Tokenizer::lex_string() {
    std::size_t start = pos_;
    char quote = source_[pos_++];
    std::string str;
    while (pos_ < source_.size() && source_[pos_] != quote) {
        if (source_[pos_] == '\\' && pos_ + 1 < source_.size()) {
            ++pos_; // the escaped character is taken literally
        }
        str += source_[pos_++];
    }
    if (pos_ >= source_.size()) {
        throw SyntaxError("Unterminated string literal at position " + std::to_string(start), start);
    }
    ++pos_; // closing quote
    push(TokenKind::STRING, std::move(str), start);
}

void Tokenizer::lex_identifier() {
    std::size_t start = pos_;
    while (pos_ < source_.size() && is_ident_char(source_[pos_])) {
        ++pos_;
    }
    std::string ident(source_.substr(start, pos_ - start));
    if (ident == "true") {
        push(TokenKind::BOOLEAN, true, start);
    } else if (ident == "false") {
        push(TokenKind::BOOLEAN, false, start);
    } else if (ident == "null") {
        push(TokenKind::NULL_LITERAL, nullptr, start);
    } else {
        push(TokenKind::IDENTIFIER, std::move(ident), start);
    }
}

bool Tokenizer::lex_operator() {
    std::string_view rest = source_.substr(pos_);
    for (const auto& op : kOperators) {
        std::string_view spelling(op.text);
        if (rest.substr(0, spelling.size()) == spelling) {
            std::size_t start = pos_;
            pos_ += spelling.size();
            push(op.kind, std::string(spelling), start);
            return true;
        }
    }
    return false;
}

std::vector<Token> tokenize(std::string_view source, std::size_t max_tokens) {
    Tokenizer tokenizer(source, max_tokens);
    return tokenizer.tokenize();
}

} // namespace screenbind
