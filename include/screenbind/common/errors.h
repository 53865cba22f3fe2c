#ifndef SCREENBIND_COMMON_ERRORS_H
#define SCREENBIND_COMMON_ERRORS_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace screenbind {

enum class ErrorKind : uint8_t {
    NONE,
    SYNTAX,
    COMPLEXITY,
    DEPTH_EXCEEDED,
    UNKNOWN_FUNCTION,
    INTERNAL
};

const char* error_kind_name(ErrorKind kind);

// Base of everything tokenize / parse / evaluate can throw.
class ExpressionError : public std::runtime_error {
public:
    ExpressionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class SyntaxError : public ExpressionError {
public:
    SyntaxError(const std::string& message, std::size_t position)
        : ExpressionError(ErrorKind::SYNTAX, message), position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

// Token count or parse nesting over the configured ceiling.
class ComplexityError : public ExpressionError {
public:
    explicit ComplexityError(const std::string& message)
        : ExpressionError(ErrorKind::COMPLEXITY, message) {}
};

class DepthExceededError : public ExpressionError {
public:
    DepthExceededError(const std::string& message, int depth)
        : ExpressionError(ErrorKind::DEPTH_EXCEEDED, message), depth_(depth) {}

    int depth() const noexcept { return depth_; }

private:
    int depth_;
};

class UnknownFunctionError : public ExpressionError {
public:
    explicit UnknownFunctionError(const std::string& name)
        : ExpressionError(ErrorKind::UNKNOWN_FUNCTION, "Unknown function: " + name), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace screenbind

#endif // SCREENBIND_COMMON_ERRORS_H
