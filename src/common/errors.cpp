// src/common/errors.cpp
#include "screenbind/common/errors.h"

namespace screenbind {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::SYNTAX: return "SyntaxError";
        case ErrorKind::COMPLEXITY: return "ComplexityError";
        case ErrorKind::DEPTH_EXCEEDED: return "DepthExceededError";
        case ErrorKind::UNKNOWN_FUNCTION: return "UnknownFunctionError";
        case ErrorKind::INTERNAL: return "InternalError";
    }
    return "InternalError";
}

} // namespace screenbind
