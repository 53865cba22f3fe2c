// src/common/types.cpp
#include "screenbind/common/types.h"

namespace screenbind {

BindingContext BindingContext::from_value(const Value& doc) {
    BindingContext ctx;
    if (!doc.is_object()) {
        return ctx;
    }
    if (doc.contains("state")) ctx.state = doc["state"];
    if (doc.contains("inputs")) ctx.inputs = doc["inputs"];
    if (doc.contains("context")) ctx.context = doc["context"];
    if (doc.contains("trace_id")) ctx.trace_id = doc["trace_id"];
    return ctx;
}

const Value* BindingContext::root(std::string_view name) const {
    if (name == "state") return &state;
    if (name == "inputs") return &inputs;
    if (name == "context") return &context;
    if (name == "trace_id") return &trace_id;
    return nullptr;
}

bool is_sanctioned_root(std::string_view name) {
    return name == "state" || name == "inputs" || name == "context" || name == "trace_id";
}

} // namespace screenbind
