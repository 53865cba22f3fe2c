// src/functions/registry.cpp
#include "screenbind/functions/registry.h"
#include "screenbind/common/coerce.h"
#include "screenbind/common/errors.h"

namespace screenbind {

FunctionRegistry::FunctionRegistry(std::size_t max_array_size)
    : max_array_size_(max_array_size) {
    register_string_functions();
    register_number_functions();
    register_date_functions();
    register_collection_functions();
    register_utility_functions();
}

FunctionRegistry::FunctionRegistry(EmptyTag, std::size_t max_array_size)
    : max_array_size_(max_array_size) {}

FunctionRegistry FunctionRegistry::empty() {
    return FunctionRegistry(EmptyTag{}, kMaxArraySize);
}

const FunctionRegistry& FunctionRegistry::defaults() {
    static const FunctionRegistry registry;
    return registry;
}

bool FunctionRegistry::has_function(const std::string& name) const {
    return functions_.count(name) > 0;
}

Value FunctionRegistry::call_function(const std::string& name, const std::vector<Value>& args) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        throw UnknownFunctionError(name);
    }
    return it->second(args);
}

const FunctionSignature* FunctionRegistry::signature(const std::string& name) const {
    auto it = signatures_.find(name);
    return it != signatures_.end() ? &it->second : nullptr;
}

std::vector<std::string> FunctionRegistry::list_functions() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    return names;
}

Value FunctionRegistry::signatures_json() const {
    Value out = Value::object();
    for (const auto& [name, sig] : signatures_) {
        out[name] = {
            {"params", sig.params},
            {"returnType", sig.return_type},
            {"description", sig.description}
        };
    }
    return out;
}

namespace fn {

const Value& arg(const std::vector<Value>& args, std::size_t i) {
    static const Value null_value = nullptr;
    return i < args.size() ? args[i] : null_value;
}

bool has_arg(const std::vector<Value>& args, std::size_t i) {
    return i < args.size() && !args[i].is_null();
}

Value to_array(const Value& v, std::size_t max_size) {
    if (!v.is_array()) {
        return Value::array();
    }
    if (v.size() <= max_size) {
        return v;
    }
    Value out = Value::array();
    auto end = v.begin() + static_cast<std::ptrdiff_t>(max_size);
    for (auto it = v.begin(); it != end; ++it) {
        out.push_back(*it);
    }
    return out;
}

Value pluck_field(const Value& item, const std::string& field) {
    if (item.is_object()) {
        auto it = item.find(field);
        return it != item.end() ? *it : Value(nullptr);
    }
    if (item.is_array()) {
        auto index = parse_index(field);
        if (index && *index < item.size()) return item[*index];
    }
    return nullptr;
}

} // namespace fn

} // namespace screenbind
