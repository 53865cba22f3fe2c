// screenbind/functions/registry.h
#ifndef SCREENBIND_FUNCTIONS_REGISTRY_H
#define SCREENBIND_FUNCTIONS_REGISTRY_H

#include "screenbind/common/types.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace screenbind {

// Every function reachable from an expression takes already-evaluated arguments and
// returns a value. Implementations must never throw on bad input; they coerce instead.
using SafeFunction = std::function<Value(const std::vector<Value>&)>;

// Descriptive metadata for editor help panels. Has no effect on evaluation.
struct FunctionSignature {
    std::vector<std::string> params;   // "string", "decimals?", "...values"
    std::string return_type;
    std::string description;
};

// Closed table of callable functions. The evaluator resolves call nodes against
// this table only; there is no fallback lookup.
class FunctionRegistry {
public:
    // The full safe library, with collection inputs truncated to max_array_size.
    explicit FunctionRegistry(std::size_t max_array_size = kMaxArraySize);

    // A table with nothing in it, for callers building a narrower allow-list.
    static FunctionRegistry empty();

    // Shared instance of the default library.
    static const FunctionRegistry& defaults();

    template<typename Func>
    void register_function(std::string name, FunctionSignature signature, Func&& func) {
        signatures_[name] = std::move(signature);
        functions_[std::move(name)] = std::forward<Func>(func);
    }

    bool has_function(const std::string& name) const;

    // Throws UnknownFunctionError when name is not in the table.
    Value call_function(const std::string& name, const std::vector<Value>& args) const;

    // nullptr when name is not in the table
    const FunctionSignature* signature(const std::string& name) const;

    // Sorted by name
    std::vector<std::string> list_functions() const;

    // {"sum": {"params": ["array", "field?"], "returnType": "number", "description": "..."}, ...}
    Value signatures_json() const;

    std::size_t max_array_size() const { return max_array_size_; }

private:
    struct EmptyTag {};
    FunctionRegistry(EmptyTag, std::size_t max_array_size);

    void register_string_functions();
    void register_number_functions();
    void register_date_functions();
    void register_collection_functions();
    void register_utility_functions();

    std::size_t max_array_size_;
    std::map<std::string, SafeFunction> functions_;
    std::map<std::string, FunctionSignature> signatures_;
};

namespace fn {

// Argument access and the conversions every safe function shares.

// args[i], or null when the call supplied fewer arguments
const Value& arg(const std::vector<Value>& args, std::size_t i);

bool has_arg(const std::vector<Value>& args, std::size_t i); // present and not null

// Copy of the first max_size elements, or an empty array for a non-array.
Value to_array(const Value& v, std::size_t max_size);

// item[field] for objects (and numeric fields on arrays), null otherwise
Value pluck_field(const Value& item, const std::string& field);

} // namespace fn

} // namespace screenbind

#endif // SCREENBIND_FUNCTIONS_REGISTRY_H
