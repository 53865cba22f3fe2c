// screenbind/binding/path_resolver.h
#ifndef SCREENBIND_BINDING_PATH_RESOLVER_H
#define SCREENBIND_BINDING_PATH_RESOLVER_H

#include "screenbind/common/types.h"
#include <string>
#include <string_view>
#include <vector>

namespace screenbind {

// "rows[2].cells[1]" -> {"rows", "2", "cells", "1"}. Empty segments are dropped,
// so "items.0.name" and "items[0].name" produce the same list.
std::vector<std::string> parse_path(std::string_view path);

// Read through nested objects and arrays. nullptr when any step is missing
// or passes through a scalar. Never throws.
const Value* get(const Value& container, std::string_view path);

// Same, with the first segment naming a root of the binding context.
const Value* get(const BindingContext& ctx, std::string_view path);

// Value at path, or null.
Value get_or_null(const Value& container, std::string_view path);

// Write value at path, creating or reshaping containers on the way:
// a numeric segment turns a non-object into an array (padded with nulls),
// a named segment turns a non-object into an object.
// Throws std::out_of_range for an index >= max_array_size, leaving container untouched.
// An empty path is a no-op.
void set(Value& container, std::string_view path, Value value,
         std::size_t max_array_size = kMaxArraySize);

} // namespace screenbind

#endif // SCREENBIND_BINDING_PATH_RESOLVER_H
