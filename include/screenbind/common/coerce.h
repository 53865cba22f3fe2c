#ifndef SCREENBIND_COMMON_COERCE_H
#define SCREENBIND_COMMON_COERCE_H

#include "screenbind/common/types.h"
#include <optional>
#include <string>
#include <string_view>

namespace screenbind {

// Coercion rules shared by the evaluator and the safe functions.
// They follow the loose, never-throwing conversions persisted screens were written against.

// Text form of a value: null -> "", numbers without a trailing ".0",
// arrays comma-joined, objects "[object Object]".
std::string to_display_string(const Value& v);

// Number() semantics. NaN when the value has no numeric reading ("abc", objects).
double to_number(const Value& v);

// to_number with NaN mapped to 0.
double to_number_or_zero(const Value& v);

bool is_truthy(const Value& v);

// == / != : cross-type comparison after numeric or string conversion.
bool loose_equals(const Value& a, const Value& b);

// === / !== : same type and same value.
bool strict_equals(const Value& a, const Value& b);

// Stores integral doubles as integers so 1 + 2 renders as "3". Non-finite input becomes 0.
Value make_number(double d);

std::string format_number(double d);

// Digits only: "0", "12". Used for array-index segments.
std::optional<std::size_t> parse_index(std::string_view segment);

} // namespace screenbind

#endif // SCREENBIND_COMMON_COERCE_H
