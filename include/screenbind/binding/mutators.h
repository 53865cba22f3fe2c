// screenbind/binding/mutators.h
#ifndef SCREENBIND_BINDING_MUTATORS_H
#define SCREENBIND_BINDING_MUTATORS_H

#include "screenbind/common/types.h"
#include <optional>
#include <string>

namespace screenbind {

// Reserved sub-maps of the binding state. Only the functions below write them.
inline constexpr const char* kResultsKey = "results";
inline constexpr const char* kLoadingKey = "__loading";
inline constexpr const char* kErrorKey = "__error";

// For every target -> source pair in `bindings`, copies the value at the source path
// (resolved against ctx, null when missing) to the target path in state.
// A leading "state." on the target is dropped. Non-string sources are skipped.
// A target whose array index is over max_array_size is skipped with a warning.
void apply_bindings(Value& state, const Value& bindings, const BindingContext& ctx,
                    std::size_t max_array_size = kMaxArraySize);

// state.results[action_id] = result; then every key of result.state_patch is
// written to state at the top level. Over-cap keys are skipped like in apply_bindings.
void apply_action_result_to_state(Value& state, const std::string& action_id, const Value& result,
                                  std::size_t max_array_size = kMaxArraySize);

void set_loading(Value& state, const std::string& action_id, bool loading);

// message is a string, or null to clear
void set_error(Value& state, const std::string& action_id, const Value& message);

// Lifecycle around one action dispatch.
void begin_action(Value& state, const std::string& action_id);
void complete_action(Value& state, const std::string& action_id, const Value& result,
                     std::size_t max_array_size = kMaxArraySize);
void fail_action(Value& state, const std::string& action_id, const std::string& message);

bool is_loading(const Value& state, const std::string& action_id);
std::optional<std::string> action_error(const Value& state, const std::string& action_id);

} // namespace screenbind

#endif // SCREENBIND_BINDING_MUTATORS_H
