// src/binding/mutators.cpp
#include "screenbind/binding/mutators.h"
#include "screenbind/binding/path_resolver.h"
#include "screenbind/common/coerce.h"
#include <iostream>
#include <stdexcept>

namespace screenbind {

namespace {

// state[key] as an object, replacing whatever was there if it is not one
Value& sub_map(Value& state, const char* key) {
    if (!state.is_object()) state = Value::object();
    Value& m = state[key];
    if (!m.is_object()) m = Value::object();
    return m;
}

// One write of a batch. A rejected path does not stop the rest of the batch.
void write_or_skip(Value& state, std::string_view path, const Value& value, std::size_t max_array_size) {
    try {
        set(state, path, value, max_array_size);
    } catch (const std::out_of_range& e) {
        std::cerr << "[WARNING] Skipping write to '" << path << "': " << e.what() << std::endl;
    }
}

const Value* lookup(const Value& state, const char* key, const std::string& action_id) {
    if (!state.is_object()) return nullptr;
    auto m = state.find(key);
    if (m == state.end() || !m->is_object()) return nullptr;
    auto it = m->find(action_id);
    return it != m->end() ? &*it : nullptr;
}

} // namespace

void apply_bindings(Value& state, const Value& bindings, const BindingContext& ctx,
                    std::size_t max_array_size) {
    if (!bindings.is_object()) return;

    for (auto it = bindings.begin(); it != bindings.end(); ++it) {
        if (!it.value().is_string()) continue;

        std::string_view target = it.key();
        if (target.starts_with("state.")) target.remove_prefix(6);

        const Value* source = get(ctx, it.value().get_ref<const std::string&>());
        write_or_skip(state, target, source ? *source : Value(nullptr), max_array_size);
    }
}

void apply_action_result_to_state(Value& state, const std::string& action_id, const Value& result,
                                  std::size_t max_array_size) {
    sub_map(state, kResultsKey)[action_id] = result;

    if (!result.is_object()) return;
    auto patch = result.find("state_patch");
    if (patch == result.end() || !patch->is_object()) return;

    for (auto it = patch->begin(); it != patch->end(); ++it) {
        write_or_skip(state, it.key(), it.value(), max_array_size);
    }
}

void set_loading(Value& state, const std::string& action_id, bool loading) {
    sub_map(state, kLoadingKey)[action_id] = loading;
}

void set_error(Value& state, const std::string& action_id, const Value& message) {
    sub_map(state, kErrorKey)[action_id] =
        message.is_null() ? Value(nullptr) : Value(to_display_string(message));
}

void begin_action(Value& state, const std::string& action_id) {
    set_loading(state, action_id, true);
    set_error(state, action_id, nullptr);
}

void complete_action(Value& state, const std::string& action_id, const Value& result,
                     std::size_t max_array_size) {
    apply_action_result_to_state(state, action_id, result, max_array_size);
    set_loading(state, action_id, false);
    set_error(state, action_id, nullptr);
}

void fail_action(Value& state, const std::string& action_id, const std::string& message) {
    set_loading(state, action_id, false);
    set_error(state, action_id, message);
}

bool is_loading(const Value& state, const std::string& action_id) {
    const Value* v = lookup(state, kLoadingKey, action_id);
    return v && is_truthy(*v);
}

std::optional<std::string> action_error(const Value& state, const std::string& action_id) {
    const Value* v = lookup(state, kErrorKey, action_id);
    if (!v || v->is_null()) return std::nullopt;
    return to_display_string(*v);
}

} // namespace screenbind
