// src/binding/path_resolver.cpp
#include "screenbind/binding/path_resolver.h"
#include "screenbind/common/coerce.h"
#include <stdexcept>

namespace screenbind {

namespace {

const Value* step(const Value& current, const std::string& seg) {
    if (current.is_object()) {
        auto it = current.find(seg);
        return it != current.end() ? &*it : nullptr;
    }
    if (current.is_array()) {
        auto index = parse_index(seg);
        return (index && *index < current.size()) ? &current[*index] : nullptr;
    }
    return nullptr;
}

const Value* walk(const Value* current, const std::vector<std::string>& segments, std::size_t from) {
    for (std::size_t i = from; current && i < segments.size(); ++i) {
        current = step(*current, segments[i]);
    }
    return current;
}

// Walks the shapes assign() would produce without touching the document and
// throws for the first array index at or above the cap.
void check_indices(const Value& container, const std::vector<std::string>& segments,
                   std::size_t max_array_size) {
    const Value* node = &container;
    for (const auto& seg : segments) {
        auto index = parse_index(seg);
        if (index && !(node && node->is_object())) {
            if (*index >= max_array_size) {
                throw std::out_of_range("Array index " + seg + " exceeds limit of " +
                                        std::to_string(max_array_size) + " elements");
            }
            node = (node && node->is_array() && *index < node->size()) ? &(*node)[*index] : nullptr;
        } else if (node && node->is_object()) {
            auto it = node->find(seg);
            node = it != node->end() ? &*it : nullptr;
        } else {
            node = nullptr;
        }
    }
}

// Shapes `node` for segments[i], then recurses into the child slot.
void assign(Value& node, const std::vector<std::string>& segments, std::size_t i,
            Value& value) {
    const std::string& seg = segments[i];
    auto index = parse_index(seg);

    Value* slot = nullptr;
    if (index && !node.is_object()) {
        if (!node.is_array()) node = Value::array();
        while (node.size() <= *index) node.push_back(nullptr);
        slot = &node[*index];
    } else {
        if (!node.is_object()) node = Value::object();
        slot = &node[seg];
    }

    if (i + 1 == segments.size()) {
        *slot = std::move(value);
    } else {
        assign(*slot, segments, i + 1, value);
    }
}

} // namespace

std::vector<std::string> parse_path(std::string_view path) {
    std::vector<std::string> segments;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) segments.push_back(std::move(current));
        current.clear();
    };

    for (std::size_t i = 0; i < path.size(); ++i) {
        char c = path[i];
        if (c == '.') {
            flush();
        } else if (c == '[') {
            flush();
            auto close = path.find(']', i + 1);
            if (close == std::string_view::npos) {
                // unterminated bracket: keep the rest as a literal segment
                current.assign(path.substr(i + 1));
                break;
            }
            std::string_view inner = path.substr(i + 1, close - i - 1);
            if (inner.size() >= 2 && (inner.front() == '"' || inner.front() == '\'') &&
                inner.back() == inner.front()) {
                inner = inner.substr(1, inner.size() - 2);
            }
            current.assign(inner);
            flush();
            i = close;
        } else {
            current += c;
        }
    }
    flush();
    return segments;
}

const Value* get(const Value& container, std::string_view path) {
    return walk(&container, parse_path(path), 0);
}

const Value* get(const BindingContext& ctx, std::string_view path) {
    auto segments = parse_path(path);
    if (segments.empty()) return nullptr;
    return walk(ctx.root(segments.front()), segments, 1);
}

Value get_or_null(const Value& container, std::string_view path) {
    const Value* v = get(container, path);
    return v ? *v : Value(nullptr);
}

void set(Value& container, std::string_view path, Value value, std::size_t max_array_size) {
    auto segments = parse_path(path);
    if (segments.empty()) return;
    check_indices(container, segments, max_array_size);
    assign(container, segments, 0, value);
}

} // namespace screenbind
