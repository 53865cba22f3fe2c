// src/common/config.cpp
#include "screenbind/common/config.h"
#include "screenbind/common/yaml_json.h"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace screenbind {

namespace {

constexpr const char* kLogRenderFailures = "log_render_failures";

template<typename T>
void read_positive(const Value& section, const std::string& key, T& out) {
    const Value& v = section[key];
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        throw std::runtime_error("Invalid value for limits." + key + ": expected a positive integer, got " + v.dump());
    }
    auto n = v.get<long long>();
    if (static_cast<unsigned long long>(n) > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        throw std::runtime_error("Invalid value for limits." + key + ": " + v.dump() + " is out of range");
    }
    out = static_cast<T>(n);
}

EngineLimits limits_from(const Value& doc) {
    EngineLimits limits;
    if (doc.is_null()) return limits;
    if (!doc.is_object()) {
        throw std::runtime_error("Engine config must be a mapping");
    }

    bool nested = doc.contains("limits");
    const Value& section = nested ? doc["limits"] : doc;
    if (section.is_null()) return limits;
    if (!section.is_object()) {
        throw std::runtime_error("'limits' must be a mapping");
    }

    for (auto it = section.begin(); it != section.end(); ++it) {
        const std::string& key = it.key();
        if (key == "max_tokens") {
            read_positive(section, key, limits.max_tokens);
        } else if (key == "max_parse_depth") {
            read_positive(section, key, limits.max_parse_depth);
        } else if (key == "max_eval_depth") {
            read_positive(section, key, limits.max_eval_depth);
        } else if (key == "max_array_size") {
            read_positive(section, key, limits.max_array_size);
        } else if (!nested && key == kLogRenderFailures) {
            // top-level engine option, not a limit
        } else {
            std::cerr << "[WARNING] Ignoring unknown limit '" << key << "'" << std::endl;
        }
    }
    return limits;
}

EngineConfig config_from(const Value& doc) {
    EngineConfig config;
    config.limits = limits_from(doc);
    if (doc.is_object() && doc.contains(kLogRenderFailures)) {
        const Value& flag = doc[kLogRenderFailures];
        if (!flag.is_boolean()) {
            throw std::runtime_error(std::string("Invalid value for ") + kLogRenderFailures + ": expected true or false");
        }
        config.log_render_failures = flag.get<bool>();
    }
    return config;
}

} // namespace

EngineLimits load_engine_limits(const std::string& text) {
    return limits_from(load_document(text));
}

EngineLimits load_engine_limits_from_file(const std::string& path) {
    return limits_from(load_document_from_file(path));
}

EngineConfig load_engine_config(const std::string& text) {
    return config_from(load_document(text));
}

EngineConfig load_engine_config_from_file(const std::string& path) {
    return config_from(load_document_from_file(path));
}

} // namespace screenbind
