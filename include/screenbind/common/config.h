// screenbind/common/config.h
#ifndef SCREENBIND_COMMON_CONFIG_H
#define SCREENBIND_COMMON_CONFIG_H

#include "screenbind/common/types.h"
#include <string>

namespace screenbind {

// Reads EngineLimits from YAML or JSON:
//
//   limits:
//     max_tokens: 500
//     max_parse_depth: 10
//     max_eval_depth: 10
//     max_array_size: 10000
//
// The keys may also sit at the top level. Missing keys keep their defaults,
// unknown keys are reported with a warning and ignored. A value that is not a
// positive integer throws std::runtime_error naming the key.
EngineLimits load_engine_limits(const std::string& text);
EngineLimits load_engine_limits_from_file(const std::string& path);

// Limits as above plus a top-level `log_render_failures: true|false`.
EngineConfig load_engine_config(const std::string& text);
EngineConfig load_engine_config_from_file(const std::string& path);

} // namespace screenbind

#endif // SCREENBIND_COMMON_CONFIG_H
