// screenbind/common/yaml_json.h
#ifndef SCREENBIND_COMMON_YAML_JSON_H
#define SCREENBIND_COMMON_YAML_JSON_H

#include "screenbind/common/types.h"
#include <yaml-cpp/yaml.h>
#include <string>

namespace screenbind {

// Plain scalars become null/bool/integer/double where they read as one;
// quoted scalars always stay strings.
Value yaml_to_json(const YAML::Node& node);

// Parses YAML or JSON text. Throws std::runtime_error on malformed input.
Value load_document(const std::string& text);

// Throws std::runtime_error when the file cannot be opened or parsed.
Value load_document_from_file(const std::string& path);

} // namespace screenbind

#endif // SCREENBIND_COMMON_YAML_JSON_H
