// src/common/yaml_json.cpp
#include "screenbind/common/yaml_json.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace screenbind {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    std::size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (std::size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Integers, decimals and scientific notation, consuming the whole string
bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

Value scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // "!" is the tag yaml-cpp gives quoted scalars
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") return nullptr;

    if (is_numeric(s)) {
        try {
            if (is_integer(s)) return std::stoll(s);
            return std::stod(s);
        } catch (const std::out_of_range&) {
            // too large for the numeric types: keep the text
        }
    }
    return s;
}

} // namespace

Value yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

Value load_document(const std::string& text) {
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse document: " + std::string(e.what()));
    }
}

Value load_document_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return yaml_to_json(YAML::Load(buffer.str()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + std::string(e.what()));
    }
}

} // namespace screenbind
