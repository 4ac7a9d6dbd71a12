/**
 * @file Loader.cpp
 * @brief Document loading and parsing implementation
 *
 * Implements parsing for:
 * - JSON documents (using nlohmann::json)
 * - TOML documents (using toml++)
 * - YAML documents (using yaml-cpp)
 */

#include "confmerge/Loader.hpp"
#include "confmerge/Errors.hpp"
#include "confmerge/Parse.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace confmerge {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

/**
 * @brief Convert a yaml-cpp node to nlohmann::json.
 *
 * Quoted and explicitly !!str-tagged scalars stay strings; plain
 * scalars are typed with parse_scalar().
 */
Value yaml_node_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value(nullptr);

        case YAML::NodeType::Scalar: {
            const std::string& tag = node.Tag();
            if (tag == "!" || tag == "tag:yaml.org,2002:str") {
                return Value(node.Scalar());
            }
            return parse_scalar(node.Scalar());
        }

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_node_to_json(item));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_node_to_json(kv.second);
            }
            return obj;
        }
    }
    return Value(nullptr);
}

} // anonymous namespace

// ============================================================================
// Formats
// ============================================================================

const char* format_name(Format format) {
    switch (format) {
        case Format::Json: return "json";
        case Format::Toml: return "toml";
        case Format::Yaml: return "yaml";
    }
    return "unknown";
}

Format format_from_name(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "json") return Format::Json;
    if (lower == "toml") return Format::Toml;
    if (lower == "yaml" || lower == "yml") return Format::Yaml;
    throw OptionsError("unknown output format '" + name + "' (expected json, toml or yaml)");
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Format format_from_path(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") return Format::Json;
    if (ext == ".toml") return Format::Toml;
    if (ext == ".yaml" || ext == ".yml") return Format::Yaml;
    throw UnsupportedFormatError(path, ext);
}

// ============================================================================
// Parsing
// ============================================================================

Value parse_document(const std::string& content, Format format, const std::string& source) {
    switch (format) {
        case Format::Json:
            try {
                return nlohmann::json::parse(content);
            } catch (const nlohmann::json::parse_error& e) {
                throw ParseError(source, 0, 0, e.what());
            }

        case Format::Toml:
            try {
                toml::table table = toml::parse(content, source);
                return toml_value_to_json(table);
            } catch (const toml::parse_error& e) {
                throw ParseError(
                    source,
                    static_cast<int>(e.source().begin.line),
                    static_cast<int>(e.source().begin.column),
                    std::string(e.description())
                );
            }

        case Format::Yaml:
            try {
                YAML::Node node = YAML::Load(content);
                Value result = yaml_node_to_json(node);
                if (result.is_null()) {
                    return Value::object();
                }
                return result;
            } catch (const YAML::Exception& e) {
                throw ParseError(source, e.mark.line + 1, e.mark.column + 1, e.msg);
            }
    }
    throw ParseError(source, 0, 0, "unknown document format");
}

Value load_document_file(const std::string& path) {
    const Format format = format_from_path(path);
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_document(read_file(path), format, path);
}

// ============================================================================
// File loader
// ============================================================================

FileLoader::FileLoader(std::string base_directory)
    : base_directory_(std::move(base_directory))
{}

LoadedDocument FileLoader::load(const std::string& source) {
    const fs::path full = base_directory_.empty()
        ? fs::path(source)
        : fs::path(base_directory_) / source;

    LoadedDocument doc;
    doc.source = source;
    doc.format = format_from_path(source);

    std::string dir = fs::path(source).parent_path().generic_string();
    doc.directory = dir.empty() ? "." : dir;

    if (!file_exists(full.string())) {
        throw FileNotFoundError(full.string());
    }
    doc.content = read_file(full.string());
    return doc;
}

} // namespace confmerge
