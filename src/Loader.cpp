/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * Implements file loading for:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "unbox/Loader.hpp"
#include "unbox/Decode.hpp"
#include "unbox/Errors.hpp"
#include "unbox/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace unbox {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

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

template <typename T>
std::string stream_text(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert toml++ node to a value tree.
 */
Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_text(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_text(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(stream_text(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

std::string parse_error_details(const std::string& source, const toml::parse_error& e) {
    std::ostringstream ss;
    ss << source << ":" << e.source().begin.line << ":" << e.source().begin.column
       << ": " << e.description();
    return ss.str();
}

} // anonymous namespace

// ============================================================================
// JSON File Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError::invalid_input_data(path + ": " + e.what());
    }
}

// ============================================================================
// TOML File Loading
// ============================================================================

Value parse_toml(const std::string& text, const std::string& source_name) {
    toml::table table;
    try {
        table = toml::parse(text, source_name);
    } catch (const toml::parse_error& e) {
        throw DecodeError::invalid_input_data(parse_error_details(source_name, e));
    }
    return toml_node_to_value(table);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw DecodeError::invalid_input_data(parse_error_details(path, e));
    }
    return toml_node_to_value(table);
}

// ============================================================================
// Auto-detect File Loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    std::string ext = p.extension().string();
    return to_lower(ext);
}

Value load_tree_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw DecodeError::invalid_input_data(
        "Unsupported file type: " + ext + " (expected .json or .toml)");
}

} // namespace unbox
