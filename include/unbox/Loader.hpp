/**
 * @file Loader.hpp
 * @brief Loading value trees from files
 *
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++); tables become objects, dates and times
 *   become strings so DateFormatter can decode them
 *
 * Part of the unbox_loader library.
 */

#ifndef UNBOX_LOADER_HPP
#define UNBOX_LOADER_HPP

#include "unbox/Value.hpp"

#include <string>

namespace unbox {

/**
 * @brief Load a value tree from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed tree
 * @throws FileNotFoundError if file doesn't exist
 * @throws DecodeError (invalid_input_data) if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a value tree from a TOML file.
 *
 * @param path Path to the TOML file
 * @return Parsed tree (always an object)
 * @throws FileNotFoundError if file doesn't exist
 * @throws DecodeError (invalid_input_data) if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Parse TOML text into a value tree.
 *
 * @param text TOML document
 * @param source_name Name used in error details
 * @throws DecodeError (invalid_input_data) if TOML syntax is invalid
 */
Value parse_toml(const std::string& text, const std::string& source_name = "<string>");

/**
 * @brief Load a value tree, detecting the format by extension.
 *
 * @param path Path to a .json or .toml file (extension case-insensitive)
 * @return Parsed tree
 * @throws FileNotFoundError if file doesn't exist
 * @throws DecodeError (invalid_input_data) for syntax errors or an
 *         unsupported extension
 */
Value load_tree_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace unbox

#endif // UNBOX_LOADER_HPP
