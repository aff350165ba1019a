/**
 * @file Value.hpp
 * @brief Value tree type decoded by unbox
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef UNBOX_VALUE_HPP
#define UNBOX_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace unbox {

/**
 * @brief JSON-like value tree consumed by the decoder
 *
 * This is an alias for nlohmann::json. A tree is produced once (parsed
 * from text or loaded from a file) and is only ever read while decoding.
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Name of the JSON kind held by a value, for input-shape errors
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Render a value compactly for use inside error messages
 *
 * Output longer than @p max_length bytes is cut at a code point boundary
 * and suffixed with "...". Invalid UTF-8 is replaced instead of throwing.
 *
 * @param val The value to render
 * @param max_length Maximum number of bytes kept
 * @return Compact JSON text
 */
inline std::string describe_value(const Value& val, std::size_t max_length = 80) {
    std::string text = val.dump(-1, ' ', false, Value::error_handler_t::replace);
    if (text.size() > max_length) {
        std::size_t cut = max_length;
        // Do not split a UTF-8 sequence: back up over continuation bytes
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        text.resize(cut);
        text += "...";
    }
    return text;
}

} // namespace unbox

#endif // UNBOX_VALUE_HPP
