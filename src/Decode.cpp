/**
 * @file Decode.cpp
 * @brief JSON text entry point
 */

#include "unbox/Decode.hpp"

namespace unbox {

Value parse_json(const std::string& text) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError::invalid_input_data(e.what());
    }
}

} // namespace unbox
