/**
 * @file Options.cpp
 * @brief Decode mode parsing
 */

#include "unbox/Options.hpp"
#include "unbox/Util.hpp"

#include <stdexcept>

namespace unbox {

DecodeMode parse_decode_mode(const std::string& text) {
    const std::string lower = to_lower(text);

    if (lower == "throwing") return DecodeMode::Throwing;
    if (lower == "accumulating") return DecodeMode::Accumulating;

    throw std::invalid_argument("Unknown decode mode: '" + text +
                                "' (expected 'throwing' or 'accumulating')");
}

std::string to_string(DecodeMode mode) {
    switch (mode) {
        case DecodeMode::Throwing: return "throwing";
        case DecodeMode::Accumulating: return "accumulating";
    }
    return "throwing";
}

} // namespace unbox
