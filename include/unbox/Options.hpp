/**
 * @file Options.hpp
 * @brief Per-decode configuration
 */

#ifndef UNBOX_OPTIONS_HPP
#define UNBOX_OPTIONS_HPP

#include "Warning.hpp"

#include <memory>
#include <string>

namespace unbox {

/**
 * @brief How a session reacts to a failing required field
 *
 * - Throwing: throw DecodeError at the first failure; the model's
 *   remaining fields are not read.
 * - Accumulating: record the failure, hand the constructor a fallback
 *   value and keep going; the decode fails afterwards with one aggregated
 *   error listing every failed field in access order.
 */
enum class DecodeMode {
    Throwing,
    Accumulating
};

/**
 * @brief Options passed to every decode entry point
 *
 * Child sessions (nested models) inherit the options of their parent.
 */
struct DecodeOptions {
    DecodeMode mode = DecodeMode::Throwing;

    /// Receives warnings of this decode. Falls back to warning_observer().
    std::shared_ptr<WarningObserver> observer;

    /// When false, warnings are dropped regardless of observers.
    bool emit_warnings = true;
};

/**
 * @brief Parse a mode name
 * @param text "throwing" or "accumulating" (case-insensitive)
 * @return The mode
 * @throws std::invalid_argument for any other text
 */
DecodeMode parse_decode_mode(const std::string& text);

/**
 * @brief Name of a mode ("throwing" / "accumulating")
 */
std::string to_string(DecodeMode mode);

} // namespace unbox

#endif // UNBOX_OPTIONS_HPP
