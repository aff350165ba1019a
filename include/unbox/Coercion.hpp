/**
 * @file Coercion.hpp
 * @brief Primitive coercion table
 *
 * Converts loosely-typed JSON scalars into the requested primitive type.
 *
 * | Target   | from number                         | from string                       |
 * |----------|-------------------------------------|-----------------------------------|
 * | bool     | nonzero → true                      | true/t/y/yes, false/f/n/no (any case) |
 * | integral | range-checked, floats truncated     | full decimal parse, range-checked |
 * | floating | range-checked                       | full parse, classic locale        |
 * | string   | decimal / JSON rendering            | identity                          |
 *
 * Booleans convert to 0/1 for numeric targets. Null, arrays and objects
 * never coerce. Out-of-range values fail instead of wrapping.
 */

#ifndef UNBOX_COERCION_HPP
#define UNBOX_COERCION_HPP

#include "Value.hpp"
#include "Traits.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace unbox {

namespace detail {

std::optional<bool> coerce_bool(const Value& raw);
std::optional<std::string> coerce_string(const Value& raw);

/**
 * @brief Parse a whole string as a signed decimal integer
 * @return The number, or nullopt for empty input, stray characters or overflow
 */
std::optional<std::int64_t> parse_signed(const std::string& text);

/**
 * @brief Parse a whole string as an unsigned decimal integer
 */
std::optional<std::uint64_t> parse_unsigned(const std::string& text);

/**
 * @brief Parse a whole string as a floating point number (classic locale)
 */
std::optional<long double> parse_floating(const std::string& text);

/// Whether integral @p value is representable as T.
template <typename T, typename U>
bool fits(U value) {
    if constexpr (std::is_signed_v<U>) {
        if (value < 0) {
            if constexpr (std::is_unsigned_v<T>) {
                return false;
            } else {
                return static_cast<std::int64_t>(value)
                    >= static_cast<std::int64_t>(std::numeric_limits<T>::min());
            }
        }
    }
    return static_cast<std::uint64_t>(value)
        <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
}

template <typename T, typename U>
std::optional<T> narrow(U value) {
    if (!fits<T>(value)) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

template <typename T>
std::optional<T> narrow_floating(long double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    value = std::trunc(value);
    if (value < static_cast<long double>(std::numeric_limits<T>::min())
        || value > static_cast<long double>(std::numeric_limits<T>::max())) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

/// Finite values outside T's range fail; infinities and NaN pass through.
template <typename T>
std::optional<T> fit_floating(long double value) {
    if (std::isfinite(value)
        && (value > static_cast<long double>(std::numeric_limits<T>::max())
            || value < static_cast<long double>(std::numeric_limits<T>::lowest()))) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

template <typename T>
std::optional<T> coerce_integral(const Value& raw) {
    if (raw.is_boolean()) {
        return static_cast<T>(raw.get<bool>() ? 1 : 0);
    }
    if (raw.is_number_unsigned()) {
        return narrow<T>(raw.get<std::uint64_t>());
    }
    if (raw.is_number_integer()) {
        return narrow<T>(raw.get<std::int64_t>());
    }
    if (raw.is_number_float()) {
        return narrow_floating<T>(raw.get<double>());
    }
    if (raw.is_string()) {
        const auto& text = raw.get_ref<const std::string&>();
        if constexpr (std::is_signed_v<T>) {
            auto parsed = parse_signed(text);
            return parsed ? narrow<T>(*parsed) : std::nullopt;
        } else {
            auto parsed = parse_unsigned(text);
            return parsed ? narrow<T>(*parsed) : std::nullopt;
        }
    }
    return std::nullopt;
}

template <typename T>
std::optional<T> coerce_floating(const Value& raw) {
    if (raw.is_boolean()) {
        return static_cast<T>(raw.get<bool>() ? 1 : 0);
    }
    if (raw.is_number_unsigned()) {
        return static_cast<T>(raw.get<std::uint64_t>());
    }
    if (raw.is_number_integer()) {
        return static_cast<T>(raw.get<std::int64_t>());
    }
    if (raw.is_number_float()) {
        return fit_floating<T>(raw.get<double>());
    }
    if (raw.is_string()) {
        auto parsed = parse_floating(raw.get_ref<const std::string&>());
        if (parsed) {
            return fit_floating<T>(*parsed);
        }
    }
    return std::nullopt;
}

} // namespace detail

/**
 * @brief Coerce a raw value to a primitive type
 *
 * @tparam T bool, an integral type, a floating point type, std::string
 *           or Value (identity)
 * @param raw Raw value from the tree
 * @return Converted value, or nullopt if the coercion table has no rule
 *
 * Examples:
 * ```cpp
 * coerce<int>(Value("123"));     // 123
 * coerce<int>(Value("abc"));     // nullopt
 * coerce<bool>(Value("YES"));    // true
 * coerce<bool>(Value(2));        // true
 * coerce<uint8_t>(Value(300));   // nullopt (out of range)
 * ```
 */
template <typename T>
std::optional<T> coerce(const Value& raw) {
    static_assert(detail::is_primitive<T>::value || std::is_same_v<T, Value>,
                  "unbox::coerce requires a primitive target type");

    if constexpr (std::is_same_v<T, Value>) {
        return raw;
    } else if constexpr (std::is_same_v<T, bool>) {
        return detail::coerce_bool(raw);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return detail::coerce_string(raw);
    } else if constexpr (std::is_integral_v<T>) {
        return detail::coerce_integral<T>(raw);
    } else {
        return detail::coerce_floating<T>(raw);
    }
}

/**
 * @brief Strictly match a raw value against a declared raw type
 *
 * Used by by-transforms and formatters, which declare the JSON type they
 * accept. Unlike coerce(), no cross-type conversion happens: a string
 * matches only a string, a bool only a boolean, an integral type only an
 * integer number (range-checked), a floating type any number.
 *
 * @tparam Raw Declared raw type
 * @param raw Raw value from the tree
 * @return The matched value, or nullopt
 */
template <typename Raw>
std::optional<Raw> match_raw(const Value& raw) {
    if constexpr (std::is_same_v<Raw, Value>) {
        return raw;
    } else if constexpr (std::is_same_v<Raw, std::string>) {
        if (!raw.is_string()) return std::nullopt;
        return raw.get<std::string>();
    } else if constexpr (std::is_same_v<Raw, bool>) {
        if (!raw.is_boolean()) return std::nullopt;
        return raw.get<bool>();
    } else if constexpr (std::is_integral_v<Raw>) {
        if (raw.is_number_unsigned()) return detail::narrow<Raw>(raw.get<std::uint64_t>());
        if (raw.is_number_integer()) return detail::narrow<Raw>(raw.get<std::int64_t>());
        return std::nullopt;
    } else if constexpr (std::is_floating_point_v<Raw>) {
        if (!raw.is_number()) return std::nullopt;
        return detail::fit_floating<Raw>(raw.get<double>());
    } else {
        static_assert(detail::dependent_false<Raw>,
                      "raw_type must be Value, std::string, bool or a numeric type");
    }
}

/**
 * @brief Placeholder value substituted for a failed field in accumulating mode
 *
 * Never part of a successful result. Specialize for target types that are
 * not default-constructible and are not models.
 */
template <typename T>
struct Fallback {
    static T value() { return T{}; }
};

} // namespace unbox

#endif // UNBOX_COERCION_HPP
