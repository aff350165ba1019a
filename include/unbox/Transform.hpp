/**
 * @file Transform.hpp
 * @brief Type transform layer: turning a raw value into a requested type
 *
 * A Transform<T> returns nullopt when it cannot produce a T from the raw
 * value. It may also throw DecodeError for failures below the value
 * (a nested model field, a collection element); the caller re-addresses
 * those with its own path.
 *
 * Extension points:
 * - ByTransform<T>: T is decoded from a raw value of a declared type
 *   by a static function (e.g. Uri from a string).
 * - KeyTransform<K>: K can be used as a map key; parsed from the
 *   dictionary key string.
 *
 * Example:
 * ```cpp
 * enum class Color { Red, Green };
 *
 * template <>
 * struct unbox::ByTransform<Color> {
 *     using raw_type = std::string;
 *     static std::optional<Color> transform(const std::string& raw) {
 *         if (raw == "red") return Color::Red;
 *         if (raw == "green") return Color::Green;
 *         return std::nullopt;
 *     }
 * };
 * ```
 */

#ifndef UNBOX_TRANSFORM_HPP
#define UNBOX_TRANSFORM_HPP

#include "Coercion.hpp"
#include "Traits.hpp"
#include "Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <type_traits>

namespace unbox {

template <typename T>
using Transform = std::function<std::optional<T>(const Value&)>;

template <typename K>
using KeyTransformFn = std::function<std::optional<K>(const std::string&)>;

/**
 * @brief Specialize to make T decodable from a raw value
 *
 * A specialization provides:
 * - `using raw_type = ...;` one of std::string, bool, a numeric type or Value
 * - `static std::optional<T> transform(const raw_type&);`
 */
template <typename T>
struct ByTransform {};

/**
 * @brief Specialize to make K usable as a map key
 *
 * A specialization provides
 * `static std::optional<K> transform(const std::string& key);`
 */
template <typename K>
struct KeyTransform {};

namespace detail {

template <typename T, typename = void>
struct has_by_transform : std::false_type {};

template <typename T>
struct has_by_transform<T, std::void_t<typename ByTransform<T>::raw_type>> : std::true_type {};

template <typename K, typename = void>
struct has_key_transform : std::false_type {};

template <typename K>
struct has_key_transform<K, std::void_t<
    decltype(KeyTransform<K>::transform(std::declval<const std::string&>()))>> : std::true_type {};

/// Key types: std::string, integers and types with a KeyTransform
template <typename K>
struct is_key : std::disjunction<
    has_key_transform<K>,
    std::is_same<K, std::string>,
    std::conjunction<std::is_integral<K>, std::negation<std::is_same<K, bool>>,
                     std::negation<is_character<K>>>> {};

/// Types some decode rule applies to (collections not inspected)
template <typename T>
struct is_unboxable : std::disjunction<
    is_builtin<T>,
    has_by_transform<T>,
    is_model<T>,
    is_context_model<T>> {};

/// Like is_unboxable, but also requires collection elements and keys to be decodable
template <typename T, typename = void>
struct is_decodable : std::disjunction<
    std::is_same<T, Value>,
    is_primitive<T>,
    has_by_transform<T>,
    is_model<T>,
    is_context_model<T>> {};

template <typename T>
struct is_decodable<T, std::enable_if_t<is_sequence<T>::value || is_set<T>::value>>
    : is_decodable<typename T::value_type> {};

template <typename T>
struct is_decodable<T, std::enable_if_t<is_map<T>::value>>
    : std::conjunction<is_key<typename T::key_type>, is_decodable<typename T::mapped_type>> {};

} // namespace detail

/**
 * @brief Apply the ByTransform of T to a raw value
 * @return nullopt if the raw value does not match raw_type or the
 *         transform rejects it
 */
template <typename T>
std::optional<T> by_transform(const Value& raw) {
    using Raw = typename ByTransform<T>::raw_type;
    std::optional<Raw> matched = match_raw<Raw>(raw);
    if (!matched) {
        return std::nullopt;
    }
    return ByTransform<T>::transform(*matched);
}

/**
 * @brief Apply a formatter to a raw value
 *
 * A formatter provides `raw_type`, `formatted_type` and
 * `std::optional<formatted_type> format(const raw_type&) const`.
 */
template <typename F>
std::optional<typename F::formatted_type> apply_formatter(const F& formatter, const Value& raw) {
    std::optional<typename F::raw_type> matched = match_raw<typename F::raw_type>(raw);
    if (!matched) {
        return std::nullopt;
    }
    return formatter.format(*matched);
}

/**
 * @brief Key transform for a map key type
 *
 * KeyTransform<K> if specialized, identity for std::string, decimal
 * parsing for integers.
 */
template <typename K>
KeyTransformFn<K> key_transform_for() {
    if constexpr (detail::has_key_transform<K>::value) {
        return [](const std::string& key) -> std::optional<K> {
            return KeyTransform<K>::transform(key);
        };
    } else if constexpr (std::is_same_v<K, std::string>) {
        return [](const std::string& key) { return std::optional<std::string>(key); };
    } else {
        static_assert(detail::is_key<K>::value, "map key type has no key transform");
        return [](const std::string& key) { return coerce<K>(Value(key)); };
    }
}

} // namespace unbox

#endif // UNBOX_TRANSFORM_HPP
