/**
 * @file Traits.hpp
 * @brief Compile-time classification of decode target types
 *
 * The decoder dispatches on the static target type. These traits sort a
 * type into one of the categories the transform layer knows about:
 * Value, primitive, sequence, set, map, model or model-with-context.
 */

#ifndef UNBOX_TRAITS_HPP
#define UNBOX_TRAITS_HPP

#include "Value.hpp"

#include <deque>
#include <list>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace unbox {

class Unboxer;

namespace detail {

template <typename T> struct is_sequence : std::false_type {};
template <typename T, typename A> struct is_sequence<std::vector<T, A>> : std::true_type {};
template <typename T, typename A> struct is_sequence<std::deque<T, A>> : std::true_type {};
template <typename T, typename A> struct is_sequence<std::list<T, A>> : std::true_type {};

template <typename T> struct is_set : std::false_type {};
template <typename K, typename C, typename A>
struct is_set<std::set<K, C, A>> : std::true_type {};
template <typename K, typename H, typename E, typename A>
struct is_set<std::unordered_set<K, H, E, A>> : std::true_type {};

template <typename T> struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T>
inline constexpr bool is_sequence_v = is_sequence<T>::value;
template <typename T>
inline constexpr bool is_set_v = is_set<T>::value;
template <typename T>
inline constexpr bool is_map_v = is_map<T>::value;
template <typename T>
inline constexpr bool is_collection_v = is_sequence_v<T> || is_set_v<T> || is_map_v<T>;

/// Character types; signed/unsigned char stay integral (int8_t, uint8_t)
template <typename T>
struct is_character : std::disjunction<
    std::is_same<T, char>,
    std::is_same<T, wchar_t>,
    std::is_same<T, char16_t>,
    std::is_same<T, char32_t>> {};

/// bool, integral (except character types), floating point and std::string
template <typename T>
struct is_primitive : std::disjunction<
    std::is_same<T, bool>,
    std::conjunction<std::is_integral<T>, std::negation<is_character<T>>>,
    std::is_floating_point<T>,
    std::is_same<T, std::string>> {};

/// Types decoded by built-in rules rather than by user code
template <typename T>
struct is_builtin : std::disjunction<
    std::is_same<T, Value>,
    is_primitive<T>,
    is_sequence<T>,
    is_set<T>,
    is_map<T>> {};

/// Element type of a collection (mapped type for maps)
template <typename T, typename = void>
struct element_of {
    using type = typename T::value_type;
};

template <typename T>
struct element_of<T, std::enable_if_t<is_map<T>::value>> {
    using type = typename T::mapped_type;
};

template <typename T>
using element_of_t = typename element_of<T>::type;

template <typename T, typename = void>
struct has_context : std::false_type {};

template <typename T>
struct has_context<T, std::void_t<typename T::unbox_context>> : std::true_type {};

/// `explicit T(Unboxer&)`
template <typename T>
struct is_model : std::conjunction<
    std::negation<is_builtin<T>>,
    std::is_constructible<T, Unboxer&>> {};

/// `using unbox_context = C;` and `T(Unboxer&, const C&)`
template <typename T, typename = void>
struct is_context_model : std::false_type {};

template <typename T>
struct is_context_model<T, std::enable_if_t<has_context<T>::value>>
    : std::is_constructible<T, Unboxer&, const typename T::unbox_context&> {};

/// Context type of a model, looking through collections of models
template <typename T, typename = void>
struct context_of {};

template <typename T>
struct context_of<T, std::enable_if_t<has_context<T>::value>> {
    using type = typename T::unbox_context;
};

template <typename T>
struct context_of<T, std::enable_if_t<!has_context<T>::value && is_collection_v<T>>>
    : context_of<element_of_t<T>> {};

template <typename T>
using context_of_t = typename context_of<T>::type;

template <typename...>
inline constexpr bool dependent_false = false;

} // namespace detail
} // namespace unbox

#endif // UNBOX_TRAITS_HPP
