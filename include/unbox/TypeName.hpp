/**
 * @file TypeName.hpp
 * @brief Readable names for decode target types, used in error messages
 *
 * Examples:
 * - int32_t → "int32"
 * - std::vector<std::string> → "array<string>"
 * - std::map<std::string, double> → "map<string, double>"
 * - user types → demangled C++ name (e.g. "User")
 */

#ifndef UNBOX_TYPENAME_HPP
#define UNBOX_TYPENAME_HPP

#include "Traits.hpp"

#include <string>
#include <typeinfo>

namespace unbox {

namespace detail {

/**
 * @brief Demangle a typeid name where the ABI supports it
 * @param name Result of std::type_info::name()
 * @return Readable name, or @p name unchanged
 */
std::string demangle(const char* name);

} // namespace detail

/**
 * @brief Readable name of a decode target type
 * @tparam T The type to name
 * @return Name such as "uint16", "set<int64>" or "Address"
 */
template <typename T>
std::string type_name_of() {
    if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_integral_v<T>) {
        return (std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8);
    } else if constexpr (std::is_same_v<T, float>) {
        return "float";
    } else if constexpr (std::is_same_v<T, double>) {
        return "double";
    } else if constexpr (std::is_same_v<T, long double>) {
        return "long double";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "string";
    } else if constexpr (std::is_same_v<T, Value>) {
        return "value";
    } else if constexpr (detail::is_sequence_v<T>) {
        return "array<" + type_name_of<typename T::value_type>() + ">";
    } else if constexpr (detail::is_set_v<T>) {
        return "set<" + type_name_of<typename T::value_type>() + ">";
    } else if constexpr (detail::is_map_v<T>) {
        return "map<" + type_name_of<typename T::key_type>() + ", "
            + type_name_of<typename T::mapped_type>() + ">";
    } else {
        return detail::demangle(typeid(T).name());
    }
}

} // namespace unbox

#endif // UNBOX_TYPENAME_HPP
