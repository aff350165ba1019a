/**
 * @file Collection.hpp
 * @brief Generic unboxing of arrays, sets and maps
 *
 * The strategy is parameterized over the element (and key) transform, so
 * nested collections compose: the element transform of
 * `map<string, vector<Model>>` is itself a sequence transform.
 *
 * Policy per collection:
 * - allow_invalid == false: the first failing element aborts the whole
 *   collection with an error addressed at that element
 * - allow_invalid == true: failing elements are dropped (one warning
 *   each), the rest keep their relative order; an empty result is fine
 *
 * Sets deduplicate through the target container itself.
 */

#ifndef UNBOX_COLLECTION_HPP
#define UNBOX_COLLECTION_HPP

#include "Errors.hpp"
#include "Transform.hpp"
#include "TypeName.hpp"
#include "Value.hpp"
#include "Warning.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace unbox {

namespace detail {

/**
 * @brief Whether @p error says a type can't be decoded at all, rather than
 * that one raw value was bad
 */
inline bool is_undecodable_type(const DecodeError& error) {
    if (const PathError* path_error = error.path_error()) {
        return path_error->kind() == PathError::Kind::InvalidCollectionElementType
            || path_error->kind() == PathError::Kind::InvalidDictionaryKeyType;
    }
    for (const DecodeError& nested : error.errors()) {
        if (is_undecodable_type(nested)) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Throw @p error, or report and swallow it when invalid entries are allowed.
 *
 * Undecodable element and key types are thrown regardless of @p allow_invalid.
 */
inline void reject_element(const DecodeError& error, bool allow_invalid, const WarningSink& warn) {
    if (!allow_invalid || is_undecodable_type(error)) {
        throw error;
    }
    if (warn) {
        warn(Warning::invalid_element(error));
    }
}

} // namespace detail

/**
 * @brief Decode a raw array into a sequence or set container
 *
 * @tparam Container std::vector, std::deque, std::list, std::set or
 *                   std::unordered_set
 * @param raw Raw value (must be an array)
 * @param allow_invalid Drop failing elements instead of failing
 * @param transform Element transform
 * @param warn Receives one invalid_element warning per dropped element
 * @return The container, or nullopt if @p raw is not an array
 * @throws DecodeError for a failing element when @p allow_invalid is false.
 *         Its path is relative to @p raw ("2" or "2.name").
 */
template <typename Container>
std::optional<Container> unbox_sequence(const Value& raw, bool allow_invalid,
                                        const Transform<typename Container::value_type>& transform,
                                        const WarningSink& warn) {
    using Element = typename Container::value_type;

    if (!raw.is_array()) {
        return std::nullopt;
    }

    Container result;
    for (std::size_t index = 0; index < raw.size(); ++index) {
        const Value& element = raw[index];

        std::optional<Element> decoded;
        try {
            if (auto produced = transform(element)) {
                decoded.emplace(std::move(*produced));
            }
        } catch (const DecodeError& error) {
            detail::reject_element(error.prefixed(std::to_string(index)), allow_invalid, warn);
            continue;
        }

        if (!decoded) {
            detail::reject_element(
                DecodeError(PathError::invalid_array_element(element, index, type_name_of<Element>()), ""),
                allow_invalid, warn);
            continue;
        }

        result.insert(result.end(), std::move(*decoded));
    }
    return result;
}

/**
 * @brief Decode a raw object into a map container
 *
 * Each key goes through @p key_transform and each value through
 * @p value_transform; a pair is kept only if both succeed.
 *
 * @tparam Map std::map or std::unordered_map
 * @return The map, or nullopt if @p raw is not an object
 * @throws DecodeError for a failing pair when @p allow_invalid is false
 */
template <typename Map>
std::optional<Map> unbox_map(const Value& raw, bool allow_invalid,
                             const KeyTransformFn<typename Map::key_type>& key_transform,
                             const Transform<typename Map::mapped_type>& value_transform,
                             const WarningSink& warn) {
    using Key = typename Map::key_type;
    using Mapped = typename Map::mapped_type;

    if (!raw.is_object()) {
        return std::nullopt;
    }

    Map result;
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        const std::string& raw_key = it.key();

        std::optional<Key> key = key_transform(raw_key);
        if (!key) {
            detail::reject_element(DecodeError(PathError::invalid_dictionary_key(raw_key), ""),
                                   allow_invalid, warn);
            continue;
        }

        std::optional<Mapped> value;
        try {
            if (auto produced = value_transform(it.value())) {
                value.emplace(std::move(*produced));
            }
        } catch (const DecodeError& error) {
            detail::reject_element(error.prefixed(raw_key), allow_invalid, warn);
            continue;
        }

        if (!value) {
            detail::reject_element(
                DecodeError(PathError::invalid_dictionary_value(it.value(), raw_key,
                                                                type_name_of<Mapped>()), ""),
                allow_invalid, warn);
            continue;
        }

        // Later keys win when a key transform maps two raw keys together
        auto existing = result.find(*key);
        if (existing != result.end()) {
            result.erase(existing);
        }
        result.emplace(std::move(*key), std::move(*value));
    }
    return result;
}

} // namespace unbox

#endif // UNBOX_COLLECTION_HPP
