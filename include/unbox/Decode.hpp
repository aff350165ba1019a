/**
 * @file Decode.hpp
 * @brief Public decode entry points
 *
 * Every entry point creates a fresh session (and failure ledger) for the
 * call and returns a Result; DecodeError never escapes them.
 *
 * Example:
 * ```cpp
 * unbox::Value tree = {{"name", "John"}, {"age", 27}};
 * auto user = unbox::decode<User>(tree);
 * if (user) {
 *     std::cout << user.value().name << "\n";
 * }
 *
 * auto city = unbox::decode_at<std::string>(tree, unbox::Path::key_path("address.city"));
 * ```
 */

#ifndef UNBOX_DECODE_HPP
#define UNBOX_DECODE_HPP

#include "Errors.hpp"
#include "Options.hpp"
#include "Path.hpp"
#include "Result.hpp"
#include "Unboxer.hpp"
#include "Value.hpp"

#include <any>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace unbox {

/**
 * @brief Parse JSON text into a value tree
 * @param text JSON document
 * @return Parsed tree
 * @throws DecodeError (invalid_input_data) if @p text is malformed
 */
Value parse_json(const std::string& text);

namespace detail {

/**
 * @brief Synthetic model whose only field is the value at a path
 *
 * Lets "decode the value at P as T" reuse model decoding, including
 * accumulating mode and error addressing.
 */
template <typename T>
struct PathContainer {
    PathContainer(Unboxer& unboxer, const Path& path, bool allow_invalid_elements)
        : value(unboxer.required<T>(path, allow_invalid_elements))
    {}

    T value;
};

inline DecodeError not_an_object(const Value& tree) {
    return DecodeError::invalid_input_data("expected an object, got " + type_name(tree));
}

inline DecodeError not_an_array(const Value& tree) {
    return DecodeError::invalid_input_data("expected an array, got " + type_name(tree));
}

} // namespace detail

/**
 * @brief Decode a whole object as model T
 * @return T, or invalid_input_data if @p tree is not an object
 */
template <typename T>
Result<T> decode(const Value& tree, const DecodeOptions& options = {}) {
    if (!tree.is_object()) {
        return detail::not_an_object(tree);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(tree, ledger, options);
        return unboxer.perform<T>();
    } catch (const DecodeError& error) {
        return error;
    }
}

/**
 * @brief Decode a whole object as context model T
 *
 * Nested models see the same context unless a field overrides it.
 */
template <typename T>
Result<T> decode_with_context(const Value& tree, const typename T::unbox_context& context,
                              const DecodeOptions& options = {}) {
    if (!tree.is_object()) {
        return detail::not_an_object(tree);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(tree, ledger, options, std::any(context));
        return unboxer.perform<T>(context);
    } catch (const DecodeError& error) {
        return error;
    }
}

/**
 * @brief Decode the value at @p path of an object as T
 *
 * T can be anything a field can be: primitive, model, collection, ...
 *
 * @param allow_invalid_elements For collection targets: drop failing elements
 */
template <typename T>
Result<T> decode_at(const Value& tree, const Path& path, bool allow_invalid_elements,
                    const DecodeOptions& options = {}) {
    if (!tree.is_object()) {
        return detail::not_an_object(tree);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(tree, ledger, options);
        return std::move(unboxer.perform<detail::PathContainer<T>>(path, allow_invalid_elements).value);
    } catch (const DecodeError& error) {
        return error;
    }
}

template <typename T>
Result<T> decode_at(const Value& tree, const Path& path, const DecodeOptions& options = {}) {
    return decode_at<T>(tree, path, false, options);
}

/**
 * @brief decode_at() with a context for the models found at @p path
 */
template <typename T>
Result<T> decode_at_with_context(const Value& tree, const Path& path,
                                 const detail::context_of_t<T>& context,
                                 bool allow_invalid_elements = false,
                                 const DecodeOptions& options = {}) {
    if (!tree.is_object()) {
        return detail::not_an_object(tree);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(tree, ledger, options, std::any(context));
        return std::move(unboxer.perform<detail::PathContainer<T>>(path, allow_invalid_elements).value);
    } catch (const DecodeError& error) {
        return error;
    }
}

/**
 * @brief Decode an array of objects as a vector of T
 *
 * Element errors are addressed by index ("2.name").
 *
 * @param trees Raw array
 * @param allow_invalid_elements Drop failing elements instead of failing
 */
template <typename T>
Result<std::vector<T>> decode_array(const Value& trees, bool allow_invalid_elements = false,
                                    const DecodeOptions& options = {}) {
    if (!trees.is_array()) {
        return detail::not_an_array(trees);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(trees, ledger, options);
        auto transform = unboxer.transform_for<std::vector<T>>(allow_invalid_elements);
        std::optional<std::vector<T>> decoded = transform(trees);
        return std::move(*decoded);
    } catch (const DecodeError& error) {
        return error;
    }
}

template <typename T>
Result<std::vector<T>> decode_array(const std::vector<Value>& trees,
                                    bool allow_invalid_elements = false,
                                    const DecodeOptions& options = {}) {
    return decode_array<T>(Value(trees), allow_invalid_elements, options);
}

/**
 * @brief Decode an array of objects as a vector of context model T
 *
 * Every element sees @p context, as do the models nested in it.
 */
template <typename T>
Result<std::vector<T>> decode_array_with_context(const Value& trees,
                                                 const typename T::unbox_context& context,
                                                 bool allow_invalid_elements = false,
                                                 const DecodeOptions& options = {}) {
    if (!trees.is_array()) {
        return detail::not_an_array(trees);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(trees, ledger, options, std::any(context));
        auto transform = unboxer.transform_for<std::vector<T>>(allow_invalid_elements);
        std::optional<std::vector<T>> decoded = transform(trees);
        return std::move(*decoded);
    } catch (const DecodeError& error) {
        return error;
    }
}

/**
 * @brief Decode an object of objects as a map from key to T
 */
template <typename T>
Result<std::map<std::string, T>> decode_map(const Value& tree, bool allow_invalid_elements = false,
                                            const DecodeOptions& options = {}) {
    if (!tree.is_object()) {
        return detail::not_an_object(tree);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(tree, ledger, options);
        auto transform = unboxer.transform_for<std::map<std::string, T>>(allow_invalid_elements);
        std::optional<std::map<std::string, T>> decoded = transform(tree);
        return std::move(*decoded);
    } catch (const DecodeError& error) {
        return error;
    }
}

/**
 * @brief Closure that builds a T from a session, or returns nullopt
 *
 * Used when the same shape decodes to different values depending on its
 * content, e.g. a "type" discriminator.
 */
template <typename T>
using CustomDecoder = std::function<std::optional<T>(Unboxer&)>;

/**
 * @brief Decode an object with a closure
 * @return The closure's value, or custom_decode_failed if it returned nullopt
 */
template <typename T>
Result<T> decode_custom(const Value& tree, const CustomDecoder<T>& closure,
                        const DecodeOptions& options = {}) {
    if (!tree.is_object()) {
        return detail::not_an_object(tree);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(tree, ledger, options);
        std::optional<T> decoded = closure(unboxer);
        ledger.throw_if_failed();
        if (!decoded) {
            return DecodeError::custom_decode_failed();
        }
        return std::move(*decoded);
    } catch (const DecodeError& error) {
        return error;
    }
}

/**
 * @brief Decode an array of objects with a closure
 *
 * Elements that are not objects fail as invalid array elements; a closure
 * returning nullopt fails as custom_decode_failed. With
 * @p allow_invalid_elements both are dropped instead.
 */
template <typename T>
Result<std::vector<T>> decode_custom_array(const Value& trees, bool allow_invalid_elements,
                                           const CustomDecoder<T>& closure,
                                           const DecodeOptions& options = {}) {
    if (!trees.is_array()) {
        return detail::not_an_array(trees);
    }
    try {
        FailureLedger ledger;
        Unboxer unboxer(trees, ledger, options);
        Transform<T> element = [&options, &closure](const Value& raw) -> std::optional<T> {
            if (!raw.is_object()) {
                return std::nullopt;
            }
            FailureLedger element_ledger;
            Unboxer session(raw, element_ledger, options);
            std::optional<T> decoded = closure(session);
            element_ledger.throw_if_failed();
            if (!decoded) {
                throw DecodeError::custom_decode_failed();
            }
            return decoded;
        };
        auto transform = unboxer.collection_of<std::vector<T>>(element, allow_invalid_elements);
        std::optional<std::vector<T>> decoded = transform(trees);
        return std::move(*decoded);
    } catch (const DecodeError& error) {
        return error;
    }
}

/**
 * @brief Parse JSON text and decode it as model T
 * @return T, or invalid_input_data for malformed text
 */
template <typename T>
Result<T> decode_json(const std::string& text, const DecodeOptions& options = {}) {
    Value tree;
    try {
        tree = parse_json(text);
    } catch (const DecodeError& error) {
        return error;
    }
    return decode<T>(tree, options);
}

/**
 * @brief Parse JSON text and decode it as an array of T
 */
template <typename T>
Result<std::vector<T>> decode_json_array(const std::string& text, bool allow_invalid_elements = false,
                                         const DecodeOptions& options = {}) {
    Value tree;
    try {
        tree = parse_json(text);
    } catch (const DecodeError& error) {
        return error;
    }
    return decode_array<T>(tree, allow_invalid_elements, options);
}

/**
 * @brief Parse JSON text and decode it as an array of context model T
 */
template <typename T>
Result<std::vector<T>> decode_json_array_with_context(const std::string& text,
                                                      const typename T::unbox_context& context,
                                                      bool allow_invalid_elements = false,
                                                      const DecodeOptions& options = {}) {
    Value tree;
    try {
        tree = parse_json(text);
    } catch (const DecodeError& error) {
        return error;
    }
    return decode_array_with_context<T>(tree, context, allow_invalid_elements, options);
}

} // namespace unbox

#endif // UNBOX_DECODE_HPP
