/**
 * @file Errors.hpp
 * @brief Error taxonomy for unbox decoding
 *
 * Two layers:
 * - PathError: what went wrong at one location (missing key, bad value,
 *   bad collection element, ...). A plain value type.
 * - DecodeError: the exception surfaced to callers. Wraps a PathError with
 *   the full dotted path, or reports invalid input, a failed custom
 *   decode, or an aggregated list of field failures.
 *
 * All exceptions derive from unbox::Error (a std::runtime_error).
 */

#ifndef UNBOX_ERRORS_HPP
#define UNBOX_ERRORS_HPP

#include "Value.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace unbox {

/**
 * @brief Base class for all unbox exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A failure at a single location of the value tree
 *
 * Carries the structured data needed to render a message without
 * re-inspecting the tree: the key or index, the offending raw value and a
 * description of the expected type.
 */
class PathError {
public:
    enum class Kind {
        EmptyPath,
        MissingKey,
        InvalidValue,
        InvalidArrayElement,
        InvalidDictionaryKeyType,
        InvalidDictionaryKey,
        InvalidDictionaryValue,
        InvalidCollectionElementType
    };

    /// A key path with zero segments was used.
    static PathError empty_path();

    /// A dictionary key (or array index) was not found.
    static PathError missing_key(std::string key);

    /// A value was found but could not be converted to @p expected_type.
    static PathError invalid_value(Value value, std::string key, std::string expected_type);

    /// An array element could not be converted to @p expected_type.
    static PathError invalid_array_element(Value value, std::size_t index,
                                           std::string expected_type);

    /// A map was requested with a key type that has no key transform.
    static PathError invalid_dictionary_key_type(std::string type);

    /// A dictionary key could not be converted to the map's key type.
    static PathError invalid_dictionary_key(std::string key);

    /// A dictionary value could not be converted to @p expected_type.
    static PathError invalid_dictionary_value(Value value, std::string key,
                                              std::string expected_type);

    /// A collection was requested whose element type cannot be decoded.
    static PathError invalid_collection_element_type(std::string type);

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief Key the error refers to (empty when not applicable)
     */
    const std::string& key() const noexcept { return key_; }

    /**
     * @brief Array index (only meaningful for InvalidArrayElement)
     */
    std::size_t index() const noexcept { return index_; }

    /**
     * @brief Offending raw value (null when not applicable)
     */
    const Value& value() const noexcept { return value_; }

    /**
     * @brief Expected type, or the rejected type for the *Type kinds
     */
    const std::string& expected_type() const noexcept { return expected_type_; }

    /**
     * @brief Render a human-readable description
     * @return Message such as `The key "name" is missing.`
     */
    std::string describe() const;

    bool operator==(const PathError& other) const;
    bool operator!=(const PathError& other) const { return !(*this == other); }

private:
    explicit PathError(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string key_;
    std::size_t index_ = 0;
    Value value_;
    std::string expected_type_;
};

/**
 * @brief Decoding failure surfaced to callers
 *
 * Thrown by Unboxer field accessors in throwing mode, and carried by
 * Result<T> for the public decode entry points.
 */
class DecodeError : public Error {
public:
    enum class Kind {
        Path,
        InvalidInputData,
        CustomDecodeFailed,
        Aggregated
    };

    /**
     * @brief Construct a path error
     * @param error What went wrong
     * @param path Full dotted path at which it happened (may be empty
     *             while the error is still travelling up to its field)
     */
    DecodeError(PathError error, std::string path);

    /**
     * @brief Input could not be turned into a decodable value tree
     * @param details Optional parser or shape detail
     */
    static DecodeError invalid_input_data(std::string details = "");

    /// A custom decoding closure returned no value.
    static DecodeError custom_decode_failed();

    /**
     * @brief Several independent field failures, in access order
     *
     * Nested aggregated errors are flattened into the list.
     */
    static DecodeError aggregated(const std::vector<DecodeError>& errors);

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief The wrapped path error
     * @return Pointer to the path error, or nullptr unless kind() is Path
     */
    const PathError* path_error() const noexcept {
        return path_error_ ? &*path_error_ : nullptr;
    }

    /**
     * @brief Full dotted path of a Path error (e.g. "items.2.name")
     */
    const std::string& path() const noexcept { return path_; }

    /**
     * @brief Extra detail for InvalidInputData
     */
    const std::string& details() const noexcept { return details_; }

    /**
     * @brief Field errors of an Aggregated error (empty otherwise)
     */
    const std::vector<DecodeError>& errors() const noexcept { return errors_; }

    /**
     * @brief Message without the "[unbox] " prefix of what()
     */
    const std::string& describe() const noexcept { return description_; }

    /**
     * @brief Copy of this error located below @p prefix
     *
     * Path errors get "prefix." prepended to their path (or just "prefix"
     * when the path is empty). Aggregated errors prefix every field error.
     * Other kinds are returned unchanged.
     *
     * @param prefix Outer path
     * @return Re-addressed error
     */
    DecodeError prefixed(const std::string& prefix) const;

    bool operator==(const DecodeError& other) const;
    bool operator!=(const DecodeError& other) const { return !(*this == other); }

private:
    DecodeError(Kind kind, std::optional<PathError> error, std::string path,
                std::string details, std::vector<DecodeError> errors);

    Kind kind_;
    std::optional<PathError> path_error_;
    std::string path_;
    std::string details_;
    std::vector<DecodeError> errors_;
    std::string description_;

    static std::string format_message(Kind kind, const std::optional<PathError>& error,
                                      const std::string& path, const std::string& details,
                                      const std::vector<DecodeError>& errors);
};

/**
 * @brief Input file not found (loader)
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("[unbox] Input file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

} // namespace unbox

#endif // UNBOX_ERRORS_HPP
