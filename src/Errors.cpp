/**
 * @file Errors.cpp
 * @brief Error construction and message rendering
 */

#include "unbox/Errors.hpp"

#include <sstream>

namespace unbox {

// ============================================================================
// PathError
// ============================================================================

PathError PathError::empty_path() {
    return PathError(Kind::EmptyPath);
}

PathError PathError::missing_key(std::string key) {
    PathError error(Kind::MissingKey);
    error.key_ = std::move(key);
    return error;
}

PathError PathError::invalid_value(Value value, std::string key, std::string expected_type) {
    PathError error(Kind::InvalidValue);
    error.value_ = std::move(value);
    error.key_ = std::move(key);
    error.expected_type_ = std::move(expected_type);
    return error;
}

PathError PathError::invalid_array_element(Value value, std::size_t index,
                                           std::string expected_type) {
    PathError error(Kind::InvalidArrayElement);
    error.value_ = std::move(value);
    error.index_ = index;
    error.expected_type_ = std::move(expected_type);
    return error;
}

PathError PathError::invalid_dictionary_key_type(std::string type) {
    PathError error(Kind::InvalidDictionaryKeyType);
    error.expected_type_ = std::move(type);
    return error;
}

PathError PathError::invalid_dictionary_key(std::string key) {
    PathError error(Kind::InvalidDictionaryKey);
    error.key_ = std::move(key);
    return error;
}

PathError PathError::invalid_dictionary_value(Value value, std::string key,
                                              std::string expected_type) {
    PathError error(Kind::InvalidDictionaryValue);
    error.value_ = std::move(value);
    error.key_ = std::move(key);
    error.expected_type_ = std::move(expected_type);
    return error;
}

PathError PathError::invalid_collection_element_type(std::string type) {
    PathError error(Kind::InvalidCollectionElementType);
    error.expected_type_ = std::move(type);
    return error;
}

std::string PathError::describe() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::EmptyPath:
            oss << "Key path can't be empty.";
            break;
        case Kind::MissingKey:
            oss << "The key \"" << key_ << "\" is missing.";
            break;
        case Kind::InvalidValue:
            oss << "Invalid value (" << describe_value(value_) << ") for key \""
                << key_ << "\", expected " << expected_type_ << ".";
            break;
        case Kind::InvalidArrayElement:
            oss << "Invalid array element (" << describe_value(value_) << ") at index "
                << index_ << ", expected " << expected_type_ << ".";
            break;
        case Kind::InvalidDictionaryKeyType:
            oss << "Invalid dictionary key type: " << expected_type_
                << ". Must be either string, an integer or a type with a KeyTransform.";
            break;
        case Kind::InvalidDictionaryKey:
            oss << "Invalid dictionary key: " << key_ << ".";
            break;
        case Kind::InvalidDictionaryValue:
            oss << "Invalid dictionary value (" << describe_value(value_) << ") for key \""
                << key_ << "\", expected " << expected_type_ << ".";
            break;
        case Kind::InvalidCollectionElementType:
            oss << "Invalid collection element type: " << expected_type_
                << ". Must be a primitive, transformable, collection or model type.";
            break;
    }
    return oss.str();
}

bool PathError::operator==(const PathError& other) const {
    return kind_ == other.kind_
        && key_ == other.key_
        && index_ == other.index_
        && value_ == other.value_
        && expected_type_ == other.expected_type_;
}

// ============================================================================
// DecodeError
// ============================================================================

namespace {

/**
 * @brief Append @p error to @p out, expanding aggregated errors in place.
 */
void append_flattened(std::vector<DecodeError>& out, const DecodeError& error) {
    if (error.kind() == DecodeError::Kind::Aggregated) {
        for (const auto& nested : error.errors()) {
            append_flattened(out, nested);
        }
        return;
    }
    out.push_back(error);
}

} // anonymous namespace

DecodeError::DecodeError(PathError error, std::string path)
    : DecodeError(Kind::Path, std::move(error), std::move(path), "", {})
{}

DecodeError::DecodeError(Kind kind, std::optional<PathError> error, std::string path,
                         std::string details, std::vector<DecodeError> errors)
    : Error("[unbox] " + format_message(kind, error, path, details, errors))
    , kind_(kind)
    , path_error_(std::move(error))
    , path_(std::move(path))
    , details_(std::move(details))
    , errors_(std::move(errors))
{
    description_ = std::string(what()).substr(8);
}

DecodeError DecodeError::invalid_input_data(std::string details) {
    return DecodeError(Kind::InvalidInputData, std::nullopt, "", std::move(details), {});
}

DecodeError DecodeError::custom_decode_failed() {
    return DecodeError(Kind::CustomDecodeFailed, std::nullopt, "", "", {});
}

DecodeError DecodeError::aggregated(const std::vector<DecodeError>& errors) {
    std::vector<DecodeError> flat;
    for (const auto& error : errors) {
        append_flattened(flat, error);
    }
    return DecodeError(Kind::Aggregated, std::nullopt, "", "", std::move(flat));
}

DecodeError DecodeError::prefixed(const std::string& prefix) const {
    if (prefix.empty()) {
        return *this;
    }

    switch (kind_) {
        case Kind::Path:
            return DecodeError(*path_error_, path_.empty() ? prefix : prefix + "." + path_);
        case Kind::Aggregated: {
            std::vector<DecodeError> moved;
            moved.reserve(errors_.size());
            for (const auto& error : errors_) {
                moved.push_back(error.prefixed(prefix));
            }
            return DecodeError(Kind::Aggregated, std::nullopt, "", "", std::move(moved));
        }
        case Kind::InvalidInputData:
        case Kind::CustomDecodeFailed:
            break;
    }
    return *this;
}

bool DecodeError::operator==(const DecodeError& other) const {
    return kind_ == other.kind_
        && path_error_ == other.path_error_
        && path_ == other.path_
        && details_ == other.details_
        && errors_ == other.errors_;
}

std::string DecodeError::format_message(Kind kind, const std::optional<PathError>& error,
                                        const std::string& path, const std::string& details,
                                        const std::vector<DecodeError>& errors) {
    std::ostringstream oss;
    switch (kind) {
        case Kind::Path:
            if (path.empty()) {
                oss << "An error occurred while decoding: ";
            } else {
                oss << "An error occurred while decoding path \"" << path << "\": ";
            }
            oss << error->describe();
            break;
        case Kind::InvalidInputData:
            oss << "Invalid input data";
            if (details.empty()) {
                oss << ".";
            } else {
                oss << ": " << details;
            }
            break;
        case Kind::CustomDecodeFailed:
            oss << "The custom decoding closure returned no value.";
            break;
        case Kind::Aggregated:
            oss << "Decoding failed with " << errors.size()
                << (errors.size() == 1 ? " error:" : " errors:");
            for (const auto& nested : errors) {
                oss << "\n  - " << nested.describe();
            }
            break;
    }
    return oss.str();
}

} // namespace unbox
