/**
 * @file Result.hpp
 * @brief Success-or-DecodeError value returned by the decode entry points
 */

#ifndef UNBOX_RESULT_HPP
#define UNBOX_RESULT_HPP

#include "Errors.hpp"

#include <utility>
#include <variant>

namespace unbox {

/**
 * @brief Either a decoded T or the DecodeError that prevented it
 *
 * Example:
 * ```cpp
 * auto result = unbox::decode<User>(tree);
 * if (!result) {
 *     std::cerr << result.error().what() << "\n";
 * }
 * const User& user = result.value();
 * ```
 */
template <typename T>
class Result {
public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(DecodeError error) : storage_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return storage_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief Access the decoded value
     * @throws DecodeError the stored error if decoding failed
     */
    const T& value() const& {
        if (!ok()) {
            throw std::get<1>(storage_);
        }
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::get<1>(storage_);
        }
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Access the error
     * @throws std::bad_variant_access if decoding succeeded
     */
    const DecodeError& error() const {
        return std::get<1>(storage_);
    }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    std::variant<T, DecodeError> storage_;
};

} // namespace unbox

#endif // UNBOX_RESULT_HPP
