/**
 * @file Unboxer.hpp
 * @brief Decode session: the field-access API used by model constructors
 *
 * A model is any type constructible from a session:
 *
 * ```cpp
 * struct User {
 *     explicit User(unbox::Unboxer& unboxer)
 *         : name(unboxer.required<std::string>("name"))
 *         , age(unboxer.required<int>("age"))
 *         , email(unboxer.optional<std::string>("email"))
 *         , city(unboxer.required<std::string>(unbox::Path::key_path("address.city")))
 *     {}
 *
 *     std::string name;
 *     int age;
 *     std::optional<std::string> email;
 *     std::string city;
 * };
 * ```
 *
 * Models that need a caller-supplied value declare its type and take it
 * as a second constructor argument:
 *
 * ```cpp
 * struct Price {
 *     using unbox_context = Currency;
 *     Price(unbox::Unboxer& unboxer, const Currency& currency);
 * };
 * ```
 *
 * Required accessors fail the decode (throwing mode) or record the
 * failure and return a fallback (accumulating mode). Optional accessors
 * return nullopt when the value is absent, null or malformed; only the
 * malformed case produces a warning.
 */

#ifndef UNBOX_UNBOXER_HPP
#define UNBOX_UNBOXER_HPP

#include "Coercion.hpp"
#include "Collection.hpp"
#include "Errors.hpp"
#include "Options.hpp"
#include "Path.hpp"
#include "Traits.hpp"
#include "Transform.hpp"
#include "TypeName.hpp"
#include "Value.hpp"
#include "Warning.hpp"

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace unbox {

/**
 * @brief Failures recorded during one accumulating decode
 *
 * One ledger per model decode; nested models get their own and their
 * failures are folded into the parent's, re-addressed, when they finish.
 */
class FailureLedger {
public:
    /**
     * @brief Record a failure
     *
     * Aggregated errors are flattened so the ledger stays a flat list in
     * access order.
     */
    void record(const DecodeError& error);

    bool empty() const noexcept { return errors_.empty(); }
    std::size_t size() const noexcept { return errors_.size(); }
    const std::vector<DecodeError>& errors() const noexcept { return errors_; }

    /**
     * @throws DecodeError an aggregated error listing every recorded failure,
     *         if any were recorded
     */
    void throw_if_failed() const;

    void clear() noexcept { errors_.clear(); }

private:
    std::vector<DecodeError> errors_;
};

class Unboxer {
public:
    /// Key reported when a required context is missing.
    static constexpr const char* context_key = "unbox.context";

    /**
     * @brief Create a session over a tree
     *
     * @param tree Value to decode; must outlive the session
     * @param ledger Failure ledger of this decode; must outlive the session
     * @param options Mode and warning delivery
     * @param context Optional caller-supplied value for context models
     */
    Unboxer(const Value& tree, FailureLedger& ledger,
            DecodeOptions options = {}, std::any context = {});

    Unboxer(const Unboxer&) = delete;
    Unboxer& operator=(const Unboxer&) = delete;

    const Value& tree() const noexcept { return tree_; }
    const DecodeOptions& options() const noexcept { return options_; }
    DecodeMode mode() const noexcept { return options_.mode; }

    /**
     * @brief Keys of the underlying tree (empty unless it is an object)
     */
    std::vector<std::string> all_keys() const;

    /**
     * @brief Whether @p path resolves in this session's tree
     */
    bool contains(const Path& path) const;

    // ------------------------------------------------------------------
    // Context
    // ------------------------------------------------------------------

    bool has_context() const noexcept { return context_.has_value(); }
    const std::any& context() const noexcept { return context_; }

    /**
     * @brief Context as @p C
     * @return Pointer to the context, or nullptr if absent or of another type
     */
    template <typename C>
    const C* context_as() const noexcept {
        return std::any_cast<C>(&context_);
    }

    /**
     * @brief Context as @p C, failing the decode when it is missing
     *
     * The failure is reported as a missing key named context_key.
     */
    template <typename C>
    C required_context() {
        if (const C* context = context_as<C>()) {
            return *context;
        }
        fail(context_key);
        return Fallback<C>::value();
    }

    // ------------------------------------------------------------------
    // Field access
    // ------------------------------------------------------------------

    /**
     * @brief Decode a required value
     *
     * T may be Value, a primitive, a ByTransform type, a model, a context
     * model (using the session's context) or a collection of those.
     *
     * @param path Flat key (plain string) or Path::key_path()
     * @param allow_invalid_elements For collections: drop failing elements
     * @return The decoded value; the fallback value if the field failed
     *         in accumulating mode
     * @throws DecodeError in throwing mode
     */
    template <typename T>
    T required(const Path& path, bool allow_invalid_elements = false) {
        static_assert(detail::is_unboxable<T>::value, "unbox: type cannot be decoded");
        return require<T>(path, transform_for<T>(allow_invalid_elements));
    }

    /**
     * @brief Decode an optional value
     * @return nullopt if absent, null or malformed
     */
    template <typename T>
    std::optional<T> optional(const Path& path, bool allow_invalid_elements = false) {
        static_assert(detail::is_unboxable<T>::value, "unbox: type cannot be decoded");
        return attempt<T>(path, transform_for<T>(allow_invalid_elements));
    }

    /**
     * @brief Decode a required context model (or collection of them)
     *        with an explicit context
     *
     * The context replaces the session's for this field and everything
     * nested below it.
     */
    template <typename T>
    T required_with(const Path& path, const detail::context_of_t<T>& context,
                    bool allow_invalid_elements = false) {
        Unboxer scoped(tree_, ledger_, options_, std::any(context));
        return scoped.required<T>(path, allow_invalid_elements);
    }

    template <typename T>
    std::optional<T> optional_with(const Path& path, const detail::context_of_t<T>& context,
                                   bool allow_invalid_elements = false) {
        Unboxer scoped(tree_, ledger_, options_, std::any(context));
        return scoped.optional<T>(path, allow_invalid_elements);
    }

    /**
     * @brief Decode a required value through a formatter
     *
     * ```cpp
     * DateFormatter formatter("%Y-%m-%d");
     * auto born = unboxer.required_formatted("born", formatter);
     * ```
     */
    template <typename F>
    typename F::formatted_type required_formatted(const Path& path, const F& formatter) {
        return require<typename F::formatted_type>(path, formatter_transform(formatter));
    }

    template <typename F>
    std::optional<typename F::formatted_type> optional_formatted(const Path& path,
                                                                 const F& formatter) {
        return attempt<typename F::formatted_type>(path, formatter_transform(formatter));
    }

    /**
     * @brief Decode a required collection whose elements go through a formatter
     *
     * ```cpp
     * auto dates = unboxer.required_formatted<std::vector<DateFormatter::formatted_type>>(
     *     "dates", formatter, true);
     * ```
     */
    template <typename C, typename F>
    C required_formatted(const Path& path, const F& formatter, bool allow_invalid_elements) {
        return require<C>(path, collection_of<C>(formatter_transform(formatter),
                                                 allow_invalid_elements));
    }

    template <typename C, typename F>
    std::optional<C> optional_formatted(const Path& path, const F& formatter,
                                        bool allow_invalid_elements) {
        return attempt<C>(path, collection_of<C>(formatter_transform(formatter),
                                                 allow_invalid_elements));
    }

    /**
     * @brief Decode a required value with an ad hoc transform
     */
    template <typename T>
    T required_transformed(const Path& path, const Transform<T>& transform) {
        return require<T>(path, transform);
    }

    template <typename T>
    std::optional<T> optional_transformed(const Path& path, const Transform<T>& transform) {
        return attempt<T>(path, transform);
    }

    // ------------------------------------------------------------------
    // Manual failure
    // ------------------------------------------------------------------

    /**
     * @brief Report @p key as missing
     * @throws DecodeError in throwing mode
     */
    void fail(const std::string& key);

    /**
     * @brief Report @p value at @p key as invalid
     * @throws DecodeError in throwing mode
     */
    void fail_for_invalid_value(const Value& value, const std::string& key,
                                const std::string& expected_type = "a valid value");

    /**
     * @brief Whether this session recorded a failure (accumulating mode)
     */
    bool has_failed() const noexcept { return !ledger_.empty(); }

    // ------------------------------------------------------------------
    // Building blocks
    // ------------------------------------------------------------------

    /**
     * @brief The transform this session uses for T
     *
     * The returned transform may refer to this session; use it while the
     * session is alive.
     */
    template <typename T>
    Transform<T> transform_for(bool allow_invalid_elements = false) {
        if constexpr (std::is_same_v<T, Value>) {
            return [](const Value& raw) { return std::optional<Value>(raw); };
        } else if constexpr (detail::is_primitive<T>::value) {
            return [](const Value& raw) { return coerce<T>(raw); };
        } else if constexpr (detail::has_by_transform<T>::value) {
            return [](const Value& raw) { return by_transform<T>(raw); };
        } else if constexpr (detail::is_collection_v<T>) {
            return collection_transform<T>(allow_invalid_elements);
        } else if constexpr (detail::is_model<T>::value || detail::is_context_model<T>::value) {
            return [this](const Value& raw) { return unbox_model<T>(raw); };
        } else {
            static_assert(detail::dependent_false<T>, "unbox: type cannot be decoded");
        }
    }

    /**
     * @brief Collection transform over an arbitrary element transform
     *
     * @tparam C Sequence, set or map type
     * @param element Transform for the element (mapped) type
     */
    template <typename C>
    Transform<C> collection_of(Transform<detail::element_of_t<C>> element,
                               bool allow_invalid_elements) {
        WarningSink sink = warning_sink();
        if constexpr (detail::is_map_v<C>) {
            using Key = typename C::key_type;
            if constexpr (!detail::is_key<Key>::value) {
                return [](const Value&) -> std::optional<C> {
                    throw DecodeError(PathError::invalid_dictionary_key_type(type_name_of<Key>()), "");
                };
            } else {
                KeyTransformFn<Key> key = key_transform_for<Key>();
                return [key, element, allow_invalid_elements, sink](const Value& raw) {
                    return unbox_map<C>(raw, allow_invalid_elements, key, element, sink);
                };
            }
        } else {
            return [element, allow_invalid_elements, sink](const Value& raw) {
                return unbox_sequence<C>(raw, allow_invalid_elements, element, sink);
            };
        }
    }

    /**
     * @brief Construct T from this session, then check the ledger
     *
     * @param args Extra constructor arguments (e.g. the context)
     * @throws DecodeError the first failure in throwing mode, or an
     *         aggregated error in accumulating mode
     */
    template <typename T, typename... Args>
    T perform(Args&&... args) {
        T value(*this, std::forward<Args>(args)...);
        ledger_.throw_if_failed();
        return value;
    }

private:
    const Value& tree_;
    FailureLedger& ledger_;
    DecodeOptions options_;
    std::any context_;

    WarningSink warning_sink() const;
    void warn(const Warning& warning) const;

    /// Record in accumulating mode, rethrow in throwing mode.
    void report(const DecodeError& error);

    template <typename R>
    R apply(const Resolution& found, const Path& path, const Transform<R>& transform) {
        std::optional<R> result;
        try {
            if (auto produced = transform(*found.value)) {
                result.emplace(std::move(*produced));
            }
        } catch (const DecodeError& error) {
            throw error.prefixed(path.str());
        }
        if (!result) {
            throw DecodeError(PathError::invalid_value(*found.value, found.key, type_name_of<R>()),
                              path.str());
        }
        return std::move(*result);
    }

    template <typename R>
    R require(const Path& path, const Transform<R>& transform) {
        try {
            Resolution found = resolve_path(tree_, path);
            if (!found) {
                throw DecodeError(*found.error, path.str());
            }
            return apply(found, path, transform);
        } catch (const DecodeError& error) {
            report(error);
        }
        return fallback_for<R>();
    }

    template <typename R>
    std::optional<R> attempt(const Path& path, const Transform<R>& transform) {
        Resolution found = resolve_path(tree_, path);
        if (!found || found.value->is_null()) {
            return std::nullopt;
        }
        try {
            return apply(found, path, transform);
        } catch (const DecodeError& error) {
            warn(Warning::invalid_optional_value(error));
        }
        return std::nullopt;
    }

    template <typename F>
    static Transform<typename F::formatted_type> formatter_transform(const F& formatter) {
        return [formatter](const Value& raw) { return apply_formatter(formatter, raw); };
    }

    template <typename C>
    Transform<C> collection_transform(bool allow_invalid_elements) {
        using Element = detail::element_of_t<C>;
        if constexpr (!detail::is_decodable<Element>::value) {
            return [](const Value&) -> std::optional<C> {
                throw DecodeError(
                    PathError::invalid_collection_element_type(type_name_of<Element>()), "");
            };
        } else {
            return collection_of<C>(transform_for<Element>(allow_invalid_elements),
                                     allow_invalid_elements);
        }
    }

    template <typename T>
    std::optional<T> unbox_model(const Value& raw) {
        if (!raw.is_object()) {
            return std::nullopt;
        }

        FailureLedger ledger;
        Unboxer child(raw, ledger, options_, context_);
        if constexpr (detail::is_context_model<T>::value) {
            using Context = typename T::unbox_context;
            if (const Context* context = context_as<Context>()) {
                return child.perform<T>(*context);
            }
            if constexpr (detail::is_model<T>::value) {
                return child.perform<T>();
            } else {
                throw DecodeError(PathError::missing_key(context_key), "");
            }
        } else {
            return child.perform<T>();
        }
    }

    /**
     * @brief Placeholder for a failed required field
     *
     * Models are built from an empty object in a silent accumulating
     * session, so their own fields fall back recursively.
     */
    template <typename R>
    R fallback_for() {
        if constexpr (detail::is_model<R>::value || detail::is_context_model<R>::value) {
            static const Value empty = Value::object();
            FailureLedger scratch;
            DecodeOptions silent;
            silent.mode = DecodeMode::Accumulating;
            silent.emit_warnings = false;
            Unboxer session(empty, scratch, silent, context_);

            if constexpr (detail::is_context_model<R>::value) {
                using Context = typename R::unbox_context;
                if (const Context* context = context_as<Context>()) {
                    return R(session, *context);
                }
                if constexpr (detail::is_model<R>::value) {
                    return R(session);
                } else {
                    return R(session, Fallback<Context>::value());
                }
            } else {
                return R(session);
            }
        } else {
            return Fallback<R>::value();
        }
    }
};

} // namespace unbox

#endif // UNBOX_UNBOXER_HPP
