/**
 * @file Path.hpp
 * @brief Locating sub-values inside a value tree
 *
 * A Path is one of:
 * - a flat key, compared literally against dictionary keys even when it
 *   contains '.' (a key "a.b" matches the key "a.b", nothing nested);
 * - a key path, split on '.'; each segment descends one level, into a
 *   dictionary by key or into an array by non-negative integer index;
 * - an explicit list of segments.
 *
 * Resolution rules:
 * - zero segments: always an empty-path error, never the root
 * - dictionary: missing key error if the segment is absent
 * - array: missing key error unless the segment is an index in [0, size)
 * - scalar with segments left: invalid value error
 */

#ifndef UNBOX_PATH_HPP
#define UNBOX_PATH_HPP

#include "Value.hpp"
#include "Errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace unbox {

/**
 * @brief Split a dot-path into segments
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Vector of segments ["a", "b", "c"]
 *
 * Empty segments are skipped:
 * - "database.host" → ["database", "host"]
 * - "items.0.name" → ["items", "0", "name"]
 * - "" → []
 * - "a..b" → ["a", "b"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * @param segments Vector of path segments
 * @return Dot-joined path string
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Flat key, key path or explicit segment list
 *
 * Strings convert implicitly to a flat key, so `unboxer.required<int>("age")`
 * looks up the literal key "age". Use Path::key_path() for nested access.
 */
class Path {
public:
    Path(const char* key) : Path(std::string(key)) {}
    Path(std::string key);

    /// Flat key, matched literally.
    static Path key(std::string key);

    /// Dot-separated key path.
    static Path key_path(const std::string& path);

    /// Explicit segments, used as-is.
    static Path keys(std::vector<std::string> segments);

    const std::vector<std::string>& segments() const noexcept { return segments_; }

    bool empty() const noexcept { return segments_.empty(); }

    /**
     * @brief Path as written, used to address errors
     */
    const std::string& str() const noexcept { return text_; }

private:
    Path(std::vector<std::string> segments, std::string text)
        : segments_(std::move(segments))
        , text_(std::move(text))
    {}

    std::vector<std::string> segments_;
    std::string text_;
};

/**
 * @brief Outcome of resolving a path
 *
 * On success `value` points into the tree and `key` is the last segment.
 * On failure `value` is nullptr and `error` says why.
 */
struct Resolution {
    const Value* value = nullptr;
    std::string key;
    std::optional<PathError> error;

    explicit operator bool() const noexcept { return value != nullptr; }
};

/**
 * @brief Resolve a path against a tree
 *
 * @param root Tree to search
 * @param path Path to follow
 * @return Resolution pointing into @p root, or carrying the PathError
 *
 * Examples:
 * ```cpp
 * Value tree = {{"a", {{"b", {{{"c", 7}}}}}}};
 * resolve_path(tree, Path::key_path("a.b.0.c"));  // → 7, key "c"
 * resolve_path(tree, Path::key_path("a.b.1.c"));  // missing key "1"
 * resolve_path(tree, Path::key_path(""));         // empty path
 * ```
 */
Resolution resolve_path(const Value& root, const Path& path);

/**
 * @brief Check whether a path resolves
 * @return true if resolve_path() would succeed
 */
bool contains_path(const Value& root, const Path& path);

} // namespace unbox

#endif // UNBOX_PATH_HPP
