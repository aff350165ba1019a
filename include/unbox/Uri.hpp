/**
 * @file Uri.hpp
 * @brief URI reference type, decodable from strings
 *
 * Validation is shallow: every character must belong to the
 * RFC 3986 character set (percent escapes must be well formed) and a
 * scheme, if present, must be syntactically valid. Components are split
 * with the regular expression of RFC 3986 appendix B.
 */

#ifndef UNBOX_URI_HPP
#define UNBOX_URI_HPP

#include "Transform.hpp"

#include <optional>
#include <string>

namespace unbox {

class Uri {
public:
    Uri() = default;

    /**
     * @brief Parse a URI reference
     * @param text e.g. "https://example.com/a?b=c#d" or "/relative/path"
     * @return The URI, or nullopt if @p text is empty or not a URI reference
     *
     * Examples:
     * - "https://github.com/x" → scheme "https", authority "github.com", path "/x"
     * - "Clearly not a URL!" → nullopt (contains spaces)
     */
    static std::optional<Uri> parse(const std::string& text);

    const std::string& text() const noexcept { return text_; }
    const std::string& scheme() const noexcept { return scheme_; }
    const std::string& authority() const noexcept { return authority_; }
    const std::string& path() const noexcept { return path_; }
    const std::string& query() const noexcept { return query_; }
    const std::string& fragment() const noexcept { return fragment_; }

    bool is_absolute() const noexcept { return !scheme_.empty(); }

    bool operator==(const Uri& other) const { return text_ == other.text_; }
    bool operator!=(const Uri& other) const { return text_ != other.text_; }
    bool operator<(const Uri& other) const { return text_ < other.text_; }

private:
    std::string text_;
    std::string scheme_;
    std::string authority_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

template <>
struct ByTransform<Uri> {
    using raw_type = std::string;

    static std::optional<Uri> transform(const std::string& raw) {
        return Uri::parse(raw);
    }
};

template <>
struct KeyTransform<Uri> {
    static std::optional<Uri> transform(const std::string& key) {
        return Uri::parse(key);
    }
};

} // namespace unbox

#endif // UNBOX_URI_HPP
