/**
 * @file Uri.cpp
 * @brief URI reference validation and splitting
 */

#include "unbox/Uri.hpp"

#include <cctype>
#include <cstring>
#include <regex>

namespace unbox {

namespace {

bool is_uri_char(unsigned char c) {
    if (std::isalnum(c)) return true;
    // unreserved, gen-delims, sub-delims and '%'
    return c != '\0' && std::strchr("-._~:/?#[]@!$&'()*+,;=%", c) != nullptr;
}

bool has_valid_characters(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (!is_uri_char(c)) {
            return false;
        }
        if (c == '%') {
            if (i + 2 >= text.size()
                || !std::isxdigit(static_cast<unsigned char>(text[i + 1]))
                || !std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
                return false;
            }
            i += 2;
        }
    }
    return true;
}

bool is_valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    for (unsigned char c : scheme) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::optional<Uri> Uri::parse(const std::string& text) {
    if (text.empty() || !has_valid_characters(text)) {
        return std::nullopt;
    }

    static const std::regex pattern(
        R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)");

    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        return std::nullopt;
    }

    Uri uri;
    uri.text_ = text;
    uri.scheme_ = match[2].str();
    uri.authority_ = match[4].str();
    uri.path_ = match[5].str();
    uri.query_ = match[7].str();
    uri.fragment_ = match[9].str();

    if (match[1].matched && !is_valid_scheme(uri.scheme_)) {
        return std::nullopt;
    }
    return uri;
}

} // namespace unbox
