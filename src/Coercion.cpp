/**
 * @file Coercion.cpp
 * @brief Non-template parts of the primitive coercion table
 */

#include "unbox/Coercion.hpp"
#include "unbox/Util.hpp"

#include <cctype>
#include <charconv>
#include <locale>
#include <sstream>

namespace unbox {
namespace detail {

namespace {

/**
 * @brief Strip one leading '+' so from_chars accepts "+42".
 * @return View start, or nullptr if nothing numeric can follow
 */
const char* skip_plus(const std::string& text) {
    if (text.empty()) return nullptr;
    if (text[0] == '+') {
        if (text.size() == 1 || text[1] == '-') return nullptr;
        return text.data() + 1;
    }
    return text.data();
}

} // anonymous namespace

std::optional<bool> coerce_bool(const Value& raw) {
    if (raw.is_boolean()) {
        return raw.get<bool>();
    }
    if (raw.is_number_unsigned()) {
        return raw.get<std::uint64_t>() != 0;
    }
    if (raw.is_number_integer()) {
        return raw.get<std::int64_t>() != 0;
    }
    if (raw.is_number_float()) {
        return raw.get<double>() != 0.0;
    }
    if (raw.is_string()) {
        const std::string token = to_lower(raw.get_ref<const std::string&>());
        if (token == "true" || token == "t" || token == "y" || token == "yes") {
            return true;
        }
        if (token == "false" || token == "f" || token == "n" || token == "no") {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<std::string> coerce_string(const Value& raw) {
    if (raw.is_string()) {
        return raw.get<std::string>();
    }
    if (raw.is_boolean()) {
        return std::string(raw.get<bool>() ? "true" : "false");
    }
    if (raw.is_number_unsigned()) {
        return std::to_string(raw.get<std::uint64_t>());
    }
    if (raw.is_number_integer()) {
        return std::to_string(raw.get<std::int64_t>());
    }
    if (raw.is_number_float()) {
        return raw.dump();
    }
    return std::nullopt;
}

std::optional<std::int64_t> parse_signed(const std::string& text) {
    const char* first = skip_plus(text);
    if (first == nullptr) return std::nullopt;
    const char* last = text.data() + text.size();

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint64_t> parse_unsigned(const std::string& text) {
    const char* first = skip_plus(text);
    if (first == nullptr || *first == '-') return std::nullopt;
    const char* last = text.data() + text.size();

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<long double> parse_floating(const std::string& text) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }

    std::istringstream iss(text);
    iss.imbue(std::locale::classic());

    long double value = 0;
    iss >> value;
    if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return value;
}

} // namespace detail
} // namespace unbox
