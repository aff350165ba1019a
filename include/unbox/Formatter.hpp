/**
 * @file Formatter.hpp
 * @brief Formatter-based transforms
 *
 * A formatter is any type providing:
 * - `using raw_type = ...;` the JSON type it reads (see match_raw())
 * - `using formatted_type = ...;` what it produces
 * - `std::optional<formatted_type> format(const raw_type&) const;`
 *
 * Unlike ByTransform, the formatter instance is supplied per call, so it
 * can carry configuration such as a date pattern.
 */

#ifndef UNBOX_FORMATTER_HPP
#define UNBOX_FORMATTER_HPP

#include <chrono>
#include <optional>
#include <string>

namespace unbox {

/**
 * @brief Parses date strings into UTC time points
 *
 * Patterns use std::get_time syntax and are parsed in the classic locale.
 * The whole string must match.
 *
 * Example:
 * ```cpp
 * DateFormatter formatter("%Y-%m-%d");
 * auto day = formatter.format("2017-03-14");   // 2017-03-14T00:00:00Z
 * auto bad = formatter.format("14/03/2017");   // nullopt
 * ```
 */
class DateFormatter {
public:
    using raw_type = std::string;
    using formatted_type = std::chrono::system_clock::time_point;

    explicit DateFormatter(std::string pattern = "%Y-%m-%dT%H:%M:%S")
        : pattern_(std::move(pattern))
    {}

    std::optional<formatted_type> format(const std::string& text) const;

    const std::string& pattern() const noexcept { return pattern_; }

private:
    std::string pattern_;
};

/**
 * @brief Render a time point as UTC text
 * @param time Time point to render
 * @param pattern std::put_time pattern
 * @return Formatted text
 */
std::string format_time(std::chrono::system_clock::time_point time,
                        const std::string& pattern = "%Y-%m-%dT%H:%M:%S");

} // namespace unbox

#endif // UNBOX_FORMATTER_HPP
