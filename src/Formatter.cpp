/**
 * @file Formatter.cpp
 * @brief Date parsing and rendering in UTC
 */

#include "unbox/Formatter.hpp"

#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace unbox {

namespace {

std::time_t to_utc_time(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

bool from_utc_time(std::time_t time, std::tm* out) {
#ifdef _WIN32
    return gmtime_s(out, &time) == 0;
#else
    return gmtime_r(&time, out) != nullptr;
#endif
}

} // anonymous namespace

std::optional<DateFormatter::formatted_type> DateFormatter::format(const std::string& text) const {
    std::tm tm{};
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm, pattern_.c_str());
    if (iss.fail()) {
        return std::nullopt;
    }

    // Reject trailing input
    if (iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    tm.tm_isdst = 0;
    std::time_t seconds = to_utc_time(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

std::string format_time(std::chrono::system_clock::time_point time, const std::string& pattern) {
    std::tm tm{};
    if (!from_utc_time(std::chrono::system_clock::to_time_t(time), &tm)) {
        return "";
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, pattern.c_str());
    return oss.str();
}

} // namespace unbox
