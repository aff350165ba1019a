#ifndef UNBOX_UTIL_HPP
#define UNBOX_UTIL_HPP

#include <string>

namespace unbox {

// Helpers
std::string to_lower(std::string s);

} // namespace unbox

#endif // UNBOX_UTIL_HPP
