#include "unbox/Util.hpp"

#include <algorithm>
#include <cctype>

namespace unbox {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

} // namespace unbox
