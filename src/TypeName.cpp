/**
 * @file TypeName.cpp
 * @brief typeid demangling
 */

#include "unbox/TypeName.hpp"

#include <cstdlib>
#include <memory>

#ifdef __GNUG__
    #include <cxxabi.h>
#endif

namespace unbox {
namespace detail {

std::string demangle(const char* name) {
#ifdef __GNUG__
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> readable(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && readable) {
        return readable.get();
    }
    return name;
#else
    // MSVC names are already readable ("struct User")
    std::string result = name;
    for (const char* prefix : {"struct ", "class ", "enum "}) {
        const std::string tag = prefix;
        if (result.compare(0, tag.size(), tag) == 0) {
            return result.substr(tag.size());
        }
    }
    return result;
#endif
}

} // namespace detail
} // namespace unbox
