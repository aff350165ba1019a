/**
 * @file Path.cpp
 * @brief Implementation of path splitting and resolution
 */

#include "unbox/Path.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace unbox {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    // Add final segment
    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

// ============================================================================
// Path
// ============================================================================

Path::Path(std::string key)
    : segments_()
    , text_(key)
{
    if (!key.empty()) {
        segments_.push_back(std::move(key));
    }
}

Path Path::key(std::string key) {
    return Path(std::move(key));
}

Path Path::key_path(const std::string& path) {
    return Path(split_dot_path(path), path);
}

Path Path::keys(std::vector<std::string> segments) {
    std::string text = join_dot_path(segments);
    return Path(std::move(segments), std::move(text));
}

// ============================================================================
// Resolution
// ============================================================================

namespace {

/**
 * @brief Parse an array index segment
 * @param segment The segment string
 * @return The index, or nullopt if the segment is not all digits
 */
std::optional<size_t> parse_array_index(const std::string& segment) {
    if (segment.empty()) return std::nullopt;
    if (!std::all_of(segment.begin(), segment.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    size_t index = 0;
    const char* last = segment.data() + segment.size();
    auto [ptr, ec] = std::from_chars(segment.data(), last, index);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return index;
}

Resolution failed(PathError error) {
    Resolution resolution;
    resolution.error = std::move(error);
    return resolution;
}

} // anonymous namespace

Resolution resolve_path(const Value& root, const Path& path) {
    const auto& segments = path.segments();
    if (segments.empty()) {
        return failed(PathError::empty_path());
    }

    const Value* current = &root;

    for (const auto& seg : segments) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                return failed(PathError::missing_key(seg));
            }
            current = &*it;
        } else if (current->is_array()) {
            auto index = parse_array_index(seg);
            if (!index || *index >= current->size()) {
                return failed(PathError::missing_key(seg));
            }
            current = &(*current)[*index];
        } else {
            // Cannot descend into a scalar
            return failed(PathError::invalid_value(*current, seg, "object or array"));
        }
    }

    Resolution resolution;
    resolution.value = current;
    resolution.key = segments.back();
    return resolution;
}

bool contains_path(const Value& root, const Path& path) {
    return static_cast<bool>(resolve_path(root, path));
}

} // namespace unbox
