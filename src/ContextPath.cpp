/**
 * @file ContextPath.cpp
 * @brief Implementation of context path utilities
 */

#include "confmerge/ContextPath.hpp"

namespace confmerge {

const char* const kRootPath = "$";

std::string child_path(const std::string& parent, const std::string& key) {
    std::string path;
    path.reserve(parent.size() + key.size() + 1);
    path += parent;
    path += '.';
    path += key;
    return path;
}

bool is_relative_pattern(const std::string& pattern) {
    return !pattern.empty() && pattern[0] == '.';
}

std::string normalize_pattern(const std::string& pattern) {
    if (is_relative_pattern(pattern) || pattern.rfind("$.", 0) == 0) {
        return pattern;
    }
    return "$." + pattern;
}

} // namespace confmerge
