/**
 * @file ContextPath.hpp
 * @brief Context paths and policy pattern normalization
 *
 * A context path addresses a mapping key during recursive descent:
 * it starts at "$" (document root) and each mapping descent appends
 * "." + key, e.g. "$.storage.files". Sequence elements share the path
 * of the key that holds the sequence.
 *
 * Policy patterns are either absolute ("$.a.b", exact match) or relative
 * (".b", suffix match). Any other pattern is treated as absolute at the
 * document root: "foo" becomes "$.foo".
 */

#ifndef CONFMERGE_CONTEXTPATH_HPP
#define CONFMERGE_CONTEXTPATH_HPP

#include <string>

namespace confmerge {

/// Context path of the document root
extern const char* const kRootPath;

/**
 * @brief Extend a context path by one mapping key
 *
 * Examples:
 * - child_path("$", "storage") → "$.storage"
 * - child_path("$.storage", "files") → "$.storage.files"
 */
std::string child_path(const std::string& parent, const std::string& key);

/**
 * @brief Check whether a pattern is relative (starts with ".")
 */
bool is_relative_pattern(const std::string& pattern);

/**
 * @brief Normalize a policy pattern
 *
 * Patterns starting with "." or "$." are returned unchanged; anything
 * else is rewritten to "$." + pattern.
 *
 * Examples:
 * - ".local" → ".local"
 * - "$.storage.files" → "$.storage.files"
 * - "storage" → "$.storage"
 */
std::string normalize_pattern(const std::string& pattern);

} // namespace confmerge

#endif // CONFMERGE_CONTEXTPATH_HPP
