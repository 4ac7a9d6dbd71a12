/**
 * @file PathResolver.hpp
 * @brief Rewrite file-relative path strings before merging
 *
 * A document loaded from "host-dir/input.yaml" may refer to files next
 * to it ("foo.ign"). Once merged into a combined document those strings
 * must carry the document's directory ("host-dir/foo.ign"). The resolver
 * rewrites string leaves at every context path matched by a resolve-path
 * pattern of the MergePolicy.
 */

#ifndef CONFMERGE_PATHRESOLVER_HPP
#define CONFMERGE_PATHRESOLVER_HPP

#include "confmerge/Policy.hpp"
#include "confmerge/Value.hpp"

#include <string>

namespace confmerge {

/**
 * @brief Join a directory and a relative path, then clean the result
 *
 * The result is lexically normalized: "." segments are dropped, "x/.."
 * pairs collapse, repeated separators merge and a trailing separator is
 * removed. An absolute `path` is still placed under `dir`.
 *
 * Examples:
 * - join_path("host-dir", "foo.ign") → "host-dir/foo.ign"
 * - join_path(".", "foo.ign") → "foo.ign"
 * - join_path("a/b", "../c") → "a/c"
 * - join_path("", "./x") → "x"
 * - join_path("", "") → ""
 */
std::string join_path(const std::string& dir, const std::string& path);

/**
 * @brief Rewrite path-like string leaves of a freshly loaded document
 *
 * Walks `document` from the root and replaces every string scalar at a
 * context path for which policy.resolve_path() is true with
 * join_path(source_dir, value). The document is modified in place.
 *
 * - Non-string scalars are never rewritten.
 * - Mappings, including mappings inside sequences, are walked recursively.
 * - A sequence is replaced only if every one of its elements was
 *   rewritten; otherwise its scalar elements are left untouched and a
 *   warning is logged when the sequence sits at a resolve-path.
 *
 * @param document Document root (must be a mapping to have any effect)
 * @param source_dir Directory the document was loaded from
 * @param policy Compiled merge policy
 */
void resolve_paths(Value& document, const std::string& source_dir,
                   const MergePolicy& policy);

} // namespace confmerge

#endif // CONFMERGE_PATHRESOLVER_HPP
