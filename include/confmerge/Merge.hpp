/**
 * @file Merge.hpp
 * @brief Merge several configuration documents into one
 *
 * For each document, in the order given: load → parse → resolve relative
 * paths against the document's own directory → merge into the accumulated
 * root. The first document becomes the root unmodified by any merge.
 */

#ifndef CONFMERGE_MERGE_HPP
#define CONFMERGE_MERGE_HPP

#include "confmerge/Loader.hpp"
#include "confmerge/Options.hpp"
#include "confmerge/Value.hpp"

#include <string>
#include <vector>

namespace confmerge {

/**
 * @brief Merge documents loaded through a DocumentLoader
 *
 * The policy is compiled before any document is loaded, so a conflicting
 * policy configuration fails without touching the loader.
 *
 * @param options Merge options (options.source_base_directory is ignored;
 *                the loader decides where documents come from)
 * @param sources Document identifiers, in merge order
 * @param loader Source of raw documents
 * @return Merged tree; an empty mapping when `sources` is empty
 * @throws PolicyConflictError on conflicting patterns
 * @throws DocumentError naming the failing document for load, parse,
 *         type-mismatch and duplicate-key errors
 *
 * Example:
 * ```cpp
 * MergeOptions opts;
 * opts.resolve_path_patterns = {".local"};
 * FileLoader loader("configs");
 * Value merged = merge_documents(opts, {"common/base.yaml", "host/a.yaml"}, loader);
 * ```
 */
Value merge_documents(const MergeOptions& options,
                      const std::vector<std::string>& sources,
                      DocumentLoader& loader);

/**
 * @brief Merge document files under options.source_base_directory
 *
 * Same as the loader overload with a FileLoader.
 */
Value merge_documents(const MergeOptions& options,
                      const std::vector<std::string>& sources);

} // namespace confmerge

#endif // CONFMERGE_MERGE_HPP
