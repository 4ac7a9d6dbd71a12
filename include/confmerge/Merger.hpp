/**
 * @file Merger.hpp
 * @brief Policy-driven recursive merge of document trees
 *
 * Merging rules, decided per key of the incoming mapping:
 * - Sequence into absent key: inserted
 * - Sequence into sequence: concatenated (accumulated first), or replaced
 *   wholesale when the key's policy is overwrite
 * - Mapping into absent key or mapping: merged recursively
 * - Scalar into absent key: inserted
 * - Scalar into equal value: no-op
 * - Scalar into different value: replaced when overwrite, else
 *   DuplicateKeyError
 * - Sequence or mapping into a different structural type:
 *   TypeMismatchError, whatever the policy
 *
 * The policy is looked up with the context path of the key itself.
 */

#ifndef CONFMERGE_MERGER_HPP
#define CONFMERGE_MERGER_HPP

#include "confmerge/Policy.hpp"
#include "confmerge/Value.hpp"

#include <cstddef>
#include <string>

namespace confmerge {

/**
 * @brief Merge the keys of `src` into `dst` in place
 *
 * Not transactional: on error `dst` may be partially merged and must be
 * discarded.
 *
 * @param dst Accumulated mapping (modified)
 * @param src Incoming mapping
 * @param context_path Context path of dst ("$" for document roots)
 * @param policy Compiled merge policy
 * @throws TypeMismatchError if a key holds different structural types,
 *         or if either argument is not a mapping
 * @throws DuplicateKeyError if a scalar differs under append policy
 *
 * Example:
 * ```cpp
 * MergePolicy policy;
 * Value dst = {{"list", {1, 2}}, {"a", 1}};
 * merge_mapping(dst, {{"list", {3}}, {"b", 2}}, "$", policy);
 * // dst: {"a": 1, "b": 2, "list": [1, 2, 3]}
 * ```
 */
void merge_mapping(Value& dst, const Value& src, const std::string& context_path,
                   const MergePolicy& policy);

/**
 * @brief Accumulates documents into one merged tree
 *
 * Owns its policy and the accumulated root. Each added document first
 * has its relative paths resolved against its own directory; the first
 * document then becomes the root as-is and later documents are merged
 * into it.
 */
class DocumentMerger {
public:
    explicit DocumentMerger(MergePolicy policy);

    /**
     * @brief Resolve paths in a document and merge it into the root
     * @param document Parsed document (must be a mapping)
     * @param source_dir Directory the document was loaded from; when
     *        empty, path resolution is skipped
     * @throws TypeMismatchError, DuplicateKeyError on conflicts
     */
    void add(Value document, const std::string& source_dir = "");

    /// True until the first document has been added
    bool empty() const noexcept { return documents_ == 0; }

    /// Number of documents added so far
    std::size_t documents() const noexcept { return documents_; }

    /// Policy used for resolution and conflicts
    const MergePolicy& policy() const noexcept { return policy_; }

    /// Accumulated tree (empty mapping before the first document)
    const Value& root() const noexcept { return root_; }

    /// Hand the accumulated tree to the caller and reset
    Value release();

private:
    MergePolicy policy_;
    Value root_ = Value::object();
    std::size_t documents_ = 0;
};

} // namespace confmerge

#endif // CONFMERGE_MERGER_HPP
