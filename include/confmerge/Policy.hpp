/**
 * @file Policy.hpp
 * @brief Path-pattern driven merge policy
 *
 * A MergePolicy answers two questions for a context path:
 * - is_overwrite(): should a conflict at this key be resolved by
 *   replacing the accumulated value (true) or by appending / erroring
 *   (false)?
 * - resolve_path(): are string leaves at this key file-relative paths
 *   that must be joined with their document's directory?
 *
 * Precedence: absolute patterns, then relative patterns, then the
 * configured default. Within each group patterns are ordered
 * lexicographically and the first match wins.
 */

#ifndef CONFMERGE_POLICY_HPP
#define CONFMERGE_POLICY_HPP

#include <string>
#include <vector>

namespace confmerge {

/**
 * @brief Pattern lists a MergePolicy is compiled from
 */
struct PolicyOptions {
    /// Conflict policy when no pattern matches
    bool default_overwrite = false;

    /// Patterns forcing overwrite-on-conflict
    std::vector<std::string> overwrite;

    /// Patterns forcing append (sequences) / equality (scalars)
    std::vector<std::string> append;

    /// Patterns whose string leaves are resolved against the document directory
    std::vector<std::string> resolve_path;
};

/**
 * @brief One compiled policy rule
 */
struct PolicyEntry {
    /// Normalized pattern ("$.a.b" or ".b")
    std::string pattern;

    /// Resolved kind: true = overwrite, false = append
    bool overwrite = false;

    /// Suffix match when true, exact match otherwise
    bool relative = false;

    /**
     * @brief Check whether this entry applies to a context path
     *
     * Absolute entries match by equality; relative entries match when
     * the context path ends with the pattern (leading dot included).
     */
    bool matches(const std::string& context_path) const;
};

/// Ordered rules: absolute before relative, then lexicographic by pattern
using PolicySet = std::vector<PolicyEntry>;

/**
 * @brief Compiled, immutable merge policy
 */
class MergePolicy {
public:
    /**
     * @brief Compile pattern lists into ordered policy sets
     * @throws PolicyConflictError if a normalized pattern is both an
     *         overwrite and an append pattern
     */
    explicit MergePolicy(const PolicyOptions& options = PolicyOptions());

    /**
     * @brief Same as the constructor, for call sites that read better
     *        as a factory
     * @throws PolicyConflictError on conflicting patterns
     */
    static MergePolicy build(const PolicyOptions& options);

    /**
     * @brief Conflict policy for a context path
     * @return Kind of the first matching entry, or the default
     */
    bool is_overwrite(const std::string& context_path) const;

    /**
     * @brief Whether string leaves at a context path are file-relative
     */
    bool resolve_path(const std::string& context_path) const;

    /**
     * @brief First conflict entry matching a context path
     * @return Pointer into the policy set, or nullptr when the default applies
     */
    const PolicyEntry* find_conflict_entry(const std::string& context_path) const;

    const PolicySet& conflict_entries() const noexcept { return conflict_; }
    const PolicySet& resolve_entries() const noexcept { return resolve_; }
    bool default_overwrite() const noexcept { return default_overwrite_; }

private:
    PolicySet conflict_;
    PolicySet resolve_;
    bool default_overwrite_;
};

/**
 * @brief Human-readable policy decisions for one context path
 *
 * Example for "$.storage.files" with append pattern ".files":
 * ```
 * path:      $.storage.files
 * conflict:  append (relative pattern .files)
 * resolve:   no
 * ```
 * When no conflict pattern matches, the conflict line reads
 * "overwrite (default)" or "append (default)".
 */
std::string describe_policy(const MergePolicy& policy, const std::string& context_path);

} // namespace confmerge

#endif // CONFMERGE_POLICY_HPP
