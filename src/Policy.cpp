/**
 * @file Policy.cpp
 * @brief Implementation of the merge policy matcher
 */

#include "confmerge/Policy.hpp"
#include "confmerge/ContextPath.hpp"
#include "confmerge/Errors.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace confmerge {

namespace {

/**
 * @brief Append a normalized rule, rejecting a conflicting kind
 *
 * Re-declaring a pattern with the same kind is a no-op.
 */
void add_policy(PolicySet& policies, const std::string& raw_pattern, bool overwrite) {
    const std::string pattern = normalize_pattern(raw_pattern);

    auto it = std::find_if(policies.begin(), policies.end(),
                           [&](const PolicyEntry& e) { return e.pattern == pattern; });
    if (it != policies.end()) {
        if (it->overwrite != overwrite) {
            throw PolicyConflictError(pattern);
        }
        return;
    }

    PolicyEntry entry;
    entry.pattern = pattern;
    entry.overwrite = overwrite;
    entry.relative = is_relative_pattern(pattern);
    policies.push_back(std::move(entry));
}

void sort_policies(PolicySet& policies) {
    std::sort(policies.begin(), policies.end(),
              [](const PolicyEntry& a, const PolicyEntry& b) {
                  if (a.relative != b.relative) {
                      return !a.relative;
                  }
                  return a.pattern < b.pattern;
              });
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

bool PolicyEntry::matches(const std::string& context_path) const {
    if (relative) {
        return ends_with(context_path, pattern);
    }
    return pattern == context_path;
}

MergePolicy::MergePolicy(const PolicyOptions& options)
    : default_overwrite_(options.default_overwrite)
{
    for (const auto& pattern : options.overwrite) {
        add_policy(conflict_, pattern, true);
    }
    for (const auto& pattern : options.append) {
        add_policy(conflict_, pattern, false);
    }
    sort_policies(conflict_);

    for (const auto& pattern : options.resolve_path) {
        add_policy(resolve_, pattern, true);
    }
    sort_policies(resolve_);
}

MergePolicy MergePolicy::build(const PolicyOptions& options) {
    return MergePolicy(options);
}

const PolicyEntry* MergePolicy::find_conflict_entry(const std::string& context_path) const {
    for (const auto& entry : conflict_) {
        if (entry.matches(context_path)) {
            return &entry;
        }
    }
    return nullptr;
}

bool MergePolicy::is_overwrite(const std::string& context_path) const {
    const PolicyEntry* entry = find_conflict_entry(context_path);
    return entry != nullptr ? entry->overwrite : default_overwrite_;
}

bool MergePolicy::resolve_path(const std::string& context_path) const {
    return std::any_of(resolve_.begin(), resolve_.end(),
                       [&](const PolicyEntry& e) { return e.matches(context_path); });
}

std::string describe_policy(const MergePolicy& policy, const std::string& context_path) {
    std::ostringstream oss;
    oss << "path:      " << context_path << "\n";

    const PolicyEntry* entry = policy.find_conflict_entry(context_path);
    if (entry != nullptr) {
        oss << "conflict:  " << (entry->overwrite ? "overwrite" : "append")
            << " (" << (entry->relative ? "relative" : "absolute")
            << " pattern " << entry->pattern << ")\n";
    } else {
        oss << "conflict:  " << (policy.default_overwrite() ? "overwrite" : "append")
            << " (default)\n";
    }

    oss << "resolve:   " << (policy.resolve_path(context_path) ? "yes" : "no") << "\n";
    return oss.str();
}

} // namespace confmerge
