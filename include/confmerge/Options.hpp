/**
 * @file Options.hpp
 * @brief Options selecting documents and policies for one merge
 */

#ifndef CONFMERGE_OPTIONS_HPP
#define CONFMERGE_OPTIONS_HPP

#include "confmerge/Policy.hpp"
#include "confmerge/Value.hpp"

#include <string>
#include <vector>

namespace confmerge {

/**
 * @brief Options for merge_documents()
 *
 * Options file keys (JSON, TOML or YAML):
 * ```yaml
 * files_dir: configs
 * default_overwrite: false
 * overwrite: [".local"]
 * append: ["$.storage.files"]
 * resolve_path: [".local"]
 * ```
 */
struct MergeOptions {
    /// Base directory document source identifiers are resolved against
    std::string source_base_directory;

    /// Conflict policy when no pattern matches a context path
    bool default_overwrite = false;

    /// Patterns forcing overwrite-on-conflict
    std::vector<std::string> overwrite_patterns;

    /// Patterns forcing append/concatenate-on-conflict
    std::vector<std::string> append_patterns;

    /// Patterns whose string leaves are rewritten relative to each document
    std::vector<std::string> resolve_path_patterns;

    /**
     * @brief Policy part of the options
     */
    PolicyOptions policy() const;
};

/**
 * @brief Build MergeOptions from an already parsed options document
 * @throws OptionsError for unknown keys or wrongly typed values
 */
MergeOptions merge_options_from_value(const Value& data);

/**
 * @brief Add comma-separated pattern lists to already loaded options
 *
 * Patterns are trimmed, empty entries are dropped and patterns already
 * present are not repeated, so command-line flags extend an options file
 * rather than replace it.
 *
 * Example:
 * ```cpp
 * add_pattern_lists(opts, "$.a, .b", "", ".local");
 * ```
 */
void add_pattern_lists(MergeOptions& opts,
                       const std::string& overwrite,
                       const std::string& append,
                       const std::string& resolve_path);

/**
 * @brief Read MergeOptions from a JSON, TOML or YAML file
 * @throws LoadError if the file cannot be read or parsed
 * @throws OptionsError for unknown keys or wrongly typed values
 */
MergeOptions load_merge_options(const std::string& path);

} // namespace confmerge

#endif // CONFMERGE_OPTIONS_HPP
