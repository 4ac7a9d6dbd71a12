/**
 * @file Options.cpp
 * @brief Merge options file handling
 */

#include "confmerge/Options.hpp"
#include "confmerge/Errors.hpp"
#include "confmerge/Loader.hpp"
#include "confmerge/Util.hpp"

namespace confmerge {

namespace {

std::vector<std::string> string_list(const Value& val, const std::string& key) {
    std::vector<std::string> out;
    // A single pattern may be given without a list
    if (val.is_string()) {
        out.push_back(val.get<std::string>());
        return out;
    }
    if (!val.is_array()) {
        throw OptionsError("'" + key + "' must be a list of strings, got " + type_name(val));
    }
    for (const auto& item : val) {
        if (!item.is_string()) {
            throw OptionsError("'" + key + "' entries must be strings, got " + type_name(item));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // anonymous namespace

PolicyOptions MergeOptions::policy() const {
    PolicyOptions opts;
    opts.default_overwrite = default_overwrite;
    opts.overwrite = overwrite_patterns;
    opts.append = append_patterns;
    opts.resolve_path = resolve_path_patterns;
    return opts;
}

MergeOptions merge_options_from_value(const Value& data) {
    if (!data.is_object()) {
        throw OptionsError("options document must be a mapping, got " + type_name(data));
    }

    MergeOptions opts;
    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string& key = it.key();
        const Value& val = it.value();

        if (key == "files_dir") {
            if (!val.is_string()) {
                throw OptionsError("'files_dir' must be a string, got " + type_name(val));
            }
            opts.source_base_directory = val.get<std::string>();
        } else if (key == "default_overwrite") {
            if (!val.is_boolean()) {
                throw OptionsError("'default_overwrite' must be a boolean, got " + type_name(val));
            }
            opts.default_overwrite = val.get<bool>();
        } else if (key == "overwrite") {
            opts.overwrite_patterns = string_list(val, key);
        } else if (key == "append") {
            opts.append_patterns = string_list(val, key);
        } else if (key == "resolve_path") {
            opts.resolve_path_patterns = string_list(val, key);
        } else {
            throw OptionsError("unknown key '" + key + "'");
        }
    }
    return opts;
}

void add_pattern_lists(MergeOptions& opts,
                       const std::string& overwrite,
                       const std::string& append,
                       const std::string& resolve_path) {
    append_unique(opts.overwrite_patterns, split(overwrite, ','));
    append_unique(opts.append_patterns, split(append, ','));
    append_unique(opts.resolve_path_patterns, split(resolve_path, ','));
}

MergeOptions load_merge_options(const std::string& path) {
    return merge_options_from_value(load_document_file(path));
}

} // namespace confmerge
