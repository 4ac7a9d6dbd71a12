/**
 * @file PathResolver.cpp
 * @brief Implementation of file-relative path rewriting
 */

#include "confmerge/PathResolver.hpp"
#include "confmerge/ContextPath.hpp"
#include "confmerge/Log.hpp"

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace confmerge {

std::string join_path(const std::string& dir, const std::string& path) {
    std::string joined;
    if (dir.empty()) {
        joined = path;
    } else if (path.empty()) {
        joined = dir;
    } else {
        joined = dir + "/" + path;
    }

    if (joined.empty()) {
        return joined;
    }

    std::string cleaned = fs::path(joined).lexically_normal().generic_string();
    while (cleaned.size() > 1 && cleaned.back() == '/') {
        cleaned.pop_back();
    }
    if (cleaned.empty()) {
        return ".";
    }
    return cleaned;
}

namespace {

void resolve_mapping(Value& mapping, const std::string& source_dir,
                     const std::string& context_path, const MergePolicy& policy);

/**
 * @brief Compute the rewritten form of a value
 *
 * Mappings are rewritten in place and never count as rewritten
 * themselves. Returns the replacement for strings and for sequences
 * whose elements were all rewritten.
 */
std::optional<Value> resolve_value(Value& value, const std::string& source_dir,
                                   const std::string& context_path,
                                   const MergePolicy& policy) {
    switch (kind_of(value)) {
        case NodeKind::Mapping:
            resolve_mapping(value, source_dir, context_path, policy);
            return std::nullopt;

        case NodeKind::Sequence: {
            Value updated = Value::array();
            for (auto& element : value) {
                auto resolved = resolve_value(element, source_dir, context_path, policy);
                if (resolved) {
                    updated.push_back(std::move(*resolved));
                }
            }
            if (updated.size() == value.size()) {
                return updated;
            }
            if (!updated.empty()) {
                log::logger()->warn(
                    "sequence at {} only partially resolvable ({} of {} entries), left unchanged",
                    context_path, updated.size(), value.size());
            }
            return std::nullopt;
        }

        case NodeKind::Scalar:
            if (value.is_string() && policy.resolve_path(context_path)) {
                const auto& original = value.get_ref<const std::string&>();
                std::string joined = join_path(source_dir, original);
                log::logger()->debug("update {}: {} -> {}", context_path, original, joined);
                return Value(std::move(joined));
            }
            return std::nullopt;
    }
    return std::nullopt;
}

void resolve_mapping(Value& mapping, const std::string& source_dir,
                     const std::string& context_path, const MergePolicy& policy) {
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        const std::string path = child_path(context_path, it.key());
        auto resolved = resolve_value(it.value(), source_dir, path, policy);
        if (resolved) {
            it.value() = std::move(*resolved);
        }
    }
}

} // anonymous namespace

void resolve_paths(Value& document, const std::string& source_dir,
                   const MergePolicy& policy) {
    if (!document.is_object() || policy.resolve_entries().empty()) {
        return;
    }
    resolve_mapping(document, source_dir, kRootPath, policy);
}

} // namespace confmerge
