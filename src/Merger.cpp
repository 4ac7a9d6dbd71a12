/**
 * @file Merger.cpp
 * @brief Implementation of the policy-driven merge
 */

#include "confmerge/Merger.hpp"
#include "confmerge/ContextPath.hpp"
#include "confmerge/Errors.hpp"
#include "confmerge/Log.hpp"
#include "confmerge/PathResolver.hpp"

#include <utility>

namespace confmerge {

void merge_mapping(Value& dst, const Value& src, const std::string& context_path,
                   const MergePolicy& policy) {
    if (!dst.is_object() || !src.is_object()) {
        throw TypeMismatchError(context_path, type_name(src), type_name(dst));
    }

    for (auto it = src.begin(); it != src.end(); ++it) {
        const std::string& key = it.key();
        const Value& sv = it.value();
        const std::string path = child_path(context_path, key);

        auto found = dst.find(key);
        const bool exists = found != dst.end();

        switch (kind_of(sv)) {
            case NodeKind::Sequence: {
                if (!exists) {
                    dst[key] = sv;
                } else if (!found->is_array()) {
                    throw TypeMismatchError(path, type_name(sv), type_name(*found));
                } else if (policy.is_overwrite(path)) {
                    log::logger()->debug("replace sequence {}", path);
                    *found = sv;
                } else {
                    log::logger()->debug("append {} entries to {}", sv.size(), path);
                    auto& target = found->get_ref<Value::array_t&>();
                    target.insert(target.end(), sv.begin(), sv.end());
                }
                break;
            }

            case NodeKind::Mapping: {
                if (!exists) {
                    Value& child = dst[key];
                    child = Value::object();
                    merge_mapping(child, sv, path, policy);
                } else if (found->is_object()) {
                    merge_mapping(*found, sv, path, policy);
                } else {
                    throw TypeMismatchError(path, type_name(sv), type_name(*found));
                }
                break;
            }

            case NodeKind::Scalar: {
                if (!exists) {
                    dst[key] = sv;
                } else if (*found == sv) {
                    // Equal values merge cleanly under any policy
                } else if (!policy.is_overwrite(path)) {
                    throw DuplicateKeyError(path);
                } else {
                    log::logger()->debug("overwrite {}", path);
                    *found = sv;
                }
                break;
            }
        }
    }
}

DocumentMerger::DocumentMerger(MergePolicy policy)
    : policy_(std::move(policy))
{}

void DocumentMerger::add(Value document, const std::string& source_dir) {
    if (!document.is_object()) {
        throw TypeMismatchError(kRootPath, type_name(document), "mapping");
    }

    if (!source_dir.empty()) {
        resolve_paths(document, source_dir, policy_);
    }

    if (documents_ == 0) {
        root_ = std::move(document);
    } else {
        merge_mapping(root_, document, kRootPath, policy_);
    }
    ++documents_;
}

Value DocumentMerger::release() {
    Value result = std::move(root_);
    root_ = Value::object();
    documents_ = 0;
    return result;
}

} // namespace confmerge
