/**
 * @file Merge.cpp
 * @brief Implementation of the multi-document merge operation
 */

#include "confmerge/Merge.hpp"
#include "confmerge/Errors.hpp"
#include "confmerge/Log.hpp"
#include "confmerge/Merger.hpp"
#include "confmerge/Policy.hpp"

namespace confmerge {

Value merge_documents(const MergeOptions& options,
                      const std::vector<std::string>& sources,
                      DocumentLoader& loader) {
    DocumentMerger merger{MergePolicy(options.policy())};

    for (const auto& source : sources) {
        try {
            LoadedDocument loaded = loader.load(source);
            log::logger()->info("merging {} (dir {})", source, loaded.directory);
            Value doc = parse_document(loaded.content, loaded.format, source);
            merger.add(std::move(doc), loaded.directory);
        } catch (const LoadError& e) {
            throw DocumentError(source, e.kind(), "", e.what());
        } catch (const TypeMismatchError& e) {
            throw DocumentError(source, e.kind(), e.path(), e.what());
        } catch (const DuplicateKeyError& e) {
            throw DocumentError(source, e.kind(), e.path(), e.what());
        }
    }

    log::logger()->debug("merged {} documents", merger.documents());
    return merger.release();
}

Value merge_documents(const MergeOptions& options,
                      const std::vector<std::string>& sources) {
    FileLoader loader(options.source_base_directory);
    return merge_documents(options, sources, loader);
}

} // namespace confmerge
