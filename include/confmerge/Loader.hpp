/**
 * @file Loader.hpp
 * @brief Document loading and parsing
 *
 * Documents come from a DocumentLoader, which returns raw text plus the
 * directory component of the document's identifier. parse_document()
 * turns that text into a Value:
 * - JSON (using nlohmann::json)
 * - TOML (using toml++)
 * - YAML (using yaml-cpp, plain scalars typed by parse_scalar())
 */

#ifndef CONFMERGE_LOADER_HPP
#define CONFMERGE_LOADER_HPP

#include "confmerge/Value.hpp"
#include <string>

namespace confmerge {

/**
 * @brief Supported document text formats
 */
enum class Format {
    Json,
    Toml,
    Yaml
};

/**
 * @brief Get format name ("json", "toml", "yaml")
 */
const char* format_name(Format format);

/**
 * @brief Parse a format name (case-insensitive "json", "toml", "yaml", "yml")
 * @throws OptionsError for unknown names
 */
Format format_from_name(const std::string& name);

/**
 * @brief Detect format by file extension
 *
 * .json → Json, .toml → Toml, .yaml / .yml → Yaml (case-insensitive)
 *
 * @throws UnsupportedFormatError for any other extension
 */
Format format_from_path(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".yaml"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Raw document as returned by a DocumentLoader
 */
struct LoadedDocument {
    /// Identifier the document was requested with
    std::string source;

    /// Directory component of the identifier ("." when it has none)
    std::string directory;

    /// Raw document text
    std::string content;

    /// Text format of content
    Format format = Format::Yaml;
};

/**
 * @brief Source of raw documents
 */
class DocumentLoader {
public:
    virtual ~DocumentLoader() = default;

    /**
     * @brief Load a document by identifier
     * @throws LoadError (or a subclass) if the document cannot be read
     */
    virtual LoadedDocument load(const std::string& source) = 0;
};

/**
 * @brief Loads documents from files under a base directory
 *
 * The identifier "host-dir/input.yaml" with base "configs" reads
 * "configs/host-dir/input.yaml" and reports directory "host-dir":
 * the directory is relative to the base, never including it.
 */
class FileLoader : public DocumentLoader {
public:
    explicit FileLoader(std::string base_directory = "");

    LoadedDocument load(const std::string& source) override;

    const std::string& base_directory() const noexcept { return base_directory_; }

private:
    std::string base_directory_;
};

/**
 * @brief Parse document text into a Value
 *
 * An empty or null YAML document parses to an empty mapping.
 *
 * @param content Document text
 * @param format Text format
 * @param source Identifier used in error messages
 * @return Parsed Value
 * @throws ParseError if the text is not valid in the given format
 */
Value parse_document(const std::string& content, Format format,
                     const std::string& source = "<memory>");

/**
 * @brief Read and parse one file, format chosen by extension
 * @throws FileNotFoundError, UnsupportedFormatError, ParseError
 */
Value load_document_file(const std::string& path);

} // namespace confmerge

#endif // CONFMERGE_LOADER_HPP
