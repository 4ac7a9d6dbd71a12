/**
 * @file Serialize.hpp
 * @brief Serialization of merged documents back to text
 */

#ifndef CONFMERGE_SERIALIZE_HPP
#define CONFMERGE_SERIALIZE_HPP

#include "confmerge/Loader.hpp"
#include "confmerge/Value.hpp"

#include <string>

namespace confmerge {

/**
 * @brief Serialize a document tree
 *
 * - JSON: nlohmann::json dump with the given indent
 * - TOML: toml++ table; TOML has no null, so nulls become ""; a non-mapping
 *   root is wrapped under the key "value"
 * - YAML: yaml-cpp block style; strings that would read back as another
 *   type ("true", "42", "~") are double-quoted
 *
 * @param doc Document to serialize
 * @param format Output format
 * @param indent Indentation width (JSON and YAML)
 * @return Serialized text, newline terminated
 */
std::string dump_document(const Value& doc, Format format, int indent = 2);

/**
 * @brief Serialize and write to a file
 * @throws std::runtime_error if the file cannot be opened
 */
void write_document_file(const std::string& path, const Value& doc, Format format);

} // namespace confmerge

#endif // CONFMERGE_SERIALIZE_HPP
