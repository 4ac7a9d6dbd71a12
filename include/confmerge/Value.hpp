/**
 * @file Value.hpp
 * @brief Document tree type for configuration merging
 *
 * Uses nlohmann::json as the underlying value model. Every value is one of:
 * - Mapping  (object: {String: Value, ...})
 * - Sequence (array: [Value, ...])
 * - Scalar   (null, boolean, integer, float, string)
 */

#ifndef CONFMERGE_VALUE_HPP
#define CONFMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace confmerge {

/**
 * @brief Tree value for parsed configuration documents
 *
 * This is an alias for nlohmann::json, a tagged union over the JSON value
 * model. Parsers for every supported source format produce it and the
 * serializers consume it.
 */
using Value = nlohmann::json;

/**
 * @brief Structural shape of a Value, as seen by the merge core
 */
enum class NodeKind {
    Mapping,
    Sequence,
    Scalar
};

/**
 * @brief Classify a value into its structural shape
 * @param val The value to inspect
 * @return Mapping for objects, Sequence for arrays, Scalar otherwise
 */
inline NodeKind kind_of(const Value& val) {
    if (val.is_object()) return NodeKind::Mapping;
    if (val.is_array()) return NodeKind::Sequence;
    return NodeKind::Scalar;
}

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "sequence";
    if (val.is_object()) return "mapping";
    return "unknown";
}

} // namespace confmerge

#endif // CONFMERGE_VALUE_HPP
