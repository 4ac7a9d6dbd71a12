/**
 * @file Parse.hpp
 * @brief Typing of untyped scalar text
 *
 * YAML hands plain (unquoted) scalars over as text. parse_scalar() gives
 * them a type following the YAML 1.2 core schema, first match wins:
 * - S1: Null ("null", "Null", "NULL", "~", "")
 * - S2: Boolean ("true"/"false" in lower, title or upper case)
 * - S3: Integer (decimal, "0x" hex, "0o" octal, optional sign)
 * - S4: Float (decimal with fraction and/or exponent, ".inf", ".nan")
 * - S5: String (fallback)
 */

#ifndef CONFMERGE_PARSE_HPP
#define CONFMERGE_PARSE_HPP

#include "confmerge/Value.hpp"
#include <string>

namespace confmerge {

/**
 * @brief Parse plain scalar text to a typed Value
 *
 * Examples:
 * ```cpp
 * parse_scalar("true")     // → true (boolean)
 * parse_scalar("~")        // → null
 * parse_scalar("42")       // → 42 (integer)
 * parse_scalar("0x1F")     // → 31 (integer)
 * parse_scalar("0o644")    // → 420 (integer)
 * parse_scalar("-2.5e10")  // → -2.5e10 (float)
 * parse_scalar("foo.ign")  // → "foo.ign" (string)
 * parse_scalar("yes")      // → "yes" (string, YAML 1.1 booleans are not special)
 * ```
 */
Value parse_scalar(const std::string& str);

} // namespace confmerge

#endif // CONFMERGE_PARSE_HPP
