/**
 * @file Parse.cpp
 * @brief Implementation of scalar typing
 */

#include "confmerge/Parse.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>

namespace confmerge {

namespace {
    const std::regex& decimal_int_re() {
        static const std::regex re("^[-+]?[0-9]+$");
        return re;
    }

    const std::regex& float_re() {
        static const std::regex re(
            "^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");
        return re;
    }

    /**
     * @brief Parse an integer in the given base into `out`
     * @return false if the text is not a valid in-range integer
     */
    bool parse_int(const std::string& text, int base, Value& out) {
        try {
            size_t pos = 0;
            long long val = std::stoll(text, &pos, base);
            if (pos != text.size()) {
                return false;
            }
            out = static_cast<int64_t>(val);
            return true;
        } catch (const std::out_of_range&) {
            return false;
        } catch (const std::invalid_argument&) {
            return false;
        }
    }
}

Value parse_scalar(const std::string& str) {
    // S1: Null
    if (str.empty() || str == "~" || str == "null" || str == "Null" || str == "NULL") {
        return nullptr;
    }

    // S2: Boolean
    if (str == "true" || str == "True" || str == "TRUE") {
        return true;
    }
    if (str == "false" || str == "False" || str == "FALSE") {
        return false;
    }

    // S3: Integer
    Value result;
    if (std::regex_match(str, decimal_int_re())) {
        if (parse_int(str, 10, result)) {
            return result;
        }
    }
    // stoll would accept its own sign and whitespace after the prefix
    if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'o') &&
        std::isxdigit(static_cast<unsigned char>(str[2]))) {
        const int base = str[1] == 'x' ? 16 : 8;
        if (parse_int(str.substr(2), base, result)) {
            return result;
        }
    }

    // S4: Float
    if (str == ".inf" || str == ".Inf" || str == ".INF" || str == "+.inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (str == "-.inf" || str == "-.Inf" || str == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if (str == ".nan" || str == ".NaN" || str == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (std::regex_match(str, float_re())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Fall through to string
        }
    }

    // S5: String
    return str;
}

} // namespace confmerge
