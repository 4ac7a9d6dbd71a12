#include "confmerge/Util.hpp"
#include <algorithm>
#include <sstream>

namespace confmerge {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        tok = trim(tok);
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

void append_unique(std::vector<std::string>& list, const std::vector<std::string>& extra) {
    for (const auto& item : extra) {
        if (std::find(list.begin(), list.end(), item) == list.end()) {
            list.push_back(item);
        }
    }
}

} // namespace confmerge
