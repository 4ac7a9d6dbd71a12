#ifndef CONFMERGE_UTIL_HPP
#define CONFMERGE_UTIL_HPP

#include <string>
#include <vector>

namespace confmerge {

// Trim ASCII whitespace from both ends.
std::string trim(const std::string& s);

// Split on delim, trimming each part and dropping empty parts.
// "a, b,,c" -> ["a", "b", "c"]
std::vector<std::string> split(const std::string& s, char delim);

// Append the items of `extra` not already present in `list`, keeping order.
void append_unique(std::vector<std::string>& list, const std::vector<std::string>& extra);

} // namespace confmerge

#endif // CONFMERGE_UTIL_HPP
