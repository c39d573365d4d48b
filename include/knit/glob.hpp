#pragma once

#include <string>
#include <vector>

namespace knit {

// Match a glob pattern against a whole path. Backslashes are treated as '/'.
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// True if the pattern matches the whole path or its last component.
// "node_modules" therefore excludes ".../pkg/node_modules".
bool glob_match_path_or_name(const std::string& pattern, const std::string& path);

// True if any pattern matches according to glob_match_path_or_name.
bool glob_match_any(const std::vector<std::string>& patterns, const std::string& path);

} // namespace knit
