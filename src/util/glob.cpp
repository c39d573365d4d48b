#include <knit/glob.hpp>

namespace knit {

// ---- Helpers ----

static std::vector<std::string> to_segments(const std::string& p) {
    std::vector<std::string> segs;
    std::string cur;
    bool leading = true;
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/') {
            // Keep a single empty leading segment for absolute paths
            if (!cur.empty() || (leading && segs.empty())) segs.push_back(cur);
            cur.clear();
            leading = false;
            continue;
        }
        leading = false;
        cur.push_back(c);
    }
    if (!cur.empty()) segs.push_back(cur);
    return segs;
}

// Matches one character class starting at pat[pi] == '['. Advances pi past ']'.
static bool match_class(const std::string& pat, size_t& pi, char c) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pat.size() && (pat[i] == '!' || pat[i] == '^')) {
        negate = true;
        ++i;
    }
    bool matched = false;
    bool first = true;
    while (i < pat.size() && (first || pat[i] != ']')) {
        first = false;
        char lo = pat[i];
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            if (c >= lo && c <= pat[i + 2]) matched = true;
            i += 3;
        } else {
            if (c == lo) matched = true;
            ++i;
        }
    }
    if (i >= pat.size()) {
        // Unterminated class: '[' is a literal
        if (c != '[') return false;
        ++pi;
        return true;
    }
    pi = i + 1;
    return matched != negate;
}

// Single segment match with backtracking over the last '*'.
static bool match_segment(const std::string& pat, const std::string& str) {
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < str.size()) {
        if (pi < pat.size() && pat[pi] == '*') {
            star_pi = ++pi;
            star_si = si;
            continue;
        }
        if (pi < pat.size()) {
            size_t next = pi;
            bool ok = false;
            if (pat[pi] == '?') {
                ok = true;
                next = pi + 1;
            } else if (pat[pi] == '[') {
                ok = match_class(pat, next, str[si]);
            } else {
                ok = pat[pi] == str[si];
                next = pi + 1;
            }
            if (ok) {
                pi = next;
                ++si;
                continue;
            }
        }
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        si = ++star_si;
    }

    while (pi < pat.size() && pat[pi] == '*') ++pi;
    return pi == pat.size();
}

static bool match_from(const std::vector<std::string>& pat, size_t pi,
                       const std::vector<std::string>& path, size_t si) {
    for (; pi < pat.size(); ++pi, ++si) {
        if (pat[pi] == "**") {
            while (pi + 1 < pat.size() && pat[pi + 1] == "**") ++pi;
            if (pi + 1 == pat.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_from(pat, pi + 1, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size()) return false;
        if (!match_segment(pat[pi], path[si])) return false;
    }
    return si == path.size();
}

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_from(to_segments(pattern), 0, to_segments(path), 0);
}

bool glob_match_path_or_name(const std::string& pattern, const std::string& path) {
    if (glob_match(pattern, path)) return true;

    auto segs = to_segments(path);
    if (segs.empty()) return false;
    return glob_match(pattern, segs.back());
}

bool glob_match_any(const std::vector<std::string>& patterns, const std::string& path) {
    for (const auto& p : patterns) {
        if (glob_match_path_or_name(p, path)) return true;
    }
    return false;
}

} // namespace knit
