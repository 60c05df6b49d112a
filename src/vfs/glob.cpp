#include "vfs/glob.hpp"

#include <vector>

namespace tvfs::vfs {

namespace {

constexpr std::string_view GLOB_CHARS = "*?[{";
constexpr std::string_view REGEX_SPECIAL = "\\^$.|?+()[]{}";

/// Expand the first top-level {a,b,...} group, recursively.
/// A group without commas or without a closing brace stays literal.
void expand_braces(std::string_view glob, std::vector<std::string>& out) {
    auto open = glob.find('{');
    if (open == std::string_view::npos) {
        out.emplace_back(glob);
        return;
    }

    int depth = 0;
    size_t close = std::string_view::npos;
    std::vector<size_t> commas;
    for (size_t i = open; i < glob.size(); i++) {
        if (glob[i] == '{') {
            depth++;
        } else if (glob[i] == '}') {
            if (--depth == 0) {
                close = i;
                break;
            }
        } else if (glob[i] == ',' && depth == 1) {
            commas.push_back(i);
        }
    }

    if (close == std::string_view::npos || commas.empty()) {
        out.emplace_back(glob);
        return;
    }

    std::string head(glob.substr(0, open));
    std::string_view tail = glob.substr(close + 1);
    commas.push_back(close);

    size_t start = open + 1;
    for (size_t c : commas) {
        std::string alternative = head;
        alternative += glob.substr(start, c - start);
        alternative += tail;
        expand_braces(alternative, out);
        start = c + 1;
    }
}

/// Match a single character class starting at g[0] == '['.
/// Sets consumed to the class length, or 0 if the class is unterminated.
bool match_class(std::string_view g, char c, size_t& consumed) {
    size_t i = 1;
    bool negate = false;
    if (i < g.size() && (g[i] == '!' || g[i] == '^')) {
        negate = true;
        i++;
    }

    bool matched = false;
    bool first = true;
    for (; i < g.size(); i++) {
        if (g[i] == ']' && !first) {
            consumed = i + 1;
            return matched != negate;
        }
        first = false;
        if (i + 2 < g.size() && g[i + 1] == '-' && g[i + 2] != ']') {
            if (c >= g[i] && c <= g[i + 2]) matched = true;
            i += 2;
        } else if (g[i] == c) {
            matched = true;
        }
    }

    consumed = 0;
    return false;
}

bool match_here(std::string_view g, std::string_view p) {
    while (!g.empty()) {
        char c = g.front();

        if (c == '*') {
            bool globstar = g.size() >= 2 && g[1] == '*';
            g.remove_prefix(globstar ? 2 : 1);

            // "a/**/b" also matches "a/b"
            if (globstar && !g.empty() && g.front() == '/' &&
                match_here(g.substr(1), p)) {
                return true;
            }

            for (size_t i = 0; i <= p.size(); i++) {
                if (match_here(g, p.substr(i))) return true;
                if (i < p.size() && !globstar && p[i] == '/') break;
            }
            return false;
        }

        if (p.empty()) return false;

        if (c == '?') {
            if (p.front() == '/') return false;
        } else if (c == '[') {
            size_t consumed = 0;
            bool matched = match_class(g, p.front(), consumed);
            if (consumed == 0) {
                // Unterminated class: '[' is a literal
                if (p.front() != '[') return false;
            } else {
                if (!matched || p.front() == '/') return false;
                g.remove_prefix(consumed);
                p.remove_prefix(1);
                continue;
            }
        } else if (c == '\\' && g.size() > 1) {
            g.remove_prefix(1);
            if (g.front() != p.front()) return false;
        } else if (c != p.front()) {
            return false;
        }

        g.remove_prefix(1);
        p.remove_prefix(1);
    }
    return p.empty();
}

} // namespace

std::string glob_to_pattern(std::string_view path) {
    std::string result;
    result.reserve(path.size() * 2);
    for (char c : path) {
        if (c == '*') {
            result += ".*";
        } else if (REGEX_SPECIAL.find(c) != std::string_view::npos) {
            result += '\\';
            result += c;
        } else {
            result += c; // '/' is literal in ECMAScript patterns
        }
    }
    return result;
}

std::regex directory_pattern(std::string_view path) {
    if (path.empty() || path.back() != '/') {
        return directory_pattern(std::string(path) + "/");
    }
    return std::regex("^" + glob_to_pattern(path) + "[^/]+/?$");
}

bool glob_match(std::string_view glob, std::string_view path) {
    std::vector<std::string> alternatives;
    expand_braces(glob, alternatives);
    for (const auto& alternative : alternatives) {
        if (match_here(alternative, path)) return true;
    }
    return false;
}

bool has_glob(std::string_view path) {
    return path.find_first_of(GLOB_CHARS) != std::string_view::npos;
}

std::string strip_glob_suffix(std::string_view path) {
    return std::string(path.substr(0, path.find_first_of(GLOB_CHARS)));
}

} // namespace tvfs::vfs
