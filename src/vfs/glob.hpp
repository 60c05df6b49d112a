#pragma once

#include <regex>
#include <string>
#include <string_view>

namespace tvfs::vfs {

/// Turn an ls-style glob into ECMAScript regex source: separators become
/// escaped literals, '*' becomes ".*", other metacharacters are escaped.
std::string glob_to_pattern(std::string_view path);

/// Pattern for "exactly one segment below this prefix, with an optional
/// trailing slash". "/kui/docs" -> ^/kui/docs/[^/]+/?$
std::regex directory_pattern(std::string_view path);

/// Shell-style match of a whole path.
/// Supports: * (any chars except /), ? (single char except /),
///           ** (any chars including /), [abc], [a-z], [!0-9], {a,b}
bool glob_match(std::string_view glob, std::string_view path);

/// True if the path contains a glob metacharacter.
bool has_glob(std::string_view path);

/// Trim the path at its first glob metacharacter, yielding the literal
/// prefix used for trie lookup.
std::string strip_glob_suffix(std::string_view path);

} // namespace tvfs::vfs
