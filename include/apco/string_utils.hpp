#pragma once

#include <optional>
#include <string>
#include <vector>

namespace apco {

std::string trim(const std::string& s);
std::string to_upper(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split on runs of spaces/tabs, dropping empty pieces
std::vector<std::string> split_whitespace(const std::string& s);

// Split on single spaces, dropping empty pieces
std::vector<std::string> split_spaces(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Remove one pair of matching surrounding quotes (' or ")
std::string unquote(const std::string& s);

/**
 * Split on unquoted whitespace. Single- and double-quoted spans may contain
 * whitespace; the quote characters are kept in the token. A backslash
 * escapes the next character inside double quotes and outside quotes.
 */
std::vector<std::string> tokenize_quoted(const std::string& s);

/**
 * Parse a bracketed array literal of strings, e.g. ["a", "b"].
 * Returns nullopt when text is not a JSON array or any element is not a
 * string.
 */
std::optional<std::vector<std::string>> parse_string_list(const std::string& text);

} // namespace apco
