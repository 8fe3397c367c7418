#include "apco/string_utils.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace apco {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::vector<std::string> split_spaces(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(' ', start);
        if (end == std::string::npos) end = s.size();
        if (end > start) {
            parts.push_back(s.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::vector<std::string> tokenize_quoted(const std::string& s) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    char quote = 0;

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];

        if (quote != 0) {
            current += c;
            if (c == '\\' && quote == '"' && i + 1 < s.size()) {
                current += s[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }

        if (c == ' ' || c == '\t') {
            if (in_token) {
                tokens.push_back(current);
                current.clear();
                in_token = false;
            }
            continue;
        }

        in_token = true;
        current += c;
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '\\' && i + 1 < s.size() && s[i + 1] != ' ' && s[i + 1] != '\t') {
            current += s[++i];
        }
    }

    if (in_token) {
        tokens.push_back(current);
    }
    return tokens;
}

std::optional<std::vector<std::string>> parse_string_list(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty() || trimmed.front() != '[') {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(trimmed, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        return std::nullopt;
    }

    std::vector<std::string> items;
    for (const auto& elem : j) {
        if (!elem.is_string()) {
            return std::nullopt;
        }
        items.push_back(elem.get<std::string>());
    }
    return items;
}

} // namespace apco
