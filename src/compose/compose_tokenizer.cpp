#include "apco/compose_tokenizer.hpp"
#include "apco/string_utils.hpp"

#include <string>

namespace apco {

namespace {

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    return start == std::string::npos ? std::string() : s.substr(start);
}

size_t count_occurrences(const std::string& s, const std::string& needle) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = s.find(needle, pos)) != std::string::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}

ComposeToken grammar_error(const std::string& source, size_t line, const std::string& message) {
    ComposeToken token;
    token.kind = ErrorKind::Grammar;
    token.error = source + ":" + std::to_string(line) + ": " + message;
    return token;
}

} // namespace

bool is_plain_token(const std::string& s) {
    return s.find(' ') == std::string::npos && s.find(": ") == std::string::npos;
}

KeyValueResult split_key_value(const std::string& content) {
    KeyValueResult result;

    if (content.empty()) {
        result.error = "empty key";
        return result;
    }

    if (content.back() == ':') {
        std::string key = content.substr(0, content.size() - 1);
        if (key.empty() || !is_plain_token(key) || key.find(':') != std::string::npos) {
            result.error = "invalid key '" + key + "'";
            return result;
        }
        result.kv.key = key;
        result.ok = true;
        return result;
    }

    if (count_occurrences(content, ": ") != 1) {
        result.error = "expected 'key: value' or 'key:' but got '" + content + "'";
        return result;
    }

    auto sep = content.find(": ");
    std::string key = content.substr(0, sep);
    if (key.empty() || !is_plain_token(key)) {
        result.error = "invalid key '" + key + "'";
        return result;
    }

    std::string value = ltrim(content.substr(sep + 2));
    result.kv.key = key;
    if (!value.empty()) {
        result.kv.value = value;
    }
    result.ok = true;
    return result;
}

std::string normalize_env_value(const std::optional<std::string>& value) {
    if (!value || *value == "null") {
        return "";
    }

    const std::string& v = *value;
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        return "'" + v.substr(1, v.size() - 2) + "'";
    }
    if (v.front() != '\'' && v.back() != '\'') {
        return "'" + v + "'";
    }
    return v;
}

ComposeToken ComposeTokenizer::next() {
    auto line = reader_.next();
    if (!line) {
        ComposeToken end;
        end.ok = true;
        return end;
    }

    const std::string& source = reader_.source_name();
    std::string text = rtrim(line->text);

    size_t indent = text.find_first_not_of(' ');
    if (text[indent] == '\t') {
        return grammar_error(source, line->number, "tab character in indentation");
    }
    if (indent % 2 != 0) {
        return grammar_error(source, line->number,
                             "indentation of " + std::to_string(indent) +
                             " columns is not a multiple of two");
    }

    ComposeEvent event;
    event.line = line->number;
    event.depth = indent / 2;

    std::string content = text.substr(indent);
    if (content == "-" || content.compare(0, 2, "- ") == 0) {
        event.kind = ComposeEventKind::Item;
        event.item = ltrim(content.substr(1));
        if (event.item.empty()) {
            return grammar_error(source, line->number, "empty list item");
        }
    } else {
        auto kv = split_key_value(content);
        if (!kv.ok) {
            return grammar_error(source, line->number, kv.error);
        }
        event.kind = ComposeEventKind::Key;
        event.key = kv.kv.key;
        event.value = kv.kv.value;
    }

    ComposeToken token;
    token.ok = true;
    token.event = std::move(event);
    return token;
}

} // namespace apco
