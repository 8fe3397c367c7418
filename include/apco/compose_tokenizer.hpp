#pragma once

#include "apco/line_reader.hpp"
#include "apco/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace apco {

// ============================================================================
// Key/value extraction
// ============================================================================

struct KeyValue {
    std::string key;
    std::optional<std::string> value;  // nullopt for a block-opening "key:"
};

struct KeyValueResult {
    bool ok = false;
    std::string error;
    KeyValue kv;
};

/**
 * Split one line's content (indentation already removed) into key and value.
 *
 * "key:" opens a block (no value). Otherwise the content must split on
 * ": " into exactly two parts. Keys may not contain a space or ": ", and
 * block keys may not contain ':' at all. A value that is empty after
 * leading whitespace is dropped.
 */
KeyValueResult split_key_value(const std::string& content);

// True if s contains no space and no ": " sequence
bool is_plain_token(const std::string& s);

/**
 * Normalize an environment value for storage:
 *   missing or "null"         -> ""
 *   "double quoted"           -> 'double quoted'
 *   'single quoted'           -> unchanged
 *   unquoted                  -> 'unquoted'
 */
std::string normalize_env_value(const std::optional<std::string>& value);

// ============================================================================
// Compose events
// ============================================================================

enum class ComposeEventKind {
    Key,   // "key:" or "key: value"
    Item,  // "- item"
};

// One significant line of a compose document
struct ComposeEvent {
    size_t line = 0;
    size_t depth = 0;  // Indentation / 2
    ComposeEventKind kind = ComposeEventKind::Key;
    std::string key;                   // Key events
    std::optional<std::string> value;  // Key events
    std::string item;                  // Item events
};

struct ComposeToken {
    bool ok = false;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::optional<ComposeEvent> event;  // nullopt at end of input
};

/**
 * Turns filtered compose lines into (depth, key, value) events.
 * Indentation must be spaces only, in steps of two columns.
 */
class ComposeTokenizer {
public:
    explicit ComposeTokenizer(LineReader& reader) : reader_(reader) {}

    ComposeToken next();

private:
    LineReader& reader_;
};

} // namespace apco
