#include "apco/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace apco {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "unsupported_key") return Warning::unsupported_key;
    if (lower == "unsupported_section") return Warning::unsupported_section;
    if (lower == "arg_without_default") return Warning::arg_without_default;
    if (lower == "copy_wildcard") return Warning::copy_wildcard;
    if (lower == "copy_source_missing") return Warning::copy_source_missing;
    if (lower == "scratch_base") return Warning::scratch_base;
    if (lower == "ignored_flag") return Warning::ignored_flag;
    if (lower == "unknown_instruction") return Warning::unknown_instruction;
    if (lower == "healthcheck_disabled") return Warning::healthcheck_disabled;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace apco
