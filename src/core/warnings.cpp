#include "apco/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace apco {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// WarningCollector Implementation
// ============================================================================

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = get_effective_action(warning_key);

    // Warnings with action "ignore" are still collected but marked
    warnings_.push_back({warning_key, std::move(fields), action});
}

void WarningCollector::emit_all(const std::vector<WarningObject>& warnings) {
    for (const auto& w : warnings) {
        emit(w.key, w.fields);
    }
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    overrides_[to_lower(warning_key)] = action;

    // Re-evaluate warnings that were already collected
    for (auto& w : warnings_) {
        w.effective_action = get_effective_action(w.key);
    }
}

std::vector<std::string> WarningCollector::apply_env_overrides(
    const std::unordered_map<std::string, std::string>& env) {
    std::vector<std::string> invalid;
    const std::string prefix = kWarningOverridePrefix;

    for (const auto& [name, value] : env) {
        if (name.rfind(prefix, 0) != 0 || name.size() == prefix.size()) {
            continue;
        }
        auto action = parse_warning_action(value);
        if (!action) {
            invalid.push_back(name);
            continue;
        }
        apply_override(name.substr(prefix.size()), *action);
    }

    std::sort(invalid.begin(), invalid.end());
    return invalid;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return true;
        }
    }
    return false;
}

bool WarningCollector::has_effective_warnings() const {
    for (const auto& w : warnings_) {
        if (w.effective_action != WarningAction::Ignore) {
            return true;
        }
    }
    return false;
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = to_lower(key);

    // Check overrides first (highest precedence)
    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    return default_action_;
}

std::string format_warning(const WarningObject& warning) {
    std::string out = "Warning [" + warning.key + "]:";
    std::map<std::string, std::string> sorted(warning.fields.begin(), warning.fields.end());
    for (const auto& [field, value] : sorted) {
        out += " " + field + "=" + value;
    }
    return out;
}

} // namespace apco
