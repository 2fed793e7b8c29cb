#include "meshlink/core/policy/json_loader.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "meshlink/log/logger.hpp"

#include <simdjson.h>


namespace meshlink::core::policy {

namespace {

// ------------------------------------------------------------
// Field helpers (no logging, no allocation on failure paths)
// ------------------------------------------------------------

[[nodiscard]]
bool require_object(const simdjson::dom::element& e) noexcept {
    return e.type() == simdjson::dom::element_type::OBJECT;
}

[[nodiscard]]
bool parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    if (!require_object(parent)) {
        return false;
    }
    auto field = parent[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

[[nodiscard]]
bool parse_string_required(const simdjson::dom::element& parent, const char* key, std::string_view& out) noexcept {
    auto field = parent[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

// Absent field keeps `out` unchanged
[[nodiscard]]
bool parse_bool_optional(const simdjson::dom::element& parent, const char* key, bool& out) noexcept {
    auto field = parent[key];
    if (field.error()) {
        return true;
    }
    bool value{};
    if (field.get(value)) {
        return false;
    }
    out = value;
    return true;
}

[[nodiscard]]
bool parse_int_required(const simdjson::dom::element& parent, const char* key, std::int64_t& out) noexcept {
    auto field = parent[key];
    if (field.error()) {
        return false;
    }
    return !field.get(out);
}

[[nodiscard]]
bool parse_cache_policy(std::string_view sv, CachePolicy& out) noexcept {
    if (sv == "invalidate") { out = CachePolicy::Invalidate; return true; }
    if (sv == "skip")       { out = CachePolicy::Skip;       return true; }
    return false;
}

[[nodiscard]]
bool parse_match_field(std::string_view sv, ClassificationRule::Field& out) noexcept {
    if (sv == "name")    { out = ClassificationRule::Field::Name;    return true; }
    if (sv == "address") { out = ClassificationRule::Field::Address; return true; }
    return false;
}

[[nodiscard]]
bool parse_category(std::string_view sv, FailureCategory& out) noexcept {
    if (sv == "local_close")            { out = FailureCategory::LocalClose;           return true; }
    if (sv == "stale_cache")            { out = FailureCategory::StaleCache;           return true; }
    if (sv == "lost_connection")        { out = FailureCategory::LostConnection;       return true; }
    if (sv == "persistent_stack_fault") { out = FailureCategory::PersistentStackFault; return true; }
    if (sv == "unknown")                { out = FailureCategory::Unknown;              return true; }
    return false;
}

[[nodiscard]]
bool parse_root(simdjson::dom::parser& parser, std::string_view json, simdjson::dom::element& root) noexcept {
    auto error = parser.parse(json.data(), json.size()).get(root);
    if (error) {
        ML_ERROR("[CONFIG] Invalid JSON: " << simdjson::error_message(error));
        return false;
    }
    if (!require_object(root)) {
        ML_ERROR("[CONFIG] Root must be an object");
        return false;
    }
    return true;
}

} // namespace


Error load_device_quirks(std::string_view json, DeviceQuirkTable& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (!parse_root(parser, json, root)) {
        return Error::InvalidConfig;
    }

    std::vector<DeviceClass> classes;
    std::vector<ClassificationRule> rules;

    simdjson::dom::array class_array;
    if (!parse_array_required(root, "classes", class_array)) {
        ML_ERROR("[CONFIG] Device quirks: missing 'classes' array");
        return Error::InvalidConfig;
    }
    for (simdjson::dom::element entry : class_array) {
        if (!require_object(entry)) {
            ML_ERROR("[CONFIG] Device quirks: class entry must be an object");
            return Error::InvalidConfig;
        }
        std::string_view name;
        std::string_view cache;
        DeviceClass device_class;
        if (!parse_string_required(entry, "name", name) || name.empty()) {
            ML_ERROR("[CONFIG] Device quirks: class without a name");
            return Error::InvalidConfig;
        }
        device_class.name = std::string{name};
        if (!parse_string_required(entry, "cache", cache) || !parse_cache_policy(cache, device_class.cache)) {
            ML_ERROR("[CONFIG] Device quirks: class '" << name << "' has an invalid cache policy");
            return Error::InvalidConfig;
        }
        if (!parse_bool_optional(entry, "requires_bonding", device_class.requires_bonding)) {
            ML_ERROR("[CONFIG] Device quirks: class '" << name << "' has a non-boolean requires_bonding");
            return Error::InvalidConfig;
        }
        classes.push_back(std::move(device_class));
    }

    simdjson::dom::array rule_array;
    if (!parse_array_required(root, "rules", rule_array)) {
        ML_ERROR("[CONFIG] Device quirks: missing 'rules' array");
        return Error::InvalidConfig;
    }
    for (simdjson::dom::element entry : rule_array) {
        if (!require_object(entry)) {
            ML_ERROR("[CONFIG] Device quirks: rule entry must be an object");
            return Error::InvalidConfig;
        }
        std::string_view match;
        std::string_view prefix;
        std::string_view class_name;
        ClassificationRule rule;
        if (!parse_string_required(entry, "match", match) || !parse_match_field(match, rule.field)) {
            ML_ERROR("[CONFIG] Device quirks: rule has an invalid 'match' field");
            return Error::InvalidConfig;
        }
        if (!parse_string_required(entry, "prefix", prefix) || prefix.empty()) {
            ML_ERROR("[CONFIG] Device quirks: rule without a prefix");
            return Error::InvalidConfig;
        }
        if (!parse_string_required(entry, "class", class_name)) {
            ML_ERROR("[CONFIG] Device quirks: rule without a class");
            return Error::InvalidConfig;
        }
        bool declared = out.find_class(class_name) != nullptr;
        for (const auto& c : classes) {
            declared = declared || (c.name == class_name);
        }
        if (!declared) {
            ML_ERROR("[CONFIG] Device quirks: rule references undeclared class '" << class_name << "'");
            return Error::InvalidConfig;
        }
        rule.prefix = std::string{prefix};
        rule.device_class = std::string{class_name};
        rules.push_back(std::move(rule));
    }

    for (auto& c : classes) {
        out.add_class(std::move(c));
    }
    for (auto& r : rules) {
        out.add_rule(std::move(r));
    }
    ML_INFO("[CONFIG] Loaded " << classes.size() << " device classes and " << rules.size() << " rules");
    return Error::None;
}


Error load_failure_codes(std::string_view json, FailureCodeTable& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (!parse_root(parser, json, root)) {
        return Error::InvalidConfig;
    }

    simdjson::dom::array codes;
    if (!parse_array_required(root, "codes", codes)) {
        ML_ERROR("[CONFIG] Failure codes: missing 'codes' array");
        return Error::InvalidConfig;
    }

    std::vector<std::pair<int, FailureCategory>> mappings;
    for (simdjson::dom::element entry : codes) {
        if (!require_object(entry)) {
            ML_ERROR("[CONFIG] Failure codes: entry must be an object");
            return Error::InvalidConfig;
        }
        std::int64_t code{};
        std::string_view category_name;
        FailureCategory category{};
        if (!parse_int_required(entry, "code", code)) {
            ML_ERROR("[CONFIG] Failure codes: entry without an integer 'code'");
            return Error::InvalidConfig;
        }
        if (code < std::numeric_limits<int>::min() || code > std::numeric_limits<int>::max()) {
            ML_ERROR("[CONFIG] Failure codes: code " << code << " is out of range");
            return Error::InvalidConfig;
        }
        if (!parse_string_required(entry, "category", category_name) || !parse_category(category_name, category)) {
            ML_ERROR("[CONFIG] Failure codes: code " << code << " has an invalid category");
            return Error::InvalidConfig;
        }
        mappings.emplace_back(static_cast<int>(code), category);
    }

    for (const auto& [code, category] : mappings) {
        out.map(code, category);
    }
    ML_INFO("[CONFIG] Loaded " << mappings.size() << " failure code mappings");
    return Error::None;
}

} // namespace meshlink::core::policy
