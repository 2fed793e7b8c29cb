#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "meshlink/core/link/endpoint.hpp"


namespace meshlink::core::policy {

// Whether the platform service cache is invalidated right after link-up
enum class CachePolicy : std::uint8_t {
    Skip,
    Invalidate
};

[[nodiscard]]
inline constexpr std::string_view to_string(CachePolicy p) noexcept {
    switch (p) {
    case CachePolicy::Skip:       return "skip";
    case CachePolicy::Invalidate: return "invalidate";
    default:                      return "unknown";
    }
}

struct DeviceClass {
    std::string name;
    CachePolicy cache{CachePolicy::Skip};
    bool requires_bonding{false};
};

// Maps a device whose name or address starts with `prefix` to `device_class`
struct ClassificationRule {
    enum class Field : std::uint8_t { Name, Address };

    Field field{Field::Name};
    std::string prefix;
    std::string device_class;
};

// -----------------------------------------------------------------------------
// DeviceQuirkTable
// -----------------------------------------------------------------------------
//
// Data-driven per-device-family behavior. Rules are evaluated in insertion
// order; the first match wins. Devices matching no rule use the generic class.
//
class DeviceQuirkTable {
public:
    DeviceQuirkTable() = default;

    [[nodiscard]]
    static DeviceQuirkTable defaults() {
        DeviceQuirkTable table;
        table.add_class({"nrf52", CachePolicy::Invalidate, true});
        table.add_class({"esp32", CachePolicy::Skip, false});
        table.add_rule({ClassificationRule::Field::Name, "RAK", "nrf52"});
        table.add_rule({ClassificationRule::Field::Name, "T-Echo", "nrf52"});
        table.add_rule({ClassificationRule::Field::Name, "T-Beam", "esp32"});
        table.add_rule({ClassificationRule::Field::Name, "Heltec", "esp32"});
        return table;
    }

    // Adds or replaces a class by name
    void add_class(DeviceClass device_class) {
        for (auto& existing : classes_) {
            if (existing.name == device_class.name) {
                existing = std::move(device_class);
                return;
            }
        }
        classes_.push_back(std::move(device_class));
    }

    void add_rule(ClassificationRule rule) {
        rules_.push_back(std::move(rule));
    }

    [[nodiscard]]
    const DeviceClass* find_class(std::string_view name) const noexcept {
        for (const auto& c : classes_) {
            if (c.name == name) {
                return &c;
            }
        }
        return nullptr;
    }

    [[nodiscard]]
    const DeviceClass& classify(const link::Target& target) const noexcept {
        for (const auto& rule : rules_) {
            const std::string& field = (rule.field == ClassificationRule::Field::Name)
                ? target.name : target.address;
            if (!rule.prefix.empty() && std::string_view{field}.starts_with(rule.prefix)) {
                if (const DeviceClass* c = find_class(rule.device_class)) {
                    return *c;
                }
            }
        }
        return generic_;
    }

    [[nodiscard]] std::size_t class_count() const noexcept { return classes_.size(); }
    [[nodiscard]] std::size_t rule_count() const noexcept { return rules_.size(); }

    [[nodiscard]]
    const DeviceClass& generic() const noexcept { return generic_; }

    void clear() noexcept {
        classes_.clear();
        rules_.clear();
    }

private:
    std::vector<DeviceClass> classes_;
    std::vector<ClassificationRule> rules_;
    DeviceClass generic_{"generic", CachePolicy::Skip, false};
};

} // namespace meshlink::core::policy
