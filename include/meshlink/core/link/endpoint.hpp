#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace meshlink::core::link {

// Radio service characteristics used by the session
enum class Characteristic : std::uint8_t {
    ToRadio,    // outbound frames
    FromRadio,  // inbound frames, read until empty
    FromNum     // notify-only: new inbound frames are available
};

[[nodiscard]]
inline constexpr std::string_view to_string(Characteristic c) noexcept {
    switch (c) {
    case Characteristic::ToRadio:   return "ToRadio";
    case Characteristic::FromRadio: return "FromRadio";
    case Characteristic::FromNum:   return "FromNum";
    default:                        return "Unknown";
    }
}

// Remote device identity
struct Target {
    std::string address;
    std::string name;
    bool bonded{false};

    bool operator==(const Target&) const = default;
};

} // namespace meshlink::core::link
