#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>


namespace meshlink::core::policy {

// Classification of a platform disconnect code
enum class FailureCategory : std::uint8_t {
    None = 0,
    LocalClose,            // closed on purpose by this side
    StaleCache,            // remote services changed under a cached table
    LostConnection,        // supervision timeout, out of range, remote close
    PersistentStackFault,  // local stack wedged; only an adapter restart helps
    Unknown
};

[[nodiscard]]
inline constexpr std::string_view to_string(FailureCategory c) noexcept {
    switch (c) {
    case FailureCategory::None:                 return "none";
    case FailureCategory::LocalClose:           return "closed locally";
    case FailureCategory::StaleCache:           return "stale service cache";
    case FailureCategory::LostConnection:       return "connection lost";
    case FailureCategory::PersistentStackFault: return "persistent stack fault";
    case FailureCategory::Unknown:              return "unknown failure";
    default:                                    return "invalid";
    }
}

// Recovery applied by the connection lifecycle for a failure category
enum class Recovery : std::uint8_t {
    None,
    ImmediateReconnect,   // refresh the service cache on the next link-up
    BackoffReconnect,
    AdapterRestart
};

[[nodiscard]]
inline constexpr std::string_view to_string(Recovery r) noexcept {
    switch (r) {
    case Recovery::None:               return "None";
    case Recovery::ImmediateReconnect: return "ImmediateReconnect";
    case Recovery::BackoffReconnect:   return "BackoffReconnect";
    case Recovery::AdapterRestart:     return "AdapterRestart";
    default:                           return "Unknown";
    }
}

[[nodiscard]]
inline constexpr Recovery recovery_for(FailureCategory c) noexcept {
    switch (c) {
    case FailureCategory::StaleCache:           return Recovery::ImmediateReconnect;
    case FailureCategory::LostConnection:       return Recovery::BackoffReconnect;
    case FailureCategory::PersistentStackFault: return Recovery::AdapterRestart;
    case FailureCategory::Unknown:              return Recovery::BackoffReconnect;
    default:                                    return Recovery::None;
    }
}

// -----------------------------------------------------------------------------
// FailureCodeTable
// -----------------------------------------------------------------------------
//
// Maps platform disconnect codes to categories. Codes absent from the table
// classify as Unknown.
//
class FailureCodeTable {
public:
    // Android GATT status codes observed from radio firmware links
    [[nodiscard]]
    static FailureCodeTable defaults() {
        FailureCodeTable table;
        table.map(133, FailureCategory::StaleCache);            // GATT_ERROR
        table.map(0,   FailureCategory::LostConnection);
        table.map(8,   FailureCategory::LostConnection);        // supervision timeout
        table.map(19,  FailureCategory::LostConnection);        // terminated by peer
        table.map(22,  FailureCategory::LostConnection);        // terminated by local host
        table.map(129, FailureCategory::PersistentStackFault);  // GATT_INTERNAL_ERROR
        table.map(257, FailureCategory::PersistentStackFault);  // GATT_FAILURE
        return table;
    }

    void map(int code, FailureCategory category) {
        codes_[code] = category;
    }

    [[nodiscard]]
    FailureCategory classify(int code) const noexcept {
        auto it = codes_.find(code);
        return (it == codes_.end()) ? FailureCategory::Unknown : it->second;
    }

    [[nodiscard]]
    std::size_t size() const noexcept { return codes_.size(); }

    void clear() noexcept { codes_.clear(); }

private:
    std::unordered_map<int, FailureCategory> codes_;
};

} // namespace meshlink::core::policy
