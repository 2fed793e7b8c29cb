#pragma once

#include <string_view>

#include "meshlink/core/error.hpp"
#include "meshlink/core/policy/device_quirks.hpp"
#include "meshlink/core/policy/failure_codes.hpp"


namespace meshlink::core::policy {

// Loads device classes and classification rules, appending to `out`.
//
//   {
//     "classes": [ { "name": "nrf52", "cache": "invalidate", "requires_bonding": true } ],
//     "rules":   [ { "match": "name", "prefix": "RAK", "class": "nrf52" } ]
//   }
//
// Returns Error::InvalidConfig on malformed JSON, schema violations or rules
// naming an undeclared class. `out` is left untouched on error.
[[nodiscard]]
Error load_device_quirks(std::string_view json, DeviceQuirkTable& out);

// Loads disconnect-code mappings, merging into `out`.
//
//   { "codes": [ { "code": 133, "category": "stale_cache" } ] }
//
// Categories: local_close, stale_cache, lost_connection,
// persistent_stack_fault, unknown.
[[nodiscard]]
Error load_failure_codes(std::string_view json, FailureCodeTable& out);

} // namespace meshlink::core::policy
