#pragma once

#include "meshlink/core/policy/session_bundle.hpp"

namespace meshlink::core::preset {

// Defaults matching stock radio firmware timing
using SessionDefault = policy::session_bundle<>;

static_assert(policy::SessionBundle<SessionDefault>);

} // namespace meshlink::core::preset
