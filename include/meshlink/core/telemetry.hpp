#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1 covers per-component counters (operations, reconnects, deliveries,
// dispatch failures). Compiled out entirely unless enabled.
//

#if defined(MESHLINK_ENABLE_TELEMETRY_L1)
    #define ML_TL1(expr) expr
#else
    #define ML_TL1(expr) ((void)0)
#endif
