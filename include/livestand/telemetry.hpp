#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(LIVESTAND_ENABLE_TELEMETRY_L1)
    #define LS_TL1(expr) expr
#else
    #define LS_TL1(expr) ((void)0)
#endif
