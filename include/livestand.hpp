#pragma once

/*
===============================================================================
Livestand — Public API Entry Point
===============================================================================

Live tournament standing pipeline:

  transport → ConnectionManager → DispatchQueue → MatchStateTracker
            → SnapshotReconciler → renderer sink

livestand::Pipeline<WS> is the intended integration surface. The individual
stages are public as well, so a host can drive them without a network
connection (replay, tests).

The Boost.Beast transport is declared in livestand/transport/beast and the
WinHTTP transport (Windows only) in livestand/transport/winhttp. Neither is
included here.
===============================================================================
*/

#include <livestand/config.hpp>
#include <livestand/connection/manager.hpp>
#include <livestand/dispatch/queue.hpp>
#include <livestand/match/state_tracker.hpp>
#include <livestand/reconcile/reconciler.hpp>
#include <livestand/pipeline.hpp>
