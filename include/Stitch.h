#ifndef STITCH_LIBRARY_H
#define STITCH_LIBRARY_H

#include "../src/core.hpp"
#include "../src/network.hpp"

#include "../src/checkpoint/checkpoint.hpp"
#include "../src/config/config.hpp"
#include "../src/data/data.hpp"
#include "../src/inference/inference.hpp"
#include "../src/loss/loss.hpp"
#include "../src/lrscheduler/lrscheduler.hpp"
#include "../src/metric/metric.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/telemetry/telemetry.hpp"
#include "../src/training/training.hpp"
#include "../src/validation/validation.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the API surface downstream applications need: the orchestrator,
//    the sliding-window and flip-ensemble inference path, and the components
//    they are assembled from.
//  - Header-only; every implementation lives under src/<module>/details.

#endif // STITCH_LIBRARY_H
