#pragma once
/**
 * @file cotlink.h
 * @brief Main include file for CotLink
 *
 * CotLink - Fog-of-war aware Cursor-on-Target output for simulations
 *
 * Include this single header to access all public CotLink APIs.
 */

#include "cotlink/core/types.h"
#include "cotlink/core/log.h"

#include "cotlink/geo/coordinates.h"
#include "cotlink/geo/georeference.h"

#include "cotlink/routing/world_view.h"
#include "cotlink/routing/visibility_router.h"

#include "cotlink/network/transport.h"
#include "cotlink/network/delivery_config.h"
#include "cotlink/network/config_store.h"
#include "cotlink/network/bounded_queue.h"
#include "cotlink/network/broadcaster.h"
#include "cotlink/network/output_service.h"

#include "cotlink/cot/cot_event.h"
#include "cotlink/cot/uid_allocator.h"
#include "cotlink/cot/simulation_hooks.h"
#include "cotlink/cot/cot_emitter.h"

#include "cotlink/context.h"

/**
 * @namespace cotlink
 * @brief Root namespace for all CotLink components
 */
namespace cotlink {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace cotlink
