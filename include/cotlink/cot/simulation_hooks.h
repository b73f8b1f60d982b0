#pragma once
/**
 * @file simulation_hooks.h
 * @brief Simulation callbacks and entity data consumed by CoT emitters
 *
 * The host simulation forwards its own lifecycle events to an
 * ISimulationHooks implementation; how they are dispatched is up to the
 * host. All methods are called from the simulation thread.
 */

#include "cotlink/core/types.h"
#include "cotlink/routing/visibility_router.h"
#include <chrono>
#include <optional>
#include <string>

namespace cotlink::cot {

/**
 * @brief Entity lifecycle observer
 *
 * Override only the callbacks of interest; defaults do nothing.
 */
class ISimulationHooks {
public:
    virtual ~ISimulationHooks() = default;

    /// Entity entered the world
    virtual void on_spawn(EntityId /*entity*/) {}

    /// Health changed; fraction is remaining health in [0, 1]
    virtual void on_health_changed(EntityId /*entity*/, Real /*fraction*/) {}

    /// Entity left the world for good
    virtual void on_destroyed(EntityId /*entity*/) {}

    /// One simulation step completed
    virtual void on_tick(std::chrono::system_clock::time_point /*now*/) {}
};

/**
 * @brief Reportable state of one entity at the current tick
 */
struct EntitySnapshot {
    EntityId id{INVALID_ENTITY_ID};
    std::string callsign;
    std::string cot_type;        ///< Native CoT type (as seen by its own side)
    std::string milsym_id;       ///< Native MIL-STD-2525C identifier
    routing::CotDomain domain{routing::CotDomain::GroundMobile};

    Real cell_x{0.0};
    Real cell_y{0.0};
    Real height_m{0.0};          ///< Above origin ground level

    std::optional<Real> speed_mps;
    std::optional<Real> grid_course_deg;  ///< Clockwise from grid north
    std::optional<Real> depth_m;
};

/**
 * @brief Source of entity snapshots
 */
class IEntitySource {
public:
    virtual ~IEntitySource() = default;

    /// Current snapshot, nullopt if the entity is unknown
    virtual std::optional<EntitySnapshot> snapshot(EntityId entity) const = 0;
};

} // namespace cotlink::cot
