#pragma once
/**
 * @file cot_emitter.h
 * @brief Turns simulation entities into routed CoT events
 *
 * For each tracked entity and emission opportunity the emitter asks the
 * VisibilityRouter, and on emit builds a georeferenced CoT event (with any
 * hostile overrides applied) and hands it to the OutputService.
 *
 * Each entity keeps the UID assigned at spawn for its whole lifetime,
 * whether it is currently emitting or suppressed. Suppression sends
 * nothing by default: clients expire the marker by its stale time. With
 * push_stale_on_loss an entity that stops emitting gets one last event
 * with a short stale time instead. A destroyed entity that was emitting
 * always gets a final event whose stale time equals its time, stamped with
 * the last tick time.
 *
 * If nothing configured the output service yet, the first send starts it
 * through ensure_initialized_from() with the configured default host and port.
 *
 * Not thread-safe; drive it from the simulation thread.
 */

#include "cotlink/cot/cot_event.h"
#include "cotlink/cot/simulation_hooks.h"
#include "cotlink/cot/uid_allocator.h"
#include "cotlink/core/log.h"
#include "cotlink/geo/georeference.h"
#include "cotlink/network/output_service.h"
#include "cotlink/routing/visibility_router.h"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace cotlink::cot {

struct EmitterConfig {
    /// Ticks between two emissions of the same entity
    UInt32 emit_interval_ticks{1};

    /// Seconds a regular event stays valid
    Int32 stale_seconds{5};

    /// Send a short-lived final event when an entity stops being reportable
    bool push_stale_on_loss{false};

    /// UID prefix; empty for a random session prefix
    std::string uid_prefix;

    std::string how{"m-g"};

    /// Destination used when output was never configured before the first send
    std::string default_host{"127.0.0.1"};
    UInt16 default_port{network::DEFAULT_UNICAST_PORT};
};

struct EmitterStats {
    UInt64 emitted{0};
    UInt64 suppressed{0};
    UInt64 loss_events{0};
    UInt64 final_events{0};
    UInt64 enqueue_failures{0};
};

class CotEmitter : public ISimulationHooks {
public:
    /**
     * @param georeference May be null; emission stays disabled until one is set
     *
     * router, source and output must outlive the emitter.
     */
    CotEmitter(EmitterConfig config,
               const routing::VisibilityRouter& router,
               const IEntitySource& source,
               network::OutputService& output,
               std::shared_ptr<const geo::Georeference> georeference);

    void set_georeference(std::shared_ptr<const geo::Georeference> georeference);

    void on_spawn(EntityId entity) override;
    void on_health_changed(EntityId entity, Real fraction) override;
    void on_destroyed(EntityId entity) override;
    void on_tick(std::chrono::system_clock::time_point now) override;

    /// UID of a tracked entity
    std::optional<std::string> uid_of(EntityId entity) const;

    /// True if the entity's last decision was to emit
    bool is_emitting(EntityId entity) const;

    SizeT tracked_count() const noexcept { return entities_.size(); }

    const EmitterStats& stats() const noexcept { return stats_; }
    const EmitterConfig& config() const noexcept { return config_; }

private:
    struct Tracked {
        std::string uid;
        UInt32 ticks_since_emit{0};
        bool dirty{true};
        bool was_emitting{false};
        std::optional<Real> health;
        std::optional<CotEvent> last_event;
    };

    void process(EntityId entity, Tracked& tracked, TimePoint now);
    CotEvent build_event(const Tracked& tracked,
                         const EntitySnapshot& snapshot,
                         const routing::VisibilityDecision& decision) const;
    void send(const CotEvent& event);
    void ensure_output();

    EmitterConfig config_;
    const routing::VisibilityRouter& router_;
    const IEntitySource& source_;
    network::OutputService& output_;
    std::shared_ptr<const geo::Georeference> georeference_;

    UidAllocator uids_;
    std::map<EntityId, Tracked> entities_;
    EmitterStats stats_;
    std::optional<TimePoint> last_tick_;
    bool output_checked_{false};
    log::OnceFlag missing_georeference_reported_;
};

} // namespace cotlink::cot
