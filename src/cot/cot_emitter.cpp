/**
 * @file cot_emitter.cpp
 * @brief CoT emitter implementation
 */

#include "cotlink/cot/cot_emitter.h"
#include <algorithm>

namespace cotlink::cot {

CotEmitter::CotEmitter(EmitterConfig config,
                       const routing::VisibilityRouter& router,
                       const IEntitySource& source,
                       network::OutputService& output,
                       std::shared_ptr<const geo::Georeference> georeference)
    : config_(std::move(config))
    , router_(router)
    , source_(source)
    , output_(output)
    , georeference_(std::move(georeference))
    , uids_(config_.uid_prefix) {
    if (config_.emit_interval_ticks == 0) {
        config_.emit_interval_ticks = 1;
    }
}

void CotEmitter::set_georeference(std::shared_ptr<const geo::Georeference> georeference) {
    georeference_ = std::move(georeference);
    if (georeference_) {
        missing_georeference_reported_.reset();
    }
}

// ============================================================================
// Lifecycle Hooks
// ============================================================================

void CotEmitter::on_spawn(EntityId entity) {
    if (entities_.count(entity) != 0) {
        return;
    }

    Tracked tracked;
    tracked.uid = uids_.next();
    entities_.emplace(entity, std::move(tracked));
}

void CotEmitter::on_health_changed(EntityId entity, Real fraction) {
    auto it = entities_.find(entity);
    if (it == entities_.end()) {
        return;
    }
    it->second.health = std::clamp(fraction, 0.0, 1.0);
    it->second.dirty = true;
}

void CotEmitter::on_destroyed(EntityId entity) {
    auto it = entities_.find(entity);
    if (it == entities_.end()) {
        return;
    }

    const auto& tracked = it->second;
    if (tracked.was_emitting && tracked.last_event) {
        CotEvent final_event = *tracked.last_event;
        final_event.stamp(last_tick_.value_or(std::chrono::system_clock::now()),
                          std::chrono::milliseconds(0));
        send(final_event);
        stats_.final_events++;
    }

    entities_.erase(it);
}

void CotEmitter::on_tick(std::chrono::system_clock::time_point now) {
    last_tick_ = now;

    if (!georeference_) {
        if (missing_georeference_reported_.first_time()) {
            log::get()->warn("No georeference loaded, CoT emission disabled");
        }
        return;
    }

    for (auto& [entity, tracked] : entities_) {
        process(entity, tracked, now);
    }
}

// ============================================================================
// Emission
// ============================================================================

void CotEmitter::process(EntityId entity, Tracked& tracked, TimePoint now) {
    tracked.ticks_since_emit++;
    if (!tracked.dirty && tracked.ticks_since_emit < config_.emit_interval_ticks) {
        return;
    }

    auto snapshot = source_.snapshot(entity);
    if (!snapshot) {
        return;
    }

    tracked.ticks_since_emit = 0;
    tracked.dirty = false;

    auto decision = router_.should_emit(entity, snapshot->domain);
    if (!decision.emit) {
        stats_.suppressed++;
        if (tracked.was_emitting && config_.push_stale_on_loss && tracked.last_event) {
            CotEvent loss = *tracked.last_event;
            loss.stamp(now, std::chrono::seconds(router_.stale_seconds_on_loss()));
            send(loss);
            stats_.loss_events++;
        }
        tracked.was_emitting = false;
        return;
    }

    CotEvent event = build_event(tracked, *snapshot, decision);
    event.stamp(now, std::chrono::seconds(config_.stale_seconds));
    send(event);
    stats_.emitted++;

    tracked.was_emitting = true;
    tracked.last_event = std::move(event);
}

CotEvent CotEmitter::build_event(const Tracked& tracked,
                                 const EntitySnapshot& snapshot,
                                 const routing::VisibilityDecision& decision) const {
    CotEvent event;
    event.uid = tracked.uid;
    event.how = config_.how;
    event.type = decision.override_type.value_or(snapshot.cot_type);
    event.milsym_id = decision.override_milsym.value_or(snapshot.milsym_id);
    event.callsign = snapshot.callsign.empty() ? tracked.uid : snapshot.callsign;

    auto position = georeference_->cell_to_geodetic(snapshot.cell_x, snapshot.cell_y, snapshot.height_m);
    event.point.lat_deg = position.latitude_deg();
    event.point.lon_deg = position.longitude_deg();
    event.point.hae_m = position.altitude;

    event.speed_mps = snapshot.speed_mps;
    if (snapshot.grid_course_deg) {
        event.course_deg = georeference_->grid_to_true_course(*snapshot.grid_course_deg);
    }
    event.depth_m = snapshot.depth_m;
    event.health = tracked.health;

    return event;
}

void CotEmitter::ensure_output() {
    if (output_checked_) {
        return;
    }
    output_checked_ = true;

    auto result = output_.ensure_initialized_from(config_.default_host, config_.default_port);
    if (result != network::ConfigResult::Success && result != network::ConfigResult::PersistFailed) {
        log::get()->error("Could not start CoT output for {}:{}: {}",
                          config_.default_host, config_.default_port,
                          network::config_result_to_string(result));
    }
}

void CotEmitter::send(const CotEvent& event) {
    ensure_output();
    if (!output_.enqueue(event.to_bytes())) {
        stats_.enqueue_failures++;
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<std::string> CotEmitter::uid_of(EntityId entity) const {
    auto it = entities_.find(entity);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second.uid;
}

bool CotEmitter::is_emitting(EntityId entity) const {
    auto it = entities_.find(entity);
    return it != entities_.end() && it->second.was_emitting;
}

} // namespace cotlink::cot
