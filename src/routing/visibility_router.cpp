/**
 * @file visibility_router.cpp
 * @brief Visibility routing policy implementation
 */

#include "cotlink/routing/visibility_router.h"
#include <pugixml.hpp>
#include <stdexcept>
#include <utility>

namespace cotlink::routing {

// ============================================================================
// Domain Helpers
// ============================================================================

const char* cot_domain_to_string(CotDomain domain) noexcept {
    switch (domain) {
        case CotDomain::GroundMobile: return "ground_mobile";
        case CotDomain::Building: return "building";
        case CotDomain::Aircraft: return "aircraft";
        case CotDomain::Vessel: return "vessel";
    }
    return "unknown";
}

std::optional<CotDomain> parse_cot_domain(std::string_view name) noexcept {
    if (name == "ground_mobile" || name == "ground") return CotDomain::GroundMobile;
    if (name == "building" || name == "installation") return CotDomain::Building;
    if (name == "aircraft" || name == "air") return CotDomain::Aircraft;
    if (name == "vessel" || name == "sea" || name == "submarine") return CotDomain::Vessel;
    return std::nullopt;
}

const DomainSymbology& HostileSymbologyTable::for_domain(CotDomain domain) const noexcept {
    switch (domain) {
        case CotDomain::GroundMobile: return ground_mobile;
        case CotDomain::Building: return building;
        case CotDomain::Aircraft: return aircraft;
        case CotDomain::Vessel: return vessel;
    }
    // Out-of-range value cast into the enum
    return ground_mobile;
}

DomainSymbology& HostileSymbologyTable::for_domain(CotDomain domain) noexcept {
    return const_cast<DomainSymbology&>(std::as_const(*this).for_domain(domain));
}

// ============================================================================
// Configuration Loading
// ============================================================================

VisibilityRouterConfig VisibilityRouterConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load router config: " + std::string(result.description()));
    }

    auto root = doc.child("cot_router");
    if (!root) {
        throw std::runtime_error("Invalid router config: missing <cot_router> root element");
    }

    VisibilityRouterConfig config = defaults();

    auto read_flag = [&root](const char* name, bool& value) {
        if (auto node = root.child(name)) {
            value = node.text().as_bool(value);
        }
    };

    read_flag("team_sharing", config.team_sharing);
    read_flag("use_generic_milsym", config.use_generic_milsym);
    read_flag("override_type", config.override_type);
    read_flag("friendly_always_emit", config.friendly_always_emit);
    read_flag("stealth_emit_only_when_attacking", config.stealth_emit_only_when_attacking);

    if (auto node = root.child("stale_seconds_when_lost")) {
        config.stale_seconds_when_lost = node.text().as_int(config.stale_seconds_when_lost);
    }

    for (auto node : root.child("hostile_symbology").children("domain")) {
        auto domain = parse_cot_domain(node.attribute("name").as_string());
        if (!domain) {
            throw std::runtime_error("Invalid router config: unknown domain '" +
                                     std::string(node.attribute("name").as_string()) + "'");
        }

        auto& entry = config.hostile_symbology.for_domain(*domain);
        if (auto attr = node.attribute("milsym")) {
            entry.milsym_id = attr.as_string();
        }
        if (auto attr = node.attribute("type")) {
            entry.cot_type = attr.as_string();
        }
    }

    return config;
}

// ============================================================================
// Pure Policy
// ============================================================================

VisibilityDecision evaluate_policy(bool is_friendly,
                                   bool friendly_always_emit,
                                   bool team_detected,
                                   bool use_generic_milsym,
                                   bool override_type_flag,
                                   CotDomain domain,
                                   const HostileSymbologyTable& table) {
    VisibilityDecision decision;

    if (is_friendly && friendly_always_emit) {
        decision.emit = true;
        return decision;
    }

    if (!team_detected) {
        return decision;
    }

    decision.emit = true;

    const auto& entry = table.for_domain(domain);
    if (use_generic_milsym) {
        decision.override_milsym = entry.milsym_id;
    }
    if (override_type_flag) {
        decision.override_type = entry.cot_type;
    }

    return decision;
}

// ============================================================================
// VisibilityRouter Implementation
// ============================================================================

VisibilityRouter::VisibilityRouter(VisibilityRouterConfig config, const IWorldView& world)
    : config_(std::move(config))
    , world_(world) {}

VisibilityDecision VisibilityRouter::should_emit(EntityId entity, CotDomain domain) const {
    auto viewer = world_.local_player();
    if (!viewer) {
        viewer = world_.render_player();
    }
    return should_emit(entity, viewer, domain);
}

VisibilityDecision VisibilityRouter::should_emit(EntityId entity,
                                                 std::optional<PlayerId> viewer,
                                                 CotDomain domain) const {
    auto owner = world_.owner_of(entity);

    if (!viewer) {
        if (no_viewpoint_reported_.first_time()) {
            log::get()->warn("No viewpoint available, hostile entities are suppressed");
        }

        // Friendly only when allied with the local controller, never detected
        auto local = world_.local_player();
        bool allied_with_local = owner && local && world_.is_allied(*owner, *local);
        return evaluate(allied_with_local, false, domain);
    }

    bool is_friendly = owner && (*owner == *viewer || world_.is_allied(*owner, *viewer));
    if (is_friendly && config_.friendly_always_emit) {
        return evaluate(true, true, domain);
    }

    // Cloaked and not attacking: suppress regardless of team detection
    bool stealth_attacking = false;
    if (config_.stealth_emit_only_when_attacking && world_.is_cloaked(entity)) {
        stealth_attacking = world_.is_aiming(entity);
        if (evaluate_stealth_gate(true, stealth_attacking, config_.stealth_emit_only_when_attacking)) {
            return VisibilityDecision::suppress();
        }
    }

    bool detected = is_team_detected(entity, *viewer);

    // An attacking stealth unit is reportable even if nobody sees it yet
    detected |= stealth_attacking;

    return evaluate(is_friendly, detected, domain);
}

bool VisibilityRouter::is_team_detected(EntityId entity, PlayerId viewer) const {
    if (world_.can_be_viewed_by(entity, viewer)) {
        return true;
    }

    if (!config_.team_sharing) {
        return false;
    }

    for (const auto& player : world_.players()) {
        if (player.id == viewer || !player.contributes_vision()) {
            continue;
        }
        if (!world_.is_allied(player.id, viewer)) {
            continue;
        }
        if (world_.can_be_viewed_by(entity, player.id)) {
            return true;
        }
    }

    return false;
}

VisibilityDecision VisibilityRouter::evaluate(bool is_friendly, bool detected, CotDomain domain) const {
    return evaluate_policy(is_friendly,
                           config_.friendly_always_emit,
                           detected,
                           config_.use_generic_milsym,
                           config_.override_type,
                           domain,
                           config_.hostile_symbology);
}

} // namespace cotlink::routing
