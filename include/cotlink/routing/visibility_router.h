#pragma once
/**
 * @file visibility_router.h
 * @brief Fog-of-war aware routing policy for CoT emission
 *
 * Decides, for one entity and one viewpoint, whether a CoT event may be
 * emitted and whether its symbology must be replaced by a generic hostile
 * representation so that the feed never reveals more than the viewpoint's
 * team has detected.
 *
 * The decision is split into two pure primitives that take only booleans,
 * the domain and the configuration:
 * - evaluate_policy(): friendly / detected / override tables
 * - evaluate_stealth_gate(): cloaked units that are not attacking
 *
 * VisibilityRouter::should_emit() gathers the facts from an IWorldView and
 * combines the two. The router holds no per-entity state.
 *
 * Usage:
 * @code
 * VisibilityRouter router(VisibilityRouterConfig::defaults(), world);
 * auto decision = router.should_emit(entity, CotDomain::Aircraft);
 * if (decision.emit) {
 *     event.type = decision.override_type.value_or(native_type);
 *     event.milsym_id = decision.override_milsym.value_or(native_milsym);
 * }
 * @endcode
 */

#include "cotlink/core/types.h"
#include "cotlink/core/log.h"
#include "cotlink/routing/world_view.h"
#include <optional>
#include <string>
#include <string_view>

namespace cotlink::routing {

// ============================================================================
// Domain
// ============================================================================

/**
 * @brief Platform category of a reporting entity
 */
enum class CotDomain : UInt8 {
    GroundMobile = 0,
    Building,
    Aircraft,
    Vessel
};

/**
 * @brief Convert CotDomain to string
 */
const char* cot_domain_to_string(CotDomain domain) noexcept;

/**
 * @brief Parse a domain name ("ground_mobile", "building", "aircraft", "vessel")
 */
std::optional<CotDomain> parse_cot_domain(std::string_view name) noexcept;

// ============================================================================
// Hostile Symbology Tables
// ============================================================================

/**
 * @brief Generic hostile symbology for one domain
 */
struct DomainSymbology {
    std::string milsym_id;  ///< MIL-STD-2525C symbol identifier
    std::string cot_type;   ///< CoT event type
};

/**
 * @brief Per-domain generic hostile symbology
 */
struct HostileSymbologyTable {
    DomainSymbology ground_mobile{"SHGP-----------", "a-h-G"};
    DomainSymbology building{"SHGPI-----H----", "a-h-G-I"};
    DomainSymbology aircraft{"SHAP-----------", "a-h-A"};
    DomainSymbology vessel{"SHUP-----------", "a-h-U"};

    /**
     * @brief Entry for a domain
     *
     * Values outside the enumeration fall back to the ground mobile entry.
     */
    const DomainSymbology& for_domain(CotDomain domain) const noexcept;

    /// Mutable access, used by the configuration loader
    DomainSymbology& for_domain(CotDomain domain) noexcept;
};

// ============================================================================
// Router Configuration
// ============================================================================

/**
 * @brief Visibility routing configuration
 */
struct VisibilityRouterConfig {
    /// Union allied detection when deciding hostile visibility
    bool team_sharing{true};

    /// Hostiles use a generic MIL-STD-2525C identifier by domain
    bool use_generic_milsym{true};

    /// Hostiles also get a generic CoT type by domain
    bool override_type{true};

    /// Always emit friendly (self + allies) entities regardless of fog-of-war
    bool friendly_always_emit{true};

    /// Cloaked entities only emit while attacking
    bool stealth_emit_only_when_attacking{true};

    /// Seconds a hostile marker should remain after detection is lost
    Int32 stale_seconds_when_lost{1};

    /// Generic hostile symbology
    HostileSymbologyTable hostile_symbology;

    /// Effective stale time for a final event after detection loss (at least 1 s)
    Int32 stale_seconds_on_loss() const noexcept {
        return stale_seconds_when_lost < 1 ? 1 : stale_seconds_when_lost;
    }

    /// Default configuration
    static VisibilityRouterConfig defaults() noexcept {
        return VisibilityRouterConfig{};
    }

    /**
     * @brief Load configuration from XML file
     *
     * Elements that are absent keep their default value.
     * @throws std::runtime_error if the file cannot be parsed
     */
    static VisibilityRouterConfig load(const std::string& path);
};

// ============================================================================
// Decision
// ============================================================================

/**
 * @brief Result of a routing decision
 */
struct VisibilityDecision {
    bool emit{false};
    std::optional<std::string> override_type;
    std::optional<std::string> override_milsym;

    static VisibilityDecision suppress() { return VisibilityDecision{}; }
};

// ============================================================================
// Pure Primitives
// ============================================================================

/**
 * @brief Evaluate the routing policy from plain facts
 *
 * @param is_friendly Entity owned by the viewpoint or one of its allies
 * @param friendly_always_emit Friendly entities bypass detection
 * @param team_detected Detected by the viewpoint (or its team, when sharing)
 * @param use_generic_milsym Apply the generic hostile symbol
 * @param override_type_flag Apply the generic hostile CoT type
 * @param domain Domain used to select the table entry
 * @param table Hostile symbology
 */
VisibilityDecision evaluate_policy(bool is_friendly,
                                   bool friendly_always_emit,
                                   bool team_detected,
                                   bool use_generic_milsym,
                                   bool override_type_flag,
                                   CotDomain domain,
                                   const HostileSymbologyTable& table);

/**
 * @brief Stealth gate
 * @return True if the entity must be suppressed (cloaked, flag on, not aiming)
 */
constexpr bool evaluate_stealth_gate(bool cloak_active,
                                     bool any_weapon_aiming,
                                     bool stealth_emit_only_when_attacking) noexcept {
    if (!stealth_emit_only_when_attacking) {
        return false;
    }
    if (!cloak_active) {
        return false;
    }
    return !any_weapon_aiming;
}

// ============================================================================
// Visibility Router
// ============================================================================

/**
 * @brief Adapter between the simulation and the routing primitives
 *
 * The referenced IWorldView must outlive the router.
 */
class VisibilityRouter {
public:
    VisibilityRouter(VisibilityRouterConfig config, const IWorldView& world);

    /**
     * @brief Decide for the default viewpoint
     *
     * The local controlling player is preferred, then the render player, so
     * observer or debug render contexts never widen what is reported.
     */
    VisibilityDecision should_emit(EntityId entity, CotDomain domain) const;

    /**
     * @brief Decide for an explicit viewpoint (nullopt = no viewpoint)
     */
    VisibilityDecision should_emit(EntityId entity,
                                   std::optional<PlayerId> viewer,
                                   CotDomain domain) const;

    /**
     * @brief Team-union detection of an entity for a viewer
     *
     * Direct detection first; when team sharing is enabled, any allied
     * playable, non-spectating, combatant player that detects the entity.
     */
    bool is_team_detected(EntityId entity, PlayerId viewer) const;

    const VisibilityRouterConfig& config() const noexcept { return config_; }

    Int32 stale_seconds_on_loss() const noexcept { return config_.stale_seconds_on_loss(); }

private:
    VisibilityDecision evaluate(bool is_friendly, bool detected, CotDomain domain) const;

    VisibilityRouterConfig config_;
    const IWorldView& world_;
    mutable log::OnceFlag no_viewpoint_reported_;
};

} // namespace cotlink::routing
