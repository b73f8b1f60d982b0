#pragma once
/**
 * @file world_view.h
 * @brief Simulation facts consumed by the visibility router
 *
 * The host simulation implements IWorldView to expose ownership, alliance,
 * fog-of-war detection and stealth state. The router only reads through this
 * interface and never mutates simulation state.
 */

#include "cotlink/core/types.h"
#include <optional>
#include <vector>

namespace cotlink::routing {

/**
 * @brief Roster entry for one player of the running match
 */
struct PlayerInfo {
    PlayerId id{INVALID_PLAYER_ID};
    bool playable{true};        ///< Occupies a real slot (not a scripted/neutral player)
    bool spectating{false};     ///< Observer, never contributes vision
    bool non_combatant{false};  ///< Neutral or shared observer player

    /// True if this player may share detection with allies
    bool contributes_vision() const noexcept {
        return playable && !spectating && !non_combatant;
    }
};

/**
 * @brief Read-only view of the simulation used for routing decisions
 */
class IWorldView {
public:
    virtual ~IWorldView() = default;

    /// Owner of an entity, nullopt if the entity is unowned or unknown
    virtual std::optional<PlayerId> owner_of(EntityId entity) const = 0;

    /**
     * @brief Alliance relation between two players
     *
     * Expected to be reflexive (a player is allied with itself).
     */
    virtual bool is_allied(PlayerId a, PlayerId b) const = 0;

    /// Direct (not team-shared) visibility of an entity to one player
    virtual bool can_be_viewed_by(EntityId entity, PlayerId viewer) const = 0;

    /// All players of the match
    virtual const std::vector<PlayerInfo>& players() const = 0;

    /// True if the entity has an active cloak
    virtual bool is_cloaked(EntityId entity) const = 0;

    /// True if any weapon of the entity is aiming this tick
    virtual bool is_aiming(EntityId entity) const = 0;

    /// Locally controlling player, absent in replays and pure spectator sessions
    virtual std::optional<PlayerId> local_player() const = 0;

    /// Player whose view is rendered (observer follow target), may be absent
    virtual std::optional<PlayerId> render_player() const { return std::nullopt; }
};

} // namespace cotlink::routing
