#pragma once
/**
 * @file cot_event.h
 * @brief Cursor-on-Target event record and XML serialization
 */

#include "cotlink/core/types.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cotlink::cot {

using TimePoint = std::chrono::system_clock::time_point;

/// CE/LE value meaning "unknown error"
constexpr Real UNKNOWN_ERROR = 9999999.0;

/**
 * @brief Event position
 */
struct CotPoint {
    Real lat_deg{0.0};
    Real lon_deg{0.0};
    Real hae_m{0.0};             ///< Height above WGS84 ellipsoid
    Real ce_m{UNKNOWN_ERROR};    ///< Circular error
    Real le_m{UNKNOWN_ERROR};    ///< Linear error
};

/**
 * @brief One CoT event as sent on the wire
 */
struct CotEvent {
    std::string uid;
    std::string type;             ///< e.g. "a-f-G-U-C"
    std::string how{"m-g"};
    TimePoint time;
    TimePoint start;
    TimePoint stale;
    CotPoint point;

    std::string callsign;
    std::string milsym_id;        ///< MIL-STD-2525C identifier, omitted if empty

    std::optional<Real> speed_mps;
    std::optional<Real> course_deg;   ///< True course, degrees clockwise from north
    std::optional<Real> depth_m;      ///< Vessels below the surface
    std::optional<Real> health;       ///< Remaining health fraction [0, 1]

    /**
     * @brief Set time and start to now, stale to now + stale_after
     */
    void stamp(TimePoint now, std::chrono::milliseconds stale_after) {
        time = now;
        start = now;
        stale = now + stale_after;
    }

    /**
     * @brief Serialize as a complete XML document with declaration
     */
    std::string to_xml() const;

    /// Serialized bytes for a datagram
    std::vector<UInt8> to_bytes() const;
};

/**
 * @brief Format a UTC timestamp as YYYY-MM-DDTHH:MM:SS.mmmZ
 */
std::string format_cot_time(TimePoint time);

} // namespace cotlink::cot
