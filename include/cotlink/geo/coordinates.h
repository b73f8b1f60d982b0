#pragma once
/**
 * @file coordinates.h
 * @brief Geodetic coordinate transformations
 *
 * Conversions between:
 * - ECEF (Earth-Centered, Earth-Fixed)
 * - LLA (Latitude, Longitude, Altitude - geodetic)
 * - ENU (East-North-Up) local tangent plane
 *
 * All angles are in radians unless otherwise specified.
 * WGS84 ellipsoid model is used for geodetic calculations.
 */

#include "cotlink/core/types.h"

namespace cotlink::geo {

// ============================================================================
// WGS84 Ellipsoid Parameters
// ============================================================================

namespace wgs84 {
    /// Semi-major axis (equatorial radius) in meters
    constexpr Real a = 6378137.0;

    /// Semi-minor axis (polar radius) in meters
    constexpr Real b = 6356752.314245;

    /// Flattening
    constexpr Real f = 1.0 / 298.257223563;

    /// First eccentricity squared
    constexpr Real e2 = 2.0 * f - f * f;

    /// Second eccentricity squared
    constexpr Real ep2 = (a * a - b * b) / (b * b);
}

// ============================================================================
// Geodetic Position (Latitude, Longitude, Altitude)
// ============================================================================

/**
 * @brief Geodetic position in WGS84 coordinates
 */
struct GeodeticPosition {
    Real latitude{0.0};   ///< Geodetic latitude (radians, -PI/2 to PI/2)
    Real longitude{0.0};  ///< Longitude (radians, -PI to PI)
    Real altitude{0.0};   ///< Height above WGS84 ellipsoid (meters)

    constexpr GeodeticPosition() noexcept = default;
    constexpr GeodeticPosition(Real lat, Real lon, Real alt) noexcept
        : latitude(lat), longitude(lon), altitude(alt) {}

    /// Create from degrees
    static GeodeticPosition from_degrees(Real lat_deg, Real lon_deg, Real alt_m) noexcept;

    /// Latitude in degrees
    Real latitude_deg() const noexcept { return latitude * constants::RAD_TO_DEG; }

    /// Longitude in degrees
    Real longitude_deg() const noexcept { return longitude * constants::RAD_TO_DEG; }
};

// ============================================================================
// Coordinate Transformation Functions
// ============================================================================

namespace coord {

/**
 * @brief Convert geodetic (LLA) to ECEF coordinates
 * @param lla Geodetic position (lat/lon in radians, alt in meters)
 * @return ECEF position in meters
 */
Vec3 lla_to_ecef(const GeodeticPosition& lla) noexcept;

/**
 * @brief Convert ECEF to geodetic (LLA) coordinates
 *
 * Uses Bowring's iterative method, converging to sub-millimetre accuracy
 * within a few iterations.
 *
 * @param ecef ECEF position in meters
 * @return Geodetic position
 */
GeodeticPosition ecef_to_lla(const Vec3& ecef) noexcept;

/**
 * @brief Rotate a vector from the ENU frame at @p lla into ECEF axes
 * @param v Vector in ENU frame (East, North, Up)
 * @param lla Reference position for ENU frame
 * @return Vector in ECEF frame
 */
Vec3 enu_to_ecef(const Vec3& v, const GeodeticPosition& lla) noexcept;

/**
 * @brief Convert an ENU offset from a reference point into a geodetic position
 */
GeodeticPosition enu_offset_to_lla(const Vec3& enu, const GeodeticPosition& origin) noexcept;

} // namespace coord

} // namespace cotlink::geo
