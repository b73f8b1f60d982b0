/**
 * @file coordinates.cpp
 * @brief Coordinate transformation implementations
 */

#include "cotlink/geo/coordinates.h"
#include <cmath>

namespace cotlink {

Real Vec3::length() const noexcept {
    return std::sqrt(length_squared());
}

namespace geo {

// ============================================================================
// GeodeticPosition Implementation
// ============================================================================

GeodeticPosition GeodeticPosition::from_degrees(Real lat_deg, Real lon_deg, Real alt_m) noexcept {
    return {
        lat_deg * constants::DEG_TO_RAD,
        lon_deg * constants::DEG_TO_RAD,
        alt_m
    };
}

// ============================================================================
// ECEF <-> Geodetic Conversions
// ============================================================================

namespace coord {

Vec3 lla_to_ecef(const GeodeticPosition& lla) noexcept {
    Real sin_lat = std::sin(lla.latitude);
    Real cos_lat = std::cos(lla.latitude);
    Real sin_lon = std::sin(lla.longitude);
    Real cos_lon = std::cos(lla.longitude);

    // Radius of curvature in prime vertical
    Real N = wgs84::a / std::sqrt(1.0 - wgs84::e2 * sin_lat * sin_lat);

    Real x = (N + lla.altitude) * cos_lat * cos_lon;
    Real y = (N + lla.altitude) * cos_lat * sin_lon;
    Real z = (N * (1.0 - wgs84::e2) + lla.altitude) * sin_lat;

    return {x, y, z};
}

GeodeticPosition ecef_to_lla(const Vec3& ecef) noexcept {
    Real x = ecef.x;
    Real y = ecef.y;
    Real z = ecef.z;

    Real lon = std::atan2(y, x);

    // Distance from Z-axis
    Real p = std::sqrt(x * x + y * y);

    // Handle pole case
    if (p < 1e-10) {
        Real lat = (z >= 0.0) ? constants::PI / 2.0 : -constants::PI / 2.0;
        Real alt = std::abs(z) - wgs84::b;
        return {lat, lon, alt};
    }

    // Initial latitude estimate using Bowring's formula
    Real theta = std::atan2(z * wgs84::a, p * wgs84::b);
    Real sin_theta = std::sin(theta);
    Real cos_theta = std::cos(theta);

    Real lat = std::atan2(
        z + wgs84::ep2 * wgs84::b * sin_theta * sin_theta * sin_theta,
        p - wgs84::e2 * wgs84::a * cos_theta * cos_theta * cos_theta
    );

    // Usually converges in 2-3 iterations
    for (int i = 0; i < 5; ++i) {
        Real sin_lat = std::sin(lat);
        Real N = wgs84::a / std::sqrt(1.0 - wgs84::e2 * sin_lat * sin_lat);

        Real lat_new = std::atan2(z + wgs84::e2 * N * sin_lat, p);

        if (std::abs(lat_new - lat) < 1e-12) {
            lat = lat_new;
            break;
        }
        lat = lat_new;
    }

    Real sin_lat = std::sin(lat);
    Real cos_lat = std::cos(lat);
    Real N = wgs84::a / std::sqrt(1.0 - wgs84::e2 * sin_lat * sin_lat);
    Real alt;

    if (std::abs(cos_lat) > 1e-10) {
        alt = p / cos_lat - N;
    } else {
        alt = std::abs(z) / std::abs(sin_lat) - N * (1.0 - wgs84::e2);
    }

    return {lat, lon, alt};
}

// ============================================================================
// ENU -> ECEF
// ============================================================================

Vec3 enu_to_ecef(const Vec3& v, const GeodeticPosition& lla) noexcept {
    Real sin_lat = std::sin(lla.latitude);
    Real cos_lat = std::cos(lla.latitude);
    Real sin_lon = std::sin(lla.longitude);
    Real cos_lon = std::cos(lla.longitude);

    // Transpose of the ECEF->ENU rotation
    return {
        -sin_lon * v.x - sin_lat * cos_lon * v.y + cos_lat * cos_lon * v.z,
         cos_lon * v.x - sin_lat * sin_lon * v.y + cos_lat * sin_lon * v.z,
                                   cos_lat * v.y +           sin_lat * v.z
    };
}

GeodeticPosition enu_offset_to_lla(const Vec3& enu, const GeodeticPosition& origin) noexcept {
    Vec3 origin_ecef = lla_to_ecef(origin);
    return ecef_to_lla(origin_ecef + enu_to_ecef(enu, origin));
}

} // namespace coord

} // namespace geo

} // namespace cotlink
