#pragma once
/**
 * @file types.h
 * @brief Core type definitions for CotLink
 *
 * Fundamental numeric types, simulation identifiers and the lightweight
 * vector type shared by the georeference and emitter layers.
 */

#include <cstdint>
#include <cstddef>
#include <limits>

namespace cotlink {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type
 *
 * Double precision keeps geodetic coordinates accurate to well under a
 * centimetre, which single precision cannot do for global positions.
 */
using Real = double;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Simulation Identifiers
// ============================================================================

/**
 * @brief Identifier of a simulated entity (actor) owned by the host simulation
 */
using EntityId = UInt32;

/// Invalid entity ID constant
constexpr EntityId INVALID_ENTITY_ID = std::numeric_limits<EntityId>::max();

/**
 * @brief Identifier of a player / viewpoint in the host simulation
 */
using PlayerId = UInt32;

/// Invalid player ID constant
constexpr PlayerId INVALID_PLAYER_ID = std::numeric_limits<PlayerId>::max();

// ============================================================================
// Math Structures
// ============================================================================

/**
 * @brief 3D vector (ECEF / ENU positions)
 */
struct Vec3 {
    Real x{0.0};
    Real y{0.0};
    Real z{0.0};

    constexpr Vec3() noexcept = default;
    constexpr Vec3(Real x_, Real y_, Real z_) noexcept : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& other) const noexcept {
        return {x + other.x, y + other.y, z + other.z};
    }
    constexpr Vec3 operator-(const Vec3& other) const noexcept {
        return {x - other.x, y - other.y, z - other.z};
    }
    constexpr Vec3 operator*(Real scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Real dot(const Vec3& other) const noexcept {
        return x * other.x + y * other.y + z * other.z;
    }

    // Magnitude squared (avoid sqrt when possible)
    constexpr Real length_squared() const noexcept {
        return x*x + y*y + z*z;
    }

    // Length (magnitude) - requires sqrt, defined in cpp
    Real length() const noexcept;
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {

constexpr Real PI = 3.14159265358979323846;

constexpr Real DEG_TO_RAD = PI / 180.0;

constexpr Real RAD_TO_DEG = 180.0 / PI;

} // namespace constants

} // namespace cotlink
