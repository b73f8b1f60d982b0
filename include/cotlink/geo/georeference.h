#pragma once
/**
 * @file georeference.h
 * @brief Map grid to WGS84 georeference
 *
 * Simulation maps are square-celled grids with x growing east and y growing
 * south. A Georeference pins one cell (usually the map centre) to a geodetic
 * origin, gives the cell edge length in meters and the rotation of grid
 * north relative to true north, and converts any cell position to
 * latitude / longitude / height above ellipsoid through the local ENU
 * tangent plane at the origin.
 */

#include "cotlink/geo/coordinates.h"
#include <string>

namespace cotlink::geo {

/**
 * @brief Georeference parameters
 */
struct GeoreferenceConfig {
    Real origin_lat_deg{0.0};     ///< Latitude of the origin cell (degrees)
    Real origin_lon_deg{0.0};     ///< Longitude of the origin cell (degrees)
    Real origin_alt_m{0.0};       ///< Ground height of the origin above ellipsoid
    Real meters_per_cell{4.0};    ///< Cell edge length in meters
    Real rotation_deg{0.0};       ///< Grid north, clockwise from true north
    Real origin_cell_x{0.0};      ///< Cell column pinned to the origin
    Real origin_cell_y{0.0};      ///< Cell row pinned to the origin

    /// True when the parameters describe a usable georeference
    bool is_valid() const noexcept;
};

/**
 * @brief Converts grid cell positions into geodetic coordinates
 */
class Georeference {
public:
    explicit Georeference(const GeoreferenceConfig& config);

    /**
     * @brief Load georeference from XML file
     *
     * @code{.xml}
     * <georeference>
     *   <origin lat="48.8566" lon="2.3522" alt="35"/>
     *   <cell_size unit="m">4</cell_size>
     *   <rotation unit="deg">0</rotation>
     *   <origin_cell x="1024" y="1024"/>
     * </georeference>
     * @endcode
     *
     * @throws std::runtime_error if the file cannot be parsed or is invalid
     */
    static Georeference load(const std::string& path);

    /**
     * @brief Convert a cell position to a geodetic position
     * @param cell_x Column (fractional cells allowed)
     * @param cell_y Row (fractional cells allowed)
     * @param height_m Height above the origin ground level
     */
    GeodeticPosition cell_to_geodetic(Real cell_x, Real cell_y, Real height_m) const noexcept;

    /**
     * @brief Convert a grid course (degrees clockwise from grid north) to a true course
     * @return Course in [0, 360)
     */
    Real grid_to_true_course(Real grid_course_deg) const noexcept;

    const GeoreferenceConfig& config() const noexcept { return config_; }

private:
    GeoreferenceConfig config_;
    GeodeticPosition origin_;
    Real sin_rot_{0.0};
    Real cos_rot_{1.0};
};

} // namespace cotlink::geo
