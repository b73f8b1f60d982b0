/**
 * @file georeference.cpp
 * @brief Grid to WGS84 conversion and XML loading
 */

#include "cotlink/geo/georeference.h"
#include <pugixml.hpp>
#include <cmath>
#include <stdexcept>

namespace cotlink::geo {

namespace {

Real convert_length(Real value, const std::string& unit) {
    if (unit == "ft") return value * 0.3048;
    if (unit == "km") return value * 1000.0;
    return value;
}

Real convert_angle_to_deg(Real value, const std::string& unit) {
    if (unit == "rad") return value * constants::RAD_TO_DEG;
    return value;
}

} // anonymous namespace

bool GeoreferenceConfig::is_valid() const noexcept {
    return std::isfinite(origin_lat_deg) && std::isfinite(origin_lon_deg) &&
           origin_lat_deg >= -90.0 && origin_lat_deg <= 90.0 &&
           origin_lon_deg >= -180.0 && origin_lon_deg <= 180.0 &&
           std::isfinite(meters_per_cell) && meters_per_cell > 0.0 &&
           std::isfinite(rotation_deg);
}

Georeference::Georeference(const GeoreferenceConfig& config)
    : config_(config)
    , origin_(GeodeticPosition::from_degrees(config.origin_lat_deg,
                                             config.origin_lon_deg,
                                             config.origin_alt_m)) {
    Real rot = config.rotation_deg * constants::DEG_TO_RAD;
    sin_rot_ = std::sin(rot);
    cos_rot_ = std::cos(rot);
}

Georeference Georeference::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load georeference: " + std::string(result.description()));
    }

    auto root = doc.child("georeference");
    if (!root) {
        throw std::runtime_error("Invalid georeference file: missing <georeference> root element");
    }

    GeoreferenceConfig config;

    auto origin = root.child("origin");
    if (!origin) {
        throw std::runtime_error("Invalid georeference file: missing <origin>");
    }
    config.origin_lat_deg = origin.attribute("lat").as_double(0.0);
    config.origin_lon_deg = origin.attribute("lon").as_double(0.0);
    config.origin_alt_m = origin.attribute("alt").as_double(0.0);

    if (auto node = root.child("cell_size")) {
        config.meters_per_cell = convert_length(node.text().as_double(config.meters_per_cell),
                                                node.attribute("unit").as_string("m"));
    }
    if (auto node = root.child("rotation")) {
        config.rotation_deg = convert_angle_to_deg(node.text().as_double(0.0),
                                                   node.attribute("unit").as_string("deg"));
    }
    if (auto node = root.child("origin_cell")) {
        config.origin_cell_x = node.attribute("x").as_double(0.0);
        config.origin_cell_y = node.attribute("y").as_double(0.0);
    }

    if (!config.is_valid()) {
        throw std::runtime_error("Invalid georeference parameters in " + path);
    }

    return Georeference(config);
}

GeodeticPosition Georeference::cell_to_geodetic(Real cell_x, Real cell_y, Real height_m) const noexcept {
    // Grid axes: x east, y south
    Real grid_east = (cell_x - config_.origin_cell_x) * config_.meters_per_cell;
    Real grid_north = -(cell_y - config_.origin_cell_y) * config_.meters_per_cell;

    // Grid north sits rotation_deg clockwise from true north
    Real east = grid_east * cos_rot_ + grid_north * sin_rot_;
    Real north = -grid_east * sin_rot_ + grid_north * cos_rot_;

    return coord::enu_offset_to_lla(Vec3{east, north, height_m}, origin_);
}

Real Georeference::grid_to_true_course(Real grid_course_deg) const noexcept {
    Real course = std::fmod(grid_course_deg + config_.rotation_deg, 360.0);
    if (course < 0.0) {
        course += 360.0;
    }
    return course;
}

} // namespace cotlink::geo
