/**
 * @file georeference_tests.cpp
 * @brief Unit tests for WGS84 conversions and grid georeferencing
 */

#include <gtest/gtest.h>
#include "cotlink/geo/coordinates.h"
#include "cotlink/geo/georeference.h"
#include <cmath>
#include <cstdio>
#include <fstream>

using namespace cotlink;
using namespace cotlink::geo;

namespace {

// Roughly one meter in degrees of latitude
constexpr Real METER_DEG = 1.0 / 111000.0;

} // anonymous namespace

// ============================================================================
// Coordinate Conversion Tests
// ============================================================================

TEST(CoordinatesTest, EquatorPrimeMeridianToEcef) {
    auto ecef = coord::lla_to_ecef(GeodeticPosition::from_degrees(0.0, 0.0, 0.0));
    EXPECT_NEAR(ecef.x, wgs84::a, 1e-6);
    EXPECT_NEAR(ecef.y, 0.0, 1e-6);
    EXPECT_NEAR(ecef.z, 0.0, 1e-6);
}

TEST(CoordinatesTest, EcefRoundTrip) {
    auto lla = GeodeticPosition::from_degrees(48.8566, 2.3522, 120.0);
    auto back = coord::ecef_to_lla(coord::lla_to_ecef(lla));
    EXPECT_NEAR(back.latitude_deg(), 48.8566, 1e-9);
    EXPECT_NEAR(back.longitude_deg(), 2.3522, 1e-9);
    EXPECT_NEAR(back.altitude, 120.0, 1e-3);
}

TEST(CoordinatesTest, EnuOffsetNorthIncreasesLatitude) {
    auto origin = GeodeticPosition::from_degrees(34.0, -116.0, 0.0);
    auto moved = coord::enu_offset_to_lla(Vec3{0.0, 1000.0, 0.0}, origin);
    EXPECT_GT(moved.latitude_deg(), 34.0);
    EXPECT_NEAR(moved.longitude_deg(), -116.0, 1e-9);
    EXPECT_NEAR(moved.latitude_deg() - 34.0, 1000.0 * METER_DEG, 1e-4);
}

// ============================================================================
// Georeference Tests
// ============================================================================

class GeoreferenceTest : public ::testing::Test {
protected:
    GeoreferenceConfig base_config() const {
        GeoreferenceConfig config;
        config.origin_lat_deg = 34.0;
        config.origin_lon_deg = -116.0;
        config.origin_alt_m = 500.0;
        config.meters_per_cell = 4.0;
        config.origin_cell_x = 100.0;
        config.origin_cell_y = 100.0;
        return config;
    }
};

TEST_F(GeoreferenceTest, OriginCellMapsToOrigin) {
    Georeference georef(base_config());
    auto p = georef.cell_to_geodetic(100.0, 100.0, 0.0);
    EXPECT_NEAR(p.latitude_deg(), 34.0, 1e-9);
    EXPECT_NEAR(p.longitude_deg(), -116.0, 1e-9);
    EXPECT_NEAR(p.altitude, 500.0, 1e-3);
}

TEST_F(GeoreferenceTest, CellAxesPointEastAndSouth) {
    Georeference georef(base_config());

    auto east = georef.cell_to_geodetic(110.0, 100.0, 0.0);
    EXPECT_GT(east.longitude_deg(), -116.0);
    EXPECT_NEAR(east.latitude_deg(), 34.0, 1e-6);

    auto south = georef.cell_to_geodetic(100.0, 110.0, 0.0);
    EXPECT_LT(south.latitude_deg(), 34.0);
    EXPECT_NEAR(south.latitude_deg(), 34.0 - 40.0 * METER_DEG, 1e-5);
}

TEST_F(GeoreferenceTest, HeightAddsToOriginAltitude) {
    Georeference georef(base_config());
    auto p = georef.cell_to_geodetic(100.0, 100.0, 250.0);
    EXPECT_NEAR(p.altitude, 750.0, 1e-2);
}

TEST_F(GeoreferenceTest, RotationTurnsGridNorth) {
    auto config = base_config();
    config.rotation_deg = 90.0;
    Georeference georef(config);

    // Grid north now points true east
    auto p = georef.cell_to_geodetic(100.0, 90.0, 0.0);
    EXPECT_GT(p.longitude_deg(), -116.0);
    EXPECT_NEAR(p.latitude_deg(), 34.0, 1e-6);
}

TEST_F(GeoreferenceTest, GridCourseToTrueCourse) {
    auto config = base_config();
    config.rotation_deg = 30.0;
    Georeference georef(config);
    EXPECT_DOUBLE_EQ(georef.grid_to_true_course(0.0), 30.0);
    EXPECT_DOUBLE_EQ(georef.grid_to_true_course(350.0), 20.0);

    config.rotation_deg = -45.0;
    Georeference negative(config);
    EXPECT_DOUBLE_EQ(negative.grid_to_true_course(10.0), 325.0);
}

TEST_F(GeoreferenceTest, ConfigValidation) {
    EXPECT_TRUE(base_config().is_valid());

    auto config = base_config();
    config.meters_per_cell = 0.0;
    EXPECT_FALSE(config.is_valid());

    config = base_config();
    config.origin_lat_deg = 91.0;
    EXPECT_FALSE(config.is_valid());

    config = base_config();
    config.rotation_deg = std::nan("");
    EXPECT_FALSE(config.is_valid());
}

// ============================================================================
// XML Loading Tests
// ============================================================================

class GeoreferenceFileTest : public ::testing::Test {
protected:
    void TearDown() override { std::remove(path_.c_str()); }

    void write(const std::string& content) {
        std::ofstream file(path_);
        file << content;
    }

    std::string path_ = ::testing::TempDir() + "cotlink_georef_test.xml";
};

TEST_F(GeoreferenceFileTest, LoadWithUnits) {
    write(R"(<georeference>
        <origin lat="10.5" lon="20.25" alt="15"/>
        <cell_size unit="ft">10</cell_size>
        <rotation unit="deg">12</rotation>
        <origin_cell x="64" y="32"/>
    </georeference>)");

    auto georef = Georeference::load(path_);
    const auto& c = georef.config();
    EXPECT_DOUBLE_EQ(c.origin_lat_deg, 10.5);
    EXPECT_DOUBLE_EQ(c.origin_lon_deg, 20.25);
    EXPECT_DOUBLE_EQ(c.origin_alt_m, 15.0);
    EXPECT_NEAR(c.meters_per_cell, 3.048, 1e-9);
    EXPECT_DOUBLE_EQ(c.rotation_deg, 12.0);
    EXPECT_DOUBLE_EQ(c.origin_cell_x, 64.0);
    EXPECT_DOUBLE_EQ(c.origin_cell_y, 32.0);
}

TEST_F(GeoreferenceFileTest, MissingOriginThrows) {
    write("<georeference><cell_size>4</cell_size></georeference>");
    EXPECT_THROW(Georeference::load(path_), std::runtime_error);
}

TEST_F(GeoreferenceFileTest, InvalidParametersThrow) {
    write(R"(<georeference><origin lat="95" lon="0"/></georeference>)");
    EXPECT_THROW(Georeference::load(path_), std::runtime_error);
}

TEST(GeoreferenceLoadTest, MissingFileThrows) {
    EXPECT_THROW(Georeference::load("/nonexistent/georeference.xml"), std::runtime_error);
}
