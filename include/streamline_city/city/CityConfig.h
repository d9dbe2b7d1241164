#pragma once

#include "streamline_city/blocks/PolygonFinder.h"
#include "streamline_city/field/BasisField.h"
#include "streamline_city/field/FieldIntegrator.h"
#include "streamline_city/field/TensorField.h"
#include "streamline_city/geom/PolygonUtils.h"
#include "streamline_city/streets/StreamlineParams.h"

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace streamline_city {
namespace city {

/**
 * One basis field listed in a config file
 */
struct FieldPrimitive {
    field::FieldType type = field::FieldType::Grid;
    glm::vec2 centre{0.0f};
    float size = 100.0f;
    float decay = 0.0f;
    float theta = 0.0f;   // Grid only, radians
};

/**
 * CityConfig - everything one generation pass needs
 *
 * Plain values with defaults. Absent JSON keys keep the defaults; the road
 * tiers start from the main/major/minor presets.
 */
struct CityConfig {
    glm::vec2 origin{0.0f};
    glm::vec2 dimensions{1000.0f, 800.0f};
    uint32_t seed = 0;

    // Field: explicit primitives, or the recommended layout when empty
    std::vector<FieldPrimitive> fields;
    field::NoiseParams noise;
    bool smoothField = false;
    field::IntegratorType integrator = field::IntegratorType::RK4;

    // Water and the optional city boundary (empty = unbounded)
    geom::Polygon sea;
    geom::Polygon river;
    geom::Polygon region;

    streets::StreamlineParams mainRoads = streets::StreamlineParams::mainRoads();
    streets::StreamlineParams majorRoads = streets::StreamlineParams::majorRoads();
    streets::StreamlineParams minorRoads = streets::StreamlineParams::minorRoads();
    std::string realismPreset = "none";

    blocks::PolygonParams buildings;
    int numBigParks = 2;
    int numSmallParks = 0;
    bool clusterBigParks = false;

    // Fraction of lots kept after subdivision
    float buildingDensity = 1.0f;

    // Clamp invalid values with a warning; returns false if anything changed
    bool normalize();

    // Throws std::runtime_error on unreadable files or malformed JSON
    static CityConfig loadFromFile(const std::string& path);
    static CityConfig loadFromJsonString(const std::string& jsonString);
};

} // namespace city
} // namespace streamline_city
