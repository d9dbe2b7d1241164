#include "streamline_city/city/CityConfig.h"

#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

namespace streamline_city {
namespace city {

namespace {

// Accepts [x, y] or {"x": .., "y": ..}
glm::vec2 readPoint(const json& j) {
    if (j.is_array()) {
        return glm::vec2(j.at(0).get<float>(), j.at(1).get<float>());
    }
    if (j.is_object()) {
        return glm::vec2(j.at("x").get<float>(), j.at("y").get<float>());
    }
    throw std::runtime_error("Expected a point, got " + j.dump());
}

geom::Polygon readPolygon(const json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("Expected a point list, got " + j.dump());
    }
    geom::Polygon poly;
    for (const auto& p : j) {
        poly.push_back(readPoint(p));
    }
    return poly;
}

FieldPrimitive readFieldPrimitive(const json& j) {
    FieldPrimitive f;
    std::string typeStr = j.value("type", "grid");
    if (typeStr == "grid") {
        f.type = field::FieldType::Grid;
    } else if (typeStr == "radial") {
        f.type = field::FieldType::Radial;
    } else {
        throw std::runtime_error("Unknown field type: " + typeStr);
    }
    f.centre = readPoint(j.at("centre"));
    f.size = j.value("size", f.size);
    f.decay = j.value("decay", f.decay);
    f.theta = j.value("theta", f.theta);
    return f;
}

void readStreamlineParams(const json& j, streets::StreamlineParams& p) {
    p.dsep = j.value("dsep", p.dsep);
    p.dtest = j.value("dtest", p.dtest);
    p.dstep = j.value("dstep", p.dstep);
    p.dcirclejoin = j.value("dcirclejoin", p.dcirclejoin);
    p.dlookahead = j.value("dlookahead", p.dlookahead);
    p.joinangle = j.value("joinangle", p.joinangle);
    p.pathIterations = j.value("pathIterations", p.pathIterations);
    p.seedTries = j.value("seedTries", p.seedTries);
    p.simplifyTolerance = j.value("simplifyTolerance", p.simplifyTolerance);
    p.collideEarly = j.value("collideEarly", p.collideEarly);
    p.seedAtEndpoints = j.value("seedAtEndpoints", p.seedAtEndpoints);
    p.joinDangling = j.value("joinDangling", p.joinDangling);

    p.enablePathPerturbation = j.value("enablePathPerturbation", p.enablePathPerturbation);
    p.perturbationStrength = j.value("perturbationStrength", p.perturbationStrength);
    p.perturbationFrequency = j.value("perturbationFrequency", p.perturbationFrequency);
    p.perturbationOctaves = j.value("perturbationOctaves", p.perturbationOctaves);

    p.enableTerrainInfluence = j.value("enableTerrainInfluence", p.enableTerrainInfluence);
    p.terrainNoiseScale = j.value("terrainNoiseScale", p.terrainNoiseScale);
    p.terrainInfluenceStrength = j.value("terrainInfluenceStrength", p.terrainInfluenceStrength);
    p.terrainSteepnessThreshold = j.value("terrainSteepnessThreshold", p.terrainSteepnessThreshold);

    p.enableHistoricalLayers = j.value("enableHistoricalLayers", p.enableHistoricalLayers);
    p.historicalLayerRadius = j.value("historicalLayerRadius", p.historicalLayerRadius);
    p.modernLayerStart = j.value("modernLayerStart", p.modernLayerStart);
    p.oldCityPerturbation = j.value("oldCityPerturbation", p.oldCityPerturbation);
    p.modernCityPerturbation = j.value("modernCityPerturbation", p.modernCityPerturbation);

    p.enableDirectionalBias = j.value("enableDirectionalBias", p.enableDirectionalBias);
    p.biasDirection = j.value("biasDirection", p.biasDirection);
    p.biasStrength = j.value("biasStrength", p.biasStrength);
    p.biasNoiseScale = j.value("biasNoiseScale", p.biasNoiseScale);
}

void readPolygonParams(const json& j, blocks::PolygonParams& p) {
    p.maxLength = j.value("maxLength", p.maxLength);
    p.minArea = j.value("minArea", p.minArea);
    p.shrinkSpacing = j.value("shrinkSpacing", p.shrinkSpacing);
    p.chanceNoDivide = j.value("chanceNoDivide", p.chanceNoDivide);
    p.maxFaceNodes = j.value("maxFaceNodes", p.maxFaceNodes);
}

} // anonymous namespace

bool CityConfig::normalize() {
    bool ok = true;

    if (dimensions.x <= 0.0f || dimensions.y <= 0.0f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "City dimensions must be positive (got %.1f x %.1f), using 1000 x 800",
                    dimensions.x, dimensions.y);
        dimensions = glm::vec2(1000.0f, 800.0f);
        ok = false;
    }

    ok = mainRoads.normalize() && ok;
    ok = majorRoads.normalize() && ok;
    ok = minorRoads.normalize() && ok;
    ok = buildings.normalize() && ok;

    if (numBigParks < 0 || numSmallParks < 0) {
        numBigParks = std::max(numBigParks, 0);
        numSmallParks = std::max(numSmallParks, 0);
        ok = false;
    }
    if (buildingDensity < 0.0f || buildingDensity > 1.0f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Building density %.2f outside [0, 1], clamping", buildingDensity);
        buildingDensity = std::clamp(buildingDensity, 0.0f, 1.0f);
        ok = false;
    }

    return ok;
}

CityConfig CityConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open city config: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    CityConfig config = loadFromJsonString(content);
    SDL_Log("CityConfig: Loaded %s (seed=%u, %.0f x %.0f)",
            path.c_str(), config.seed, config.dimensions.x, config.dimensions.y);
    return config;
}

CityConfig CityConfig::loadFromJsonString(const std::string& jsonString) {
    CityConfig config;

    try {
        json j = json::parse(jsonString);
        if (!j.is_object()) {
            throw std::runtime_error("City config must be a JSON object");
        }

        if (j.contains("origin")) config.origin = readPoint(j["origin"]);
        if (j.contains("dimensions")) config.dimensions = readPoint(j["dimensions"]);
        config.seed = j.value("seed", config.seed);

        // Field
        if (j.contains("fields")) {
            for (const auto& f : j["fields"]) {
                config.fields.push_back(readFieldPrimitive(f));
            }
        }
        if (j.contains("noise")) {
            const auto& n = j["noise"];
            config.noise.globalNoise = n.value("globalNoise", config.noise.globalNoise);
            config.noise.noiseSizePark = n.value("noiseSizePark", config.noise.noiseSizePark);
            config.noise.noiseAnglePark = n.value("noiseAnglePark", config.noise.noiseAnglePark);
            config.noise.noiseSizeGlobal = n.value("noiseSizeGlobal", config.noise.noiseSizeGlobal);
            config.noise.noiseAngleGlobal = n.value("noiseAngleGlobal", config.noise.noiseAngleGlobal);
        }
        config.smoothField = j.value("smooth", config.smoothField);
        if (j.contains("integrator")) {
            std::string name = j["integrator"].get<std::string>();
            auto type = field::parseIntegratorType(name);
            if (!type) {
                throw std::runtime_error("Unknown integrator: " + name);
            }
            config.integrator = *type;
        }

        if (j.contains("sea")) config.sea = readPolygon(j["sea"]);
        if (j.contains("river")) config.river = readPolygon(j["river"]);
        if (j.contains("region")) config.region = readPolygon(j["region"]);

        // Roads: preset first, explicit per-tier keys override it
        config.realismPreset = j.value("preset", config.realismPreset);
        for (auto* tier : {&config.mainRoads, &config.majorRoads, &config.minorRoads}) {
            if (!tier->applyRealismPreset(config.realismPreset)) {
                throw std::runtime_error("Unknown realism preset: " + config.realismPreset);
            }
        }
        if (j.contains("roads")) {
            const auto& roads = j["roads"];
            if (roads.contains("main")) readStreamlineParams(roads["main"], config.mainRoads);
            if (roads.contains("major")) readStreamlineParams(roads["major"], config.majorRoads);
            if (roads.contains("minor")) readStreamlineParams(roads["minor"], config.minorRoads);
        }

        // Parks and buildings
        if (j.contains("parks")) {
            const auto& parks = j["parks"];
            config.numBigParks = parks.value("big", config.numBigParks);
            config.numSmallParks = parks.value("small", config.numSmallParks);
            config.clusterBigParks = parks.value("cluster", config.clusterBigParks);
        }
        if (j.contains("buildings")) {
            readPolygonParams(j["buildings"], config.buildings);
        }
        config.buildingDensity = j.value("density", config.buildingDensity);

    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("City config JSON error: ") + e.what());
    }

    config.normalize();
    return config;
}

} // namespace city
} // namespace streamline_city
