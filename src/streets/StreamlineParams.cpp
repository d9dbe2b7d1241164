#include "streamline_city/streets/StreamlineParams.h"

#include <SDL3/SDL_log.h>
#include <algorithm>

namespace streamline_city {
namespace streets {

namespace {

// Smallest noise scale (world units per noise unit) accepted by normalize()
constexpr float MIN_NOISE_SCALE = 1.0f;

bool clampNoiseScale(float& scale, const char* name) {
    if (scale >= MIN_NOISE_SCALE) {
        return true;
    }
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "%s must be at least %.1f (got %.2f), clamping", name, MIN_NOISE_SCALE, scale);
    scale = MIN_NOISE_SCALE;
    return false;
}

} // anonymous namespace

bool StreamlineParams::normalize() {
    bool ok = true;

    if (dsep <= 0.0f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "dsep must be positive (got %.2f), using 1", dsep);
        dsep = 1.0f;
        ok = false;
    }
    if (dstep <= 0.0f || dstep > dsep) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Streamline step %.2f outside (0, dsep=%.2f], clamping", dstep, dsep);
        dstep = std::clamp(dstep, 0.01f, dsep);
        ok = false;
    }
    if (dtest > dsep) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "dtest %.2f bigger than dsep %.2f, clamping", dtest, dsep);
        dtest = dsep;
        ok = false;
    }
    if (dtest < 0.0f) {
        dtest = 0.0f;
        ok = false;
    }
    if (dcirclejoin < dstep) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "dcirclejoin %.2f smaller than dstep %.2f, clamping", dcirclejoin, dstep);
        dcirclejoin = dstep;
        ok = false;
    }
    if (pathIterations < 0) {
        pathIterations = 0;
        ok = false;
    }
    if (seedTries < 0) {
        seedTries = 0;
        ok = false;
    }
    if (perturbationOctaves < 1) {
        perturbationOctaves = 1;
        ok = false;
    }
    if (modernLayerStart < historicalLayerRadius) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "modernLayerStart %.2f inside historicalLayerRadius %.2f, clamping",
                    modernLayerStart, historicalLayerRadius);
        modernLayerStart = historicalLayerRadius;
        ok = false;
    }
    ok = clampNoiseScale(perturbationFrequency, "perturbationFrequency") && ok;
    ok = clampNoiseScale(terrainNoiseScale, "terrainNoiseScale") && ok;
    ok = clampNoiseScale(biasNoiseScale, "biasNoiseScale") && ok;
    if (terrainSteepnessThreshold < 0.0f) {
        terrainSteepnessThreshold = 0.0f;
        ok = false;
    }
    simplifyTolerance = std::max(0.0f, simplifyTolerance);
    collideEarly = std::clamp(collideEarly, 0.0f, 1.0f);

    return ok;
}

bool StreamlineParams::applyRealismPreset(const std::string& name) {
    if (name == "none") {
        enablePathPerturbation = false;
        enableTerrainInfluence = false;
        enableHistoricalLayers = false;
        enableDirectionalBias = false;
    } else if (name == "modern") {
        enablePathPerturbation = true;
        perturbationStrength = 0.1f;
        perturbationFrequency = 200.0f;
        perturbationOctaves = 2;
        enableTerrainInfluence = false;
        enableHistoricalLayers = false;
        enableDirectionalBias = false;
    } else if (name == "old_town") {
        enablePathPerturbation = true;
        perturbationStrength = 0.4f;
        perturbationFrequency = 80.0f;
        perturbationOctaves = 3;
        enableTerrainInfluence = true;
        terrainNoiseScale = 150.0f;
        terrainInfluenceStrength = 0.5f;
        terrainSteepnessThreshold = 0.3f;
        enableHistoricalLayers = false;
        enableDirectionalBias = false;
    } else if (name == "mixed") {
        enablePathPerturbation = true;
        perturbationStrength = 0.25f;
        perturbationFrequency = 150.0f;
        perturbationOctaves = 2;
        enableTerrainInfluence = false;
        enableHistoricalLayers = true;
        historicalLayerRadius = 200.0f;
        modernLayerStart = 500.0f;
        oldCityPerturbation = 2.0f;
        modernCityPerturbation = 0.3f;
        enableDirectionalBias = false;
    } else if (name == "terrain") {
        enablePathPerturbation = true;
        perturbationStrength = 0.15f;
        perturbationFrequency = 180.0f;
        perturbationOctaves = 2;
        enableTerrainInfluence = true;
        terrainNoiseScale = 200.0f;
        terrainInfluenceStrength = 1.0f;
        terrainSteepnessThreshold = 0.2f;
        enableHistoricalLayers = false;
        enableDirectionalBias = false;
    } else {
        return false;
    }
    return true;
}

StreamlineParams StreamlineParams::minorRoads() {
    return StreamlineParams();
}

StreamlineParams StreamlineParams::majorRoads() {
    StreamlineParams params;
    params.dsep = 100.0f;
    params.dtest = 30.0f;
    params.dlookahead = 200.0f;
    return params;
}

StreamlineParams StreamlineParams::mainRoads() {
    StreamlineParams params;
    params.dsep = 400.0f;
    params.dtest = 200.0f;
    params.dlookahead = 500.0f;
    return params;
}

} // namespace streets
} // namespace streamline_city
