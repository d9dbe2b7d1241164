#pragma once

#include <string>

namespace streamline_city {
namespace streets {

/**
 * Parameters for one tier of streamline generation.
 * Distances are in world units; the defaults describe minor roads.
 */
struct StreamlineParams {
    float dsep = 20.0f;           // Seed separation distance
    float dtest = 15.0f;          // Integration collision distance, <= dsep
    float dstep = 1.0f;           // Integration step, <= dsep
    float dcirclejoin = 5.0f;     // Distance at which loop fronts are joined
    float dlookahead = 40.0f;     // Search radius for joining dangling ends
    float joinangle = 0.1f;       // Max angle (radians) to join a dangling end
    int pathIterations = 1000;    // Integration steps per front
    int seedTries = 300;          // Consecutive failed seeds before the tier ends
    float simplifyTolerance = 0.5f;
    float collideEarly = 0.0f;    // Chance of testing against both grids while integrating

    bool seedAtEndpoints = false; // Try endpoints of the other direction first
    bool joinDangling = true;     // Run the dangling-end join pass when done

    // Path perturbation: multi-octave noise angle, up to +-π/4 * strength
    bool enablePathPerturbation = false;
    float perturbationStrength = 0.2f;
    float perturbationFrequency = 150.0f;
    int perturbationOctaves = 2;

    // Terrain avoidance: follow contours where the noise slope is steep
    bool enableTerrainInfluence = false;
    float terrainNoiseScale = 200.0f;
    float terrainInfluenceStrength = 0.5f;
    float terrainSteepnessThreshold = 0.3f;

    // Historical layers: perturbation scale by distance from the centre
    bool enableHistoricalLayers = false;
    float historicalLayerRadius = 200.0f;
    float modernLayerStart = 500.0f;
    float oldCityPerturbation = 2.0f;
    float modernCityPerturbation = 0.3f;

    // Directional bias masked by noise
    bool enableDirectionalBias = false;
    float biasDirection = 0.0f;
    float biasStrength = 0.3f;
    float biasNoiseScale = 200.0f;

    /**
     * Clamp values that would break the tracer. Returns false if anything
     * had to change.
     */
    bool normalize();

    /**
     * Apply a named realism preset: "none", "modern", "old_town", "mixed"
     * or "terrain". Returns false for an unknown name.
     */
    bool applyRealismPreset(const std::string& name);

    static StreamlineParams minorRoads();
    static StreamlineParams majorRoads();
    static StreamlineParams mainRoads();
};

} // namespace streets
} // namespace streamline_city
