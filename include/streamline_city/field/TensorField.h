#pragma once

#include "streamline_city/field/BasisField.h"
#include "streamline_city/field/Tensor.h"
#include "streamline_city/geom/PolygonUtils.h"
#include "streamline_city/utils/Noise.h"
#include "streamline_city/utils/Random.h"

#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace streamline_city {
namespace field {

/**
 * Rotational noise applied on top of the summed basis fields.
 * Sizes are in world units, angles in degrees.
 */
struct NoiseParams {
    bool globalNoise = false;
    double noiseSizePark = 20.0;
    double noiseAnglePark = 90.0;
    double noiseSizeGlobal = 30.0;
    double noiseAngleGlobal = 20.0;
};

/**
 * TensorField - sum of basis fields with exclusion zones
 *
 * A value type: copy it to take a snapshot for a generation pass. Sampling
 * is a pure function of the primitive list, the water/park polygons and the
 * noise seed.
 */
class TensorField {
public:
    explicit TensorField(const NoiseParams& noiseParams = NoiseParams(), uint32_t noiseSeed = 0);

    // Field editing
    void addGrid(const glm::vec2& centre, double size, double decay, double theta);
    void addRadial(const glm::vec2& centre, double size, double decay);
    void addField(BasisFieldPtr field);
    void reset();

    /**
     * Replaces the primitives with four grids on the corners of the central
     * 70% of the domain and one radial field near its centre.
     */
    void setRecommended(const glm::vec2& origin, const glm::vec2& dimensions, utils::Random& random);

    const std::vector<BasisFieldPtr>& fields() const { return fields_; }

    // Exclusion zones
    void setSea(const geom::Polygon& sea) { sea_ = sea; }
    void setRiver(const geom::Polygon& river) { river_ = river; }
    void setParks(const std::vector<geom::Polygon>& parks) { parks_ = parks; }
    void addPark(const geom::Polygon& park) { parks_.push_back(park); }

    const geom::Polygon& sea() const { return sea_; }
    const geom::Polygon& river() const { return river_; }
    const std::vector<geom::Polygon>& parks() const { return parks_; }

    NoiseParams& noiseParams() { return noiseParams_; }
    const NoiseParams& noiseParams() const { return noiseParams_; }

    /**
     * Tensor at `point`: zero in water, the weighted sum of all primitives
     * elsewhere, rotated by noise inside parks (and everywhere when global
     * noise is on). With no primitive in reach the default grid along the
     * x axis is returned.
     */
    Tensor samplePoint(const glm::vec2& point) const;

    bool onLand(const glm::vec2& point) const;
    bool inParks(const glm::vec2& point) const;
    bool inSea(const glm::vec2& point) const;
    bool inRiver(const glm::vec2& point) const;

    // Blend primitives with d^-decay and renormalise
    bool smooth = false;

    // Treat the river as land (used when tracing river banks)
    bool ignoreRiver = false;

private:
    std::vector<BasisFieldPtr> fields_;

    geom::Polygon sea_;
    geom::Polygon river_;
    std::vector<geom::Polygon> parks_;

    NoiseParams noiseParams_;
    utils::Perlin noise_;

    // Noise angle in radians, scaled to +-angle degrees
    double getRotationalNoise(const glm::vec2& point, double noiseSize, double noiseAngle) const;
};

} // namespace field
} // namespace streamline_city
