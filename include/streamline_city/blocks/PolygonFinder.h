#pragma once

#include "streamline_city/field/TensorField.h"
#include "streamline_city/geom/PolygonUtils.h"
#include "streamline_city/graph/Graph.h"
#include "streamline_city/utils/Random.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace streamline_city {
namespace blocks {

using geom::Polygon;

/**
 * Parameters for block extraction and lot subdivision
 */
struct PolygonParams {
    float maxLength = 20.0f;       // Lots with a longer edge are split
    float minArea = 50.0f;         // Splits never go below this
    float shrinkSpacing = 4.0f;    // Inset of each block from its roads
    float chanceNoDivide = 0.05f;  // Chance of keeping a lot whole at each split
    size_t maxFaceNodes = 1000;    // Faces with more nodes are discarded

    // Clamp values that would stall subdivision; returns false if anything changed
    bool normalize();
};

/**
 * PolygonFinder - blocks and lots from a planar road graph
 *
 * findPolygons() traces the bounded faces; shrink() insets them and divide()
 * recursively cuts them into lots. shrink and divide share one work queue,
 * so they can run to completion or be driven one polygon at a time through
 * update().
 */
class PolygonFinder {
public:
    PolygonFinder(const std::vector<graph::Node>& nodes,
                  const PolygonParams& params,
                  std::shared_ptr<const field::TensorField> field,
                  uint32_t seed = 0);

    void reset();

    /**
     * Trace every directed edge once, always taking the smallest
     * counter-clockwise turn from the reverse of the incoming edge. This
     * walks each face clockwise; faces that come out anticlockwise are the
     * outer boundary of a component and are dropped. Faces whose average
     * point is in water or a park are dropped too. Results are stored
     * counter-clockwise.
     */
    void findPolygons();

    // Inset every face by shrinkSpacing; runs to completion unless stepwise
    void shrink(bool stepwise = false);

    /**
     * Inset one polygon by `spacing`. Empty if the result has no area, or if
     * a positive spacing fails to shrink it or lets it escape the original.
     */
    std::optional<Polygon> shrinkPolygon(const Polygon& poly, double spacing) const;

    // Subdivide shrunk blocks (or faces if nothing was shrunk) into lots
    void divide(bool stepwise = false);

    // One shrink or one division; returns true while work remains
    bool update();

    // Latest stage output: lots, else shrunk blocks, else faces
    const std::vector<Polygon>& polygons() const;

    const std::vector<Polygon>& faces() const { return faces_; }
    const std::vector<Polygon>& shrunkPolygons() const { return shrunkPolygons_; }
    const std::vector<Polygon>& dividedPolygons() const { return dividedPolygons_; }

    const PolygonParams& params() const { return params_; }

    // Slivers below this area / perimeter^2 are not divided further
    static constexpr double MIN_SHAPE_INDEX = 0.04;

private:
    std::vector<graph::Node> nodes_;
    PolygonParams params_;
    std::shared_ptr<const field::TensorField> field_;
    utils::Random random_;

    std::vector<Polygon> faces_;
    std::vector<Polygon> shrunkPolygons_;
    std::vector<Polygon> dividedPolygons_;

    std::vector<Polygon> toShrink_;
    std::vector<Polygon> toDivide_;

    // Index into nodes_[from].neighbors of the next edge of the face walk
    size_t getRightmostNeighbor(size_t from, size_t at) const;
    std::vector<std::vector<size_t>> splitWalk(const std::vector<size_t>& walk) const;
    bool keepFace(const Polygon& face) const;

    bool stepShrink();
    bool stepDivide();
};

} // namespace blocks
} // namespace streamline_city
