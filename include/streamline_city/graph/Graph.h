#pragma once

#include "streamline_city/geom/PolygonUtils.h"

#include <glm/glm.hpp>
#include <cstddef>
#include <vector>

namespace streamline_city {
namespace graph {

using geom::Polyline;

/**
 * Node - graph vertex with its adjacent node indices
 */
struct Node {
    glm::vec2 value;
    std::vector<size_t> neighbors;

    bool hasNeighbor(size_t other) const;
};

/**
 * Graph - planar graph built from road polylines
 *
 * Every polyline segment is copied and split at all crossings with other
 * segments. Segment endpoints that stop just short of another segment are
 * snapped onto it, and points within the snap tolerance become one node, so
 * edges meet only at nodes.
 */
class Graph {
public:
    Graph() = default;

    /**
     * Build the graph from `streamlines`.
     *
     * @param snapTolerance  points closer than this are merged
     * @param deleteDangling remove degree-1 nodes until none remain
     */
    static Graph build(const std::vector<Polyline>& streamlines, float snapTolerance,
                       bool deleteDangling = false);

    const std::vector<Node>& nodes() const { return nodes_; }

    // Undirected edge count
    size_t edgeCount() const;

    // Crossing points found between segments (interior of at least one)
    const std::vector<glm::vec2>& intersections() const { return intersections_; }

private:
    std::vector<Node> nodes_;
    std::vector<glm::vec2> intersections_;

    void addEdge(size_t a, size_t b);
    void deleteDanglingNodes();
    // Drops nodes without edges; returns old index -> new index (SIZE_MAX if dropped)
    std::vector<size_t> removeIsolatedNodes();
};

} // namespace graph
} // namespace streamline_city
