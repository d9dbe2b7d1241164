#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace streamline_city {
namespace geom {

// Open or closed sequence of points; closed when front() == back()
using Polyline = std::vector<glm::vec2>;

// Simple ring, implicitly closed (last vertex connects to the first)
using Polygon = std::vector<glm::vec2>;

/**
 * PolygonUtils - measurements and transforms over plain point rings
 *
 * Orientation follows the usual maths convention: positive signed area is
 * counter-clockwise with y pointing up.
 */
class PolygonUtils {
public:
    static double signedArea(const Polygon& poly);

    static double area(const Polygon& poly) {
        double s = signedArea(poly);
        return s < 0 ? -s : s;
    }

    static double perimeter(const Polygon& poly);

    // Vertex average
    static glm::vec2 averagePoint(const Polygon& poly);

    // Area centroid; falls back to the vertex average for degenerate rings
    static glm::vec2 centroid(const Polygon& poly);

    /**
     * Even-odd ray casting. Points exactly on the boundary may go either way.
     */
    static bool containsPoint(const Polygon& poly, const glm::vec2& p);

    // area / perimeter^2, 1/(4*pi) for a circle, 1/16 for a square
    static double shapeIndex(const Polygon& poly);

    // True if no two non-adjacent edges touch
    static bool isSimple(const Polygon& poly);

    // Reorders in place so that the signed area is non-negative
    static void makeCounterClockwise(Polygon& poly);

    // Index i of the longest edge (poly[i], poly[i + 1])
    static size_t longestEdge(const Polygon& poly);

    /**
     * Douglas-Peucker reduction. Endpoints are always kept, a closed input
     * stays closed. A tolerance of zero or less returns the input unchanged.
     */
    static Polyline simplify(const Polyline& points, double tolerance);

    /**
     * Inward offset of a counter-clockwise ring by `spacing`.
     *
     * Each edge is pushed along its inward normal, crossings between the
     * offset edges are inserted as shared vertices and the ring is cut there
     * into loops. The loop with the largest positive area is returned. An
     * empty polygon means the ring collapsed.
     */
    static Polygon inset(const Polygon& poly, double spacing);

    /**
     * Cuts a counter-clockwise ring along the inward perpendicular of edge
     * `edgeIndex`, starting at `ratio` of the way along that edge and ending
     * at the first boundary hit. Returns nullopt if the chord finds no exit
     * or either half is degenerate.
     */
    static std::optional<std::pair<Polygon, Polygon>> splitByChord(
        const Polygon& poly, size_t edgeIndex, double ratio);
};

} // namespace geom
} // namespace streamline_city
