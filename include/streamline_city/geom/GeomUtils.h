#pragma once

#include <glm/glm.hpp>
#include <optional>

namespace streamline_city {
namespace geom {

/**
 * GeomUtils - static 2D vector and segment helpers
 */
class GeomUtils {
public:
    /**
     * Cross product (z-component) of two 2D vectors
     */
    static double cross(const glm::vec2& a, const glm::vec2& b) {
        return static_cast<double>(a.x) * b.y - static_cast<double>(a.y) * b.x;
    }

    /**
     * Rotate 90 degrees counterclockwise
     */
    static glm::vec2 rotate90(const glm::vec2& v) {
        return glm::vec2(-v.y, v.x);
    }

    /**
     * Rotate a vector by an angle in radians (counterclockwise)
     */
    static glm::vec2 rotate(const glm::vec2& v, double angle);

    /**
     * Signed angle from a to b in (-pi, pi]
     */
    static double angleBetween(const glm::vec2& a, const glm::vec2& b);

    /**
     * Intersection of two lines given as point + direction.
     * Returns the parametric values (t1, t2) along each direction, or nullopt
     * if the lines are parallel.
     */
    static std::optional<glm::dvec2> intersectLines(
        const glm::vec2& p1, const glm::vec2& d1,
        const glm::vec2& p2, const glm::vec2& d2
    );

    /**
     * Proper intersection of segments a0-a1 and b0-b1.
     * Returns (t, u) along each segment when both lie in [0, 1].
     */
    static std::optional<glm::dvec2> intersectSegments(
        const glm::vec2& a0, const glm::vec2& a1,
        const glm::vec2& b0, const glm::vec2& b1
    );

    /**
     * Parameter in [0, 1] of the point of segment a-b closest to p
     */
    static double closestParameter(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b);

    static double distanceToSegment(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b);
};

} // namespace geom
} // namespace streamline_city
