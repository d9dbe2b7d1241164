#include "streamline_city/geom/GeomUtils.h"

#include <cmath>

namespace streamline_city {
namespace geom {

glm::vec2 GeomUtils::rotate(const glm::vec2& v, double angle) {
    double cosA = std::cos(angle);
    double sinA = std::sin(angle);
    return glm::vec2(
        static_cast<float>(v.x * cosA - v.y * sinA),
        static_cast<float>(v.x * sinA + v.y * cosA)
    );
}

double GeomUtils::angleBetween(const glm::vec2& a, const glm::vec2& b) {
    double angle = std::atan2(b.y, b.x) - std::atan2(a.y, a.x);
    if (angle > M_PI) angle -= 2 * M_PI;
    if (angle <= -M_PI) angle += 2 * M_PI;
    return angle;
}

std::optional<glm::dvec2> GeomUtils::intersectLines(
    const glm::vec2& p1, const glm::vec2& d1,
    const glm::vec2& p2, const glm::vec2& d2
) {
    double d = static_cast<double>(d1.x) * d2.y - static_cast<double>(d1.y) * d2.x;
    if (d == 0) {
        return std::nullopt;
    }

    double dx = static_cast<double>(p2.x) - p1.x;
    double dy = static_cast<double>(p2.y) - p1.y;
    double t1 = (dx * d2.y - dy * d2.x) / d;
    double t2 = (dx * d1.y - dy * d1.x) / d;
    return glm::dvec2(t1, t2);
}

std::optional<glm::dvec2> GeomUtils::intersectSegments(
    const glm::vec2& a0, const glm::vec2& a1,
    const glm::vec2& b0, const glm::vec2& b1
) {
    auto t = intersectLines(a0, a1 - a0, b0, b1 - b0);
    if (!t.has_value()) {
        return std::nullopt;
    }
    if (t->x < 0.0 || t->x > 1.0 || t->y < 0.0 || t->y > 1.0) {
        return std::nullopt;
    }
    return t;
}

double GeomUtils::closestParameter(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b) {
    glm::dvec2 ab(b.x - a.x, b.y - a.y);
    double lenSq = ab.x * ab.x + ab.y * ab.y;
    if (lenSq < 1e-12) {
        return 0.0;
    }
    double t = ((p.x - a.x) * ab.x + (p.y - a.y) * ab.y) / lenSq;
    if (t < 0.0) return 0.0;
    if (t > 1.0) return 1.0;
    return t;
}

double GeomUtils::distanceToSegment(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b) {
    double t = closestParameter(p, a, b);
    double x = a.x + (b.x - a.x) * t - p.x;
    double y = a.y + (b.y - a.y) * t - p.y;
    return std::sqrt(x * x + y * y);
}

} // namespace geom
} // namespace streamline_city
