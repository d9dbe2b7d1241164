#include "streamline_city/geom/PolygonUtils.h"
#include "streamline_city/geom/GeomUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace streamline_city {
namespace geom {

namespace {

constexpr double DELTA = 1e-6;

void douglasPeucker(const Polyline& points, double epsilon,
                    std::vector<bool>& keep, size_t startIdx, size_t endIdx) {
    if (endIdx <= startIdx + 1) return;

    // Find the point with maximum distance from the chord
    const glm::vec2& lineStart = points[startIdx];
    const glm::vec2& lineEnd = points[endIdx];

    double maxDist = 0.0;
    size_t maxIdx = startIdx;

    for (size_t i = startIdx + 1; i < endIdx; i++) {
        // A closed ring has a zero-length chord, so measure to the segment
        double dist = GeomUtils::distanceToSegment(points[i], lineStart, lineEnd);
        if (dist > maxDist) {
            maxDist = dist;
            maxIdx = i;
        }
    }

    if (maxDist > epsilon) {
        keep[maxIdx] = true;
        douglasPeucker(points, epsilon, keep, startIdx, maxIdx);
        douglasPeucker(points, epsilon, keep, maxIdx, endIdx);
    }
}

// Drops consecutive repeats, including a closing vertex equal to the first
void removeRepeats(Polygon& ring) {
    Polygon out;
    out.reserve(ring.size());
    for (const auto& v : ring) {
        if (out.empty() || glm::distance(out.back(), v) > DELTA) {
            out.push_back(v);
        }
    }
    while (out.size() > 1 && glm::distance(out.back(), out.front()) <= DELTA) {
        out.pop_back();
    }
    ring = std::move(out);
}

} // anonymous namespace

double PolygonUtils::signedArea(const Polygon& poly) {
    if (poly.size() < 3) return 0;

    double s = 0.0;
    size_t n = poly.size();
    for (size_t i = 0; i < n; ++i) {
        s += GeomUtils::cross(poly[i], poly[(i + 1) % n]);
    }
    return s * 0.5;
}

double PolygonUtils::perimeter(const Polygon& poly) {
    double len = 0.0;
    size_t n = poly.size();
    if (n < 2) return 0.0;
    for (size_t i = 0; i < n; ++i) {
        len += glm::distance(poly[i], poly[(i + 1) % n]);
    }
    return len;
}

glm::vec2 PolygonUtils::averagePoint(const Polygon& poly) {
    if (poly.empty()) return glm::vec2(0.0f);

    glm::dvec2 c(0.0);
    for (const auto& v : poly) {
        c += glm::dvec2(v);
    }
    c /= static_cast<double>(poly.size());
    return glm::vec2(c);
}

glm::vec2 PolygonUtils::centroid(const Polygon& poly) {
    double x = 0.0, y = 0.0, a = 0.0;
    size_t n = poly.size();
    for (size_t i = 0; i < n; ++i) {
        const glm::vec2& v0 = poly[i];
        const glm::vec2& v1 = poly[(i + 1) % n];
        double f = GeomUtils::cross(v0, v1);
        a += f;
        x += (v0.x + v1.x) * f;
        y += (v0.y + v1.y) * f;
    }
    if (std::abs(a) < 1e-9) {
        return averagePoint(poly);
    }
    double s6 = 1.0 / (3.0 * a);
    return glm::vec2(static_cast<float>(s6 * x), static_cast<float>(s6 * y));
}

bool PolygonUtils::containsPoint(const Polygon& poly, const glm::vec2& p) {
    size_t n = poly.size();
    if (n < 3) return false;

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const glm::vec2& a = poly[i];
        const glm::vec2& b = poly[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            double xCross = a.x + (static_cast<double>(p.y) - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < xCross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

double PolygonUtils::shapeIndex(const Polygon& poly) {
    double p = perimeter(poly);
    if (p <= 0.0) return 0.0;
    return area(poly) / (p * p);
}

bool PolygonUtils::isSimple(const Polygon& poly) {
    size_t n = poly.size();
    if (n < 3) return false;

    for (size_t i = 0; i < n; ++i) {
        const glm::vec2& a0 = poly[i];
        const glm::vec2& a1 = poly[(i + 1) % n];
        for (size_t j = i + 1; j < n; ++j) {
            // Adjacent edges share a vertex
            if (j == i + 1 || (i == 0 && j == n - 1)) continue;
            if (GeomUtils::intersectSegments(a0, a1, poly[j], poly[(j + 1) % n]).has_value()) {
                return false;
            }
        }
    }
    return true;
}

void PolygonUtils::makeCounterClockwise(Polygon& poly) {
    if (signedArea(poly) < 0) {
        std::reverse(poly.begin(), poly.end());
    }
}

size_t PolygonUtils::longestEdge(const Polygon& poly) {
    size_t n = poly.size();
    size_t best = 0;
    float bestLen = -1.0f;
    for (size_t i = 0; i < n; ++i) {
        float len = glm::distance(poly[i], poly[(i + 1) % n]);
        if (len > bestLen) {
            bestLen = len;
            best = i;
        }
    }
    return best;
}

Polyline PolygonUtils::simplify(const Polyline& points, double tolerance) {
    if (tolerance <= 0.0 || points.size() < 3) {
        return points;
    }

    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;
    douglasPeucker(points, tolerance, keep, 0, points.size() - 1);

    Polyline simplified;
    for (size_t i = 0; i < points.size(); ++i) {
        if (keep[i]) {
            simplified.push_back(points[i]);
        }
    }
    return simplified;
}

// ============================================================================
// Inset
// ============================================================================

Polygon PolygonUtils::inset(const Polygon& poly, double spacing) {
    Polygon ring = poly;
    removeRepeats(ring);
    if (ring.size() < 3) return {};
    makeCounterClockwise(ring);
    if (spacing <= 0.0) return ring;

    // Creating a polygon (probably invalid) with offset edges
    Polygon q;
    size_t n = ring.size();
    for (size_t i = 0; i < n; ++i) {
        const glm::vec2& v0 = ring[i];
        const glm::vec2& v1 = ring[(i + 1) % n];
        glm::vec2 v = v1 - v0;
        float len = glm::length(v);
        if (len < DELTA) continue;

        glm::vec2 normal = GeomUtils::rotate90(v / len) * static_cast<float>(spacing);
        q.push_back(v0 + normal);
        q.push_back(v1 + normal);
    }
    removeRepeats(q);
    if (q.size() < 3) return {};

    // Creating a valid polygon by dealing with self-intersection
    bool wasCut;
    int lastEdge = 0;
    size_t cuts = 0;
    const size_t maxCuts = q.size() * q.size();

    do {
        wasCut = false;
        int count = static_cast<int>(q.size());

        for (int ii = lastEdge; ii < count - 2; ++ii) {
            lastEdge = ii;

            const glm::vec2 p11 = q[ii];
            const glm::vec2 p12 = q[ii + 1];

            int jEnd = (ii > 0 ? count : count - 1);
            for (int j = ii + 2; j < jEnd; ++j) {
                const glm::vec2& p21 = q[j];
                const glm::vec2& p22 = (j < count - 1) ? q[j + 1] : q[0];

                auto intersection = GeomUtils::intersectLines(p11, p12 - p11, p21, p22 - p21);
                if (intersection.has_value() &&
                    intersection->x > DELTA && intersection->x < 1 - DELTA &&
                    intersection->y > DELTA && intersection->y < 1 - DELTA) {

                    glm::vec2 pn = p11 + (p12 - p11) * static_cast<float>(intersection->x);
                    q.insert(q.begin() + j + 1, pn);
                    q.insert(q.begin() + ii + 1, pn);

                    wasCut = true;
                    ++cuts;
                    break;
                }
            }
            if (wasCut) break;
        }
    } while (wasCut && cuts < maxCuts);

    // Each inserted crossing appears twice; stepping onto one copy continues
    // from the other, which splits the ring into loops
    int count = static_cast<int>(q.size());
    std::vector<int> next(count);
    for (int k = 0; k < count; ++k) {
        int nextIdx = (k + 1) % count;
        int other = -1;
        for (int m = 0; m < count; ++m) {
            if (m != nextIdx && q[m] == q[nextIdx]) {
                other = m;
                break;
            }
        }
        next[k] = (other == -1) ? nextIdx : other;
    }

    Polygon bestPart;
    double bestPartArea = 0.0;
    std::vector<bool> visited(count, false);

    for (int start = 0; start < count; ++start) {
        if (visited[start]) continue;

        Polygon part;
        int ii = start;
        while (!visited[ii]) {
            visited[ii] = true;
            part.push_back(q[ii]);
            ii = next[ii];
        }

        removeRepeats(part);
        double s = signedArea(part);
        if (s > bestPartArea) {
            bestPart = std::move(part);
            bestPartArea = s;
        }
    }

    return bestPart;
}

// ============================================================================
// Chord split
// ============================================================================

std::optional<std::pair<Polygon, Polygon>> PolygonUtils::splitByChord(
    const Polygon& poly, size_t edgeIndex, double ratio) {
    size_t n = poly.size();
    if (n < 3 || edgeIndex >= n) return std::nullopt;

    const glm::vec2& a = poly[edgeIndex];
    const glm::vec2& b = poly[(edgeIndex + 1) % n];
    glm::vec2 edge = b - a;
    float len = glm::length(edge);
    if (len < DELTA) return std::nullopt;

    glm::vec2 start = a + edge * static_cast<float>(ratio);
    glm::vec2 dir = GeomUtils::rotate90(edge / len);

    // Nearest exit of the inward ray
    double bestT = std::numeric_limits<double>::infinity();
    size_t hitEdge = n;
    for (size_t k = 0; k < n; ++k) {
        if (k == edgeIndex) continue;
        const glm::vec2& c = poly[k];
        const glm::vec2& d = poly[(k + 1) % n];

        auto hit = GeomUtils::intersectLines(start, dir, c, d - c);
        if (!hit.has_value()) continue;
        if (hit->x <= DELTA || hit->y < 0.0 || hit->y > 1.0) continue;
        if (hit->x < bestT) {
            bestT = hit->x;
            hitEdge = k;
        }
    }
    if (hitEdge == n) return std::nullopt;

    glm::vec2 end = start + dir * static_cast<float>(bestT);

    Polygon first;
    first.push_back(start);
    for (size_t k = (edgeIndex + 1) % n;; k = (k + 1) % n) {
        first.push_back(poly[k]);
        if (k == hitEdge) break;
    }
    first.push_back(end);

    Polygon second;
    second.push_back(end);
    for (size_t k = (hitEdge + 1) % n;; k = (k + 1) % n) {
        second.push_back(poly[k]);
        if (k == edgeIndex) break;
    }
    second.push_back(start);

    removeRepeats(first);
    removeRepeats(second);
    if (first.size() < 3 || second.size() < 3) return std::nullopt;
    if (signedArea(first) <= DELTA || signedArea(second) <= DELTA) return std::nullopt;

    return std::make_pair(std::move(first), std::move(second));
}

} // namespace geom
} // namespace streamline_city
