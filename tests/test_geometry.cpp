#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <cmath>

#include "streamline_city/geom/GeomUtils.h"
#include "streamline_city/geom/PolygonUtils.h"

using namespace streamline_city::geom;

static Polygon makeRect(float x0, float y0, float x1, float y1) {
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

static Polyline makeWave(size_t n) {
    Polyline line;
    for (size_t i = 0; i < n; ++i) {
        float x = static_cast<float>(i);
        line.push_back({x, 3.0f * std::sin(x * 0.3f)});
    }
    return line;
}

TEST_SUITE("GeomUtils") {
    TEST_CASE("rotate90 is counterclockwise") {
        glm::vec2 r = GeomUtils::rotate90({1.0f, 0.0f});
        CHECK(r.x == doctest::Approx(0.0f));
        CHECK(r.y == doctest::Approx(1.0f));
    }

    TEST_CASE("angleBetween is signed") {
        CHECK(GeomUtils::angleBetween({1, 0}, {0, 1}) == doctest::Approx(M_PI / 2));
        CHECK(GeomUtils::angleBetween({1, 0}, {0, -1}) == doctest::Approx(-M_PI / 2));
    }

    TEST_CASE("intersectSegments finds crossing parameters") {
        auto hit = GeomUtils::intersectSegments({0, 0}, {10, 0}, {5, -5}, {5, 5});
        REQUIRE(hit.has_value());
        CHECK(hit->x == doctest::Approx(0.5));
        CHECK(hit->y == doctest::Approx(0.5));
    }

    TEST_CASE("intersectSegments rejects disjoint and parallel segments") {
        CHECK_FALSE(GeomUtils::intersectSegments({0, 0}, {1, 0}, {5, -5}, {5, 5}).has_value());
        CHECK_FALSE(GeomUtils::intersectSegments({0, 0}, {10, 0}, {0, 1}, {10, 1}).has_value());
    }

    TEST_CASE("distanceToSegment clamps to endpoints") {
        CHECK(GeomUtils::distanceToSegment({5, 3}, {0, 0}, {10, 0}) == doctest::Approx(3.0));
        CHECK(GeomUtils::distanceToSegment({13, 4}, {0, 0}, {10, 0}) == doctest::Approx(5.0));
    }
}

TEST_SUITE("PolygonUtils") {
    TEST_CASE("signedArea is positive counterclockwise") {
        Polygon square = makeRect(0, 0, 10, 10);
        CHECK(PolygonUtils::signedArea(square) == doctest::Approx(100.0));

        Polygon reversed(square.rbegin(), square.rend());
        CHECK(PolygonUtils::signedArea(reversed) == doctest::Approx(-100.0));
        PolygonUtils::makeCounterClockwise(reversed);
        CHECK(PolygonUtils::signedArea(reversed) == doctest::Approx(100.0));
    }

    TEST_CASE("centroid and containment") {
        Polygon rect = makeRect(0, 0, 20, 10);
        glm::vec2 c = PolygonUtils::centroid(rect);
        CHECK(c.x == doctest::Approx(10.0f));
        CHECK(c.y == doctest::Approx(5.0f));
        CHECK(PolygonUtils::containsPoint(rect, {3, 3}));
        CHECK_FALSE(PolygonUtils::containsPoint(rect, {25, 3}));
    }

    TEST_CASE("shapeIndex of a square is 1/16") {
        CHECK(PolygonUtils::shapeIndex(makeRect(0, 0, 4, 4)) == doctest::Approx(1.0 / 16.0));
    }

    TEST_CASE("longestEdge picks the widest side") {
        Polygon rect = makeRect(0, 0, 20, 10);
        size_t e = PolygonUtils::longestEdge(rect);
        CHECK((e == 0 || e == 2));
    }

    TEST_CASE("simplify with zero tolerance is the identity") {
        Polyline wave = makeWave(50);
        Polyline out = PolygonUtils::simplify(wave, 0.0);
        REQUIRE(out.size() == wave.size());
        for (size_t i = 0; i < wave.size(); ++i) {
            CHECK(out[i] == wave[i]);
        }
    }

    TEST_CASE("simplify keeps endpoints and never grows with tolerance") {
        Polyline wave = makeWave(80);
        size_t previous = wave.size();
        for (double tol : {0.01, 0.1, 0.5, 1.0, 2.0, 10.0}) {
            Polyline out = PolygonUtils::simplify(wave, tol);
            CHECK(out.size() <= previous);
            CHECK(out.front() == wave.front());
            CHECK(out.back() == wave.back());
            previous = out.size();
        }
        CHECK(previous == 2);
    }

    TEST_CASE("simplify keeps a closed ring closed") {
        Polyline ring;
        for (int i = 0; i <= 36; ++i) {
            float a = static_cast<float>(i) * 2.0f * static_cast<float>(M_PI) / 36.0f;
            ring.push_back({10.0f * std::cos(a), 10.0f * std::sin(a)});
        }
        ring.back() = ring.front();
        Polyline out = PolygonUtils::simplify(ring, 0.5);
        CHECK(out.size() >= 4);
        CHECK(out.front() == out.back());
    }

    TEST_CASE("inset of a square") {
        Polygon square = makeRect(0, 0, 10, 10);
        Polygon inner = PolygonUtils::inset(square, 1.0);
        REQUIRE_FALSE(inner.empty());
        CHECK(PolygonUtils::area(inner) == doctest::Approx(64.0).epsilon(0.001));
        for (const auto& v : inner) {
            CHECK(PolygonUtils::containsPoint(square, v));
        }
    }

    TEST_CASE("inset accepts clockwise input") {
        Polygon square = makeRect(0, 0, 10, 10);
        Polygon clockwise(square.rbegin(), square.rend());
        Polygon inner = PolygonUtils::inset(clockwise, 2.0);
        CHECK(PolygonUtils::area(inner) == doctest::Approx(36.0).epsilon(0.001));
    }

    TEST_CASE("inset area shrinks monotonically") {
        // L-shaped block
        Polygon ell = {{0, 0}, {30, 0}, {30, 10}, {10, 10}, {10, 30}, {0, 30}};
        double previous = PolygonUtils::area(ell);
        for (double s : {0.5, 1.0, 2.0, 3.0, 4.0}) {
            Polygon inner = PolygonUtils::inset(ell, s);
            double a = PolygonUtils::area(inner);
            CHECK(a <= previous);
            previous = a;
        }
    }

    TEST_CASE("splitByChord halves a rectangle") {
        Polygon rect = makeRect(0, 0, 20, 10);
        auto halves = PolygonUtils::splitByChord(rect, 0, 0.5);
        REQUIRE(halves.has_value());
        CHECK(PolygonUtils::signedArea(halves->first) == doctest::Approx(100.0));
        CHECK(PolygonUtils::signedArea(halves->second) == doctest::Approx(100.0));
    }

    TEST_CASE("splitByChord preserves total area") {
        Polygon poly = {{0, 0}, {40, 0}, {35, 20}, {5, 25}};
        size_t edge = PolygonUtils::longestEdge(poly);
        auto halves = PolygonUtils::splitByChord(poly, edge, 0.4);
        REQUIRE(halves.has_value());
        double total = PolygonUtils::area(halves->first) + PolygonUtils::area(halves->second);
        CHECK(total == doctest::Approx(PolygonUtils::area(poly)).epsilon(0.001));
    }
}
