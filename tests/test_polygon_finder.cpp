#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <memory>
#include <utility>
#include <vector>

#include "streamline_city/blocks/PolygonFinder.h"
#include "streamline_city/field/TensorField.h"
#include "streamline_city/graph/Graph.h"

using namespace streamline_city;
using namespace streamline_city::blocks;
using geom::PolygonUtils;

namespace {

// n x n road lattice with `spacing` between roads
graph::Graph makeLatticeGraph(int n, float spacing) {
    std::vector<geom::Polyline> lines;
    float extent = static_cast<float>(n - 1) * spacing;
    for (int i = 0; i < n; ++i) {
        float c = static_cast<float>(i) * spacing;
        lines.push_back({{0.0f, c}, {extent, c}});
        lines.push_back({{c, 0.0f}, {c, extent}});
    }
    return graph::Graph::build(lines, 0.5f);
}

graph::Node makeNode(float x, float y, std::vector<size_t> neighbors) {
    graph::Node node;
    node.value = glm::vec2(x, y);
    node.neighbors = std::move(neighbors);
    return node;
}

double totalArea(const std::vector<Polygon>& polygons) {
    double area = 0.0;
    for (const auto& p : polygons) {
        area += PolygonUtils::area(p);
    }
    return area;
}

} // anonymous namespace

TEST_SUITE("PolygonFinder") {
    TEST_CASE("lattice faces are the bounded cells") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);
        PolygonFinder finder(g.nodes(), PolygonParams(), nullptr);
        finder.findPolygons();

        REQUIRE(finder.faces().size() == 9);
        for (const auto& face : finder.faces()) {
            CHECK(face.size() == 4);
            CHECK(PolygonUtils::signedArea(face) == doctest::Approx(900.0));
        }
        CHECK(finder.polygons().size() == 9);
    }

    TEST_CASE("square with a diagonal has two triangles") {
        std::vector<graph::Node> nodes = {
            makeNode(0, 0, {1, 3, 2}),
            makeNode(10, 0, {0, 2}),
            makeNode(10, 10, {1, 3, 0}),
            makeNode(0, 10, {2, 0})
        };
        PolygonFinder finder(nodes, PolygonParams(), nullptr);
        finder.findPolygons();

        REQUIRE(finder.faces().size() == 2);
        for (const auto& face : finder.faces()) {
            CHECK(face.size() == 3);
            CHECK(PolygonUtils::signedArea(face) == doctest::Approx(50.0));
        }
    }

    TEST_CASE("dangling spur inside a face is split off") {
        std::vector<graph::Node> nodes = {
            makeNode(0, 0, {1, 3}),
            makeNode(20, 0, {0, 2, 4}),
            makeNode(20, 20, {1, 3}),
            makeNode(0, 20, {2, 0}),
            makeNode(10, 8, {1})
        };
        PolygonFinder finder(nodes, PolygonParams(), nullptr);
        finder.findPolygons();

        REQUIRE(finder.faces().size() == 1);
        CHECK(finder.faces()[0].size() == 4);
        CHECK(PolygonUtils::signedArea(finder.faces()[0]) == doctest::Approx(400.0));
    }

    TEST_CASE("disconnected components each keep their faces") {
        std::vector<graph::Node> nodes = {
            makeNode(0, 0, {1, 3}),
            makeNode(10, 0, {0, 2}),
            makeNode(10, 10, {1, 3}),
            makeNode(0, 10, {2, 0}),
            makeNode(50, 0, {5, 7}),
            makeNode(60, 0, {4, 6}),
            makeNode(60, 10, {5, 7}),
            makeNode(50, 10, {6, 4})
        };
        PolygonFinder finder(nodes, PolygonParams(), nullptr);
        finder.findPolygons();
        CHECK(finder.faces().size() == 2);
    }

    TEST_CASE("maxFaceNodes drops large faces") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);
        PolygonParams params;
        params.maxFaceNodes = 3;
        PolygonFinder finder(g.nodes(), params, nullptr);
        finder.findPolygons();
        CHECK(finder.faces().empty());
    }

    TEST_CASE("faces in water or parks are dropped") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);

        auto field = std::make_shared<field::TensorField>();
        // Left column of cells in the sea, top-right cell a park
        field->setSea({{-5, -5}, {30, -5}, {30, 95}, {-5, 95}});
        field->addPark({{60, 60}, {90, 60}, {90, 90}, {60, 90}});

        PolygonFinder finder(g.nodes(), PolygonParams(), field);
        finder.findPolygons();
        CHECK(finder.faces().size() == 5);
        for (const auto& face : finder.faces()) {
            glm::vec2 c = PolygonUtils::averagePoint(face);
            CHECK(field->onLand(c));
            CHECK_FALSE(field->inParks(c));
        }
    }

    TEST_CASE("shrink insets every block") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);
        PolygonParams params;
        params.shrinkSpacing = 4.0f;
        PolygonFinder finder(g.nodes(), params, nullptr);
        finder.findPolygons();
        finder.shrink();

        REQUIRE(finder.shrunkPolygons().size() == 9);
        for (const auto& block : finder.shrunkPolygons()) {
            CHECK(PolygonUtils::area(block) == doctest::Approx(484.0).epsilon(0.001));
        }
    }

    TEST_CASE("shrinkPolygon applies the shrink stage rules") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);
        PolygonParams params;
        params.shrinkSpacing = 3.0f;
        PolygonFinder finder(g.nodes(), params, nullptr);
        finder.findPolygons();
        finder.shrink();

        REQUIRE(finder.shrunkPolygons().size() == finder.faces().size());
        for (size_t i = 0; i < finder.faces().size(); ++i) {
            auto single = finder.shrinkPolygon(finder.faces()[i], params.shrinkSpacing);
            REQUIRE(single.has_value());
            CHECK(*single == finder.shrunkPolygons()[i]);
        }

        geom::Polygon square = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
        auto half = finder.shrinkPolygon(square, 1.5);
        REQUIRE(half.has_value());
        CHECK(PolygonUtils::area(*half) == doctest::Approx(49.0).epsilon(0.001));

        auto unchanged = finder.shrinkPolygon(square, 0.0);
        REQUIRE(unchanged.has_value());
        CHECK(PolygonUtils::area(*unchanged) == doctest::Approx(100.0));

        CHECK_FALSE(finder.shrinkPolygon({{0, 0}, {10, 0}}, 1.0).has_value());
    }

    TEST_CASE("shrink is monotonic in spacing") {
        std::vector<geom::Polyline> lines = {
            {{0, 0}, {100, 0}, {110, 60}, {40, 90}, {0, 70}, {0, 0}},
            {{0, 35}, {105, 30}},
            {{50, 0}, {40, 90}}
        };
        graph::Graph g = graph::Graph::build(lines, 0.5f);
        PolygonParams params;

        params.shrinkSpacing = 1.0f;
        PolygonFinder small(g.nodes(), params, nullptr);
        small.findPolygons();
        small.shrink();

        params.shrinkSpacing = 3.0f;
        PolygonFinder large(g.nodes(), params, nullptr);
        large.findPolygons();
        large.shrink();

        REQUIRE(small.faces().size() == 4);
        REQUIRE(small.shrunkPolygons().size() == small.faces().size());
        REQUIRE(large.shrunkPolygons().size() == small.faces().size());
        for (size_t i = 0; i < small.faces().size(); ++i) {
            double original = PolygonUtils::area(small.faces()[i]);
            double a1 = PolygonUtils::area(small.shrunkPolygons()[i]);
            double a3 = PolygonUtils::area(large.shrunkPolygons()[i]);
            CHECK(a1 < original);
            CHECK(a3 < a1);
        }
    }

    TEST_CASE("divide respects minArea") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);
        PolygonParams params;
        params.maxLength = 8.0f;
        params.minArea = 50.0f;
        params.chanceNoDivide = 0.0f;
        PolygonFinder finder(g.nodes(), params, nullptr, 3);
        finder.findPolygons();
        finder.shrink();
        finder.divide();

        const auto& lots = finder.dividedPolygons();
        CHECK(lots.size() > finder.shrunkPolygons().size());
        for (const auto& lot : lots) {
            CHECK(PolygonUtils::area(lot) >= params.minArea);
            CHECK(PolygonUtils::signedArea(lot) > 0.0);
        }
        CHECK(totalArea(lots) == doctest::Approx(totalArea(finder.shrunkPolygons())).epsilon(0.01));
        CHECK(&finder.polygons() == &finder.dividedPolygons());
    }

    TEST_CASE("small blocks pass through whole") {
        graph::Graph g = makeLatticeGraph(3, 10.0f);
        PolygonParams params;
        params.shrinkSpacing = 2.0f;
        params.minArea = 50.0f;
        params.maxLength = 1.0f;
        params.chanceNoDivide = 0.0f;
        PolygonFinder finder(g.nodes(), params, nullptr);
        finder.findPolygons();
        finder.shrink();
        finder.divide();

        REQUIRE(finder.dividedPolygons().size() == 4);
        for (const auto& lot : finder.dividedPolygons()) {
            CHECK(PolygonUtils::area(lot) == doctest::Approx(36.0).epsilon(0.001));
        }
    }

    TEST_CASE("chanceNoDivide of one keeps blocks whole") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);
        PolygonParams params;
        params.chanceNoDivide = 1.0f;
        PolygonFinder finder(g.nodes(), params, nullptr, 5);
        finder.findPolygons();
        finder.shrink();
        finder.divide();

        const auto& blocks = finder.shrunkPolygons();
        const auto& lots = finder.dividedPolygons();
        REQUIRE(lots.size() == blocks.size());
        for (size_t i = 0; i < lots.size(); ++i) {
            CHECK(PolygonUtils::area(lots[i]) == doctest::Approx(PolygonUtils::area(blocks[i])));
        }
    }

    TEST_CASE("stepwise update matches blocking") {
        graph::Graph g = makeLatticeGraph(4, 30.0f);
        PolygonParams params;
        params.chanceNoDivide = 0.1f;

        PolygonFinder blocking(g.nodes(), params, nullptr, 9);
        blocking.findPolygons();
        blocking.shrink();
        blocking.divide();

        PolygonFinder stepwise(g.nodes(), params, nullptr, 9);
        stepwise.findPolygons();
        stepwise.shrink(true);
        while (stepwise.update()) {
        }
        CHECK(stepwise.shrunkPolygons().size() == blocking.shrunkPolygons().size());
        stepwise.divide(true);
        int steps = 0;
        while (stepwise.update()) {
            ++steps;
        }
        CHECK(steps > 0);

        REQUIRE(stepwise.dividedPolygons().size() == blocking.dividedPolygons().size());
        for (size_t i = 0; i < blocking.dividedPolygons().size(); ++i) {
            CHECK(stepwise.dividedPolygons()[i] == blocking.dividedPolygons()[i]);
        }
    }

    TEST_CASE("reset clears all stages") {
        graph::Graph g = makeLatticeGraph(3, 30.0f);
        PolygonFinder finder(g.nodes(), PolygonParams(), nullptr);
        finder.findPolygons();
        finder.shrink();
        finder.divide();
        finder.reset();
        CHECK(finder.faces().empty());
        CHECK(finder.shrunkPolygons().empty());
        CHECK(finder.dividedPolygons().empty());
        CHECK_FALSE(finder.update());
    }

    TEST_CASE("normalize clamps parameters") {
        PolygonParams params;
        params.maxLength = -1.0f;
        params.chanceNoDivide = 2.0f;
        params.maxFaceNodes = 1;
        CHECK_FALSE(params.normalize());
        CHECK(params.maxLength > 0.0f);
        CHECK(params.chanceNoDivide == doctest::Approx(1.0f));
        CHECK(params.maxFaceNodes == 3);
    }
}
