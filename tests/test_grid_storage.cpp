#include <doctest/doctest.h>
#include <glm/glm.hpp>

#include "streamline_city/streets/GridStorage.h"

using namespace streamline_city::streets;

TEST_SUITE("GridStorage") {
    TEST_CASE("empty grid accepts everything") {
        GridStorage grid({100, 100}, {0, 0}, 10.0f);
        CHECK(grid.size() == 0);
        CHECK(grid.isValidSample({50, 50}, 100.0f));
        CHECK(grid.getNearbyPoints({50, 50}, 30.0f).empty());
    }

    TEST_CASE("isValidSample rejects samples closer than the distance") {
        GridStorage grid({100, 100}, {0, 0}, 10.0f);
        grid.addSample({25, 25});

        CHECK_FALSE(grid.isValidSample({27, 25}, 9.0f));
        CHECK(grid.isValidSample({28, 25}, 9.0f));
        CHECK(grid.isValidSample({40, 25}, 100.0f));

        // Neighbouring cell across the boundary
        grid.addSample({29.9f, 50});
        CHECK_FALSE(grid.isValidSample({30.1f, 50}, 1.0f));
    }

    TEST_CASE("addPolyline and clear") {
        GridStorage grid({100, 100}, {0, 0}, 10.0f);
        grid.addPolyline({{1, 1}, {2, 2}, {3, 3}});
        CHECK(grid.size() == 3);
        grid.clear();
        CHECK(grid.size() == 0);
        CHECK(grid.isValidSample({2, 2}, 1.0f));
    }

    TEST_CASE("points outside the domain go to border cells") {
        GridStorage grid({100, 100}, {0, 0}, 10.0f);
        grid.addSample({-5, -5});
        grid.addSample({150, 50});
        CHECK(grid.size() == 2);
        CHECK_FALSE(grid.isValidSample({-4, -5}, 4.0f));
        CHECK_FALSE(grid.isValidSample({149, 50}, 4.0f));
    }

    TEST_CASE("non-zero origin") {
        GridStorage grid({100, 100}, {-50, -50}, 10.0f);
        grid.addSample({-45, -45});
        CHECK_FALSE(grid.isValidSample({-44, -45}, 4.0f));
        CHECK(grid.isValidSample({45, 45}, 4.0f));
    }

    TEST_CASE("getNearbyPoints covers the search radius") {
        GridStorage grid({200, 200}, {0, 0}, 10.0f);
        grid.addSample({100, 100});
        grid.addSample({125, 100});
        grid.addSample({190, 190});

        auto near = grid.getNearbyPoints({101, 101}, 30.0f);
        CHECK(near.size() == 2);

        auto tight = grid.getNearbyPoints({101, 101}, 4.0f);
        CHECK(tight.size() == 1);
    }

    TEST_CASE("addAll copies samples between grids of different spacing") {
        GridStorage coarse({100, 100}, {0, 0}, 50.0f);
        coarse.addPolyline({{10, 10}, {60, 60}});

        GridStorage fine({100, 100}, {0, 0}, 5.0f);
        fine.addAll(coarse);
        CHECK(fine.size() == 2);
        CHECK_FALSE(fine.isValidSample({61, 60}, 4.0f));

        // The source is left untouched
        CHECK(coarse.size() == 2);
    }
}
