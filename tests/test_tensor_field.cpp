#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <cmath>

#include "streamline_city/field/BasisField.h"
#include "streamline_city/field/Tensor.h"
#include "streamline_city/field/TensorField.h"
#include "streamline_city/utils/Random.h"

using namespace streamline_city;
using namespace streamline_city::field;

static geom::Polygon makeRect(float x0, float y0, float x1, float y1) {
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

TEST_SUITE("Tensor") {
    TEST_CASE("fromAngle eigenvectors") {
        Tensor t = Tensor::fromAngle(0.0);
        CHECK(t.major().x == doctest::Approx(1.0f));
        CHECK(t.major().y == doctest::Approx(0.0f));
        CHECK(std::abs(t.minor().y) == doctest::Approx(1.0f));
        CHECK(glm::dot(t.major(), t.minor()) == doctest::Approx(0.0f));
    }

    TEST_CASE("theta round trips within half a turn") {
        Tensor t = Tensor::fromAngle(M_PI / 6.0);
        CHECK(t.theta() == doctest::Approx(M_PI / 6.0));

        // Direction is sign-ambiguous: +pi is the same tensor
        Tensor u = Tensor::fromAngle(M_PI / 6.0 + M_PI);
        CHECK(u.m0() == doctest::Approx(t.m0()));
        CHECK(u.m1() == doctest::Approx(t.m1()));
    }

    TEST_CASE("zero tensor is degenerate") {
        Tensor z = Tensor::zero();
        CHECK(z.isDegenerate());
        CHECK(glm::length(z.major()) == doctest::Approx(0.0f));
        CHECK(glm::length(z.minor()) == doctest::Approx(0.0f));
    }

    TEST_CASE("opposing tensors cancel") {
        Tensor t = Tensor::fromAngle(0.0);
        t.add(Tensor::fromAngle(M_PI / 2.0));
        CHECK(t.isDegenerate());
    }

    TEST_CASE("rotate turns the major eigenvector") {
        Tensor t = Tensor::fromAngle(0.0);
        t.rotate(M_PI / 4.0);
        glm::vec2 m = t.major();
        CHECK(std::abs(m.x) == doctest::Approx(std::sqrt(0.5)).epsilon(0.001));
        CHECK(std::abs(m.y) == doctest::Approx(std::sqrt(0.5)).epsilon(0.001));
    }
}

TEST_SUITE("BasisField") {
    TEST_CASE("weight falls off with distance") {
        GridField grid({0, 0}, 100.0, 2.0, 0.0);
        CHECK(grid.getTensorWeight({0, 0}, false) == doctest::Approx(1.0));
        CHECK(grid.getTensorWeight({50, 0}, false) == doctest::Approx(0.25));
        CHECK(grid.getTensorWeight({150, 0}, false) == doctest::Approx(0.0));
    }

    TEST_CASE("zero decay is a hard disc") {
        GridField grid({0, 0}, 100.0, 0.0, 0.0);
        CHECK(grid.getTensorWeight({99, 0}, false) == doctest::Approx(1.0));
        CHECK(grid.getTensorWeight({100, 0}, false) == doctest::Approx(0.0));
    }

    TEST_CASE("radial major eigenvector is tangential") {
        RadialField radial({50, 50}, 100.0, 1.0);
        for (glm::vec2 p : {glm::vec2(60, 50), glm::vec2(50, 80), glm::vec2(30, 20)}) {
            glm::vec2 radius = glm::normalize(p - glm::vec2(50, 50));
            Tensor t = radial.getTensor(p);
            CHECK(std::abs(glm::dot(t.major(), radius)) < 1e-4f);
            CHECK(std::abs(glm::dot(t.minor(), radius)) == doctest::Approx(1.0f).epsilon(0.001));
        }
    }

    TEST_CASE("radial centre is degenerate") {
        RadialField radial({50, 50}, 100.0, 1.0);
        CHECK(radial.getTensor({50, 50}).isDegenerate());
    }
}

TEST_SUITE("TensorField") {
    TEST_CASE("empty field defaults to the x axis") {
        TensorField field;
        Tensor t = field.samplePoint({123, 456});
        CHECK(t.major().x == doctest::Approx(1.0f));
        CHECK(t.major().y == doctest::Approx(0.0f));
    }

    TEST_CASE("single grid dominates inside its radius") {
        TensorField field;
        field.addGrid({0, 0}, 500.0, 1.0, M_PI / 4.0);
        Tensor t = field.samplePoint({10, 10});
        CHECK(t.theta() == doctest::Approx(M_PI / 4.0));
    }

    TEST_CASE("sea and river are degenerate and off land") {
        TensorField field;
        field.addGrid({0, 0}, 1000.0, 1.0, 0.0);
        field.setSea(makeRect(0, 0, 100, 100));
        field.setRiver(makeRect(200, 0, 220, 300));

        CHECK_FALSE(field.onLand({50, 50}));
        CHECK(field.inSea({50, 50}));
        CHECK(field.samplePoint({50, 50}).isDegenerate());

        CHECK_FALSE(field.onLand({210, 150}));
        CHECK(field.inRiver({210, 150}));

        CHECK(field.onLand({150, 150}));
        CHECK_FALSE(field.samplePoint({150, 150}).isDegenerate());

        field.ignoreRiver = true;
        CHECK(field.onLand({210, 150}));
    }

    TEST_CASE("parks rotate the field") {
        NoiseParams noise;
        noise.noiseAnglePark = 90.0;
        TensorField field(noise, 7);
        field.addGrid({0, 0}, 1000.0, 1.0, 0.0);
        field.addPark(makeRect(0, 0, 200, 200));
        CHECK(field.inParks({100, 100}));
        CHECK_FALSE(field.inParks({300, 100}));

        // Outside the park the grid is untouched
        CHECK(field.samplePoint({300, 100}).theta() == doctest::Approx(0.0));

        bool rotated = false;
        for (float x = 5.0f; x < 200.0f; x += 13.0f) {
            if (std::abs(field.samplePoint({x, 77.0f}).theta()) > 1e-3) {
                rotated = true;
            }
        }
        CHECK(rotated);
    }

    TEST_CASE("smooth mode blends two grids") {
        TensorField field;
        field.smooth = true;
        field.addGrid({0, 0}, 100.0, 2.0, 0.0);
        field.addGrid({100, 0}, 100.0, 2.0, M_PI / 3.0);

        double a = field.samplePoint({10, 0}).theta();
        double b = field.samplePoint({90, 0}).theta();
        CHECK(std::abs(a) < std::abs(b));
        CHECK(b == doctest::Approx(M_PI / 3.0).epsilon(0.05));
    }

    TEST_CASE("recommended field is reproducible") {
        utils::Random r1(42);
        utils::Random r2(42);
        TensorField f1;
        TensorField f2;
        f1.setRecommended({0, 0}, {1000, 800}, r1);
        f2.setRecommended({0, 0}, {1000, 800}, r2);

        REQUIRE(f1.fields().size() == 5);
        CHECK(f1.fields().back()->type() == FieldType::Radial);
        for (glm::vec2 p : {glm::vec2(100, 100), glm::vec2(500, 400), glm::vec2(900, 700)}) {
            CHECK(f1.samplePoint(p).theta() == doctest::Approx(f2.samplePoint(p).theta()));
        }
    }
}
