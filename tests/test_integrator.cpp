#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <cmath>
#include <memory>
#include <string>

#include "streamline_city/field/FieldIntegrator.h"
#include "streamline_city/field/TensorField.h"

using namespace streamline_city;
using namespace streamline_city::field;

static std::shared_ptr<const TensorField> makeGridField(double theta) {
    auto field = std::make_shared<TensorField>();
    field->addGrid({0, 0}, 10000.0, 1.0, theta);
    return field;
}

TEST_SUITE("FieldIntegrator") {
    TEST_CASE("RK4 step on a uniform grid") {
        RK4Integrator integrator(makeGridField(0.0), 2.0);
        glm::vec2 step = integrator.integrate({10, 10}, true);
        CHECK(glm::length(step) == doctest::Approx(2.0f));
        CHECK(std::abs(step.y) < 1e-4f);

        glm::vec2 minor = integrator.integrate({10, 10}, false);
        CHECK(std::abs(minor.x) < 1e-4f);
        CHECK(std::abs(minor.y) == doctest::Approx(2.0f));
    }

    TEST_CASE("reference direction resolves the sign") {
        RK4Integrator integrator(makeGridField(0.0), 1.0);
        glm::vec2 forward = integrator.integrate({10, 10}, true, glm::vec2(1.0f, 0.1f));
        glm::vec2 backward = integrator.integrate({10, 10}, true, glm::vec2(-1.0f, 0.1f));
        CHECK(forward.x > 0.0f);
        CHECK(backward.x < 0.0f);
    }

    TEST_CASE("Euler and RK4 agree on a uniform field") {
        auto field = makeGridField(M_PI / 5.0);
        RK4Integrator rk4(field, 1.0);
        EulerIntegrator euler(field, 1.0);
        glm::vec2 ref(1.0f, 1.0f);
        glm::vec2 a = rk4.integrate({50, 50}, true, ref);
        glm::vec2 b = euler.integrate({50, 50}, true, ref);
        CHECK(a.x == doctest::Approx(b.x).epsilon(0.001));
        CHECK(a.y == doctest::Approx(b.y).epsilon(0.001));
    }

    TEST_CASE("degenerate points give a zero step") {
        auto field = std::make_shared<TensorField>();
        field->addGrid({0, 0}, 10000.0, 1.0, 0.0);
        field->setSea({{0, 0}, {100, 0}, {100, 100}, {0, 100}});
        RK4Integrator integrator(field, 1.0);
        CHECK(glm::length(integrator.integrate({50, 50}, true)) == doctest::Approx(0.0f));
        CHECK_FALSE(integrator.onLand({50, 50}));
        CHECK(integrator.onLand({150, 50}));
    }

    TEST_CASE("RK4 follows a circle around a radial centre") {
        auto field = std::make_shared<TensorField>();
        field->addRadial({0, 0}, 10000.0, 1.0);
        RK4Integrator integrator(field, 1.0);

        glm::vec2 p(50.0f, 0.0f);
        glm::vec2 dir(0.0f, 1.0f);
        for (int i = 0; i < 100; ++i) {
            glm::vec2 step = integrator.integrate(p, true, dir);
            p += step;
            dir = step;
        }
        CHECK(glm::length(p) == doctest::Approx(50.0f).epsilon(0.02));
    }

    TEST_CASE("null field falls back to the default grid") {
        RK4Integrator integrator(nullptr, 1.0);
        glm::vec2 v = integrator.sampleFieldVector({3, 4}, true);
        CHECK(std::abs(v.x) == doctest::Approx(1.0f));
    }

    TEST_CASE("integrator factory") {
        auto field = makeGridField(0.0);
        auto rk4 = createIntegrator(IntegratorType::RK4, field, 1.0);
        auto euler = createIntegrator(IntegratorType::Euler, field, 1.0);
        CHECK(dynamic_cast<const RK4Integrator*>(rk4.get()) != nullptr);
        CHECK(dynamic_cast<const EulerIntegrator*>(euler.get()) != nullptr);
        CHECK(glm::length(euler->integrate({10, 10}, true)) == doctest::Approx(1.0f));

        CHECK(parseIntegratorType("rk4") == IntegratorType::RK4);
        CHECK(parseIntegratorType("euler") == IntegratorType::Euler);
        CHECK_FALSE(parseIntegratorType("midpoint").has_value());
        CHECK(std::string(getIntegratorTypeName(IntegratorType::Euler)) == "euler");
    }
}
