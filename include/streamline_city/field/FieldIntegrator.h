#pragma once

#include "streamline_city/field/TensorField.h"

#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace streamline_city {
namespace field {

/**
 * FieldIntegrator - turns the tensor field into step vectors
 *
 * Holds an immutable snapshot of the field, so edits made to the caller's
 * TensorField after construction never reach an in-progress generation.
 */
class FieldIntegrator {
public:
    explicit FieldIntegrator(std::shared_ptr<const TensorField> field);
    virtual ~FieldIntegrator() = default;

    /**
     * One integration step of length ~dstep from `point`.
     *
     * Each field sample is flipped to agree (dot >= 0) with `reference`, or
     * with the first sample when no reference is given. Returns a zero vector
     * at degenerate points.
     */
    virtual glm::vec2 integrate(const glm::vec2& point, bool major,
                                const std::optional<glm::vec2>& reference = std::nullopt) const = 0;

    // Raw unit eigenvector at `point`, sign unresolved
    glm::vec2 sampleFieldVector(const glm::vec2& point, bool major) const;

    bool onLand(const glm::vec2& point) const;

    const TensorField& field() const { return *field_; }

protected:
    std::shared_ptr<const TensorField> field_;

    // Flip `v` so that it points the same way as `reference`
    static glm::vec2 align(const glm::vec2& v, const glm::vec2& reference) {
        return glm::dot(v, reference) < 0.0f ? -v : v;
    }
};

/**
 * EulerIntegrator - single sample per step
 */
class EulerIntegrator : public FieldIntegrator {
public:
    EulerIntegrator(std::shared_ptr<const TensorField> field, double dstep)
        : FieldIntegrator(std::move(field)), dstep_(dstep) {}

    glm::vec2 integrate(const glm::vec2& point, bool major,
                        const std::optional<glm::vec2>& reference = std::nullopt) const override;

private:
    double dstep_;
};

/**
 * RK4Integrator - classic fourth-order Runge-Kutta over the direction field
 *
 * k1 = f(p), k2 = k3 = f(p + h/2), k4 = f(p + h), where h is dstep along the
 * reference direction. Result is (k1 + 4 k23 + k4) * dstep / 6.
 */
class RK4Integrator : public FieldIntegrator {
public:
    RK4Integrator(std::shared_ptr<const TensorField> field, double dstep)
        : FieldIntegrator(std::move(field)), dstep_(dstep) {}

    glm::vec2 integrate(const glm::vec2& point, bool major,
                        const std::optional<glm::vec2>& reference = std::nullopt) const override;

private:
    double dstep_;
};

enum class IntegratorType {
    RK4,
    Euler
};

const char* getIntegratorTypeName(IntegratorType type);
std::optional<IntegratorType> parseIntegratorType(const std::string& name);

std::shared_ptr<FieldIntegrator> createIntegrator(IntegratorType type,
                                                  std::shared_ptr<const TensorField> field,
                                                  double dstep);

} // namespace field
} // namespace streamline_city
