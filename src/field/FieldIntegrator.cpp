#include "streamline_city/field/FieldIntegrator.h"

namespace streamline_city {
namespace field {

namespace {

// Squared length below which a reference direction is ignored
constexpr float MIN_REFERENCE_LENGTH_SQ = 1e-12f;

} // anonymous namespace

FieldIntegrator::FieldIntegrator(std::shared_ptr<const TensorField> field)
    : field_(std::move(field)) {
    if (!field_) {
        field_ = std::make_shared<const TensorField>();
    }
}

glm::vec2 FieldIntegrator::sampleFieldVector(const glm::vec2& point, bool major) const {
    Tensor tensor = field_->samplePoint(point);
    return major ? tensor.major() : tensor.minor();
}

bool FieldIntegrator::onLand(const glm::vec2& point) const {
    return field_->onLand(point);
}

glm::vec2 EulerIntegrator::integrate(const glm::vec2& point, bool major,
                                     const std::optional<glm::vec2>& reference) const {
    glm::vec2 k1 = sampleFieldVector(point, major);
    if (reference.has_value() && glm::dot(*reference, *reference) > MIN_REFERENCE_LENGTH_SQ) {
        k1 = align(k1, *reference);
    }
    return k1 * static_cast<float>(dstep_);
}

glm::vec2 RK4Integrator::integrate(const glm::vec2& point, bool major,
                                   const std::optional<glm::vec2>& reference) const {
    glm::vec2 k1 = sampleFieldVector(point, major);
    if (glm::dot(k1, k1) < MIN_REFERENCE_LENGTH_SQ) {
        return glm::vec2(0.0f);
    }

    glm::vec2 ref = k1;
    if (reference.has_value() && glm::dot(*reference, *reference) > MIN_REFERENCE_LENGTH_SQ) {
        ref = glm::normalize(*reference);
        k1 = align(k1, ref);
    }

    const float h = static_cast<float>(dstep_);
    glm::vec2 k23 = align(sampleFieldVector(point + ref * (h * 0.5f), major), ref);
    glm::vec2 k4 = align(sampleFieldVector(point + ref * h, major), ref);

    return (k1 + k23 * 4.0f + k4) * (h / 6.0f);
}

const char* getIntegratorTypeName(IntegratorType type) {
    switch (type) {
        case IntegratorType::RK4: return "rk4";
        case IntegratorType::Euler: return "euler";
    }
    return "unknown";
}

std::optional<IntegratorType> parseIntegratorType(const std::string& name) {
    if (name == "rk4") return IntegratorType::RK4;
    if (name == "euler") return IntegratorType::Euler;
    return std::nullopt;
}

std::shared_ptr<FieldIntegrator> createIntegrator(IntegratorType type,
                                                  std::shared_ptr<const TensorField> field,
                                                  double dstep) {
    if (type == IntegratorType::Euler) {
        return std::make_shared<EulerIntegrator>(std::move(field), dstep);
    }
    return std::make_shared<RK4Integrator>(std::move(field), dstep);
}

} // namespace field
} // namespace streamline_city
