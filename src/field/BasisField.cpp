#include "streamline_city/field/BasisField.h"

#include <algorithm>
#include <cmath>

namespace streamline_city {
namespace field {

namespace {
// Cap for the smooth falloff at the centre itself
constexpr double MAX_SMOOTH_WEIGHT = 1e9;
}

double BasisField::getTensorWeight(const glm::vec2& point, bool smooth) const {
    if (size_ <= 0.0) {
        return 0.0;
    }
    double normDistanceToCentre = glm::distance(point, centre_) / size_;

    if (smooth) {
        if (normDistanceToCentre <= 0.0) {
            return MAX_SMOOTH_WEIGHT;
        }
        return std::min(MAX_SMOOTH_WEIGHT, std::pow(normDistanceToCentre, -decay_));
    }

    if (decay_ == 0.0 && normDistanceToCentre >= 1.0) {
        return 0.0;
    }
    return std::pow(std::max(0.0, 1.0 - normDistanceToCentre), decay_);
}

Tensor GridField::getTensor(const glm::vec2& /*point*/) const {
    return Tensor::fromAngle(theta_);
}

Tensor RadialField::getTensor(const glm::vec2& point) const {
    glm::dvec2 t = glm::dvec2(point) - glm::dvec2(centre_);
    double t1 = t.y * t.y - t.x * t.x;
    double t2 = -2.0 * t.x * t.y;
    double len = std::hypot(t1, t2);
    if (len <= 0.0) {
        // Centre of the pattern
        return Tensor::zero();
    }
    return Tensor(1.0, t1 / len, t2 / len);
}

} // namespace field
} // namespace streamline_city
