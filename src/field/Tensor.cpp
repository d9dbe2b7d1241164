#include "streamline_city/field/Tensor.h"

#include <cmath>

namespace streamline_city {
namespace field {

Tensor::Tensor(double r, double m0, double m1) {
    double len = std::hypot(m0, m1);
    if (len <= 0.0 || r <= 0.0) {
        return;
    }
    r_ = r * len;
    m0_ = m0 / len;
    m1_ = m1 / len;
}

Tensor Tensor::fromAngle(double angle) {
    return Tensor(1.0, std::cos(2.0 * angle), std::sin(2.0 * angle));
}

Tensor& Tensor::add(const Tensor& other) {
    double x = m0_ * r_ + other.m0_ * other.r_;
    double y = m1_ * r_ + other.m1_ * other.r_;
    *this = Tensor(1.0, x, y);
    return *this;
}

Tensor& Tensor::scale(double s) {
    if (s <= 0.0) {
        *this = Tensor();
    } else {
        r_ *= s;
    }
    return *this;
}

Tensor& Tensor::rotate(double angle) {
    if (angle == 0.0 || isDegenerate()) {
        return *this;
    }
    double newTheta = theta() + angle;
    m0_ = std::cos(2.0 * newTheta);
    m1_ = std::sin(2.0 * newTheta);
    return *this;
}

double Tensor::theta() const {
    if (isDegenerate()) {
        return 0.0;
    }
    return std::atan2(m1_, m0_) / 2.0;
}

glm::vec2 Tensor::major() const {
    if (isDegenerate()) {
        return glm::vec2(0.0f);
    }
    double t = theta();
    return glm::vec2(static_cast<float>(std::cos(t)), static_cast<float>(std::sin(t)));
}

glm::vec2 Tensor::minor() const {
    if (isDegenerate()) {
        return glm::vec2(0.0f);
    }
    double t = theta() + M_PI / 2.0;
    return glm::vec2(static_cast<float>(std::cos(t)), static_cast<float>(std::sin(t)));
}

} // namespace field
} // namespace streamline_city
