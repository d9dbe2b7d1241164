#pragma once

#include <glm/glm.hpp>

namespace streamline_city {
namespace field {

/**
 * Tensor - symmetric traceless 2x2 tensor
 *
 * Stored as a magnitude r and the unit pair [cos 2θ, sin 2θ], which is the
 * first row of
 *
 *     R * | cos 2θ   sin 2θ |
 *         | sin 2θ  -cos 2θ |
 *
 * The major eigenvector points along θ, the minor one along θ + π/2. Both
 * carry a sign ambiguity that callers resolve by continuity.
 */
class Tensor {
public:
    Tensor() = default;

    // (m0, m1) need not be normalised; their length is folded into r
    Tensor(double r, double m0, double m1);

    static Tensor zero() { return Tensor(); }

    // Tensor whose major eigenvector points along `angle`
    static Tensor fromAngle(double angle);

    // Component-wise sum of the two tensors, renormalised
    Tensor& add(const Tensor& other);

    Tensor& scale(double s);

    // Rotate eigenvectors by `angle` radians
    Tensor& rotate(double angle);

    double r() const { return r_; }
    double m0() const { return m0_; }
    double m1() const { return m1_; }

    // Angle of the major eigenvector in (-π/2, π/2]
    double theta() const;

    // Both eigenvalues equal: no preferred direction
    bool isDegenerate() const { return r_ <= DEGENERATE_EPSILON; }

    glm::vec2 major() const;
    glm::vec2 minor() const;

    static constexpr double DEGENERATE_EPSILON = 1e-9;

private:
    double r_ = 0.0;
    double m0_ = 0.0;
    double m1_ = 0.0;
};

} // namespace field
} // namespace streamline_city
