#pragma once

#include "streamline_city/field/Tensor.h"

#include <glm/glm.hpp>
#include <memory>

namespace streamline_city {
namespace field {

enum class FieldType {
    Grid,
    Radial
};

/**
 * BasisField - one primitive of the tensor field
 *
 * A primitive contributes its tensor around `centre`, weighted by a falloff
 * of the distance normalised by `size`. Primitives are immutable once built;
 * editing replaces them.
 */
class BasisField {
public:
    BasisField(const glm::vec2& centre, double size, double decay)
        : centre_(centre), size_(size), decay_(decay) {}
    virtual ~BasisField() = default;

    virtual FieldType type() const = 0;
    virtual Tensor getTensor(const glm::vec2& point) const = 0;

    /**
     * Falloff weight at `point`.
     *
     * Default: max(0, 1 - d)^decay, zero outside the radius when decay is 0.
     * Smooth: d^-decay, unbounded at the centre; the field renormalises.
     */
    double getTensorWeight(const glm::vec2& point, bool smooth) const;

    const glm::vec2& centre() const { return centre_; }
    double size() const { return size_; }
    double decay() const { return decay_; }

protected:
    glm::vec2 centre_;
    double size_;
    double decay_;
};

/**
 * GridField - uniform orientation `theta` (radians)
 */
class GridField : public BasisField {
public:
    GridField(const glm::vec2& centre, double size, double decay, double theta)
        : BasisField(centre, size, decay), theta_(theta) {}

    FieldType type() const override { return FieldType::Grid; }
    Tensor getTensor(const glm::vec2& point) const override;

    double theta() const { return theta_; }

private:
    double theta_;
};

/**
 * RadialField - major eigenvector tangent to circles around the centre
 */
class RadialField : public BasisField {
public:
    RadialField(const glm::vec2& centre, double size, double decay)
        : BasisField(centre, size, decay) {}

    FieldType type() const override { return FieldType::Radial; }
    Tensor getTensor(const glm::vec2& point) const override;
};

using BasisFieldPtr = std::shared_ptr<const BasisField>;

} // namespace field
} // namespace streamline_city
