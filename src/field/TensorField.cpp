#include "streamline_city/field/TensorField.h"

#include <cmath>
#include <memory>

namespace streamline_city {
namespace field {

TensorField::TensorField(const NoiseParams& noiseParams, uint32_t noiseSeed)
    : noiseParams_(noiseParams), noise_(noiseSeed) {}

void TensorField::addGrid(const glm::vec2& centre, double size, double decay, double theta) {
    fields_.push_back(std::make_shared<GridField>(centre, size, decay, theta));
}

void TensorField::addRadial(const glm::vec2& centre, double size, double decay) {
    fields_.push_back(std::make_shared<RadialField>(centre, size, decay));
}

void TensorField::addField(BasisFieldPtr field) {
    if (field) {
        fields_.push_back(std::move(field));
    }
}

void TensorField::reset() {
    fields_.clear();
    parks_.clear();
    sea_.clear();
    river_.clear();
}

void TensorField::setRecommended(const glm::vec2& origin, const glm::vec2& dimensions,
                                 utils::Random& random) {
    fields_.clear();

    const double width = dimensions.x;
    glm::vec2 size = dimensions * 0.7f;
    glm::vec2 tlCorner = origin + (dimensions - size) * 0.5f;
    glm::vec2 trCorner = tlCorner + glm::vec2(size.x, 0.0f);
    glm::vec2 brCorner = tlCorner + size;
    glm::vec2 blCorner = tlCorner + glm::vec2(0.0f, size.y);

    for (const auto& corner : {tlCorner, trCorner, brCorner, blCorner}) {
        addGrid(corner, random.range(width / 4.0, width), random.range(0.0, 50.0),
                random.range(0.0, M_PI / 2.0));
    }

    // Radial field somewhere in the middle 40% of the domain
    glm::vec2 centre = origin + dimensions * 0.5f;
    glm::vec2 spread = dimensions * 0.4f;
    glm::vec2 location(
        centre.x + static_cast<float>(random.range(-0.5, 0.5)) * spread.x,
        centre.y + static_cast<float>(random.range(-0.5, 0.5)) * spread.y
    );
    addRadial(location, random.range(width / 10.0, width / 5.0), random.range(0.0, 50.0));
}

Tensor TensorField::samplePoint(const glm::vec2& point) const {
    // Degenerate point in water
    if (!onLand(point)) {
        return Tensor::zero();
    }

    // Default field is a grid
    if (fields_.empty()) {
        return Tensor::fromAngle(0.0);
    }

    Tensor tensorAcc;
    double totalWeight = 0.0;
    for (const auto& field : fields_) {
        double w = field->getTensorWeight(point, smooth);
        if (w <= 0.0) continue;

        tensorAcc.add(field->getTensor(point).scale(w));
        totalWeight += w;
    }

    if (totalWeight <= 0.0) {
        return Tensor::fromAngle(0.0);
    }
    if (smooth) {
        tensorAcc.scale(1.0 / totalWeight);
    }

    if (inParks(point)) {
        tensorAcc.rotate(getRotationalNoise(point, noiseParams_.noiseSizePark,
                                            noiseParams_.noiseAnglePark));
    }

    if (noiseParams_.globalNoise) {
        tensorAcc.rotate(getRotationalNoise(point, noiseParams_.noiseSizeGlobal,
                                            noiseParams_.noiseAngleGlobal));
    }

    return tensorAcc;
}

bool TensorField::onLand(const glm::vec2& point) const {
    if (inSea(point)) {
        return false;
    }
    if (!ignoreRiver && inRiver(point)) {
        return false;
    }
    return true;
}

bool TensorField::inParks(const glm::vec2& point) const {
    for (const auto& park : parks_) {
        if (geom::PolygonUtils::containsPoint(park, point)) {
            return true;
        }
    }
    return false;
}

bool TensorField::inSea(const glm::vec2& point) const {
    return sea_.size() >= 3 && geom::PolygonUtils::containsPoint(sea_, point);
}

bool TensorField::inRiver(const glm::vec2& point) const {
    return river_.size() >= 3 && geom::PolygonUtils::containsPoint(river_, point);
}

double TensorField::getRotationalNoise(const glm::vec2& point, double noiseSize,
                                       double noiseAngle) const {
    if (noiseSize <= 0.0) {
        return 0.0;
    }
    double n = noise_.get(point.x / noiseSize, point.y / noiseSize);
    return n * noiseAngle * M_PI / 180.0;
}

} // namespace field
} // namespace streamline_city
