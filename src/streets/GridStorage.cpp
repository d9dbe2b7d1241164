#include "streamline_city/streets/GridStorage.h"

#include <algorithm>
#include <cmath>

namespace streamline_city {
namespace streets {

GridStorage::GridStorage(const glm::vec2& worldDimensions, const glm::vec2& origin, float dsep)
    : worldDimensions_(worldDimensions)
    , origin_(origin)
    , dsep_(dsep > 0.0f ? dsep : 1.0f) {
    gridWidth_ = std::max(1, static_cast<int>(std::ceil(worldDimensions_.x / dsep_)));
    gridHeight_ = std::max(1, static_cast<int>(std::ceil(worldDimensions_.y / dsep_)));
    cells_.resize(static_cast<size_t>(gridWidth_) * gridHeight_);
}

void GridStorage::addAll(const GridStorage& other) {
    for (const auto& samples : other.cells_) {
        for (const auto& sample : samples) {
            addSample(sample);
        }
    }
}

void GridStorage::addPolyline(const std::vector<glm::vec2>& line) {
    for (const auto& v : line) {
        addSample(v);
    }
}

void GridStorage::addSample(const glm::vec2& v) {
    glm::ivec2 coords = getCellCoords(v);
    cells_[static_cast<size_t>(coords.y) * gridWidth_ + coords.x].push_back(v);
    ++count_;
}

bool GridStorage::isValidSample(const glm::vec2& v, float dSq) const {
    glm::ivec2 coords = getCellCoords(v);

    // Check samples in 9 cells in 3x3 grid
    for (int x = -1; x <= 1; x++) {
        for (int y = -1; y <= 1; y++) {
            int cx = coords.x + x;
            int cy = coords.y + y;
            if (cellOutOfBounds(cx, cy)) continue;

            for (const auto& sample : cell(cx, cy)) {
                glm::vec2 d = sample - v;
                if (glm::dot(d, d) < dSq) {
                    return false;
                }
            }
        }
    }

    return true;
}

std::vector<glm::vec2> GridStorage::getNearbyPoints(const glm::vec2& v, float distance) const {
    int radius = static_cast<int>(std::ceil((distance / dsep_) - 0.5f));
    radius = std::max(radius, 0);
    glm::ivec2 coords = getCellCoords(v);

    std::vector<glm::vec2> out;
    for (int x = -radius; x <= radius; x++) {
        for (int y = -radius; y <= radius; y++) {
            int cx = coords.x + x;
            int cy = coords.y + y;
            if (cellOutOfBounds(cx, cy)) continue;

            const auto& samples = cell(cx, cy);
            out.insert(out.end(), samples.begin(), samples.end());
        }
    }
    return out;
}

void GridStorage::clear() {
    for (auto& samples : cells_) {
        samples.clear();
    }
    count_ = 0;
}

glm::ivec2 GridStorage::getCellCoords(const glm::vec2& v) const {
    glm::vec2 z = v - origin_;
    int x = static_cast<int>(std::floor(z.x / dsep_));
    int y = static_cast<int>(std::floor(z.y / dsep_));
    return glm::ivec2(std::clamp(x, 0, gridWidth_ - 1), std::clamp(y, 0, gridHeight_ - 1));
}

} // namespace streets
} // namespace streamline_city
