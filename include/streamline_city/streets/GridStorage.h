#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <vector>

namespace streamline_city {
namespace streets {

/**
 * GridStorage - uniform cell grid over accepted streamline samples
 *
 * Cells are dsep wide, so any sample within dsep of a query lies in the 3x3
 * block of cells around it. Points outside the domain are stored in the
 * nearest border cell.
 */
class GridStorage {
public:
    GridStorage(const glm::vec2& worldDimensions, const glm::vec2& origin, float dsep);

    // Copies every sample of `other` into this grid
    void addAll(const GridStorage& other);

    void addPolyline(const std::vector<glm::vec2>& line);

    void addSample(const glm::vec2& v);

    /**
     * True if no stored sample is closer than sqrt(dSq) to `v`.
     * Only the 3x3 neighbourhood is scanned, so dSq must not exceed dsep^2.
     */
    bool isValidSample(const glm::vec2& v, float dSq) const;

    /**
     * Samples from the (2r+1)^2 cells around `v`, r = ceil(distance/dsep - 0.5).
     * Callers filter by exact distance; samples near the far rim may be missed.
     */
    std::vector<glm::vec2> getNearbyPoints(const glm::vec2& v, float distance) const;

    void clear();

    size_t size() const { return count_; }
    float dsep() const { return dsep_; }

private:
    glm::vec2 worldDimensions_;
    glm::vec2 origin_;
    float dsep_;
    int gridWidth_;
    int gridHeight_;
    size_t count_ = 0;

    std::vector<std::vector<glm::vec2>> cells_;

    glm::ivec2 getCellCoords(const glm::vec2& v) const;

    bool cellOutOfBounds(int x, int y) const {
        return x < 0 || y < 0 || x >= gridWidth_ || y >= gridHeight_;
    }

    const std::vector<glm::vec2>& cell(int x, int y) const {
        return cells_[static_cast<size_t>(y) * gridWidth_ + x];
    }
};

} // namespace streets
} // namespace streamline_city
