#include "streamline_city/blocks/PolygonFinder.h"

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <unordered_map>

namespace streamline_city {
namespace blocks {

using geom::PolygonUtils;

namespace {

constexpr double TWO_PI = 6.283185307179586;
constexpr double ANGLE_EPSILON = 1e-9;

} // anonymous namespace

bool PolygonParams::normalize() {
    bool ok = true;

    if (maxLength <= 0.0f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Lot maxLength must be positive (got %.2f), using 1", maxLength);
        maxLength = 1.0f;
        ok = false;
    }
    if (minArea < 0.0f) {
        minArea = 0.0f;
        ok = false;
    }
    if (shrinkSpacing < 0.0f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Negative shrinkSpacing %.2f, using 0", shrinkSpacing);
        shrinkSpacing = 0.0f;
        ok = false;
    }
    if (chanceNoDivide < 0.0f || chanceNoDivide > 1.0f) {
        chanceNoDivide = std::clamp(chanceNoDivide, 0.0f, 1.0f);
        ok = false;
    }
    if (maxFaceNodes < 3) {
        maxFaceNodes = 3;
        ok = false;
    }

    return ok;
}

PolygonFinder::PolygonFinder(const std::vector<graph::Node>& nodes,
                             const PolygonParams& params,
                             std::shared_ptr<const field::TensorField> field,
                             uint32_t seed)
    : nodes_(nodes)
    , params_(params)
    , field_(std::move(field))
    , random_(seed) {
    params_.normalize();
}

void PolygonFinder::reset() {
    faces_.clear();
    shrunkPolygons_.clear();
    dividedPolygons_.clear();
    toShrink_.clear();
    toDivide_.clear();
}

const std::vector<Polygon>& PolygonFinder::polygons() const {
    if (!dividedPolygons_.empty()) return dividedPolygons_;
    if (!shrunkPolygons_.empty()) return shrunkPolygons_;
    return faces_;
}

// ============================================================================
// Face tracing
// ============================================================================

void PolygonFinder::findPolygons() {
    reset();

    // One flag per directed edge, indexed like Node::neighbors
    std::vector<std::vector<bool>> visited(nodes_.size());
    size_t directedEdges = 0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        visited[i].assign(nodes_[i].neighbors.size(), false);
        directedEdges += nodes_[i].neighbors.size();
    }

    for (size_t start = 0; start < nodes_.size(); ++start) {
        for (size_t startSlot = 0; startSlot < nodes_[start].neighbors.size(); ++startSlot) {
            if (visited[start][startSlot]) continue;

            std::vector<size_t> walk{start};
            size_t from = start;
            size_t slot = startSlot;
            for (size_t steps = 0; steps < directedEdges && !visited[from][slot]; ++steps) {
                visited[from][slot] = true;
                size_t at = nodes_[from].neighbors[slot];
                walk.push_back(at);
                slot = getRightmostNeighbor(from, at);
                from = at;
            }

            for (const auto& loop : splitWalk(walk)) {
                if (loop.size() < 3 || loop.size() > params_.maxFaceNodes) continue;

                Polygon face;
                face.reserve(loop.size());
                for (size_t id : loop) {
                    face.push_back(nodes_[id].value);
                }
                // Bounded faces are walked clockwise
                if (PolygonUtils::signedArea(face) >= 0.0) continue;
                std::reverse(face.begin(), face.end());

                if (keepFace(face)) {
                    faces_.push_back(std::move(face));
                }
            }
        }
    }

    SDL_Log("PolygonFinder: %zu faces from %zu nodes", faces_.size(), nodes_.size());
}

size_t PolygonFinder::getRightmostNeighbor(size_t from, size_t at) const {
    const graph::Node& node = nodes_[at];
    glm::vec2 back = nodes_[from].value - node.value;
    double backAngle = std::atan2(back.y, back.x);

    size_t best = 0;
    double bestAngle = TWO_PI * 2.0;
    float bestDistance = 0.0f;

    for (size_t s = 0; s < node.neighbors.size(); ++s) {
        size_t n = node.neighbors[s];
        glm::vec2 d = nodes_[n].value - node.value;

        // Counter-clockwise angle from the reverse edge, in (0, 2pi]
        double angle = TWO_PI;
        if (n != from) {
            angle = std::atan2(d.y, d.x) - backAngle;
            while (angle <= 0.0) angle += TWO_PI;
            while (angle > TWO_PI) angle -= TWO_PI;
        }
        float distance = glm::length(d);

        bool better = angle < bestAngle - ANGLE_EPSILON;
        if (!better && std::abs(angle - bestAngle) <= ANGLE_EPSILON) {
            better = distance < bestDistance
                || (distance == bestDistance && n < node.neighbors[best]);
        }
        if (better) {
            best = s;
            bestAngle = angle;
            bestDistance = distance;
        }
    }
    return best;
}

std::vector<std::vector<size_t>> PolygonFinder::splitWalk(const std::vector<size_t>& walk) const {
    std::vector<std::vector<size_t>> loops;
    std::vector<size_t> stack;
    std::unordered_map<size_t, size_t> position;

    for (size_t id : walk) {
        auto it = position.find(id);
        if (it != position.end()) {
            size_t p = it->second;
            std::vector<size_t> loop(stack.begin() + static_cast<std::ptrdiff_t>(p), stack.end());
            for (size_t n : loop) {
                position.erase(n);
            }
            stack.resize(p);
            loops.push_back(std::move(loop));
        }
        position[id] = stack.size();
        stack.push_back(id);
    }
    return loops;
}

bool PolygonFinder::keepFace(const Polygon& face) const {
    if (!field_) return true;
    glm::vec2 p = PolygonUtils::averagePoint(face);
    return field_->onLand(p) && !field_->inParks(p);
}

// ============================================================================
// Shrinking and division
// ============================================================================

void PolygonFinder::shrink(bool stepwise) {
    shrunkPolygons_.clear();
    dividedPolygons_.clear();
    toDivide_.clear();
    toShrink_.assign(faces_.rbegin(), faces_.rend());

    if (!stepwise) {
        while (stepShrink()) {}
        SDL_Log("PolygonFinder: %zu of %zu blocks shrunk by %.2f",
                shrunkPolygons_.size(), faces_.size(), params_.shrinkSpacing);
    }
}

void PolygonFinder::divide(bool stepwise) {
    dividedPolygons_.clear();
    toShrink_.clear();
    const auto& source = shrunkPolygons_.empty() ? faces_ : shrunkPolygons_;
    toDivide_.assign(source.rbegin(), source.rend());

    if (!stepwise) {
        while (stepDivide()) {}
        SDL_Log("PolygonFinder: %zu blocks divided into %zu lots",
                source.size(), dividedPolygons_.size());
    }
}

bool PolygonFinder::update() {
    if (!toShrink_.empty()) {
        stepShrink();
    } else if (!toDivide_.empty()) {
        stepDivide();
    } else {
        return false;
    }
    return !toShrink_.empty() || !toDivide_.empty();
}

bool PolygonFinder::stepShrink() {
    if (toShrink_.empty()) return false;

    Polygon poly = std::move(toShrink_.back());
    toShrink_.pop_back();

    auto shrunk = shrinkPolygon(poly, params_.shrinkSpacing);
    if (shrunk) {
        shrunkPolygons_.push_back(std::move(*shrunk));
    }

    return !toShrink_.empty();
}

std::optional<Polygon> PolygonFinder::shrinkPolygon(const Polygon& poly, double spacing) const {
    Polygon shrunk = PolygonUtils::inset(poly, spacing);
    double area = PolygonUtils::area(shrunk);
    if (shrunk.empty() || area <= 0.0) {
        return std::nullopt;
    }
    if (spacing > 0.0) {
        bool inside = area < PolygonUtils::area(poly)
            && std::all_of(shrunk.begin(), shrunk.end(), [&](const glm::vec2& p) {
                   return PolygonUtils::containsPoint(poly, p);
               });
        if (!inside) {
            return std::nullopt;
        }
    }
    return shrunk;
}

bool PolygonFinder::stepDivide() {
    if (toDivide_.empty()) return false;

    Polygon poly = std::move(toDivide_.back());
    toDivide_.pop_back();
    PolygonUtils::makeCounterClockwise(poly);

    // Blocks already below minArea pass through whole
    if (poly.size() < 3 || PolygonUtils::area(poly) < params_.minArea) {
        dividedPolygons_.push_back(std::move(poly));
        return !toDivide_.empty();
    }

    size_t edge = PolygonUtils::longestEdge(poly);
    float edgeLength = glm::distance(poly[edge], poly[(edge + 1) % poly.size()]);
    if (edgeLength <= params_.maxLength || random_.floatVal() < params_.chanceNoDivide) {
        dividedPolygons_.push_back(std::move(poly));
        return !toDivide_.empty();
    }

    auto halves = PolygonUtils::splitByChord(poly, edge, random_.range(0.4, 0.6));
    if (!halves.has_value()
        || PolygonUtils::area(halves->first) < params_.minArea
        || PolygonUtils::area(halves->second) < params_.minArea) {
        dividedPolygons_.push_back(std::move(poly));
        return !toDivide_.empty();
    }

    for (Polygon* half : {&halves->second, &halves->first}) {
        if (PolygonUtils::shapeIndex(*half) < MIN_SHAPE_INDEX) {
            dividedPolygons_.push_back(std::move(*half));
        } else {
            toDivide_.push_back(std::move(*half));
        }
    }

    return !toDivide_.empty();
}

} // namespace blocks
} // namespace streamline_city
