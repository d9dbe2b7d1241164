#include "streamline_city/streets/StreamlineGenerator.h"
#include "streamline_city/geom/GeomUtils.h"

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace streamline_city {
namespace streets {

using geom::GeomUtils;

namespace {

StreamlineParams normalized(StreamlineParams params) {
    params.normalize();
    return params;
}

// Squared step length (relative to dstep^2) below which a point is degenerate
constexpr float DEGENERATE_STEP_SQ = 0.01f;

// Same test used while interpolating joins
constexpr float DEGENERATE_JOIN_SQ = 0.001f;

} // anonymous namespace

StreamlineGenerator::StreamlineGenerator(std::shared_ptr<const field::FieldIntegrator> integrator,
                                         const glm::vec2& origin,
                                         const glm::vec2& worldDimensions,
                                         const StreamlineParams& params,
                                         uint32_t seed)
    : integrator_(std::move(integrator))
    , origin_(origin)
    , worldDimensions_(worldDimensions)
    , params_(normalized(params))
    , majorGrid_(worldDimensions, origin, params_.dsep)
    , minorGrid_(worldDimensions, origin, params_.dsep)
    , random_(seed)
    , perturbationNoise_(utils::FractalNoise::create(random_, params_.perturbationOctaves))
    , terrainNoise_(random_.nextSeed())
    , biasNoise_(random_.nextSeed())
    , centerPoint_(origin + worldDimensions * 0.5f) {
    dsepSq_ = params_.dsep * params_.dsep;
    dtestSq_ = params_.dtest * params_.dtest;
    dstepSq_ = params_.dstep * params_.dstep;
    dcirclejoinSq_ = params_.dcirclejoin * params_.dcirclejoin;
    dlookaheadSq_ = params_.dlookahead * params_.dlookahead;

    // Needs to be less than circlejoin
    dcollideself_ = params_.dcirclejoin / 2.0f;
    dcollideselfSq_ = dcollideself_ * dcollideself_;
    nStreamlineStep_ = static_cast<int>(std::floor(params_.dcirclejoin / params_.dstep));
    nStreamlineLookBack_ = 2 * nStreamlineStep_;
}

void StreamlineGenerator::clearStreamlines() {
    allStreamlines_.clear();
    allStreamlinesSimple_.clear();
    streamlineIsMajor_.clear();
    candidateSeedsMajor_.clear();
    candidateSeedsMinor_.clear();
    majorGrid_.clear();
    minorGrid_.clear();
    failedStreamlines_ = 0;
    state_ = State::Idle;
}

void StreamlineGenerator::addExistingStreamlines(const StreamlineGenerator& other) {
    majorGrid_.addAll(other.majorGrid_);
    minorGrid_.addAll(other.minorGrid_);
}

void StreamlineGenerator::generate(bool stepwise) {
    state_ = State::Tracing;
    failedStreamlines_ = 0;
    // update() flips before tracing, so the first streamline is major
    lastStreamlineMajor_ = false;

    if (!stepwise) {
        while (update()) {
        }
    }
}

bool StreamlineGenerator::update() {
    switch (state_) {
        case State::Tracing:
            lastStreamlineMajor_ = !lastStreamlineMajor_;
            if (!createStreamline(lastStreamlineMajor_)) {
                SDL_Log("Seeding exhausted: %zu streamlines, %zu major / %zu minor samples",
                        allStreamlines_.size(), majorGrid_.size(), minorGrid_.size());
                state_ = params_.joinDangling ? State::Joining : State::Done;
            }
            return true;

        case State::Joining:
            joinDanglingStreamlines();
            state_ = State::Done;
            return true;

        case State::Idle:
        case State::Done:
            break;
    }
    return false;
}

std::vector<Polyline> StreamlineGenerator::streamlines(bool major) const {
    std::vector<Polyline> out;
    for (size_t i = 0; i < allStreamlines_.size(); ++i) {
        if (streamlineIsMajor_[i] == major) {
            out.push_back(allStreamlines_[i]);
        }
    }
    return out;
}

// ============================================================================
// Seeding
// ============================================================================

std::optional<glm::vec2> StreamlineGenerator::getSeed(bool major) {
    // Candidate seeds first
    if (params_.seedAtEndpoints) {
        auto& seeds = candidateSeeds(major);
        while (!seeds.empty()) {
            glm::vec2 seed = seeds.back();
            seeds.pop_back();
            if (pointInBounds(seed) && isValidSample(major, seed, dsepSq_)) {
                return seed;
            }
        }
    }

    glm::vec2 seed = samplePoint();
    int i = 0;
    while (!isValidSample(major, seed, dsepSq_)) {
        if (i >= params_.seedTries) {
            return std::nullopt;
        }
        seed = samplePoint();
        i++;
    }

    return seed;
}

glm::vec2 StreamlineGenerator::samplePoint() {
    return glm::vec2(
        origin_.x + static_cast<float>(random_.floatVal()) * worldDimensions_.x,
        origin_.y + static_cast<float>(random_.floatVal()) * worldDimensions_.y
    );
}

// ============================================================================
// Integration
// ============================================================================

bool StreamlineGenerator::createStreamline(bool major) {
    auto seed = getSeed(major);
    if (!seed.has_value()) {
        return false;
    }

    std::vector<glm::vec2> streamline = integrateStreamline(*seed, major);
    if (!validStreamline(streamline)) {
        // Seeds that trace nothing count towards seedTries
        return ++failedStreamlines_ < std::max(params_.seedTries, 1);
    }

    failedStreamlines_ = 0;
    gridFor(major).addPolyline(streamline);
    allStreamlinesSimple_.push_back(simplifyStreamline(streamline));

    // Open ends seed the other direction
    if (streamline.front() != streamline.back()) {
        candidateSeeds(!major).push_back(streamline.front());
        candidateSeeds(!major).push_back(streamline.back());
    }

    allStreamlines_.push_back(std::move(streamline));
    streamlineIsMajor_.push_back(major);

    return true;
}

std::vector<glm::vec2> StreamlineGenerator::integrateStreamline(const glm::vec2& seed, bool major) {
    int count = 0;
    bool pointsEscaped = false;  // True once the two fronts have moved dcirclejoin apart
    selfSamples_.clear();

    // Whether to test validity against both grids
    const bool collideBoth = random_.floatVal() < params_.collideEarly;

    glm::vec2 d = integrator_->integrate(seed, major);
    if (glm::dot(d, d) < DEGENERATE_STEP_SQ * dstepSq_) {
        return {};
    }

    StreamlineIntegration forwardParams;
    forwardParams.seed = seed;
    forwardParams.originalDir = d;
    forwardParams.previousDirection = d;
    forwardParams.previousPoint = seed + d;
    forwardParams.forward = true;
    pushPoint(forwardParams, seed);
    forwardParams.valid = pointInBounds(forwardParams.previousPoint)
        && isValidSample(major, forwardParams.previousPoint, dtestSq_, collideBoth);

    StreamlineIntegration backwardParams;
    backwardParams.seed = seed;
    backwardParams.originalDir = -d;
    backwardParams.previousDirection = -d;
    backwardParams.previousPoint = seed - d;
    backwardParams.forward = false;
    backwardParams.valid = pointInBounds(backwardParams.previousPoint)
        && isValidSample(major, backwardParams.previousPoint, dtestSq_, collideBoth);

    bool closed = false;
    while (count < params_.pathIterations && (forwardParams.valid || backwardParams.valid)) {
        streamlineIntegrationStep(forwardParams, major, collideBoth);
        streamlineIntegrationStep(backwardParams, major, collideBoth);

        // Join up circles
        glm::vec2 between = forwardParams.previousPoint - backwardParams.previousPoint;
        float sqDistanceBetweenPoints = glm::dot(between, between);

        if (!pointsEscaped && sqDistanceBetweenPoints > dcirclejoinSq_) {
            pointsEscaped = true;
        }

        if (pointsEscaped && forwardParams.valid && backwardParams.valid
            && sqDistanceBetweenPoints <= dcirclejoinSq_) {
            forwardParams.streamline.push_back(forwardParams.previousPoint);
            forwardParams.streamline.push_back(backwardParams.previousPoint);
            backwardParams.streamline.push_back(backwardParams.previousPoint);
            closed = true;
            break;
        }

        count++;
    }

    // Iteration budget ran out with live fronts: keep their last accepted point
    if (!closed) {
        if (forwardParams.valid) {
            forwardParams.streamline.push_back(forwardParams.previousPoint);
        }
        if (backwardParams.valid) {
            backwardParams.streamline.push_back(backwardParams.previousPoint);
        }
    }

    std::vector<glm::vec2> result(backwardParams.streamline.rbegin(), backwardParams.streamline.rend());
    result.insert(result.end(), forwardParams.streamline.begin(), forwardParams.streamline.end());
    return result;
}

void StreamlineGenerator::streamlineIntegrationStep(StreamlineIntegration& front, bool major,
                                                    bool collideBoth) {
    if (!front.valid) {
        return;
    }

    pushPoint(front, front.previousPoint);
    glm::vec2 nextDirection = integrator_->integrate(front.previousPoint, major, front.previousDirection);

    // Stop at degenerate point
    if (glm::dot(nextDirection, nextDirection) < DEGENERATE_STEP_SQ * dstepSq_) {
        front.valid = false;
        return;
    }

    // Make sure we travel in the same direction
    if (glm::dot(nextDirection, front.previousDirection) < 0.0f) {
        nextDirection = -nextDirection;
    }

    nextDirection = applyRealismEnhancements(front.previousPoint, nextDirection);
    glm::vec2 nextPoint = front.previousPoint + nextDirection;

    if (pointInBounds(nextPoint)
        && isValidSample(major, nextPoint, dtestSq_, collideBoth)
        && !streamlineTurned(front.seed, front.originalDir, nextPoint, nextDirection)
        && !collidesSelf(nextPoint, front)) {
        front.previousPoint = nextPoint;
        front.previousDirection = nextDirection;
    } else {
        // One more step so the road reaches the obstacle, but never into water
        if (pointInBounds(nextPoint) && integrator_->onLand(nextPoint) && inRegion(nextPoint)
            && !collidesSelf(nextPoint, front)) {
            pushPoint(front, nextPoint);
        }
        front.valid = false;
    }
}

void StreamlineGenerator::pushPoint(StreamlineIntegration& front, const glm::vec2& point) {
    int index = static_cast<int>(front.streamline.size());
    front.streamline.push_back(point);

    int cx = static_cast<int>(std::floor(point.x / dcollideself_));
    int cy = static_cast<int>(std::floor(point.y / dcollideself_));
    selfSamples_[selfCellKey(cx, cy)].push_back(SelfSample{point, front.forward, index});
}

int64_t StreamlineGenerator::selfCellKey(int x, int y) const {
    return (static_cast<int64_t>(x) << 32) ^ static_cast<int64_t>(static_cast<uint32_t>(y));
}

bool StreamlineGenerator::collidesSelf(const glm::vec2& candidate,
                                       const StreamlineIntegration& front) const {
    // Index the candidate would take in its own front
    const int k = static_cast<int>(front.streamline.size());
    int cx = static_cast<int>(std::floor(candidate.x / dcollideself_));
    int cy = static_cast<int>(std::floor(candidate.y / dcollideself_));

    for (int x = -1; x <= 1; x++) {
        for (int y = -1; y <= 1; y++) {
            auto it = selfSamples_.find(selfCellKey(cx + x, cy + y));
            if (it == selfSamples_.end()) continue;

            for (const auto& sample : it->second) {
                // Distance along the final polyline: fronts meet at the seed
                int gap = (sample.forward == front.forward) ? k - sample.index
                                                            : k + sample.index + 1;
                if (gap <= nStreamlineLookBack_) continue;

                glm::vec2 d = sample.point - candidate;
                if (glm::dot(d, d) < dcollideselfSq_) {
                    return true;
                }
            }
        }
    }
    return false;
}

bool StreamlineGenerator::streamlineTurned(const glm::vec2& seed, const glm::vec2& originalDir,
                                           const glm::vec2& point, const glm::vec2& direction) const {
    if (glm::dot(originalDir, direction) < 0.0f) {
        glm::vec2 perpendicularVector(originalDir.y, -originalDir.x);
        bool isLeft = glm::dot(point - seed, perpendicularVector) < 0.0f;
        bool directionUp = glm::dot(direction, perpendicularVector) > 0.0f;
        return isLeft == directionUp;
    }

    return false;
}

// ============================================================================
// Directional modifiers
// ============================================================================

glm::vec2 StreamlineGenerator::applyRealismEnhancements(const glm::vec2& point,
                                                        const glm::vec2& direction) const {
    glm::vec2 enhancedDirection = direction;

    double perturbationAngle = calculatePathPerturbation(point);
    perturbationAngle *= getHistoricalPerturbationStrength(point);
    perturbationAngle += calculateDirectionalBias(point);

    if (perturbationAngle != 0.0) {
        enhancedDirection = GeomUtils::rotate(enhancedDirection, perturbationAngle);
    }

    enhancedDirection += calculateTerrainInfluence(point, enhancedDirection);

    // Back to the original step length
    float len = glm::length(enhancedDirection);
    if (len < 1e-6f) {
        return direction;
    }
    return enhancedDirection * (glm::length(direction) / len);
}

double StreamlineGenerator::calculatePathPerturbation(const glm::vec2& point) const {
    if (!params_.enablePathPerturbation) {
        return 0.0;
    }

    const double scale = params_.perturbationFrequency;
    double perturbation = perturbationNoise_.get(point.x / scale, point.y / scale)
        * params_.perturbationStrength;

    // Noise in [-1, 1] maps to [-π/4, π/4]
    return perturbation * M_PI / 4.0;
}

double StreamlineGenerator::getHistoricalPerturbationStrength(const glm::vec2& point) const {
    if (!params_.enableHistoricalLayers) {
        return 1.0;
    }

    double distanceFromCenter = glm::distance(point, centerPoint_);

    if (distanceFromCenter < params_.historicalLayerRadius) {
        return params_.oldCityPerturbation;
    }
    if (distanceFromCenter > params_.modernLayerStart
        || params_.modernLayerStart <= params_.historicalLayerRadius) {
        return params_.modernCityPerturbation;
    }

    double t = (distanceFromCenter - params_.historicalLayerRadius)
        / (params_.modernLayerStart - params_.historicalLayerRadius);
    return params_.oldCityPerturbation * (1.0 - t) + params_.modernCityPerturbation * t;
}

double StreamlineGenerator::calculateDirectionalBias(const glm::vec2& point) const {
    if (!params_.enableDirectionalBias) {
        return 0.0;
    }

    const double scale = params_.biasNoiseScale;
    double noiseValue = biasNoise_.get(point.x / scale, point.y / scale);
    double effectiveStrength = params_.biasStrength * (noiseValue * 0.5 + 0.5);
    return params_.biasDirection * effectiveStrength;
}

glm::vec2 StreamlineGenerator::calculateTerrainInfluence(const glm::vec2& point,
                                                         const glm::vec2& direction) const {
    if (!params_.enableTerrainInfluence) {
        return glm::vec2(0.0f);
    }

    const double scale = params_.terrainNoiseScale;
    const double h = params_.dstep * 0.5;
    double x = point.x / scale;
    double y = point.y / scale;
    double hs = h / scale;

    // Slope in noise units per noise-space unit
    double currentHeight = terrainNoise_.get(x, y);
    double gradX = (terrainNoise_.get(x + hs, y) - currentHeight) / hs;
    double gradY = (terrainNoise_.get(x, y + hs) - currentHeight) / hs;

    glm::vec2 gradient(static_cast<float>(gradX), static_cast<float>(gradY));
    float slope = glm::length(gradient);
    if (slope <= params_.terrainSteepnessThreshold) {
        return glm::vec2(0.0f);
    }

    // Follow the contour on the side the road is already heading
    glm::vec2 contour = GeomUtils::rotate90(gradient / slope) * params_.terrainInfluenceStrength;
    if (glm::dot(contour, direction) < 0.0f) {
        contour = -contour;
    }
    return contour;
}

// ============================================================================
// Dangling ends
// ============================================================================

void StreamlineGenerator::joinDanglingStreamlines() {
    int joined = 0;

    for (size_t s = 0; s < allStreamlines_.size(); ++s) {
        Polyline& streamline = allStreamlines_[s];
        const bool major = streamlineIsMajor_[s];

        // Ignore circles
        if (streamline.size() < 5 || streamline.front() == streamline.back()) {
            continue;
        }

        auto newStart = getBestNextPoint(streamline.front(), streamline[4]);
        if (newStart.has_value()) {
            std::vector<glm::vec2> points = pointsBetween(streamline.front(), *newStart);
            for (const auto& p : points) {
                gridFor(major).addSample(p);
            }
            streamline.insert(streamline.begin(), points.rbegin(), points.rend());
            joined += points.empty() ? 0 : 1;
        }

        auto newEnd = getBestNextPoint(streamline.back(), streamline[streamline.size() - 4]);
        if (newEnd.has_value()) {
            std::vector<glm::vec2> points = pointsBetween(streamline.back(), *newEnd);
            for (const auto& p : points) {
                gridFor(major).addSample(p);
            }
            streamline.insert(streamline.end(), points.begin(), points.end());
            joined += points.empty() ? 0 : 1;
        }
    }

    // Reset simplified streamlines
    allStreamlinesSimple_.clear();
    for (const auto& s : allStreamlines_) {
        allStreamlinesSimple_.push_back(simplifyStreamline(s));
    }

    SDL_Log("Joined %d dangling streamline ends", joined);
}

std::optional<glm::vec2> StreamlineGenerator::getBestNextPoint(const glm::vec2& point,
                                                               const glm::vec2& previousPoint) const {
    std::vector<glm::vec2> nearbyPoints = majorGrid_.getNearbyPoints(point, params_.dlookahead);
    std::vector<glm::vec2> nearbyMinor = minorGrid_.getNearbyPoints(point, params_.dlookahead);
    nearbyPoints.insert(nearbyPoints.end(), nearbyMinor.begin(), nearbyMinor.end());

    glm::vec2 direction = point - previousPoint;
    if (glm::dot(direction, direction) <= 0.0f) {
        return std::nullopt;
    }

    std::optional<glm::vec2> closestSample;
    float closestDistance = std::numeric_limits<float>::infinity();

    for (const auto& sample : nearbyPoints) {
        if (sample == point || sample == previousPoint) continue;

        glm::vec2 differenceVector = sample - point;
        if (glm::dot(differenceVector, direction) < 0.0f) {
            // Backwards
            continue;
        }

        float distanceToSample = glm::dot(differenceVector, differenceVector);
        if (distanceToSample > dlookaheadSq_) continue;

        // Close enough to join straight away
        if (distanceToSample < 2.0f * dstepSq_) {
            closestSample = sample;
            break;
        }

        double angleBetween = std::abs(GeomUtils::angleBetween(direction, differenceVector));
        if (angleBetween < params_.joinangle && distanceToSample < closestDistance) {
            closestDistance = distanceToSample;
            closestSample = sample;
        }
    }

    // Push the target past the sample so simplification keeps the crossing
    if (closestSample.has_value()) {
        *closestSample += glm::normalize(direction) * (params_.simplifyTolerance * 4.0f);
    }

    return closestSample;
}

std::vector<glm::vec2> StreamlineGenerator::pointsBetween(const glm::vec2& v1, const glm::vec2& v2) const {
    float d = glm::distance(v1, v2);
    int nPoints = static_cast<int>(std::floor(d / params_.dstep));
    if (nPoints == 0) return {};

    glm::vec2 stepVector = v2 - v1;

    std::vector<glm::vec2> out;
    for (int i = 1; i <= nPoints; i++) {
        glm::vec2 next = v1 + stepVector * (static_cast<float>(i) / nPoints);
        // Test for degenerate point
        glm::vec2 dir = integrator_->integrate(next, true);
        if (glm::dot(dir, dir) > DEGENERATE_JOIN_SQ * dstepSq_) {
            out.push_back(next);
        } else {
            return out;
        }
    }
    return out;
}

// ============================================================================
// Validity
// ============================================================================

bool StreamlineGenerator::isValidSample(bool major, const glm::vec2& point, float dSq,
                                        bool bothGrids) const {
    bool gridValid = grid(major).isValidSample(point, dSq);
    if (bothGrids) {
        gridValid = gridValid && grid(!major).isValidSample(point, dSq);
    }
    if (!inRegion(point)) {
        return false;
    }
    return gridValid && integrator_->onLand(point);
}

bool StreamlineGenerator::pointInBounds(const glm::vec2& v) const {
    return v.x >= origin_.x
        && v.y >= origin_.y
        && v.x < worldDimensions_.x + origin_.x
        && v.y < worldDimensions_.y + origin_.y;
}

Polyline StreamlineGenerator::simplifyStreamline(const Polyline& streamline) const {
    return geom::PolygonUtils::simplify(streamline, params_.simplifyTolerance);
}

} // namespace streets
} // namespace streamline_city
