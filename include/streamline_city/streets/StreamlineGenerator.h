#pragma once

#include "streamline_city/field/FieldIntegrator.h"
#include "streamline_city/geom/PolygonUtils.h"
#include "streamline_city/streets/GridStorage.h"
#include "streamline_city/streets/StreamlineParams.h"
#include "streamline_city/utils/Noise.h"
#include "streamline_city/utils/Random.h"

#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace streamline_city {
namespace streets {

using geom::Polyline;

// Point-in-region test supplied by the host; empty admits every point
using RegionPredicate = std::function<bool(const glm::vec2&)>;

/**
 * StreamlineGenerator - traces one tier of roads through the tensor field
 *
 * Streamlines alternate between the major and minor eigenvector. Each one
 * grows from a seed in both directions at once until it hits the domain
 * edge, water, the region boundary, another road (closer than dtest), itself,
 * or turns back on itself; fronts that meet again close a loop. When seeding
 * is exhausted, open ends are extended to nearby roads.
 *
 * Work is resumable: update() performs one streamline (or the final join
 * pass) per call, generate(false) loops it to completion.
 */
class StreamlineGenerator {
public:
    StreamlineGenerator(std::shared_ptr<const field::FieldIntegrator> integrator,
                        const glm::vec2& origin,
                        const glm::vec2& worldDimensions,
                        const StreamlineParams& params,
                        uint32_t seed = 0);

    // Discards streamlines, samples and pending seeds
    void clearStreamlines();

    void setRegionPredicate(RegionPredicate predicate) { regionPredicate_ = std::move(predicate); }

    /**
     * Copies the samples of an already generated tier into this tier's grids
     * so new roads keep their distance from it.
     */
    void addExistingStreamlines(const StreamlineGenerator& other);

    /**
     * Starts a generation pass. Blocks until done unless `stepwise`, in which
     * case the caller drives it with update().
     */
    void generate(bool stepwise = false);

    // One unit of work; returns true while work remains
    bool update();

    bool isDone() const { return state_ == State::Done || state_ == State::Idle; }

    // Extends open ends towards nearby samples and rebuilds the simplified output
    void joinDanglingStreamlines();

    const std::vector<Polyline>& allStreamlines() const { return allStreamlines_; }
    const std::vector<Polyline>& allStreamlinesSimple() const { return allStreamlinesSimple_; }
    std::vector<Polyline> streamlines(bool major) const;

    const GridStorage& grid(bool major) const { return major ? majorGrid_ : minorGrid_; }
    const StreamlineParams& params() const { return params_; }

    // Self-collision guard: samples closer than this in index are exempt
    int nStreamlineLookBack() const { return nStreamlineLookBack_; }
    float dcollideself() const { return dcollideself_; }

    glm::vec2 origin() const { return origin_; }
    glm::vec2 worldDimensions() const { return worldDimensions_; }

private:
    enum class State {
        Idle,
        Tracing,
        Joining,
        Done
    };

    struct StreamlineIntegration {
        glm::vec2 seed;
        glm::vec2 originalDir;
        std::vector<glm::vec2> streamline;
        glm::vec2 previousDirection;
        glm::vec2 previousPoint;
        bool forward = true;
        bool valid = true;
    };

    // Point of the streamline being traced, bucketed for the self-collision guard
    struct SelfSample {
        glm::vec2 point;
        bool forward;
        int index;
    };

    std::shared_ptr<const field::FieldIntegrator> integrator_;
    glm::vec2 origin_;
    glm::vec2 worldDimensions_;
    StreamlineParams params_;

    float dsepSq_;
    float dtestSq_;
    float dstepSq_;
    float dcirclejoinSq_;
    float dlookaheadSq_;
    float dcollideself_;
    float dcollideselfSq_;
    int nStreamlineStep_;
    int nStreamlineLookBack_;

    GridStorage majorGrid_;
    GridStorage minorGrid_;
    std::vector<glm::vec2> candidateSeedsMajor_;
    std::vector<glm::vec2> candidateSeedsMinor_;

    std::vector<Polyline> allStreamlines_;
    std::vector<Polyline> allStreamlinesSimple_;
    std::vector<bool> streamlineIsMajor_;

    RegionPredicate regionPredicate_;

    std::unordered_map<int64_t, std::vector<SelfSample>> selfSamples_;

    State state_ = State::Idle;
    bool lastStreamlineMajor_ = true;
    int failedStreamlines_ = 0;  // Consecutive seeds that traced no valid streamline

    utils::Random random_;
    utils::FractalNoise perturbationNoise_;
    utils::Perlin terrainNoise_;
    utils::Perlin biasNoise_;
    glm::vec2 centerPoint_;

    // Seeding
    std::optional<glm::vec2> getSeed(bool major);
    glm::vec2 samplePoint();

    // Integration
    bool createStreamline(bool major);
    std::vector<glm::vec2> integrateStreamline(const glm::vec2& seed, bool major);
    void streamlineIntegrationStep(StreamlineIntegration& front, bool major, bool collideBoth);
    void pushPoint(StreamlineIntegration& front, const glm::vec2& point);
    bool streamlineTurned(const glm::vec2& seed, const glm::vec2& originalDir,
                          const glm::vec2& point, const glm::vec2& direction) const;
    bool collidesSelf(const glm::vec2& candidate, const StreamlineIntegration& front) const;
    int64_t selfCellKey(int x, int y) const;
    bool validStreamline(const std::vector<glm::vec2>& s) const { return s.size() > 5; }

    // Directional modifiers
    glm::vec2 applyRealismEnhancements(const glm::vec2& point, const glm::vec2& direction) const;
    double calculatePathPerturbation(const glm::vec2& point) const;
    double getHistoricalPerturbationStrength(const glm::vec2& point) const;
    double calculateDirectionalBias(const glm::vec2& point) const;
    glm::vec2 calculateTerrainInfluence(const glm::vec2& point, const glm::vec2& direction) const;

    // Dangling ends
    std::optional<glm::vec2> getBestNextPoint(const glm::vec2& point,
                                              const glm::vec2& previousPoint) const;
    std::vector<glm::vec2> pointsBetween(const glm::vec2& v1, const glm::vec2& v2) const;

    // Validity
    bool isValidSample(bool major, const glm::vec2& point, float dSq, bool bothGrids = false) const;
    bool pointInBounds(const glm::vec2& v) const;
    bool inRegion(const glm::vec2& v) const { return !regionPredicate_ || regionPredicate_(v); }

    GridStorage& gridFor(bool major) { return major ? majorGrid_ : minorGrid_; }
    std::vector<glm::vec2>& candidateSeeds(bool major) {
        return major ? candidateSeedsMajor_ : candidateSeedsMinor_;
    }

    Polyline simplifyStreamline(const Polyline& streamline) const;
};

} // namespace streets
} // namespace streamline_city
