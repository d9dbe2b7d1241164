#pragma once

#include "streamline_city/blocks/PolygonFinder.h"
#include "streamline_city/city/CityConfig.h"
#include "streamline_city/field/TensorField.h"
#include "streamline_city/graph/Graph.h"
#include "streamline_city/streets/StreamlineGenerator.h"
#include "streamline_city/utils/Random.h"

#include <memory>
#include <vector>

namespace streamline_city {
namespace city {

using geom::Polygon;
using geom::Polyline;

enum class CityStage {
    MainRoads,
    MajorRoads,
    MinorRoads,
    Buildings,
    Done
};

const char* getCityStageName(CityStage stage);

/**
 * CityGenerator - runs the whole pipeline for one config
 *
 * Main, major and minor roads are traced in turn, each tier keeping its
 * distance from the tiers before it. Big parks are picked from the blocks of
 * the main and major roads, small parks after the minor roads, and the
 * field is re-snapshotted so later tiers bend around them. Finally the
 * graph of every road is turned into blocks and building lots.
 */
class CityGenerator {
public:
    explicit CityGenerator(const CityConfig& config);

    // Discards all output and rebuilds the field from the config
    void reset();

    // One streamline, park pick, shrink or division; returns true while work remains
    bool update();

    void generateEverything();

    CityStage stage() const { return stage_; }
    bool isDone() const { return stage_ == CityStage::Done; }

    const CityConfig& config() const { return config_; }
    const field::TensorField& tensorField() const { return *field_; }

    const std::vector<Polyline>& mainRoads() const;
    const std::vector<Polyline>& majorRoads() const;
    const std::vector<Polyline>& minorRoads() const;

    // Simplified roads of every finished tier, main first
    std::vector<Polyline> allRoads() const;

    const std::vector<Polygon>& bigParks() const { return bigParks_; }
    const std::vector<Polygon>& smallParks() const { return smallParks_; }

    // Faces of the final road graph, inset by half the lot spacing
    const std::vector<Polygon>& blocks() const { return blocks_; }
    const std::vector<Polygon>& lots() const { return lots_; }
    const graph::Graph& roadGraph() const { return roadGraph_; }

private:
    CityConfig config_;
    std::shared_ptr<field::TensorField> field_;
    utils::Random random_;

    CityStage stage_ = CityStage::MainRoads;

    std::unique_ptr<streets::StreamlineGenerator> mainGenerator_;
    std::unique_ptr<streets::StreamlineGenerator> majorGenerator_;
    std::unique_ptr<streets::StreamlineGenerator> minorGenerator_;
    streets::StreamlineGenerator* activeGenerator_ = nullptr;

    std::vector<Polygon> bigParks_;
    std::vector<Polygon> smallParks_;

    graph::Graph roadGraph_;
    std::unique_ptr<blocks::PolygonFinder> polygonFinder_;
    bool dividing_ = false;
    std::vector<Polygon> blocks_;
    std::vector<Polygon> lots_;

    void buildField();
    streets::RegionPredicate regionPredicate() const;

    void startTier();
    void finishTier();
    void addParks();
    std::vector<Polygon> pickPolygons(const std::vector<Polygon>& polygons, size_t count,
                                      bool clustered);

    void startBuildings();
    void finishBuildings();
};

} // namespace city
} // namespace streamline_city
