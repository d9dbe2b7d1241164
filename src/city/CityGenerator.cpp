#include "streamline_city/city/CityGenerator.h"
#include "streamline_city/field/FieldIntegrator.h"

#include <SDL3/SDL_log.h>
#include <initializer_list>
#include <utility>

namespace streamline_city {
namespace city {

using geom::PolygonUtils;

namespace {

const std::vector<Polyline>& noRoads() {
    static const std::vector<Polyline> empty;
    return empty;
}

} // anonymous namespace

const char* getCityStageName(CityStage stage) {
    switch (stage) {
        case CityStage::MainRoads: return "main roads";
        case CityStage::MajorRoads: return "major roads";
        case CityStage::MinorRoads: return "minor roads";
        case CityStage::Buildings: return "buildings";
        case CityStage::Done: return "done";
    }
    return "unknown";
}

CityGenerator::CityGenerator(const CityConfig& config)
    : config_(config)
    , random_(config.seed) {
    config_.normalize();
    reset();
}

void CityGenerator::reset() {
    random_.reset(config_.seed);
    stage_ = CityStage::MainRoads;

    activeGenerator_ = nullptr;
    mainGenerator_.reset();
    majorGenerator_.reset();
    minorGenerator_.reset();

    bigParks_.clear();
    smallParks_.clear();
    roadGraph_ = graph::Graph();
    polygonFinder_.reset();
    dividing_ = false;
    blocks_.clear();
    lots_.clear();

    buildField();
}

void CityGenerator::buildField() {
    field_ = std::make_shared<field::TensorField>(config_.noise, random_.nextSeed());
    field_->smooth = config_.smoothField;
    field_->setSea(config_.sea);
    field_->setRiver(config_.river);

    if (config_.fields.empty()) {
        field_->setRecommended(config_.origin, config_.dimensions, random_);
    } else {
        for (const auto& f : config_.fields) {
            if (f.type == field::FieldType::Grid) {
                field_->addGrid(f.centre, f.size, f.decay, f.theta);
            } else {
                field_->addRadial(f.centre, f.size, f.decay);
            }
        }
    }

    SDL_Log("CityGenerator: Field with %zu basis fields, %s",
            field_->fields().size(), config_.fields.empty() ? "recommended" : "from config");
}

streets::RegionPredicate CityGenerator::regionPredicate() const {
    if (config_.region.size() < 3) {
        return {};
    }
    return [region = config_.region](const glm::vec2& p) {
        return PolygonUtils::containsPoint(region, p);
    };
}

bool CityGenerator::update() {
    switch (stage_) {
        case CityStage::MainRoads:
        case CityStage::MajorRoads:
        case CityStage::MinorRoads:
            if (!activeGenerator_) {
                startTier();
                return true;
            }
            if (activeGenerator_->update()) {
                return true;
            }
            finishTier();
            return true;

        case CityStage::Buildings:
            if (!polygonFinder_) {
                startBuildings();
                return true;
            }
            if (polygonFinder_->update()) {
                return true;
            }
            if (!dividing_) {
                polygonFinder_->divide(true);
                dividing_ = true;
                return true;
            }
            finishBuildings();
            return false;

        case CityStage::Done:
            break;
    }
    return false;
}

void CityGenerator::generateEverything() {
    while (update()) {
    }
    SDL_Log("CityGenerator: %zu main, %zu major, %zu minor roads, %zu parks, %zu blocks, %zu lots",
            mainRoads().size(), majorRoads().size(), minorRoads().size(),
            bigParks_.size() + smallParks_.size(), blocks_.size(), lots_.size());
}

const std::vector<Polyline>& CityGenerator::mainRoads() const {
    return mainGenerator_ ? mainGenerator_->allStreamlinesSimple() : noRoads();
}

const std::vector<Polyline>& CityGenerator::majorRoads() const {
    return majorGenerator_ ? majorGenerator_->allStreamlinesSimple() : noRoads();
}

const std::vector<Polyline>& CityGenerator::minorRoads() const {
    return minorGenerator_ ? minorGenerator_->allStreamlinesSimple() : noRoads();
}

std::vector<Polyline> CityGenerator::allRoads() const {
    std::vector<Polyline> roads;
    for (const auto* tier : {&mainRoads(), &majorRoads(), &minorRoads()}) {
        roads.insert(roads.end(), tier->begin(), tier->end());
    }
    return roads;
}

// ============================================================================
// Road tiers
// ============================================================================

void CityGenerator::startTier() {
    const streets::StreamlineParams* params = &config_.minorRoads;
    std::unique_ptr<streets::StreamlineGenerator>* slot = &minorGenerator_;
    if (stage_ == CityStage::MainRoads) {
        params = &config_.mainRoads;
        slot = &mainGenerator_;
    } else if (stage_ == CityStage::MajorRoads) {
        params = &config_.majorRoads;
        slot = &majorGenerator_;
    }

    // Later edits to the field (parks) must not reach this tier
    auto snapshot = std::make_shared<const field::TensorField>(*field_);
    auto integrator = field::createIntegrator(config_.integrator, snapshot, params->dstep);

    auto generator = std::make_unique<streets::StreamlineGenerator>(
        integrator, config_.origin, config_.dimensions, *params, random_.nextSeed());
    generator->setRegionPredicate(regionPredicate());
    if (mainGenerator_) generator->addExistingStreamlines(*mainGenerator_);
    if (majorGenerator_) generator->addExistingStreamlines(*majorGenerator_);
    generator->generate(true);

    activeGenerator_ = generator.get();
    *slot = std::move(generator);

    SDL_Log("CityGenerator: Tracing %s (dsep=%.1f, dtest=%.1f, %s)",
            getCityStageName(stage_), params->dsep, params->dtest,
            field::getIntegratorTypeName(config_.integrator));
}

void CityGenerator::finishTier() {
    SDL_Log("CityGenerator: %s done, %zu streamlines",
            getCityStageName(stage_), activeGenerator_->allStreamlinesSimple().size());
    activeGenerator_ = nullptr;

    switch (stage_) {
        case CityStage::MainRoads:
            stage_ = CityStage::MajorRoads;
            break;
        case CityStage::MajorRoads:
            addParks();
            stage_ = CityStage::MinorRoads;
            break;
        case CityStage::MinorRoads:
            addParks();
            stage_ = CityStage::Buildings;
            break;
        default:
            break;
    }
}

void CityGenerator::addParks() {
    graph::Graph g = graph::Graph::build(allRoads(), config_.minorRoads.dstep);

    auto snapshot = std::make_shared<const field::TensorField>(*field_);
    blocks::PolygonFinder finder(g.nodes(), config_.buildings, snapshot, random_.nextSeed());
    finder.findPolygons();
    const auto& polygons = finder.faces();

    // Big parks come from the main and major blocks only
    if (minorRoads().empty()) {
        bigParks_ = pickPolygons(polygons, static_cast<size_t>(config_.numBigParks),
                                 config_.clusterBigParks);
        smallParks_.clear();
    } else {
        smallParks_ = pickPolygons(polygons, static_cast<size_t>(config_.numSmallParks), false);
    }

    std::vector<Polygon> parks = bigParks_;
    parks.insert(parks.end(), smallParks_.begin(), smallParks_.end());
    field_->setParks(parks);

    SDL_Log("CityGenerator: %zu big parks, %zu small parks from %zu blocks",
            bigParks_.size(), smallParks_.size(), polygons.size());
}

std::vector<Polygon> CityGenerator::pickPolygons(const std::vector<Polygon>& polygons,
                                                 size_t count, bool clustered) {
    if (polygons.size() <= count) {
        return polygons;
    }

    std::vector<Polygon> picked;
    const int n = static_cast<int>(polygons.size());
    if (clustered) {
        // Consecutive faces tend to be neighbours
        int start = random_.intVal(0, n);
        for (size_t i = 0; i < count; ++i) {
            picked.push_back(polygons[(static_cast<size_t>(start) + i) % polygons.size()]);
        }
        return picked;
    }

    std::vector<size_t> order(polygons.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    for (size_t i = 0; i < count; ++i) {
        int j = random_.intVal(static_cast<int>(i), n);
        std::swap(order[i], order[static_cast<size_t>(j)]);
        picked.push_back(polygons[order[i]]);
    }
    return picked;
}

// ============================================================================
// Blocks and lots
// ============================================================================

void CityGenerator::startBuildings() {
    roadGraph_ = graph::Graph::build(allRoads(), config_.minorRoads.dstep, true);

    auto snapshot = std::make_shared<const field::TensorField>(*field_);
    polygonFinder_ = std::make_unique<blocks::PolygonFinder>(
        roadGraph_.nodes(), config_.buildings, snapshot, random_.nextSeed());
    polygonFinder_->findPolygons();

    const double blockSpacing = polygonFinder_->params().shrinkSpacing * 0.5;
    blocks_.clear();
    for (const auto& face : polygonFinder_->faces()) {
        if (auto block = polygonFinder_->shrinkPolygon(face, blockSpacing)) {
            blocks_.push_back(std::move(*block));
        }
    }

    polygonFinder_->shrink(true);
    dividing_ = false;

    SDL_Log("CityGenerator: %zu faces, %zu blocks", polygonFinder_->faces().size(), blocks_.size());
}

void CityGenerator::finishBuildings() {
    lots_.clear();
    const bool bounded = config_.region.size() >= 3;
    for (const auto& lot : polygonFinder_->dividedPolygons()) {
        glm::vec2 centre = PolygonUtils::averagePoint(lot);
        if (bounded && !PolygonUtils::containsPoint(config_.region, centre)) continue;
        if (random_.floatVal() >= config_.buildingDensity) continue;
        lots_.push_back(lot);
    }
    stage_ = CityStage::Done;

    SDL_Log("CityGenerator: %zu of %zu lots kept", lots_.size(),
            polygonFinder_->dividedPolygons().size());
}

} // namespace city
} // namespace streamline_city
