#include "streamline_city/city/CityConfig.h"
#include "streamline_city/city/CityGenerator.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
using namespace streamline_city;

static void printUsage(const char* progName) {
    SDL_Log("Usage: %s [options]", progName);
    SDL_Log("");
    SDL_Log("Generates a street network, parks, blocks and building lots from a tensor field.");
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --config <file.json>   City config (default: recommended field, 1000 x 800)");
    SDL_Log("  --seed <N>             Override the config seed");
    SDL_Log("  --preset <name>        Realism preset: none, modern, old_town, mixed, terrain");
    SDL_Log("  --summary <out.json>   Write counts and lengths of the generated city");
    SDL_Log("  --help                 Show this help message");
    SDL_Log("");
    SDL_Log("Examples:");
    SDL_Log("  %s --seed 42 --summary city.json", progName);
    SDL_Log("  %s --config coast.json --preset old_town", progName);
}

static double totalLength(const std::vector<geom::Polyline>& lines) {
    double length = 0.0;
    for (const auto& line : lines) {
        for (size_t i = 0; i + 1 < line.size(); ++i) {
            length += glm::distance(line[i], line[i + 1]);
        }
    }
    return length;
}

static double totalArea(const std::vector<geom::Polygon>& polygons) {
    double area = 0.0;
    for (const auto& p : polygons) {
        area += geom::PolygonUtils::area(p);
    }
    return area;
}

static bool saveSummary(const std::string& path, const city::CityGenerator& generator) {
    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create summary file: %s", path.c_str());
        return false;
    }

    const auto& config = generator.config();
    json j;
    j["seed"] = config.seed;
    j["dimensions"] = {config.dimensions.x, config.dimensions.y};
    j["roads"] = {
        {"main", {{"count", generator.mainRoads().size()}, {"length", totalLength(generator.mainRoads())}}},
        {"major", {{"count", generator.majorRoads().size()}, {"length", totalLength(generator.majorRoads())}}},
        {"minor", {{"count", generator.minorRoads().size()}, {"length", totalLength(generator.minorRoads())}}}
    };
    j["graph"] = {
        {"nodes", generator.roadGraph().nodes().size()},
        {"edges", generator.roadGraph().edgeCount()},
        {"intersections", generator.roadGraph().intersections().size()}
    };
    j["parks"] = {
        {"big", generator.bigParks().size()},
        {"small", generator.smallParks().size()}
    };
    j["blocks"] = {{"count", generator.blocks().size()}, {"area", totalArea(generator.blocks())}};
    j["lots"] = {{"count", generator.lots().size()}, {"area", totalArea(generator.lots())}};

    file << j.dump(2) << "\n";
    SDL_Log("Saved summary: %s", path.c_str());
    return true;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string summaryPath;
    std::string preset;
    bool seedOverride = false;
    uint32_t seed = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--summary" && i + 1 < argc) {
            summaryPath = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid seed: %s", argv[i]);
                return 1;
            }
            seedOverride = true;
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }

    city::CityConfig config;
    try {
        if (!configPath.empty()) {
            config = city::CityConfig::loadFromFile(configPath);
        }
    } catch (const std::runtime_error& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", e.what());
        return 1;
    }

    if (seedOverride) {
        config.seed = seed;
    }
    if (!preset.empty()) {
        for (auto* tier : {&config.mainRoads, &config.majorRoads, &config.minorRoads}) {
            if (!tier->applyRealismPreset(preset)) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown realism preset: %s", preset.c_str());
                return 1;
            }
        }
        config.realismPreset = preset;
    }

    SDL_Log("Generating city: seed=%u, %.0f x %.0f, preset=%s",
            config.seed, config.dimensions.x, config.dimensions.y, config.realismPreset.c_str());

    city::CityGenerator generator(config);
    generator.generateEverything();

    if (!summaryPath.empty() && !saveSummary(summaryPath, generator)) {
        return 1;
    }

    return 0;
}
