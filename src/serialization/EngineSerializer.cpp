#include "nodeweave/serialization/EngineSerializer.h"
#include "nodeweave/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace nodeweave {

namespace {

json pointToJson(Point p) {
    return {{"x", p.x}, {"y", p.y}};
}

json rectToJson(const Rect& r) {
    return {{"minX", r.min.x}, {"minY", r.min.y}, {"maxX", r.max.x}, {"maxY", r.max.y}};
}

/// Sub-object j[key], or an empty object when absent.
const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    return it != j.end() ? *it : empty;
}

}  // namespace

std::string EngineSerializer::orientationToString(LayoutOrientation orientation) {
    switch (orientation) {
        case LayoutOrientation::Horizontal: return "horizontal";
        case LayoutOrientation::Vertical: return "vertical";
    }
    return "horizontal";
}

LayoutOrientation EngineSerializer::stringToOrientation(const std::string& str) {
    if (str == "vertical") return LayoutOrientation::Vertical;
    if (str != "horizontal") {
        LOG_WARN("Unknown orientation '{}', using horizontal", str);
    }
    return LayoutOrientation::Horizontal;
}

std::string EngineSerializer::toJson(const EngineConfig& config) {
    json j;
    j["version"] = 1;

    const ForceOptions& f = config.force;
    j["force"] = {
        {"repulsion", f.repulsion},
        {"attraction", f.attraction},
        {"gravityRadius", f.gravityRadius},
        {"theta", f.theta},
        {"leafCapacity", f.leafCapacity},
        {"layoutArea", f.layoutArea}
    };

    const AnnealingSchedule::Options& a = config.annealing;
    j["annealing"] = {
        {"startTemperature", a.startTemperature},
        {"cooling", a.cooling},
        {"minTemperature", a.minTemperature},
        {"convergedDisplacement", a.convergedDisplacement},
        {"maxSteps", a.maxSteps}
    };

    j["louvain"] = {
        {"resolution", config.louvain.resolution},
        {"randomize", config.louvain.randomize},
        {"seed", config.louvain.seed}
    };

    const GeneticOptions& g = config.circular.genetic;
    j["circular"] = {
        {"seed", config.circular.seed},
        {"fallbackSpacing", config.circular.fallbackSpacing},
        {"genetic", {
            {"populationSize", g.populationSize},
            {"generations", g.generations},
            {"crossoverRate", g.crossoverRate},
            {"mutationRate", g.mutationRate},
            {"tournamentSize", g.tournamentSize},
            {"maxStagnation", g.maxStagnation}
        }}
    };

    j["linear"] = {
        {"orientation", orientationToString(config.linear.orientation)},
        {"spacing", config.linear.spacing},
        {"duplicateOffset", config.linear.duplicateOffset},
        {"seed", config.linear.seed}
    };

    j["ortho"] = {
        {"laneMargin", config.ortho.laneMargin},
        {"laneSpacing", config.ortho.laneSpacing},
        {"frameMargin", config.ortho.frameMargin}
    };

    return j.dump(2);
}

bool EngineSerializer::fromJson(EngineConfig& config, const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_WARN("Engine config must be a JSON object, got {}", j.type_name());
            config = EngineConfig{};
            return false;
        }

        EngineConfig parsed = config;

        const json& f = section(j, "force");
        parsed.force.repulsion = f.value("repulsion", parsed.force.repulsion);
        parsed.force.attraction = f.value("attraction", parsed.force.attraction);
        parsed.force.gravityRadius = f.value("gravityRadius", parsed.force.gravityRadius);
        parsed.force.theta = f.value("theta", parsed.force.theta);
        parsed.force.leafCapacity = f.value("leafCapacity", parsed.force.leafCapacity);
        parsed.force.layoutArea = f.value("layoutArea", parsed.force.layoutArea);

        const json& a = section(j, "annealing");
        auto& ann = parsed.annealing;
        ann.startTemperature = a.value("startTemperature", ann.startTemperature);
        ann.cooling = a.value("cooling", ann.cooling);
        ann.minTemperature = a.value("minTemperature", ann.minTemperature);
        ann.convergedDisplacement = a.value("convergedDisplacement", ann.convergedDisplacement);
        ann.maxSteps = a.value("maxSteps", ann.maxSteps);

        const json& l = section(j, "louvain");
        parsed.louvain.resolution = l.value("resolution", parsed.louvain.resolution);
        parsed.louvain.randomize = l.value("randomize", parsed.louvain.randomize);
        parsed.louvain.seed = l.value("seed", parsed.louvain.seed);

        const json& c = section(j, "circular");
        parsed.circular.seed = c.value("seed", parsed.circular.seed);
        parsed.circular.fallbackSpacing = c.value("fallbackSpacing", parsed.circular.fallbackSpacing);
        const json& g = section(c, "genetic");
        auto& gen = parsed.circular.genetic;
        gen.populationSize = g.value("populationSize", gen.populationSize);
        gen.generations = g.value("generations", gen.generations);
        gen.crossoverRate = g.value("crossoverRate", gen.crossoverRate);
        gen.mutationRate = g.value("mutationRate", gen.mutationRate);
        gen.tournamentSize = g.value("tournamentSize", gen.tournamentSize);
        gen.maxStagnation = g.value("maxStagnation", gen.maxStagnation);

        const json& lin = section(j, "linear");
        if (lin.contains("orientation")) {
            parsed.linear.orientation = stringToOrientation(lin["orientation"].get<std::string>());
        }
        parsed.linear.spacing = lin.value("spacing", parsed.linear.spacing);
        parsed.linear.duplicateOffset = lin.value("duplicateOffset", parsed.linear.duplicateOffset);
        parsed.linear.seed = lin.value("seed", parsed.linear.seed);

        const json& o = section(j, "ortho");
        parsed.ortho.laneMargin = o.value("laneMargin", parsed.ortho.laneMargin);
        parsed.ortho.laneSpacing = o.value("laneSpacing", parsed.ortho.laneSpacing);
        parsed.ortho.frameMargin = o.value("frameMargin", parsed.ortho.frameMargin);

        config = parsed;
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("Invalid engine config, using defaults: {}", e.what());
        config = EngineConfig{};
        return false;
    }
}

bool EngineSerializer::saveToFile(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for writing", path);
        return false;
    }
    file << toJson(config);
    return file.good();
}

bool EngineSerializer::loadFromFile(EngineConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for reading", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(config, buffer.str());
}

std::string EngineSerializer::toJson(const ForceStepResult& result) {
    json j;
    j["maxDisplacement"] = result.maxDisplacement;
    json positions = json::array();
    for (const auto& p : result.positions) {
        positions.push_back({
            {"pos", pointToJson(p.pos)},
            {"vel", pointToJson(p.vel)},
            {"locked", p.locked}
        });
    }
    j["positions"] = positions;
    return j.dump(2);
}

std::string EngineSerializer::toJson(const ClusterResult& result) {
    json j;
    j["clusterCount"] = result.clusterCount;
    j["nodeCluster"] = result.nodeCluster;
    return j.dump(2);
}

std::string EngineSerializer::toJson(const OrthoResult& result) {
    json j;

    json rects = json::array();
    for (const auto& r : result.rects) {
        rects.push_back(rectToJson(r));
    }
    j["rects"] = rects;

    json routes = json::array();
    for (const auto& route : result.edgeRoutes) {
        json points = json::array();
        for (const auto& p : route.points) {
            points.push_back(pointToJson(p));
        }
        routes.push_back({
            {"edgeIndex", route.edgeIndex},
            {"from", route.from},
            {"to", route.to},
            {"points", points},
            {"channelSlots", route.channelSlots}
        });
    }
    j["edgeRoutes"] = routes;
    j["channelSlots"] = result.channelSlots;
    j["detectedCycles"] = result.detectedCycles;
    return j.dump(2);
}

}  // namespace nodeweave
