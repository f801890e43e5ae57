#include "graphview/config/SettingsSerializer.h"
#include "graphview/common/Logger.h"

#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace graphview {

namespace {

/// Read key into value if present; type mismatches throw json::type_error
template <typename T>
void readInto(const json& j, const char* key, T& value) {
    if (j.contains(key)) {
        value = j.at(key).get<T>();
    }
}

}  // namespace

std::string SettingsSerializer::toJson(const Settings& settings) {
    json j;
    j["version"] = 1;

    const auto& in = settings.interaction;
    j["interaction"] = {
        {"clickingEnabled", in.clickingEnabled},
        {"draggingEnabled", in.draggingEnabled},
        {"selectionEnabled", in.selectionEnabled},
        {"selectionMultiEnabled", in.selectionMultiEnabled}
    };

    const auto& nav = settings.navigation;
    j["navigation"] = {
        {"zoomAndPanEnabled", nav.zoomAndPanEnabled},
        {"fitToScreenEnabled", nav.fitToScreenEnabled},
        {"zoomSpeed", nav.zoomSpeed},
        {"screenPadding", nav.screenPadding}
    };

    const auto& style = settings.style;
    j["style"] = {
        {"edgeRadiusWeight", style.edgeRadiusWeight},
        {"labelsAlways", style.labelsAlways},
        {"edgeWidth", style.edgeWidth},
        {"edgeCurveSize", style.edgeCurveSize},
        {"edgeTipSize", style.edgeTipSize},
        {"edgeTipAngle", style.edgeTipAngle}
    };

    const auto& sim = settings.simulation;
    j["simulation"] = {
        {"timeStep", sim.timeStep},
        {"iterationCap", sim.iterationCap},
        {"restartOnDrag", sim.restartOnDrag},
        {"damping", sim.damping},
        {"idealDistanceScale", sim.idealDistanceScale},
        {"maxDisplacement", sim.maxDisplacement}
    };

    return j.dump(2);
}

bool SettingsSerializer::fromJson(Settings& settings, const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        Settings parsed = settings;

        if (j.contains("interaction")) {
            const auto& in = j["interaction"];
            readInto(in, "clickingEnabled", parsed.interaction.clickingEnabled);
            readInto(in, "draggingEnabled", parsed.interaction.draggingEnabled);
            readInto(in, "selectionEnabled", parsed.interaction.selectionEnabled);
            readInto(in, "selectionMultiEnabled", parsed.interaction.selectionMultiEnabled);
        }

        if (j.contains("navigation")) {
            const auto& nav = j["navigation"];
            readInto(nav, "zoomAndPanEnabled", parsed.navigation.zoomAndPanEnabled);
            readInto(nav, "fitToScreenEnabled", parsed.navigation.fitToScreenEnabled);
            readInto(nav, "zoomSpeed", parsed.navigation.zoomSpeed);
            readInto(nav, "screenPadding", parsed.navigation.screenPadding);
        }

        if (j.contains("style")) {
            const auto& style = j["style"];
            readInto(style, "edgeRadiusWeight", parsed.style.edgeRadiusWeight);
            readInto(style, "labelsAlways", parsed.style.labelsAlways);
            readInto(style, "edgeWidth", parsed.style.edgeWidth);
            readInto(style, "edgeCurveSize", parsed.style.edgeCurveSize);
            readInto(style, "edgeTipSize", parsed.style.edgeTipSize);
            readInto(style, "edgeTipAngle", parsed.style.edgeTipAngle);
        }

        if (j.contains("simulation")) {
            const auto& sim = j["simulation"];
            readInto(sim, "timeStep", parsed.simulation.timeStep);
            readInto(sim, "iterationCap", parsed.simulation.iterationCap);
            readInto(sim, "restartOnDrag", parsed.simulation.restartOnDrag);
            readInto(sim, "damping", parsed.simulation.damping);
            readInto(sim, "idealDistanceScale", parsed.simulation.idealDistanceScale);
            readInto(sim, "maxDisplacement", parsed.simulation.maxDisplacement);
        }

        settings = parsed;
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("Failed to parse settings: {}", e.what());
        return false;
    }
}

bool SettingsSerializer::saveToFile(const Settings& settings, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(settings);
    return true;
}

bool SettingsSerializer::loadFromFile(Settings& settings, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(settings, buffer.str());
}

std::string SettingsSerializer::toJson(const Viewport& viewport) {
    json j;
    j["zoom"] = viewport.zoom;
    j["pan"] = {{"x", viewport.pan.x}, {"y", viewport.pan.y}};
    j["firstFrame"] = viewport.firstFrame;
    return j.dump(2);
}

std::optional<Viewport> SettingsSerializer::viewportFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        Viewport viewport;
        viewport.zoom = j.value("zoom", 1.0f);
        if (j.contains("pan")) {
            viewport.pan.x = j["pan"].at("x").get<float>();
            viewport.pan.y = j["pan"].at("y").get<float>();
        }
        viewport.firstFrame = j.value("firstFrame", true);

        if (!std::isfinite(viewport.zoom) || viewport.zoom <= 0.0f) {
            LOG_WARN("Rejecting stored viewport with zoom {}", viewport.zoom);
            return std::nullopt;
        }
        return viewport;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

}  // namespace graphview
