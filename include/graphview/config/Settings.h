#pragma once

#include <cstddef>
#include <numbers>

namespace graphview {

/// What pointer input is allowed to do with nodes
struct SettingsInteraction {
    bool clickingEnabled = false;
    bool draggingEnabled = false;
    bool selectionEnabled = false;
    bool selectionMultiEnabled = false;

    /// Multi-select is a mode of selection, so either flag allows selecting
    bool selectionAllowed() const { return selectionEnabled || selectionMultiEnabled; }
};

struct SettingsNavigation {
    bool zoomAndPanEnabled = false;
    bool fitToScreenEnabled = true;   ///< Refit every frame while set
    float zoomSpeed = 0.1f;
    float screenPadding = 0.3f;       ///< Fraction of the graph size added around it on fit
};

struct SettingsStyle {
    /// Screen radius grows by this much per incident edge
    float edgeRadiusWeight = 1.0f;
    /// Draw every label, not only those of selected or dragged nodes
    bool labelsAlways = false;

    float edgeWidth = 2.0f;
    float edgeCurveSize = 20.0f;
    float edgeTipSize = 15.0f;
    float edgeTipAngle = std::numbers::pi_v<float> / 6.0f;
};

/// Force-directed layout tuning
struct SettingsSimulation {
    float timeStep = 0.05f;
    size_t iterationCap = 1000;
    bool restartOnDrag = true;
    float damping = 0.9f;
    float idealDistanceScale = 1.0f;   ///< C in k = C * sqrt(area / n)
    float maxDisplacement = 10.0f;     ///< Per-step movement cap in canvas units
};

/// All settings groups, as persisted by SettingsSerializer
struct Settings {
    SettingsInteraction interaction;
    SettingsNavigation navigation;
    SettingsStyle style;
    SettingsSimulation simulation;
};

}  // namespace graphview
