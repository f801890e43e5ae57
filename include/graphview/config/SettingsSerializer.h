#pragma once

#include "Settings.h"
#include "graphview/view/Viewport.h"

#include <optional>
#include <string>

namespace graphview {

/// JSON persistence for settings and the viewport record
class SettingsSerializer {
public:
    // === Settings ===

    /// Serialize all settings groups
    static std::string toJson(const Settings& settings);

    /// Overwrite settings with the values present in json.
    /// Missing keys keep their current values.
    /// @return false if json is malformed or a value has the wrong type;
    ///         settings is left untouched in that case
    static bool fromJson(Settings& settings, const std::string& json);

    static bool saveToFile(const Settings& settings, const std::string& path);
    static bool loadFromFile(Settings& settings, const std::string& path);

    // === Viewport ===

    /// Zoom, pan and first-frame flag. The canvas rectangle is per frame
    /// and is not stored.
    static std::string toJson(const Viewport& viewport);

    /// @return nullopt if json is malformed or the zoom is not positive
    static std::optional<Viewport> viewportFromJson(const std::string& json);
};

}  // namespace graphview
