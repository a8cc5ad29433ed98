#pragma once

#include "nodeweave/serialization/EngineConfig.h"

#include <string>

namespace nodeweave {

/// JSON conversion of engine parameters and computed results.
/// The engine never persists anything itself; files are written only on request.
class EngineSerializer {
public:
    // === EngineConfig ===

    /// Serialize all parameters to an indented JSON object
    static std::string toJson(const EngineConfig& config);

    /// Populate config from JSON. Keys that are missing keep the value
    /// already in config.
    /// @return false if the text is not valid JSON or a value has the wrong
    ///         type; config is reset to defaults in that case
    static bool fromJson(EngineConfig& config, const std::string& json);

    /// Write toJson(config) to path
    /// @return true if the file was written
    static bool saveToFile(const EngineConfig& config, const std::string& path);

    /// Read path and parse it with fromJson()
    /// @return false if the file cannot be read or parsed
    static bool loadFromFile(EngineConfig& config, const std::string& path);

    // === Results ===

    static std::string toJson(const ForceStepResult& result);
    static std::string toJson(const ClusterResult& result);
    static std::string toJson(const OrthoResult& result);

private:
    static std::string orientationToString(LayoutOrientation orientation);
    static LayoutOrientation stringToOrientation(const std::string& str);
};

}  // namespace nodeweave
