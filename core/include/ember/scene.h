#pragma once

/**
 * @file scene.h
 * @brief JSON persistence for multi-system scenes
 *
 * A scene document looks like:
 * @code{.json}
 * {
 *   "version": "1.0",
 *   "timestamp": "2026-01-01T12:00:00Z",
 *   "systems": [ { "name": "Sparks", "emissionShape": "sphere", ... } ],
 *   "activeSystemIndex": 0
 * }
 * @endcode
 *
 * Every EmissionConfig field is written. On load, missing fields keep
 * their defaults, but a document without a version or without a non-empty
 * systems array of objects is rejected.
 */

#include <ember/emission_config.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ember {

inline constexpr const char* kSceneVersion = "1.0";

struct SceneData {
    std::string version = kSceneVersion;
    std::string timestamp;
    std::vector<EmissionConfig> systems;
    int activeSystemIndex = 0;
};

/// Serialize one configuration (all fields).
nlohmann::json configToJson(const EmissionConfig& config);

/**
 * @brief Read one configuration, defaulting absent fields
 * @throws nlohmann::json::exception on a field of the wrong type
 */
EmissionConfig configFromJson(const nlohmann::json& j);

nlohmann::json sceneToJson(const SceneData& scene);

/**
 * @brief Validate and decode a scene document
 * @param error Receives a human-readable reason on failure
 * @return false if the document is malformed; @p out is left untouched
 */
bool parseScene(const nlohmann::json& j, SceneData& out, std::string* error = nullptr);

/// Parse JSON text, then parseScene().
bool parseSceneText(const std::string& text, SceneData& out, std::string* error = nullptr);

bool loadSceneFile(const std::string& path, SceneData& out, std::string* error = nullptr);
bool saveSceneFile(const std::string& path, const SceneData& scene, std::string* error = nullptr);

/// UTC time as ISO-8601, e.g. 2026-01-01T12:00:00Z
std::string isoTimestamp();

} // namespace ember
