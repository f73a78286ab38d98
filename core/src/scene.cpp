// Ember - Scene persistence

#include <ember/scene.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ember {

namespace {

json vec3ToJson(const glm::vec3& v) {
    return json::array({v.x, v.y, v.z});
}

template<typename T>
void read(const json& j, const char* key, T& field) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        field = it->get<T>();
    }
}

void readVec3(const json& j, const char* key, glm::vec3& field) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_array() || it->size() != 3) {
        throw std::runtime_error(std::string("field '") + key + "' must be an array of 3 numbers");
    }
    field = glm::vec3((*it)[0].get<float>(), (*it)[1].get<float>(), (*it)[2].get<float>());
}

// Read as a signed value so negative counts are not wrapped
void readCapacity(const json& j, uint32_t& field) {
    auto it = j.find("maxParticles");
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number()) {
        throw std::runtime_error("field 'maxParticles' must be a number");
    }
    double value = it->get<double>();
    if (!(value >= 1.0 && value <= static_cast<double>(kMaxCapacity))) {
        throw std::runtime_error("field 'maxParticles' must be between 1 and " +
                                 std::to_string(kMaxCapacity));
    }
    field = static_cast<uint32_t>(value);
}

template<typename Enum>
void readEnum(const json& j, const char* key, Enum& field, bool (*fromName)(const std::string&, Enum&)) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    std::string name = it->get<std::string>();
    if (!fromName(name, field)) {
        std::cerr << "[Scene] Unknown " << key << " '" << name << "', keeping default\n";
    }
}

void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

} // namespace

json configToJson(const EmissionConfig& c) {
    json j;
    j["id"] = c.id;
    j["name"] = c.name;

    j["burstMode"] = c.burstMode;
    j["particleCount"] = c.particleCount;
    j["emissionRate"] = c.emissionRate;
    j["emissionDuration"] = c.emissionDuration;
    j["lifetime"] = c.lifetime;
    j["maxParticles"] = c.maxParticles;

    j["emissionShape"] = shapeName(c.emissionShape);
    j["cubeLength"] = c.outerLength;
    j["innerLength"] = c.innerLength;
    j["outerLength"] = c.outerLength;
    j["innerRadius"] = c.innerRadius;
    j["outerRadius"] = c.outerRadius;
    j["squareInnerSize"] = c.squareInnerSize;
    j["squareSize"] = c.squareSize;
    j["circleInnerRadius"] = c.circleInnerRadius;
    j["circleOuterRadius"] = c.circleOuterRadius;
    j["cylinderInnerRadius"] = c.cylinderInnerRadius;
    j["cylinderOuterRadius"] = c.cylinderOuterRadius;
    j["cylinderHeight"] = c.cylinderHeight;

    j["shapeRotationX"] = c.shapeRotationX;
    j["shapeRotationY"] = c.shapeRotationY;
    j["shapeRotationZ"] = c.shapeRotationZ;
    j["shapeTranslationX"] = c.shapeTranslationX;
    j["shapeTranslationY"] = c.shapeTranslationY;
    j["shapeTranslationZ"] = c.shapeTranslationZ;

    j["particleSpeed"] = c.particleSpeed;
    j["randomSpeed"] = c.randomSpeed;
    j["minSpeed"] = c.minSpeed;
    j["maxSpeed"] = c.maxSpeed;

    j["overrideXVelocity"] = c.overrideXVelocity;
    j["overrideYVelocity"] = c.overrideYVelocity;
    j["overrideZVelocity"] = c.overrideZVelocity;
    j["xVelocity"] = c.xVelocity;
    j["yVelocity"] = c.yVelocity;
    j["zVelocity"] = c.zVelocity;
    j["circleVelocityDirection"] = directionName(c.circleVelocityDirection);
    j["cylinderVelocityDirection"] = directionName(c.cylinderVelocityDirection);

    j["fadeEnabled"] = c.fadeEnabled;
    j["fadeSizeEnabled"] = c.fadeSizeEnabled;
    j["particleSize"] = c.particleSize;
    j["randomSize"] = c.randomSize;
    j["minSize"] = c.minSize;
    j["maxSize"] = c.maxSize;
    j["aspectRatio"] = c.aspectRatio;
    j["rotation"] = c.rotation;
    j["rotationMode"] = rotationModeName(c.rotationMode);
    j["minRotation"] = c.minRotation;
    j["maxRotation"] = c.maxRotation;
    j["colorTransitionEnabled"] = c.colorTransitionEnabled;
    j["particleColor"] = vec3ToJson(c.particleColor);
    j["startColor"] = vec3ToJson(c.startColor);
    j["endColor"] = vec3ToJson(c.endColor);
    j["opacity"] = c.opacity;
    j["textureEnabled"] = c.textureEnabled;

    j["bloomEnabled"] = c.bloomEnabled;
    j["bloomIntensity"] = c.bloomIntensity;

    j["gravityEnabled"] = c.gravityEnabled;
    j["gravityStrength"] = c.gravityStrength;
    j["dampingEnabled"] = c.dampingEnabled;
    j["dampingStrength"] = c.dampingStrength;
    j["attractorEnabled"] = c.attractorEnabled;
    j["attractorStrength"] = c.attractorStrength;
    j["attractorPosition"] = vec3ToJson(c.attractorPosition);
    return j;
}

EmissionConfig configFromJson(const json& j) {
    EmissionConfig c;

    read(j, "id", c.id);
    read(j, "name", c.name);

    read(j, "burstMode", c.burstMode);
    read(j, "particleCount", c.particleCount);
    read(j, "emissionRate", c.emissionRate);
    read(j, "emissionDuration", c.emissionDuration);
    read(j, "lifetime", c.lifetime);
    readCapacity(j, c.maxParticles);

    readEnum(j, "emissionShape", c.emissionShape, &shapeFromName);
    read(j, "innerLength", c.innerLength);
    // Older files only carry cubeLength
    read(j, "cubeLength", c.outerLength);
    read(j, "outerLength", c.outerLength);
    c.cubeLength = c.outerLength;
    read(j, "innerRadius", c.innerRadius);
    read(j, "outerRadius", c.outerRadius);
    read(j, "squareInnerSize", c.squareInnerSize);
    read(j, "squareSize", c.squareSize);
    read(j, "circleInnerRadius", c.circleInnerRadius);
    read(j, "circleOuterRadius", c.circleOuterRadius);
    read(j, "cylinderInnerRadius", c.cylinderInnerRadius);
    read(j, "cylinderOuterRadius", c.cylinderOuterRadius);
    read(j, "cylinderHeight", c.cylinderHeight);

    read(j, "shapeRotationX", c.shapeRotationX);
    read(j, "shapeRotationY", c.shapeRotationY);
    read(j, "shapeRotationZ", c.shapeRotationZ);
    read(j, "shapeTranslationX", c.shapeTranslationX);
    read(j, "shapeTranslationY", c.shapeTranslationY);
    read(j, "shapeTranslationZ", c.shapeTranslationZ);

    read(j, "particleSpeed", c.particleSpeed);
    read(j, "randomSpeed", c.randomSpeed);
    read(j, "minSpeed", c.minSpeed);
    read(j, "maxSpeed", c.maxSpeed);

    read(j, "overrideXVelocity", c.overrideXVelocity);
    read(j, "overrideYVelocity", c.overrideYVelocity);
    read(j, "overrideZVelocity", c.overrideZVelocity);
    read(j, "xVelocity", c.xVelocity);
    read(j, "yVelocity", c.yVelocity);
    read(j, "zVelocity", c.zVelocity);
    readEnum(j, "circleVelocityDirection", c.circleVelocityDirection, &directionFromName);
    readEnum(j, "cylinderVelocityDirection", c.cylinderVelocityDirection, &directionFromName);

    read(j, "fadeEnabled", c.fadeEnabled);
    read(j, "fadeSizeEnabled", c.fadeSizeEnabled);
    read(j, "particleSize", c.particleSize);
    read(j, "randomSize", c.randomSize);
    read(j, "minSize", c.minSize);
    read(j, "maxSize", c.maxSize);
    read(j, "aspectRatio", c.aspectRatio);
    read(j, "rotation", c.rotation);
    readEnum(j, "rotationMode", c.rotationMode, &rotationModeFromName);
    read(j, "minRotation", c.minRotation);
    read(j, "maxRotation", c.maxRotation);
    read(j, "colorTransitionEnabled", c.colorTransitionEnabled);
    readVec3(j, "particleColor", c.particleColor);
    readVec3(j, "startColor", c.startColor);
    readVec3(j, "endColor", c.endColor);
    read(j, "opacity", c.opacity);
    read(j, "textureEnabled", c.textureEnabled);

    read(j, "bloomEnabled", c.bloomEnabled);
    read(j, "bloomIntensity", c.bloomIntensity);

    read(j, "gravityEnabled", c.gravityEnabled);
    read(j, "gravityStrength", c.gravityStrength);
    read(j, "dampingEnabled", c.dampingEnabled);
    read(j, "dampingStrength", c.dampingStrength);
    read(j, "attractorEnabled", c.attractorEnabled);
    read(j, "attractorStrength", c.attractorStrength);
    readVec3(j, "attractorPosition", c.attractorPosition);
    return c;
}

json sceneToJson(const SceneData& scene) {
    json j;
    j["version"] = scene.version.empty() ? kSceneVersion : scene.version;
    j["timestamp"] = scene.timestamp.empty() ? isoTimestamp() : scene.timestamp;
    j["systems"] = json::array();
    for (const auto& config : scene.systems) {
        j["systems"].push_back(configToJson(config));
    }
    j["activeSystemIndex"] = scene.activeSystemIndex;
    return j;
}

bool parseScene(const json& j, SceneData& out, std::string* error) {
    if (!j.is_object()) {
        setError(error, "scene must be a JSON object");
        return false;
    }
    if (!j.contains("version")) {
        setError(error, "invalid scene file: missing version information");
        return false;
    }

    auto systems = j.find("systems");
    if (systems == j.end() || !systems->is_array() || systems->empty()) {
        setError(error, "no valid particle systems found in the file");
        return false;
    }

    SceneData scene;
    try {
        const json& version = j.at("version");
        scene.version = version.is_string() ? version.get<std::string>() : version.dump();
        scene.timestamp = j.value("timestamp", "");
        scene.activeSystemIndex = j.value("activeSystemIndex", 0);

        for (const auto& entry : *systems) {
            if (!entry.is_object()) {
                setError(error, "system entry " + std::to_string(scene.systems.size()) +
                         " is not an object");
                return false;
            }
            scene.systems.push_back(configFromJson(entry));
        }
    } catch (const std::exception& e) {
        setError(error, std::string("malformed scene: ") + e.what());
        return false;
    }

    if (scene.version != kSceneVersion) {
        std::cerr << "[Scene] Loading version " << scene.version << " as " << kSceneVersion << "\n";
    }

    out = std::move(scene);
    return true;
}

bool parseSceneText(const std::string& text, SceneData& out, std::string* error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const std::exception& e) {
        setError(error, std::string("invalid JSON: ") + e.what());
        return false;
    }
    return parseScene(j, out, error);
}

bool loadSceneFile(const std::string& path, SceneData& out, std::string* error) {
    std::ifstream file(path);
    if (!file) {
        setError(error, "cannot open " + path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parseSceneText(buffer.str(), out, error)) {
        std::cerr << "[Scene] Failed to load " << path << "\n";
        return false;
    }

    std::cout << "[Scene] Loaded " << out.systems.size() << " system(s) from " << path << "\n";
    return true;
}

bool saveSceneFile(const std::string& path, const SceneData& scene, std::string* error) {
    if (scene.systems.empty()) {
        setError(error, "no particle systems to save");
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        setError(error, "cannot write " + path);
        return false;
    }

    file << sceneToJson(scene).dump(2) << "\n";
    if (!file) {
        setError(error, "write failed for " + path);
        return false;
    }

    std::cout << "[Scene] Saved " << scene.systems.size() << " system(s) to " << path << "\n";
    return true;
}

std::string isoTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace ember
