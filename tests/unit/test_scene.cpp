/**
 * @file test_scene.cpp
 * @brief Unit tests for scene JSON encoding, validation and file I/O
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <ember/scene.h>
#include <cstdio>
#include <filesystem>

using namespace ember;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

EmissionConfig customConfig() {
    EmissionConfig c;
    c.id = 7;
    c.name = "Sparks";
    c.burstMode = true;
    c.particleCount = 1234;
    c.emissionRate = 37.5f;
    c.emissionDuration = 3.25f;
    c.lifetime = 1.7f;
    c.maxParticles = 5000;
    c.emissionShape = EmissionShape::Cylinder;
    c.innerLength = 0.3f;
    c.outerLength = 1.9f;
    c.cubeLength = 1.9f;
    c.innerRadius = 0.2f;
    c.outerRadius = 2.2f;
    c.squareInnerSize = 0.4f;
    c.squareSize = 1.1f;
    c.circleInnerRadius = 0.6f;
    c.circleOuterRadius = 0.9f;
    c.cylinderInnerRadius = 0.25f;
    c.cylinderOuterRadius = 1.75f;
    c.cylinderHeight = 6.5f;
    c.shapeRotationX = 15.0f;
    c.shapeRotationY = -30.0f;
    c.shapeRotationZ = 45.5f;
    c.shapeTranslationX = 0.1f;
    c.shapeTranslationY = -0.2f;
    c.shapeTranslationZ = 0.3f;
    c.particleSpeed = 2.75f;
    c.randomSpeed = true;
    c.minSpeed = 0.33f;
    c.maxSpeed = 4.4f;
    c.overrideXVelocity = true;
    c.overrideZVelocity = true;
    c.xVelocity = -1.5f;
    c.zVelocity = 0.125f;
    c.circleVelocityDirection = VelocityDirection::Tangential;
    c.cylinderVelocityDirection = VelocityDirection::Tangential;
    c.fadeEnabled = false;
    c.fadeSizeEnabled = true;
    c.particleSize = 0.42f;
    c.randomSize = true;
    c.minSize = 0.05f;
    c.maxSize = 0.95f;
    c.aspectRatio = 1.6f;
    c.rotation = 22.5f;
    c.rotationMode = RotationMode::Random;
    c.minRotation = -45.0f;
    c.maxRotation = 135.0f;
    c.colorTransitionEnabled = true;
    c.particleColor = {0.1f, 0.2f, 0.3f};
    c.startColor = {0.9f, 0.8f, 0.7f};
    c.endColor = {0.05f, 0.15f, 0.25f};
    c.opacity = 0.65f;
    c.textureEnabled = true;
    c.bloomEnabled = false;
    c.bloomIntensity = 2.2f;
    c.gravityEnabled = true;
    c.gravityStrength = 3.3f;
    c.dampingEnabled = true;
    c.dampingStrength = 0.7f;
    c.attractorEnabled = true;
    c.attractorStrength = 5.5f;
    c.attractorPosition = {1.0f, -2.0f, 3.5f};
    return c;
}

void requireSameConfig(const EmissionConfig& a, const EmissionConfig& b) {
    REQUIRE(a.id == b.id);
    REQUIRE(a.name == b.name);
    REQUIRE(a.burstMode == b.burstMode);
    REQUIRE(a.particleCount == b.particleCount);
    REQUIRE(a.emissionRate == b.emissionRate);
    REQUIRE(a.emissionDuration == b.emissionDuration);
    REQUIRE(a.lifetime == b.lifetime);
    REQUIRE(a.maxParticles == b.maxParticles);
    REQUIRE(a.emissionShape == b.emissionShape);
    REQUIRE(a.cubeLength == b.cubeLength);
    REQUIRE(a.innerLength == b.innerLength);
    REQUIRE(a.outerLength == b.outerLength);
    REQUIRE(a.innerRadius == b.innerRadius);
    REQUIRE(a.outerRadius == b.outerRadius);
    REQUIRE(a.squareInnerSize == b.squareInnerSize);
    REQUIRE(a.squareSize == b.squareSize);
    REQUIRE(a.circleInnerRadius == b.circleInnerRadius);
    REQUIRE(a.circleOuterRadius == b.circleOuterRadius);
    REQUIRE(a.cylinderInnerRadius == b.cylinderInnerRadius);
    REQUIRE(a.cylinderOuterRadius == b.cylinderOuterRadius);
    REQUIRE(a.cylinderHeight == b.cylinderHeight);
    REQUIRE(a.shapeRotationX == b.shapeRotationX);
    REQUIRE(a.shapeRotationY == b.shapeRotationY);
    REQUIRE(a.shapeRotationZ == b.shapeRotationZ);
    REQUIRE(a.shapeTranslationX == b.shapeTranslationX);
    REQUIRE(a.shapeTranslationY == b.shapeTranslationY);
    REQUIRE(a.shapeTranslationZ == b.shapeTranslationZ);
    REQUIRE(a.particleSpeed == b.particleSpeed);
    REQUIRE(a.randomSpeed == b.randomSpeed);
    REQUIRE(a.minSpeed == b.minSpeed);
    REQUIRE(a.maxSpeed == b.maxSpeed);
    REQUIRE(a.overrideXVelocity == b.overrideXVelocity);
    REQUIRE(a.overrideYVelocity == b.overrideYVelocity);
    REQUIRE(a.overrideZVelocity == b.overrideZVelocity);
    REQUIRE(a.xVelocity == b.xVelocity);
    REQUIRE(a.yVelocity == b.yVelocity);
    REQUIRE(a.zVelocity == b.zVelocity);
    REQUIRE(a.circleVelocityDirection == b.circleVelocityDirection);
    REQUIRE(a.cylinderVelocityDirection == b.cylinderVelocityDirection);
    REQUIRE(a.fadeEnabled == b.fadeEnabled);
    REQUIRE(a.fadeSizeEnabled == b.fadeSizeEnabled);
    REQUIRE(a.particleSize == b.particleSize);
    REQUIRE(a.randomSize == b.randomSize);
    REQUIRE(a.minSize == b.minSize);
    REQUIRE(a.maxSize == b.maxSize);
    REQUIRE(a.aspectRatio == b.aspectRatio);
    REQUIRE(a.rotation == b.rotation);
    REQUIRE(a.rotationMode == b.rotationMode);
    REQUIRE(a.minRotation == b.minRotation);
    REQUIRE(a.maxRotation == b.maxRotation);
    REQUIRE(a.colorTransitionEnabled == b.colorTransitionEnabled);
    REQUIRE(a.particleColor == b.particleColor);
    REQUIRE(a.startColor == b.startColor);
    REQUIRE(a.endColor == b.endColor);
    REQUIRE(a.opacity == b.opacity);
    REQUIRE(a.textureEnabled == b.textureEnabled);
    REQUIRE(a.bloomEnabled == b.bloomEnabled);
    REQUIRE(a.bloomIntensity == b.bloomIntensity);
    REQUIRE(a.gravityEnabled == b.gravityEnabled);
    REQUIRE(a.gravityStrength == b.gravityStrength);
    REQUIRE(a.dampingEnabled == b.dampingEnabled);
    REQUIRE(a.dampingStrength == b.dampingStrength);
    REQUIRE(a.attractorEnabled == b.attractorEnabled);
    REQUIRE(a.attractorStrength == b.attractorStrength);
    REQUIRE(a.attractorPosition == b.attractorPosition);
}

json minimalScene() {
    return json{
        {"version", "1.0"},
        {"timestamp", "2026-01-01T00:00:00Z"},
        {"systems", json::array({json{{"name", "Only"}}})},
        {"activeSystemIndex", 0}
    };
}

} // namespace

TEST_CASE("Config JSON encoding", "[scene]") {
    EmissionConfig config = customConfig();
    json j = configToJson(config);

    SECTION("enums are written by name") {
        REQUIRE(j["emissionShape"] == "cylinder");
        REQUIRE(j["rotationMode"] == "random");
        REQUIRE(j["circleVelocityDirection"] == "tangential");
    }

    SECTION("colors are three-element arrays") {
        REQUIRE(j["startColor"].is_array());
        REQUIRE(j["startColor"].size() == 3);
        REQUIRE(j["attractorPosition"][2].get<float>() == 3.5f);
    }

    SECTION("cubeLength mirrors outerLength") {
        REQUIRE(j["cubeLength"].get<float>() == j["outerLength"].get<float>());
    }

    SECTION("every field survives a round-trip") {
        requireSameConfig(configFromJson(j), config);
    }
}

TEST_CASE("Config JSON decoding", "[scene]") {
    SECTION("missing fields keep their defaults") {
        EmissionConfig c = configFromJson(json{{"name", "Sparse"}, {"emissionRate", 25.0}});
        EmissionConfig defaults;
        REQUIRE(c.name == "Sparse");
        REQUIRE(c.emissionRate == 25.0f);
        REQUIRE(c.lifetime == defaults.lifetime);
        REQUIRE(c.emissionShape == defaults.emissionShape);
        REQUIRE(c.particleColor == defaults.particleColor);
    }

    SECTION("older files that only carry cubeLength") {
        EmissionConfig c = configFromJson(json{{"cubeLength", 3.5}});
        REQUIRE(c.outerLength == 3.5f);
        REQUIRE(c.cubeLength == 3.5f);
    }

    SECTION("unknown enum names keep the default") {
        EmissionConfig c = configFromJson(json{{"emissionShape", "torus"}});
        REQUIRE(c.emissionShape == EmissionShape::Cube);
    }

    SECTION("wrong color shape throws") {
        REQUIRE_THROWS(configFromJson(json{{"startColor", json::array({1.0, 0.0})}}));
    }
}

TEST_CASE("Scene round-trip", "[scene]") {
    SceneData scene;
    scene.timestamp = "2026-03-04T05:06:07Z";
    scene.systems.push_back(customConfig());
    EmissionConfig second;
    second.id = 8;
    second.name = "Second";
    scene.systems.push_back(second);
    scene.activeSystemIndex = 1;

    std::string text = sceneToJson(scene).dump(2);
    SceneData loaded;
    std::string error;
    REQUIRE(parseSceneText(text, loaded, &error));

    REQUIRE(loaded.version == kSceneVersion);
    REQUIRE(loaded.timestamp == scene.timestamp);
    REQUIRE(loaded.activeSystemIndex == 1);
    REQUIRE(loaded.systems.size() == 2);
    requireSameConfig(loaded.systems[0], scene.systems[0]);
    requireSameConfig(loaded.systems[1], scene.systems[1]);
}

TEST_CASE("Malformed scenes are rejected", "[scene][errors]") {
    SceneData out;
    out.timestamp = "untouched";
    std::string error;

    SECTION("not an object") {
        REQUIRE_FALSE(parseScene(json::array(), out, &error));
    }

    SECTION("missing version") {
        json j = minimalScene();
        j.erase("version");
        REQUIRE_FALSE(parseScene(j, out, &error));
        REQUIRE_THAT(error, ContainsSubstring("version"));
    }

    SECTION("missing systems") {
        json j = minimalScene();
        j.erase("systems");
        REQUIRE_FALSE(parseScene(j, out, &error));
    }

    SECTION("empty systems") {
        json j = minimalScene();
        j["systems"] = json::array();
        REQUIRE_FALSE(parseScene(j, out, &error));
    }

    SECTION("systems is not an array") {
        json j = minimalScene();
        j["systems"] = json{{"name", "x"}};
        REQUIRE_FALSE(parseScene(j, out, &error));
    }

    SECTION("system entry is not an object") {
        json j = minimalScene();
        j["systems"].push_back(42);
        REQUIRE_FALSE(parseScene(j, out, &error));
    }

    SECTION("field of the wrong type") {
        json j = minimalScene();
        j["systems"][0]["emissionRate"] = "fast";
        REQUIRE_FALSE(parseScene(j, out, &error));
        REQUIRE_THAT(error, ContainsSubstring("malformed"));
    }

    SECTION("negative maxParticles") {
        json j = minimalScene();
        j["systems"][0]["maxParticles"] = -1;
        REQUIRE_FALSE(parseScene(j, out, &error));
        REQUIRE_THAT(error, ContainsSubstring("maxParticles"));
    }

    SECTION("maxParticles above the capacity limit") {
        json j = minimalScene();
        j["systems"][0]["maxParticles"] = 100000000;
        REQUIRE_FALSE(parseScene(j, out, &error));
        REQUIRE_THAT(error, ContainsSubstring("maxParticles"));
    }

    SECTION("invalid JSON text") {
        REQUIRE_FALSE(parseSceneText("{ \"version\": ", out, &error));
    }

    REQUIRE_FALSE(error.empty());
    REQUIRE(out.timestamp == "untouched");
    REQUIRE(out.systems.empty());
}

TEST_CASE("Scene files", "[scene][io]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "ember_scene_test.json";

    SECTION("save then load") {
        SceneData scene;
        scene.systems.push_back(customConfig());
        std::string error;
        REQUIRE(saveSceneFile(path.string(), scene, &error));

        SceneData loaded;
        REQUIRE(loadSceneFile(path.string(), loaded, &error));
        REQUIRE(loaded.systems.size() == 1);
        REQUIRE_FALSE(loaded.timestamp.empty());
        requireSameConfig(loaded.systems[0], scene.systems[0]);
        fs::remove(path);
    }

    SECTION("an empty scene is not saved") {
        std::string error;
        REQUIRE_FALSE(saveSceneFile(path.string(), SceneData{}, &error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("a missing file fails to load") {
        SceneData loaded;
        std::string error;
        REQUIRE_FALSE(loadSceneFile("/nonexistent/dir/scene.json", loaded, &error));
    }
}

TEST_CASE("ISO timestamps", "[scene]") {
    std::string ts = isoTimestamp();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}
