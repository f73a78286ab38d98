/**
 * @file test_emission_config.cpp
 * @brief Unit tests for EmissionConfig defaults, bounded edits and normalization
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <ember/emission_config.h>
#include <random>

using namespace ember;
using Catch::Matchers::WithinAbs;

TEST_CASE("EmissionConfig defaults", "[config]") {
    EmissionConfig config;

    SECTION("emission defaults") {
        REQUIRE_FALSE(config.burstMode);
        REQUIRE(config.particleCount == 100);
        REQUIRE_THAT(config.emissionRate, WithinAbs(10.0f, 0.0001f));
        REQUIRE_THAT(config.emissionDuration, WithinAbs(10.0f, 0.0001f));
        REQUIRE_THAT(config.lifetime, WithinAbs(5.0f, 0.0001f));
        REQUIRE(config.maxParticles == MAX_PARTICLES);
    }

    SECTION("shape defaults") {
        REQUIRE(config.emissionShape == EmissionShape::Cube);
        REQUIRE_THAT(config.outerLength, WithinAbs(2.0f, 0.0001f));
        REQUIRE_THAT(config.cubeLength, WithinAbs(config.outerLength, 0.0001f));
        REQUIRE_THAT(config.cylinderHeight, WithinAbs(4.0f, 0.0001f));
    }

    SECTION("every pair starts with outer above inner") {
        REQUIRE(config.outerLength > config.innerLength);
        REQUIRE(config.outerRadius > config.innerRadius);
        REQUIRE(config.squareSize > config.squareInnerSize);
        REQUIRE(config.circleOuterRadius > config.circleInnerRadius);
        REQUIRE(config.cylinderOuterRadius > config.cylinderInnerRadius);
        REQUIRE(config.maxSpeed > config.minSpeed);
        REQUIRE(config.maxSize > config.minSize);
        REQUIRE(config.maxRotation > config.minRotation);
    }

    SECTION("capacity follows maxParticles") {
        REQUIRE(config.capacity() == MAX_PARTICLES);
        config.maxParticles = 0;
        REQUIRE(config.capacity() == 1);
        config.maxParticles = 0xFFFFFFFFu;
        REQUIRE(config.capacity() == kMaxCapacity);
    }
}

TEST_CASE("Bounded edit helpers", "[config][bounds]") {
    SECTION("lower edit below the gap nudges the upper bound") {
        float lower = 0.0f, upper = 1.0f;
        editLowerBound(lower, upper, 1.0f, 0.0f);
        REQUIRE_THAT(lower, WithinAbs(1.0f, 0.0001f));
        REQUIRE_THAT(upper, WithinAbs(1.1f, 0.0001f));
    }

    SECTION("lower edit with room leaves the upper bound alone") {
        float lower = 0.0f, upper = 2.0f;
        editLowerBound(lower, upper, 0.5f, 0.0f);
        REQUIRE_THAT(lower, WithinAbs(0.5f, 0.0001f));
        REQUIRE_THAT(upper, WithinAbs(2.0f, 0.0001f));
    }

    SECTION("lower edit is clamped to the floor") {
        float lower = 0.5f, upper = 2.0f;
        editLowerBound(lower, upper, -3.0f, 0.0f);
        REQUIRE_THAT(lower, WithinAbs(0.0f, 0.0001f));
    }

    SECTION("upper edit below the lower bound pulls the lower bound down") {
        float lower = 1.0f, upper = 2.0f;
        editUpperBound(lower, upper, 0.5f, 0.0f);
        REQUIRE_THAT(upper, WithinAbs(0.5f, 0.0001f));
        REQUIRE_THAT(lower, WithinAbs(0.4f, 0.0001f));
    }

    SECTION("upper edit never drops below floor plus the gap") {
        float lower = 0.0f, upper = 2.0f;
        editUpperBound(lower, upper, -1.0f, 0.0f);
        REQUIRE_THAT(upper, WithinAbs(kMinGap, 0.0001f));
        REQUIRE_THAT(lower, WithinAbs(0.0f, 0.0001f));
        REQUIRE(upper > lower);
    }

    SECTION("rotation pair may go negative") {
        EmissionConfig config;
        config.setMinRotation(-90.0f);
        REQUIRE_THAT(config.minRotation, WithinAbs(-90.0f, 0.0001f));
        config.setMaxRotation(-400.0f);
        REQUIRE(config.maxRotation > config.minRotation);
        REQUIRE(config.minRotation >= -360.0f);
    }

    SECTION("length edits keep cubeLength mirrored") {
        EmissionConfig config;
        config.setOuterLength(5.0f);
        REQUIRE_THAT(config.cubeLength, WithinAbs(5.0f, 0.0001f));
        config.setInnerLength(6.0f);
        REQUIRE_THAT(config.outerLength, WithinAbs(6.1f, 0.0001f));
        REQUIRE_THAT(config.cubeLength, WithinAbs(6.1f, 0.0001f));
    }
}

TEST_CASE("Randomized bounded edits keep outer above inner", "[config][bounds]") {
    EmissionConfig config;
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> value(-500.0f, 500.0f);
    std::uniform_int_distribution<int> which(0, 15);

    for (int i = 0; i < 5000; ++i) {
        float v = value(rng);
        switch (which(rng)) {
            case 0:  config.setInnerLength(v); break;
            case 1:  config.setOuterLength(v); break;
            case 2:  config.setInnerRadius(v); break;
            case 3:  config.setOuterRadius(v); break;
            case 4:  config.setSquareInnerSize(v); break;
            case 5:  config.setSquareSize(v); break;
            case 6:  config.setCircleInnerRadius(v); break;
            case 7:  config.setCircleOuterRadius(v); break;
            case 8:  config.setCylinderInnerRadius(v); break;
            case 9:  config.setCylinderOuterRadius(v); break;
            case 10: config.setMinSpeed(v); break;
            case 11: config.setMaxSpeed(v); break;
            case 12: config.setMinSize(v); break;
            case 13: config.setMaxSize(v); break;
            case 14: config.setMinRotation(v); break;
            default: config.setMaxRotation(v); break;
        }

        REQUIRE(config.outerLength > config.innerLength);
        REQUIRE(config.outerRadius > config.innerRadius);
        REQUIRE(config.squareSize > config.squareInnerSize);
        REQUIRE(config.circleOuterRadius > config.circleInnerRadius);
        REQUIRE(config.cylinderOuterRadius > config.cylinderInnerRadius);
        REQUIRE(config.maxSpeed > config.minSpeed);
        REQUIRE(config.maxSize > config.minSize);
        REQUIRE(config.maxRotation > config.minRotation);
        REQUIRE(config.innerLength >= 0.0f);
        REQUIRE(config.minSpeed >= 0.0f);
    }
}

TEST_CASE("EmissionConfig normalize repairs loaded values", "[config]") {
    EmissionConfig config;
    config.innerRadius = 3.0f;
    config.outerRadius = 1.0f;
    config.minSpeed = -2.0f;
    config.lifetime = 0.0f;
    config.emissionRate = -5.0f;
    config.particleCount = 50000;
    config.opacity = 1.5f;
    config.outerLength = 7.0f;

    config.normalize();

    REQUIRE_THAT(config.innerRadius, WithinAbs(3.0f, 0.0001f));
    REQUIRE_THAT(config.outerRadius, WithinAbs(3.1f, 0.0001f));
    REQUIRE_THAT(config.minSpeed, WithinAbs(0.0f, 0.0001f));
    REQUIRE(config.lifetime > 0.0f);
    REQUIRE_THAT(config.emissionRate, WithinAbs(0.0f, 0.0001f));
    REQUIRE(config.particleCount == static_cast<int>(MAX_PARTICLES));
    REQUIRE_THAT(config.opacity, WithinAbs(1.0f, 0.0001f));
    REQUIRE_THAT(config.cubeLength, WithinAbs(7.0f, 0.0001f));
}

TEST_CASE("Enum names round-trip", "[config]") {
    SECTION("shapes") {
        for (EmissionShape shape : {EmissionShape::Point, EmissionShape::Cube, EmissionShape::Sphere,
                                    EmissionShape::Square, EmissionShape::Circle, EmissionShape::Cylinder}) {
            EmissionShape parsed = EmissionShape::Point;
            REQUIRE(shapeFromName(shapeName(shape), parsed));
            REQUIRE(parsed == shape);
        }
    }

    SECTION("unknown names are rejected and leave the output alone") {
        EmissionShape shape = EmissionShape::Sphere;
        REQUIRE_FALSE(shapeFromName("torus", shape));
        REQUIRE(shape == EmissionShape::Sphere);

        VelocityDirection dir = VelocityDirection::Tangential;
        REQUIRE_FALSE(directionFromName("spiral", dir));
        REQUIRE(dir == VelocityDirection::Tangential);
    }

    SECTION("directions and rotation modes") {
        VelocityDirection dir = VelocityDirection::Radial;
        REQUIRE(directionFromName(directionName(VelocityDirection::Tangential), dir));
        REQUIRE(dir == VelocityDirection::Tangential);

        RotationMode mode = RotationMode::Fixed;
        REQUIRE(rotationModeFromName(rotationModeName(RotationMode::Random), mode));
        REQUIRE(mode == RotationMode::Random);
    }
}
