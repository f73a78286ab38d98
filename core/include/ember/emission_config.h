#pragma once

/**
 * @file emission_config.h
 * @brief Tunables for one particle system
 *
 * EmissionConfig enumerates every field the control panel and scene files
 * can touch, with typed defaults applied at construction. Inner/outer and
 * min/max pairs are edited through the bounded-edit helpers so that the
 * outer bound always exceeds the inner one.
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <string>

namespace ember {

/// Maximum slots per system unless a config asks for fewer.
constexpr uint32_t MAX_PARTICLES = 10000;

/// Upper bound for maxParticles; keeps every buffer under device limits.
constexpr uint32_t kMaxCapacity = 1000000;

/// Minimum separation kept between an inner and an outer bound.
constexpr float kMinGap = 0.01f;

/// Amount the opposite bound is pushed when an edit violates kMinGap.
constexpr float kNudge = 0.1f;

enum class EmissionShape {
    Point,
    Cube,
    Sphere,
    Square,
    Circle,
    Cylinder
};

enum class VelocityDirection {
    Radial,     ///< Away from the shape origin
    Tangential  ///< Perpendicular to the radius in the shape's cross-section
};

enum class RotationMode {
    Fixed,
    Random
};

const char* shapeName(EmissionShape shape);
bool shapeFromName(const std::string& name, EmissionShape& out);

const char* directionName(VelocityDirection dir);
bool directionFromName(const std::string& name, VelocityDirection& out);

const char* rotationModeName(RotationMode mode);
bool rotationModeFromName(const std::string& name, RotationMode& out);

/**
 * @brief Full configuration of one emitter
 *
 * Owned by exactly one ParticleSystem. The UI collaborator writes fields
 * directly; paired bounds should go through the edit helpers below.
 */
struct EmissionConfig {
    // Identity
    int id = 0;
    std::string name = "Particle System";

    // Emission
    bool burstMode = false;
    int particleCount = 100;            ///< Burst size (burst mode only)
    float emissionRate = 10.0f;         ///< Particles per second
    float emissionDuration = 10.0f;     ///< Seconds of continuous emission
    float lifetime = 5.0f;              ///< Base particle lifetime in seconds
    uint32_t maxParticles = MAX_PARTICLES;

    // Shape
    EmissionShape emissionShape = EmissionShape::Cube;
    float cubeLength = 2.0f;            ///< Mirrors outerLength
    float innerLength = 0.0f;
    float outerLength = 2.0f;
    float innerRadius = 0.0f;
    float outerRadius = 2.0f;
    float squareInnerSize = 0.0f;
    float squareSize = 2.0f;
    float circleInnerRadius = 0.0f;
    float circleOuterRadius = 2.0f;
    float cylinderInnerRadius = 0.0f;
    float cylinderOuterRadius = 2.0f;
    float cylinderHeight = 4.0f;

    // Shape transform (rotation in degrees)
    float shapeRotationX = 0.0f;
    float shapeRotationY = 0.0f;
    float shapeRotationZ = 0.0f;
    float shapeTranslationX = 0.0f;
    float shapeTranslationY = 0.0f;
    float shapeTranslationZ = 0.0f;

    // Speed
    float particleSpeed = 1.0f;
    bool randomSpeed = false;
    float minSpeed = 0.5f;
    float maxSpeed = 1.5f;

    // Velocity
    bool overrideXVelocity = false;
    bool overrideYVelocity = false;
    bool overrideZVelocity = false;
    float xVelocity = 0.0f;
    float yVelocity = 0.0f;
    float zVelocity = 0.0f;
    VelocityDirection circleVelocityDirection = VelocityDirection::Radial;
    VelocityDirection cylinderVelocityDirection = VelocityDirection::Radial;

    // Appearance
    bool fadeEnabled = true;
    bool fadeSizeEnabled = false;
    float particleSize = 0.5f;
    bool randomSize = false;
    float minSize = 0.1f;
    float maxSize = 0.5f;
    float aspectRatio = 1.0f;
    float rotation = 0.0f;              ///< Degrees
    RotationMode rotationMode = RotationMode::Fixed;
    float minRotation = 0.0f;
    float maxRotation = 90.0f;
    bool colorTransitionEnabled = false;
    glm::vec3 particleColor{1.0f, 1.0f, 1.0f};
    glm::vec3 startColor{1.0f, 0.0f, 0.0f};
    glm::vec3 endColor{0.0f, 0.0f, 1.0f};
    float opacity = 1.0f;
    bool textureEnabled = false;

    // Bloom
    bool bloomEnabled = true;
    float bloomIntensity = 1.0f;

    // Physics
    bool gravityEnabled = false;
    float gravityStrength = 9.8f;
    bool dampingEnabled = false;
    float dampingStrength = 0.5f;
    bool attractorEnabled = false;
    float attractorStrength = 1.0f;
    glm::vec3 attractorPosition{0.0f, 0.0f, 0.0f};

    /// Slot capacity actually allocated for this system, in [1, kMaxCapacity].
    uint32_t capacity() const;

    /**
     * @brief Repair every paired bound and keep cubeLength == outerLength
     *
     * Called before a spawn and after loading from a scene file. Values are
     * nudged, never rejected.
     */
    void normalize();

    // -------------------------------------------------------------------------
    /// @name Bounded edits (UI-style)
    /// Each helper assigns one bound and nudges its partner when needed.
    /// @{

    void setInnerLength(float v);
    void setOuterLength(float v);
    void setInnerRadius(float v);
    void setOuterRadius(float v);
    void setSquareInnerSize(float v);
    void setSquareSize(float v);
    void setCircleInnerRadius(float v);
    void setCircleOuterRadius(float v);
    void setCylinderInnerRadius(float v);
    void setCylinderOuterRadius(float v);
    void setMinSpeed(float v);
    void setMaxSpeed(float v);
    void setMinSize(float v);
    void setMaxSize(float v);
    void setMinRotation(float v);
    void setMaxRotation(float v);

    /// @}
};

/**
 * @brief Assign the lower bound of a pair, nudging the upper one if needed
 * @param floor Smallest legal value for either bound
 */
void editLowerBound(float& lower, float& upper, float value, float floor);

/**
 * @brief Assign the upper bound of a pair, nudging the lower one if needed
 * @param floor Smallest legal value for either bound
 */
void editUpperBound(float& lower, float& upper, float value, float floor);

} // namespace ember
