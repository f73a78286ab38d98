#pragma once

/**
 * @file emitter.h
 * @brief Spawn sampling for one particle system
 *
 * The emitter turns an EmissionConfig into fresh particle records: a spawn
 * position drawn from the configured shape, an initial velocity, a color
 * and a jittered lifetime. It holds no state of its own besides references
 * to the config and to the owning system's random engine.
 */

#include <ember/emission_config.h>
#include <glm/glm.hpp>
#include <random>

namespace ember {

/// One freshly emitted particle, before it is packed into a slot.
struct EmittedParticle {
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
    glm::vec3 color{1.0f};
    float age = 0.0f;
    float lifetime = 1.0f;
};

class Emitter {
public:
    Emitter(const EmissionConfig& config, std::mt19937& rng);

    /// Sample a world-space spawn position (shape sample, rotation, translation).
    glm::vec3 sample();

    /// Sample a position in the shape's own frame, before any transform.
    glm::vec3 sampleLocal();

    /**
     * @brief Unit launch direction for a particle spawned at @p position
     *
     * Radial by default. Circle and cylinder shapes in tangential mode use
     * the tangent of their cross-section, computed in the un-rotated frame.
     */
    glm::vec3 direction(const glm::vec3& position);

    /// Launch speed: fixed, or uniform in [minSpeed, maxSpeed].
    float speed();

    /// direction() * speed() with per-axis overrides applied.
    glm::vec3 velocity(const glm::vec3& position);

    /// Base lifetime jittered by up to +/-20%.
    float lifetime();

    /// Spawn color for the current color mode.
    glm::vec3 color() const;

    /// Full record for a new particle.
    EmittedParticle emit();

    // Shape transform helpers (rotation order X, then Y, then Z)
    glm::vec3 rotate(const glm::vec3& v) const;
    glm::vec3 inverseRotate(const glm::vec3& v) const;
    glm::vec3 translation() const;

private:
    glm::vec3 sampleCube();
    glm::vec3 sampleSphere();
    glm::vec3 sampleSquare();
    glm::vec3 sampleCircle();
    glm::vec3 sampleCylinder();
    glm::vec3 randomUnitVector();

    float uniform();
    float uniform(float lo, float hi);
    int pick(int n);

    const EmissionConfig& m_config;
    std::mt19937& m_rng;
};

} // namespace ember
