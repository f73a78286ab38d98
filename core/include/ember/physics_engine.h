#pragma once

/**
 * @file physics_engine.h
 * @brief Fixed-timestep driver for the physics compute kernel
 *
 * The engine owns the step accumulator and a simulation clock. Each frame
 * the owning system calls accumulate(), then drain() to run as many fixed
 * steps as the accumulator holds, then forceStepIfStale() so that at least
 * minUpdatesPerSecond steps happen even when frames are short.
 *
 * step() and readback() are silent no-ops while the backend is not ready.
 */

#include <ember/emission_config.h>
#include <ember/gpu_backend.h>
#include <ember/particle_buffers.h>
#include <cstdint>

namespace ember {

/// Physics toggles copied out of EmissionConfig.
struct PhysicsSettings {
    bool gravityEnabled = false;
    float gravityStrength = 9.8f;
    bool dampingEnabled = false;    ///< Carried, not applied by the kernel
    float dampingStrength = 0.5f;
    float turbulence = 0.0f;        ///< Carried, not applied by the kernel
    bool attractorEnabled = false;
    float attractorStrength = 1.0f;
    glm::vec3 attractorPosition{0.0f};
    float particleSpeed = 1.0f;
};

class PhysicsEngine {
public:
    explicit PhysicsEngine(ParticleBackend& backend);

    /// Refresh gravity/attractor/speed settings from @p config.
    void configure(const EmissionConfig& config);
    const PhysicsSettings& settings() const { return m_settings; }

    /// Build the parameter block for one step of @p dt seconds.
    PhysicsParams params(float dt) const;

    // -------------------------------------------------------------------------
    /// @name Stepping
    /// @{

    /// Write the parameter block and dispatch the kernel. False if not ready.
    bool step(float dt, uint32_t activeCount);

    /// Add frame time to the accumulator and the simulation clock.
    void accumulate(float dt);

    /// Run fixed steps while the accumulator holds one. Returns steps dispatched.
    uint32_t drain(uint32_t activeCount);

    /// Force one step if more than 1/minUpdatesPerSecond passed since the last one.
    bool forceStepIfStale(uint32_t activeCount);

    /// Zero the accumulator and restart the clock.
    void reset();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Readback
    /// @{

    /// Request an asynchronous copy of the first @p activeCount records.
    bool readback(uint32_t activeCount, ReadbackCallback callback);
    bool readbackPending() const { return m_backend.hasPendingReadback(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Timing
    /// @{

    float fixedDeltaTime() const { return m_fixedDeltaTime; }
    void setFixedDeltaTime(float dt);
    int minUpdatesPerSecond() const { return m_minUpdatesPerSecond; }
    void setMinUpdatesPerSecond(int ups);
    float accumulator() const { return m_accumulator; }
    double simulationTime() const { return m_clock; }
    uint64_t stepCount() const { return m_steps; }

    /// @}

private:
    ParticleBackend& m_backend;
    PhysicsSettings m_settings;

    float m_fixedDeltaTime = 1.0f / 60.0f;
    int m_minUpdatesPerSecond = 30;
    float m_accumulator = 0.0f;
    double m_clock = 0.0;
    double m_lastStepTime = 0.0;
    uint64_t m_steps = 0;
};

} // namespace ember
