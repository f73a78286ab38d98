#pragma once

/**
 * @file physics_kernel.h
 * @brief Host reference of the particle physics compute kernel
 *
 * Mirrors PHYSICS_COMPUTE_SHADER lane for lane. HostBackend dispatches it
 * and the unit tests use it to pin down the kernel formula.
 */

#include <ember/gpu_backend.h>
#include <cstdint>

namespace ember {

/// Largest time step applied to positions in a single kernel invocation.
constexpr float kMaxPositionStep = 0.033f;

/// Minimum distance at which the attractor pulls.
constexpr float kAttractorMinDistance = 0.1f;

/**
 * @brief Integrate one particle slot
 * @param particle Eight floats: pos.xyz, color.rgb, age, lifetime
 * @param velocity Four floats: vel.xyz, pad
 *
 * Dead particles (age >= lifetime) are left untouched.
 */
void integrateParticle(float* particle, float* velocity, const PhysicsBlock& params);

/**
 * @brief Run the kernel over ceil(activeCount / 64) workgroups
 *
 * Lanes at or beyond @p activeCount do nothing, exactly like the GPU
 * dispatch.
 */
void runPhysicsKernel(float* particles, float* velocities, uint32_t activeCount,
                      const PhysicsBlock& params);

} // namespace ember
