#pragma once

/**
 * @file shaders.h
 * @brief WGSL source of the particle physics compute kernel
 *
 * Bindings (group 0):
 * - 0: PhysicsParams uniform (12 floats)
 * - 1: particle records, 8 floats per slot
 * - 2: velocity records, vec3 + pad per slot
 * - 3: DispatchInfo uniform, active particle count
 *
 * physics_kernel.cpp is the host mirror of this kernel; keep them in step.
 */

namespace ember {

inline constexpr const char* PHYSICS_COMPUTE_SHADER = R"(
struct PhysicsParams {
    deltaTime: f32,
    particleSpeed: f32,
    gravity: f32,
    turbulence: f32,
    attractorStrength: f32,
    _pad0: f32,
    attractorX: f32,
    attractorY: f32,
    attractorZ: f32,
    _pad1: f32,
    _pad2: f32,
    _pad3: f32,
};

struct ParticleVelocity {
    velocity: vec3f,
    _pad: f32,
};

struct DispatchInfo {
    activeCount: u32,
    _pad0: u32,
    _pad1: u32,
    _pad2: u32,
};

@group(0) @binding(0) var<uniform> physics: PhysicsParams;
@group(0) @binding(1) var<storage, read_write> particles: array<f32>;
@group(0) @binding(2) var<storage, read_write> velocities: array<ParticleVelocity>;
@group(0) @binding(3) var<uniform> info: DispatchInfo;

@compute @workgroup_size(64)
fn main(@builtin(global_invocation_id) id: vec3u) {
    let index = id.x;
    if (index >= info.activeCount) {
        return;
    }

    let base = index * 8u;
    let age = particles[base + 6u];
    let lifetime = particles[base + 7u];
    if (age >= lifetime) {
        return;
    }

    let dt = physics.deltaTime;
    particles[base + 6u] = age + dt;

    let position = vec3f(particles[base], particles[base + 1u], particles[base + 2u]);
    var v = velocities[index].velocity;

    if (physics.gravity > 0.0) {
        v.y -= physics.gravity * dt;
    }

    if (physics.attractorStrength > 0.0) {
        let toAttractor = vec3f(physics.attractorX, physics.attractorY, physics.attractorZ) - position;
        let distance = length(toAttractor);
        if (distance > 0.1) {
            v += normalize(toAttractor) * physics.attractorStrength / max(distance * distance, 0.01) * dt;
        }
    }

    velocities[index].velocity = v;

    let moved = position + v * min(dt, 0.033);
    particles[base] = moved.x;
    particles[base + 1u] = moved.y;
    particles[base + 2u] = moved.z;
}
)";

} // namespace ember
