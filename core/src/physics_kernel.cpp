// Ember - Host physics kernel

#include <ember/physics_kernel.h>
#include <algorithm>
#include <cmath>

namespace ember {

void integrateParticle(float* particle, float* velocity, const PhysicsBlock& params) {
    const float dt = params[0];
    const float gravity = params[2];
    const float attractorStrength = params[4];

    float age = particle[6];
    float lifetime = particle[7];
    if (age >= lifetime) {
        return;
    }
    particle[6] = age + dt;

    float vx = velocity[0];
    float vy = velocity[1];
    float vz = velocity[2];

    if (gravity > 0.0f) {
        vy -= gravity * dt;
    }

    if (attractorStrength > 0.0f) {
        float tx = params[6] - particle[0];
        float ty = params[7] - particle[1];
        float tz = params[8] - particle[2];
        float distance = std::sqrt(tx * tx + ty * ty + tz * tz);
        if (distance > kAttractorMinDistance) {
            float pull = attractorStrength / std::max(distance * distance, 0.01f) * dt;
            vx += tx / distance * pull;
            vy += ty / distance * pull;
            vz += tz / distance * pull;
        }
    }

    velocity[0] = vx;
    velocity[1] = vy;
    velocity[2] = vz;

    float step = std::min(dt, kMaxPositionStep);
    particle[0] += vx * step;
    particle[1] += vy * step;
    particle[2] += vz * step;
}

void runPhysicsKernel(float* particles, float* velocities, uint32_t activeCount,
                      const PhysicsBlock& params) {
    uint32_t groups = workgroupCount(activeCount);
    for (uint32_t group = 0; group < groups; ++group) {
        for (uint32_t lane = 0; lane < kWorkgroupSize; ++lane) {
            uint32_t index = group * kWorkgroupSize + lane;
            if (index >= activeCount) {
                return;
            }
            integrateParticle(particles + index * kFloatsPerParticle,
                              velocities + index * kFloatsPerVelocity, params);
        }
    }
}

} // namespace ember
