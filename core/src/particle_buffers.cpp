// Ember - Particle buffers

#include <ember/particle_buffers.h>
#include <algorithm>

namespace ember {

namespace {

float flag(bool b) { return b ? 1.0f : 0.0f; }

} // namespace

ParticleBuffers::ParticleBuffers(uint32_t capacity)
    : m_capacity(capacity)
    , m_particles(static_cast<size_t>(capacity) * kFloatsPerParticle, 0.0f)
    , m_velocities(static_cast<size_t>(capacity) * kFloatsPerVelocity, 0.0f) {}

void ParticleBuffers::store(uint32_t slot, const EmittedParticle& p) {
    float* d = &m_particles[slot * kFloatsPerParticle];
    d[0] = p.position.x;
    d[1] = p.position.y;
    d[2] = p.position.z;
    d[3] = p.color.r;
    d[4] = p.color.g;
    d[5] = p.color.b;
    d[6] = p.age;
    d[7] = p.lifetime;
    setVelocity(slot, p.velocity);
}

void ParticleBuffers::setVelocity(uint32_t slot, const glm::vec3& v) {
    float* d = &m_velocities[slot * kFloatsPerVelocity];
    d[0] = v.x;
    d[1] = v.y;
    d[2] = v.z;
    d[3] = 0.0f;
}

void ParticleBuffers::setColor(uint32_t slot, const glm::vec3& c) {
    float* d = &m_particles[slot * kFloatsPerParticle];
    d[3] = c.r;
    d[4] = c.g;
    d[5] = c.b;
}

glm::vec3 ParticleBuffers::position(uint32_t slot) const {
    const float* d = &m_particles[slot * kFloatsPerParticle];
    return {d[0], d[1], d[2]};
}

glm::vec3 ParticleBuffers::color(uint32_t slot) const {
    const float* d = &m_particles[slot * kFloatsPerParticle];
    return {d[3], d[4], d[5]};
}

glm::vec3 ParticleBuffers::velocity(uint32_t slot) const {
    const float* d = &m_velocities[slot * kFloatsPerVelocity];
    return {d[0], d[1], d[2]};
}

float ParticleBuffers::age(uint32_t slot) const {
    return m_particles[slot * kFloatsPerParticle + 6];
}

float ParticleBuffers::lifetime(uint32_t slot) const {
    return m_particles[slot * kFloatsPerParticle + 7];
}

void ParticleBuffers::upload(ParticleBackend& backend, uint32_t first, uint32_t count) const {
    if (count == 0 || first >= m_capacity) return;
    count = std::min(count, m_capacity - first);
    backend.writeParticles(first, &m_particles[first * kFloatsPerParticle], count);
    backend.writeVelocities(first, &m_velocities[first * kFloatsPerVelocity], count);
}

void ParticleBuffers::uploadSlots(ParticleBackend& backend, const std::vector<uint32_t>& slots) const {
    size_t i = 0;
    while (i < slots.size()) {
        uint32_t first = slots[i];
        uint32_t count = 1;
        while (i + count < slots.size() && slots[i + count] == first + count) {
            ++count;
        }
        upload(backend, first, count);
        i += count;
    }
}

void ParticleBuffers::uploadVelocities(ParticleBackend& backend, uint32_t first, uint32_t count) const {
    if (count == 0 || first >= m_capacity) return;
    count = std::min(count, m_capacity - first);
    backend.writeVelocities(first, &m_velocities[first * kFloatsPerVelocity], count);
}

void ParticleBuffers::applySnapshot(const ReadbackResult& snapshot, uint32_t activeCount) {
    uint32_t n = std::min({snapshot.count, activeCount, m_capacity});
    n = std::min<uint32_t>(n, static_cast<uint32_t>(snapshot.particles.size() / kFloatsPerParticle));
    n = std::min<uint32_t>(n, static_cast<uint32_t>(snapshot.velocities.size() / kFloatsPerVelocity));
    std::copy(snapshot.particles.begin(), snapshot.particles.begin() + n * kFloatsPerParticle,
              m_particles.begin());
    std::copy(snapshot.velocities.begin(), snapshot.velocities.begin() + n * kFloatsPerVelocity,
              m_velocities.begin());
}

void ParticleBuffers::copySlot(uint32_t from, uint32_t to) {
    std::copy_n(&m_particles[from * kFloatsPerParticle], kFloatsPerParticle,
                &m_particles[to * kFloatsPerParticle]);
    std::copy_n(&m_velocities[from * kFloatsPerVelocity], kFloatsPerVelocity,
                &m_velocities[to * kFloatsPerVelocity]);
}

CompactionResult ParticleBuffers::compact(uint32_t activeCount,
                                          const std::function<bool(uint32_t slot)>& respawn) {
    CompactionResult result;
    uint32_t active = std::min(activeCount, m_capacity);
    uint32_t firstDirty = active;
    uint32_t dirtyEnd = 0;

    uint32_t i = 0;
    bool refilled = false;
    while (i < active) {
        if (!isDead(i)) {
            if (refilled) {
                result.changedSlots.push_back(i);
                refilled = false;
            }
            ++i;
            continue;
        }

        firstDirty = std::min(firstDirty, i);
        dirtyEnd = std::max(dirtyEnd, i + 1);

        if (respawn && respawn(i)) {
            result.changedSlots.push_back(i);
            result.respawned++;
            refilled = false;
            ++i;
            continue;
        }

        // Swap-remove; the moved particle is examined on the next pass
        uint32_t last = active - 1;
        if (i != last) {
            copySlot(last, i);
            refilled = true;
        }
        --active;
        result.removed++;
    }

    result.activeCount = active;
    if (result.changed()) {
        result.firstDirty = firstDirty;
        result.dirtyEnd = std::min(dirtyEnd, active);
    }
    return result;
}

PhysicsBlock ParticleBuffers::encodePhysics(const PhysicsParams& params) {
    PhysicsBlock b{};
    b[0] = params.deltaTime;
    b[1] = params.particleSpeed;
    b[2] = params.gravity;
    b[3] = params.turbulence;
    b[4] = params.attractorStrength;
    b[5] = 0.0f;
    b[6] = params.attractorPosition.x;
    b[7] = params.attractorPosition.y;
    b[8] = params.attractorPosition.z;
    return b;
}

AppearanceBlock ParticleBuffers::encodeAppearance(const EmissionConfig& c) {
    AppearanceBlock b{};
    b[0] = flag(c.fadeEnabled);
    b[1] = flag(c.colorTransitionEnabled);
    b[2] = c.particleSize;
    b[3] = flag(c.textureEnabled);
    b[4] = c.particleColor.r;
    b[5] = c.particleColor.g;
    b[6] = c.particleColor.b;
    b[7] = c.rotation;
    b[8] = c.startColor.r;
    b[9] = c.startColor.g;
    b[10] = c.startColor.b;
    b[11] = flag(c.rotationMode == RotationMode::Random);
    b[12] = c.endColor.r;
    b[13] = c.endColor.g;
    b[14] = c.endColor.b;
    b[15] = c.minRotation;
    b[16] = c.maxRotation;
    b[17] = c.opacity;
    b[18] = c.aspectRatio;
    b[19] = flag(c.randomSize);
    b[20] = c.minSize;
    b[21] = c.maxSize;
    b[22] = flag(c.fadeSizeEnabled);
    b[23] = 0.0f;
    return b;
}

BloomBlock ParticleBuffers::encodeBloom(const EmissionConfig& c) {
    return BloomBlock{c.bloomIntensity, flag(c.bloomEnabled), 0.0f, 0.0f};
}

} // namespace ember
