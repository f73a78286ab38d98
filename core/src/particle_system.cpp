// Ember - Particle System

#include <ember/particle_system.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace ember {

namespace {

// Emission balance limits, in particles. The balance tracks how far actual
// emission trails the configured rate.
constexpr float kBalanceFloor = -0.5f;
constexpr float kBalanceCeiling = 2.0f;

} // namespace

ParticleSystem::ParticleSystem(Device& device, const EmissionConfig& config)
    : m_device(device)
    , m_config(config)
    , m_rng(kDefaultSeed)
    , m_emitter(m_config, m_rng)
    , m_buffers(m_config.capacity())
    , m_backend(device.createBackend(m_config.capacity())) {
    m_config.normalize();

    if (!m_backend) {
        std::cerr << "[ParticleSystem] " << device.name() << " device returned no backend for '"
                  << m_config.name << "'\n";
        return;
    }

    m_physics = std::make_unique<PhysicsEngine>(*m_backend);
    m_physics->configure(m_config);
    uploadAppearance();

    std::cout << "[ParticleSystem] Created '" << m_config.name << "' (id " << m_config.id
              << ", capacity " << capacity() << ", " << device.name() << ")\n";
}

ParticleSystem::~ParticleSystem() {
    dispose();
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

void ParticleSystem::spawnParticles() {
    if (isDisposed()) return;

    m_config.normalize();

    // Any readback in flight now describes particles that no longer exist
    m_generation++;
    m_activeParticles = 0;
    m_currentEmissionTime = 0.0f;
    m_emissionBalance = 0.0f;
    m_lastEmissionTime = 0.0f;
    m_framesSinceReadback = 0;
    m_recolorPending = false;

    m_physics->configure(m_config);
    m_physics->reset();
    uploadAppearance();

    const uint32_t cap = capacity();

    if (m_config.burstMode) {
        m_burstCycle = true;
        m_emitting = false;
        m_particleCount = std::min<uint32_t>(static_cast<uint32_t>(std::max(m_config.particleCount, 0)), cap);

        for (uint32_t first = 0; first < m_particleCount; first += kBurstBatchSize) {
            emitInto(first, std::min(kBurstBatchSize, m_particleCount - first));
        }

        std::cout << "[ParticleSystem] '" << m_config.name << "' burst " << m_particleCount
                  << " particles\n";
    } else {
        m_burstCycle = false;
        double window = std::max(m_config.emissionDuration, m_config.lifetime);
        double provision = std::ceil(static_cast<double>(m_config.emissionRate) * window);
        m_particleCount = static_cast<uint32_t>(std::clamp(provision, 0.0, static_cast<double>(cap)));
        m_emitting = true;

        std::cout << "[ParticleSystem] '" << m_config.name << "' emitting " << m_config.emissionRate
                  << "/s for " << m_config.emissionDuration << "s (" << m_particleCount
                  << " slots)\n";
    }
}

void ParticleSystem::updateParticles(float dt) {
    if (isDisposed()) return;

    // Pipeline setup, buffer mapping and texture decode all land here
    m_device.poll();
    m_backend->poll();
    pollTexture(false);

    if (dt <= 0.0f) return;

    m_physics->accumulate(dt);

    if (m_emitting) {
        emitContinuous(dt);
    }

    uint32_t steps = m_physics->drain(m_activeParticles);
    if (m_physics->forceStepIfStale(m_activeParticles)) {
        steps++;
    }
    m_stats.physicsSteps += steps;

    scheduleReadback();
}

void ParticleSystem::dispose() {
    if (isDisposed()) return;

    m_generation++;
    m_physics.reset();
    m_backend->release();
    m_backend.reset();
    m_texture.reset();

    m_activeParticles = 0;
    m_emitting = false;

    std::cout << "[ParticleSystem] Disposed '" << m_config.name << "'\n";
}

uint32_t ParticleSystem::emitInto(uint32_t first, uint32_t count) {
    count = std::min(count, capacity() - std::min(first, capacity()));
    for (uint32_t i = 0; i < count; ++i) {
        m_buffers.store(first + i, m_emitter.emit());
    }
    m_buffers.upload(*m_backend, first, count);
    m_activeParticles = std::max(m_activeParticles, first + count);
    m_stats.emitted += count;
    return count;
}

void ParticleSystem::emitContinuous(float dt) {
    m_currentEmissionTime += dt;
    if (m_currentEmissionTime >= m_config.emissionDuration) {
        m_emitting = false;
        std::cout << "[ParticleSystem] '" << m_config.name << "' emission finished ("
                  << m_stats.emitted << " emitted)\n";
        return;
    }

    const uint32_t room = m_particleCount > m_activeParticles ? m_particleCount - m_activeParticles : 0;
    const float due = m_config.emissionRate * dt;
    const float pending = m_emissionBalance + due;

    float whole = std::floor(due);
    uint32_t count = static_cast<uint32_t>(std::min(whole, static_cast<float>(room)));

    // Fractional part as a coin flip, unless that would run too far ahead
    float fraction = due - whole;
    if (fraction > 0.0f && pending - (count + 1.0f) >= kBalanceFloor) {
        std::bernoulli_distribution extra(fraction);
        if (extra(m_rng)) {
            count++;
        }
    }

    // Low rates: keep up with the configured rate when frames are short
    float minInterval = 1.0f / m_physics->minUpdatesPerSecond();
    if (count == 0 && pending >= 1.0f && room > 0 &&
        m_currentEmissionTime - m_lastEmissionTime > minInterval) {
        count = 1;
    }

    count = std::min(count, room);
    m_emissionBalance = std::min(pending - static_cast<float>(count), kBalanceCeiling);

    if (count > 0) {
        emitInto(m_activeParticles, count);
        m_lastEmissionTime = m_currentEmissionTime;
    }
}

// -----------------------------------------------------------------------------
// Readback and compaction
// -----------------------------------------------------------------------------

void ParticleSystem::scheduleReadback() {
    if (m_framesSinceReadback < m_readbackInterval) {
        m_framesSinceReadback++;
    }
    if (m_framesSinceReadback < m_readbackInterval) return;
    if (m_activeParticles == 0 || m_physics->readbackPending()) return;

    uint64_t generation = m_generation;
    bool issued = m_physics->readback(m_activeParticles,
        [this, generation](bool ok, ReadbackResult result) {
            onReadback(generation, ok, std::move(result));
        });
    if (issued) {
        m_framesSinceReadback = 0;
    }
}

void ParticleSystem::onReadback(uint64_t generation, bool ok, ReadbackResult result) {
    if (generation != m_generation) {
        m_stats.readbacksDiscarded++;
        return;
    }

    if (!ok) {
        m_stats.readbacksFailed++;
        std::cerr << "[ParticleSystem] Readback failed for '" << m_config.name
                  << "', skipping compaction\n";
        if (!m_readbackFailing) {
            m_readbackFailing = true;
            notify("Particle cleanup for '" + m_config.name + "' is paused while readbacks fail");
        }
        return;
    }
    m_stats.readbacksCompleted++;
    m_readbackFailing = false;

    m_buffers.applySnapshot(result, m_activeParticles);

    CompactionResult compacted = m_buffers.compact(m_activeParticles, [this](uint32_t slot) {
        if (!m_emitting || slot >= m_particleCount) {
            return false;
        }
        m_buffers.store(slot, m_emitter.emit());
        return true;
    });

    m_activeParticles = compacted.activeCount;
    m_stats.respawned += compacted.respawned;
    m_stats.compacted += compacted.removed;

    if (m_recolorPending) {
        // Host and device agree here, so the whole live range can be rewritten
        m_recolorPending = false;
        glm::vec3 color = m_emitter.color();
        for (uint32_t i = 0; i < m_activeParticles; ++i) {
            m_buffers.setColor(i, color);
        }
        m_buffers.upload(*m_backend, 0, m_activeParticles);
        return;
    }

    // Survivors keep their device state; only rewritten slots are sent
    m_buffers.uploadSlots(*m_backend, compacted.changedSlots);
}

// -----------------------------------------------------------------------------
// Config hooks
// -----------------------------------------------------------------------------

void ParticleSystem::onRespawn() {
    spawnParticles();
}

void ParticleSystem::onAppearanceChange() {
    if (isDisposed()) return;
    uploadAppearance();

    // Per-particle colors are rewritten at the next readback
    m_recolorPending = m_activeParticles > 0;
    if (m_recolorPending) {
        m_framesSinceReadback = m_readbackInterval;
    }
}

void ParticleSystem::onPhysicsChange() {
    if (isDisposed()) return;
    m_physics->configure(m_config);
}

void ParticleSystem::onSpeedChange() {
    if (isDisposed()) return;
    m_config.normalize();
    m_physics->configure(m_config);
    for (uint32_t i = 0; i < m_activeParticles; ++i) {
        m_buffers.setVelocity(i, m_emitter.velocity(m_buffers.position(i)));
    }
    m_buffers.uploadVelocities(*m_backend, 0, m_activeParticles);
}

void ParticleSystem::onBloomIntensityChange() {
    if (isDisposed()) return;
    m_backend->writeBloom(ParticleBuffers::encodeBloom(m_config));
}

void ParticleSystem::uploadAppearance() {
    m_backend->writeAppearance(ParticleBuffers::encodeAppearance(m_config));
    m_backend->writeBloom(ParticleBuffers::encodeBloom(m_config));
}

// -----------------------------------------------------------------------------
// Texture
// -----------------------------------------------------------------------------

bool ParticleSystem::loadTexture(const std::string& path) {
    if (isDisposed()) return false;
    if (m_pendingTexture.valid()) {
        notify("Texture load already in progress (" + m_pendingTexturePath + ")");
        return false;
    }

    m_pendingTexturePath = path;
    m_pendingTexture = std::async(std::launch::async, [path]() {
        TextureLoad load;
        load.image = io::loadImage(path, &load.error);
        return load;
    });
    return true;
}

bool ParticleSystem::pollTexture(bool wait) {
    if (!m_pendingTexture.valid()) return false;
    if (!wait && m_pendingTexture.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return false;
    }

    TextureLoad load;
    try {
        load = m_pendingTexture.get();
    } catch (const std::exception& e) {
        notify("Texture load failed for " + m_pendingTexturePath + ": " + e.what());
        return false;
    }

    if (!load.image.valid()) {
        notify("Texture load failed: " + load.error);
        return false;
    }
    return setTexture(load.image);
}

bool ParticleSystem::setTexture(const io::ImageData& image) {
    if (isDisposed()) return false;

    std::unique_ptr<GpuTexture> texture = m_device.createTexture(image);
    if (!texture) {
        notify("Could not create a " + std::to_string(image.width) + "x" +
               std::to_string(image.height) + " texture");
        return false;
    }

    // Previous owned texture is released here; the default one is never owned
    m_texture = std::move(texture);
    m_config.textureEnabled = true;
    uploadAppearance();

    std::cout << "[ParticleSystem] '" << m_config.name << "' texture " << image.width << "x"
              << image.height << "\n";
    return true;
}

void ParticleSystem::clearTexture() {
    m_texture.reset();
    m_config.textureEnabled = false;
    if (!isDisposed()) {
        uploadAppearance();
    }
}

const GpuTexture* ParticleSystem::boundTexture() const {
    return m_texture ? m_texture.get() : m_device.defaultTexture();
}

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------

EmissionState ParticleSystem::state() const {
    if (m_emitting) return EmissionState::Emitting;
    if (m_burstCycle && m_activeParticles > 0) return EmissionState::Bursting;
    return EmissionState::Idle;
}

RenderInputs ParticleSystem::renderInputs() const {
    RenderInputs inputs;
    inputs.backend = m_backend.get();
    inputs.instanceCount = m_activeParticles;
    inputs.texture = boundTexture();
    inputs.appearance = ParticleBuffers::encodeAppearance(m_config);
    inputs.bloom = ParticleBuffers::encodeBloom(m_config);
    return inputs;
}

void ParticleSystem::setReadbackInterval(int frames) {
    m_readbackInterval = std::clamp(frames, kMinReadbackInterval, kMaxReadbackInterval);
}

void ParticleSystem::notify(const std::string& message) {
    std::cerr << "[ParticleSystem] " << message << "\n";
    if (m_notice) {
        m_notice(message);
    }
}

} // namespace ember
