// Ember - Physics engine

#include <ember/physics_engine.h>
#include <algorithm>
#include <iostream>

namespace ember {

PhysicsEngine::PhysicsEngine(ParticleBackend& backend)
    : m_backend(backend) {}

void PhysicsEngine::configure(const EmissionConfig& config) {
    m_settings.gravityEnabled = config.gravityEnabled;
    m_settings.gravityStrength = config.gravityStrength;
    m_settings.dampingEnabled = config.dampingEnabled;
    m_settings.dampingStrength = config.dampingStrength;
    m_settings.attractorEnabled = config.attractorEnabled;
    m_settings.attractorStrength = config.attractorStrength;
    m_settings.attractorPosition = config.attractorPosition;
    m_settings.particleSpeed = config.particleSpeed;
}

PhysicsParams PhysicsEngine::params(float dt) const {
    PhysicsParams p;
    p.deltaTime = dt;
    p.particleSpeed = m_settings.particleSpeed;
    p.gravity = m_settings.gravityEnabled ? m_settings.gravityStrength : 0.0f;
    p.turbulence = m_settings.turbulence;
    p.attractorStrength = m_settings.attractorEnabled ? m_settings.attractorStrength : 0.0f;
    p.attractorPosition = m_settings.attractorPosition;
    return p;
}

bool PhysicsEngine::step(float dt, uint32_t activeCount) {
    if (!m_backend.isReady()) {
        return false;
    }
    m_backend.writePhysicsParams(ParticleBuffers::encodePhysics(params(dt)));
    if (activeCount > 0) {
        m_backend.dispatch(activeCount);
    }
    m_steps++;
    return true;
}

void PhysicsEngine::accumulate(float dt) {
    if (dt <= 0.0f) return;
    m_accumulator += dt;
    m_clock += dt;
}

uint32_t PhysicsEngine::drain(uint32_t activeCount) {
    uint32_t dispatched = 0;
    while (m_accumulator >= m_fixedDeltaTime) {
        if (step(m_fixedDeltaTime, activeCount)) {
            dispatched++;
        }
        m_accumulator -= m_fixedDeltaTime;
        m_lastStepTime = m_clock;
    }
    return dispatched;
}

bool PhysicsEngine::forceStepIfStale(uint32_t activeCount) {
    double limit = 1.0 / m_minUpdatesPerSecond;
    if (m_clock - m_lastStepTime <= limit) {
        return false;
    }
    bool stepped = step(m_fixedDeltaTime, activeCount);
    m_accumulator = std::max(0.0f, m_accumulator - m_fixedDeltaTime);
    m_lastStepTime = m_clock;
    return stepped;
}

void PhysicsEngine::reset() {
    m_accumulator = 0.0f;
    m_clock = 0.0;
    m_lastStepTime = 0.0;
}

bool PhysicsEngine::readback(uint32_t activeCount, ReadbackCallback callback) {
    if (!m_backend.isReady() || m_backend.hasPendingReadback()) {
        return false;
    }
    return m_backend.requestReadback(activeCount, std::move(callback));
}

void PhysicsEngine::setFixedDeltaTime(float dt) {
    if (dt <= 0.0f) {
        std::cerr << "[PhysicsEngine] Ignoring non-positive fixed step " << dt << "\n";
        return;
    }
    m_fixedDeltaTime = dt;
}

void PhysicsEngine::setMinUpdatesPerSecond(int ups) {
    m_minUpdatesPerSecond = std::max(1, ups);
}

} // namespace ember
