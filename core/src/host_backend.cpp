// Ember - Host compute backend

#include <ember/host_backend.h>
#include <ember/physics_kernel.h>
#include <ember/io/image_loader.h>
#include <algorithm>
#include <iostream>

namespace ember {

HostTexture::HostTexture(int width, int height, std::vector<uint8_t> pixels)
    : m_width(width), m_height(height), m_pixels(std::move(pixels)) {}

HostBackend::HostBackend(uint32_t capacity)
    : m_capacity(capacity)
    , m_particles(static_cast<size_t>(capacity) * kFloatsPerParticle, 0.0f)
    , m_velocities(static_cast<size_t>(capacity) * kFloatsPerVelocity, 0.0f) {}

void HostBackend::poll() {
    if (!m_pending) return;

    // Detach first so the callback may request the next readback
    std::unique_ptr<PendingReadback> done = std::move(m_pending);
    bool ok = readbackSucceeds();
    if (!ok) {
        std::cerr << "[HostBackend] Readback failed\n";
        done->callback(false, ReadbackResult{});
        return;
    }
    done->callback(true, std::move(done->result));
}

void HostBackend::writeParticles(uint32_t firstSlot, const float* data, uint32_t count) {
    if (!m_live || count == 0) return;
    if (firstSlot + count > m_capacity) {
        std::cerr << "[HostBackend] Particle write out of range (" << firstSlot << "+" << count
                  << " > " << m_capacity << ")\n";
        return;
    }
    std::copy(data, data + count * kFloatsPerParticle,
              m_particles.begin() + firstSlot * kFloatsPerParticle);
}

void HostBackend::writeVelocities(uint32_t firstSlot, const float* data, uint32_t count) {
    if (!m_live || count == 0) return;
    if (firstSlot + count > m_capacity) {
        std::cerr << "[HostBackend] Velocity write out of range (" << firstSlot << "+" << count
                  << " > " << m_capacity << ")\n";
        return;
    }
    std::copy(data, data + count * kFloatsPerVelocity,
              m_velocities.begin() + firstSlot * kFloatsPerVelocity);
}

void HostBackend::writePhysicsParams(const PhysicsBlock& block) {
    if (m_live) m_physics = block;
}

void HostBackend::writeAppearance(const AppearanceBlock& block) {
    if (m_live) m_appearance = block;
}

void HostBackend::writeBloom(const BloomBlock& block) {
    if (m_live) m_bloom = block;
}

void HostBackend::dispatch(uint32_t activeCount) {
    if (!isReady() || activeCount == 0) return;
    activeCount = std::min(activeCount, m_capacity);
    runPhysicsKernel(m_particles.data(), m_velocities.data(), activeCount, m_physics);
    m_dispatches++;
    m_lastDispatchCount = activeCount;
}

bool HostBackend::requestReadback(uint32_t activeCount, ReadbackCallback callback) {
    if (!isReady() || m_pending) return false;

    activeCount = std::min(activeCount, m_capacity);
    auto pending = std::make_unique<PendingReadback>();
    pending->result.count = activeCount;
    pending->result.particles.assign(m_particles.begin(),
                                     m_particles.begin() + activeCount * kFloatsPerParticle);
    pending->result.velocities.assign(m_velocities.begin(),
                                      m_velocities.begin() + activeCount * kFloatsPerVelocity);
    pending->callback = std::move(callback);
    m_pending = std::move(pending);
    return true;
}

void HostBackend::release() {
    m_live = false;
    m_pending.reset();
    m_particles.clear();
    m_particles.shrink_to_fit();
    m_velocities.clear();
    m_velocities.shrink_to_fit();
}

HostDevice::HostDevice() {
    io::ImageData white = io::solidImage(1, 1, 255, 255, 255, 255);
    m_defaultTexture = std::make_unique<HostTexture>(white.width, white.height, std::move(white.pixels));
}

std::unique_ptr<ParticleBackend> HostDevice::createBackend(uint32_t capacity) {
    return std::make_unique<HostBackend>(capacity);
}

std::unique_ptr<GpuTexture> HostDevice::createTexture(const io::ImageData& image) {
    if (!image.valid()) {
        std::cerr << "[HostDevice] Refusing to create texture from empty image\n";
        return nullptr;
    }
    return std::make_unique<HostTexture>(image.width, image.height, image.pixels);
}

} // namespace ember
