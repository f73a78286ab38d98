#pragma once

/**
 * @file host_backend.h
 * @brief Host-memory implementation of the compute boundary
 *
 * HostBackend keeps its "GPU" buffers in host vectors and runs the
 * reference kernel on dispatch(). Readbacks snapshot the buffers when
 * requested and complete on the next poll(), so callers observe the same
 * one-frame latency as on a real device.
 */

#include <ember/gpu_backend.h>
#include <memory>
#include <vector>

namespace ember {

class HostTexture : public GpuTexture {
public:
    HostTexture(int width, int height, std::vector<uint8_t> pixels);

    int width() const override { return m_width; }
    int height() const override { return m_height; }
    const std::vector<uint8_t>& pixels() const { return m_pixels; }

private:
    int m_width;
    int m_height;
    std::vector<uint8_t> m_pixels;
};

class HostBackend : public ParticleBackend {
public:
    explicit HostBackend(uint32_t capacity);
    ~HostBackend() override = default;

    bool isReady() const override { return m_live; }
    uint32_t capacity() const override { return m_capacity; }
    void poll() override;

    void writeParticles(uint32_t firstSlot, const float* data, uint32_t count) override;
    void writeVelocities(uint32_t firstSlot, const float* data, uint32_t count) override;
    void writePhysicsParams(const PhysicsBlock& block) override;
    void writeAppearance(const AppearanceBlock& block) override;
    void writeBloom(const BloomBlock& block) override;

    void dispatch(uint32_t activeCount) override;
    bool requestReadback(uint32_t activeCount, ReadbackCallback callback) override;
    bool hasPendingReadback() const override { return m_pending != nullptr; }

    void release() override;

    // Inspection
    const std::vector<float>& particles() const { return m_particles; }
    const std::vector<float>& velocities() const { return m_velocities; }
    const PhysicsBlock& physicsParams() const { return m_physics; }
    const AppearanceBlock& appearance() const { return m_appearance; }
    const BloomBlock& bloom() const { return m_bloom; }
    uint64_t dispatchCount() const { return m_dispatches; }
    uint32_t lastDispatchCount() const { return m_lastDispatchCount; }

protected:
    /// Decide the outcome of a readback about to complete. Default succeeds.
    virtual bool readbackSucceeds() { return true; }

private:
    struct PendingReadback {
        ReadbackResult result;
        ReadbackCallback callback;
    };

    uint32_t m_capacity;
    bool m_live = true;

    std::vector<float> m_particles;
    std::vector<float> m_velocities;
    PhysicsBlock m_physics{};
    AppearanceBlock m_appearance{};
    BloomBlock m_bloom{};

    std::unique_ptr<PendingReadback> m_pending;

    uint64_t m_dispatches = 0;
    uint32_t m_lastDispatchCount = 0;
};

class HostDevice : public Device {
public:
    HostDevice();
    ~HostDevice() override = default;

    const char* name() const override { return "host"; }
    std::unique_ptr<ParticleBackend> createBackend(uint32_t capacity) override;
    GpuTexture* defaultTexture() override { return m_defaultTexture.get(); }
    std::unique_ptr<GpuTexture> createTexture(const io::ImageData& image) override;
    void poll() override {}

private:
    std::unique_ptr<HostTexture> m_defaultTexture;
};

} // namespace ember
