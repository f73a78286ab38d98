#pragma once

/**
 * @file webgpu_backend.h
 * @brief WebGPU implementation of the compute boundary
 *
 * WebGpuDevice acquires an instance, adapter and device without a surface.
 * Each WebGpuBackend owns the six buffers of one particle system and the
 * physics compute pipeline bound to them.
 *
 * Pipeline creation is deferred to the first poll() and wrapped in a
 * validation error scope; the backend only reports ready once that scope
 * has popped clean. Until then step and readback requests are ignored.
 */

#include <ember/gpu_backend.h>
#include <ember/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <memory>

namespace ember {

class WebGpuTexture : public GpuTexture {
public:
    WebGpuTexture(WGPUTexture texture, WGPUTextureView view, int width, int height);

    int width() const override { return m_width; }
    int height() const override { return m_height; }
    WGPUTextureView view() const { return m_view.get(); }

private:
    TextureHandle m_texture;
    TextureViewHandle m_view;
    int m_width;
    int m_height;
};

class WebGpuBackend : public ParticleBackend {
public:
    /// @p device may be null, in which case the backend never becomes ready.
    WebGpuBackend(WGPUDevice device, WGPUQueue queue, uint32_t capacity);
    ~WebGpuBackend() override;

    WebGpuBackend(const WebGpuBackend&) = delete;
    WebGpuBackend& operator=(const WebGpuBackend&) = delete;

    bool isReady() const override;
    uint32_t capacity() const override { return m_capacity; }
    void poll() override;

    void writeParticles(uint32_t firstSlot, const float* data, uint32_t count) override;
    void writeVelocities(uint32_t firstSlot, const float* data, uint32_t count) override;
    void writePhysicsParams(const PhysicsBlock& block) override;
    void writeAppearance(const AppearanceBlock& block) override;
    void writeBloom(const BloomBlock& block) override;

    void dispatch(uint32_t activeCount) override;
    bool requestReadback(uint32_t activeCount, ReadbackCallback callback) override;
    bool hasPendingReadback() const override { return m_readback != nullptr; }

    void release() override;

    // Render collaborator access
    WGPUBuffer instanceBuffer() const { return m_instanceBuffer.get(); }
    WGPUBuffer appearanceBuffer() const { return m_appearanceBuffer.get(); }
    WGPUBuffer bloomBuffer() const { return m_bloomBuffer.get(); }

    /// Usage flags for a buffer of the given role.
    static WGPUBufferUsage usageFor(BufferRole role);

private:
    enum class SetupState { Pending, Building, Ready, Failed };

    /// Shared with the error-scope callback, which may outlive the backend.
    struct SetupFlag {
        SetupState state = SetupState::Pending;
    };

    struct ReadbackRequest {
        BufferHandle particleStaging;
        BufferHandle velocityStaging;
        uint64_t particleBytes = 0;
        uint64_t velocityBytes = 0;
        uint32_t count = 0;
        int mapsDone = 0;
        bool particleMapped = false;
        bool velocityMapped = false;
        ReadbackCallback callback;
    };

    bool createBuffers();
    WGPUBuffer createBuffer(BufferRole role, uint64_t size, const char* label);
    void beginPipelineSetup();
    void finishReadback();
    void dropReadback();

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    uint32_t m_capacity;

    BufferHandle m_instanceBuffer;
    BufferHandle m_velocityBuffer;
    BufferHandle m_physicsBuffer;
    BufferHandle m_dispatchBuffer;
    BufferHandle m_appearanceBuffer;
    BufferHandle m_bloomBuffer;

    BindGroupLayoutHandle m_bindGroupLayout;
    ComputePipelineHandle m_pipeline;
    BindGroupHandle m_bindGroup;
    std::shared_ptr<SetupFlag> m_setup;

    std::unique_ptr<ReadbackRequest> m_readback;
};

class WebGpuDevice : public Device {
public:
    WebGpuDevice();
    ~WebGpuDevice() override;

    WebGpuDevice(const WebGpuDevice&) = delete;
    WebGpuDevice& operator=(const WebGpuDevice&) = delete;

    /**
     * @brief Acquire instance, adapter and device
     *
     * On failure the device stays usable: backends it creates simply never
     * become ready, so simulations degrade to bookkeeping only.
     */
    bool init();
    bool isAvailable() const { return m_device != nullptr; }

    const char* name() const override { return "webgpu"; }
    std::unique_ptr<ParticleBackend> createBackend(uint32_t capacity) override;
    GpuTexture* defaultTexture() override;
    std::unique_ptr<GpuTexture> createTexture(const io::ImageData& image) override;
    void poll() override;

    WGPUDevice device() const { return m_device; }

private:
    bool requestAdapter();
    bool requestDevice();
    void shutdown();

    WGPUInstance m_instance = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    std::unique_ptr<WebGpuTexture> m_defaultTexture;
};

} // namespace ember
