#pragma once

/**
 * @file gpu_handle.h
 * @brief RAII ownership of WebGPU objects
 *
 * Move-only handles that call the matching wgpu*Release() when they go out
 * of scope. WebGpuBackend holds all of its buffers, pipeline and bind group
 * this way so that dispose() and destruction release them in one place.
 *
 * @code
 * BufferHandle buffer(wgpuDeviceCreateBuffer(device, &desc));
 * wgpuQueueWriteBuffer(queue, buffer, 0, data, size);
 * buffer.reset();   // released here
 * @endcode
 */

#include <webgpu/webgpu.h>
#include <utility>

namespace ember {

template<typename T>
struct WGPUReleaseTrait;

template<>
struct WGPUReleaseTrait<WGPUBuffer> {
    static void release(WGPUBuffer h) { if (h) wgpuBufferRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUTexture> {
    static void release(WGPUTexture h) { if (h) wgpuTextureRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUTextureView> {
    static void release(WGPUTextureView h) { if (h) wgpuTextureViewRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUComputePipeline> {
    static void release(WGPUComputePipeline h) { if (h) wgpuComputePipelineRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBindGroup> {
    static void release(WGPUBindGroup h) { if (h) wgpuBindGroupRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBindGroupLayout> {
    static void release(WGPUBindGroupLayout h) { if (h) wgpuBindGroupLayoutRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUPipelineLayout> {
    static void release(WGPUPipelineLayout h) { if (h) wgpuPipelineLayoutRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUShaderModule> {
    static void release(WGPUShaderModule h) { if (h) wgpuShaderModuleRelease(h); }
};

/**
 * @brief Unique owner of one WebGPU object
 * @tparam T A WebGPU handle type with a WGPUReleaseTrait specialization
 */
template<typename T>
class GpuHandle {
public:
    GpuHandle() = default;
    explicit GpuHandle(T handle) : m_handle(handle) {}
    ~GpuHandle() { reset(); }

    GpuHandle(GpuHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    GpuHandle& operator=(GpuHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_handle = other.m_handle;
            other.m_handle = nullptr;
        }
        return *this;
    }

    GpuHandle(const GpuHandle&) = delete;
    GpuHandle& operator=(const GpuHandle&) = delete;

    T get() const { return m_handle; }
    operator T() const { return m_handle; }
    explicit operator bool() const { return m_handle != nullptr; }

    /// Release the current object and optionally adopt @p handle.
    void reset(T handle = nullptr) {
        WGPUReleaseTrait<T>::release(m_handle);
        m_handle = handle;
    }

private:
    T m_handle = nullptr;
};

using BufferHandle = GpuHandle<WGPUBuffer>;
using TextureHandle = GpuHandle<WGPUTexture>;
using TextureViewHandle = GpuHandle<WGPUTextureView>;
using ComputePipelineHandle = GpuHandle<WGPUComputePipeline>;
using BindGroupHandle = GpuHandle<WGPUBindGroup>;
using BindGroupLayoutHandle = GpuHandle<WGPUBindGroupLayout>;
using PipelineLayoutHandle = GpuHandle<WGPUPipelineLayout>;
using ShaderModuleHandle = GpuHandle<WGPUShaderModule>;

} // namespace ember
