// Ember - WebGPU compute backend

#include <ember/webgpu_backend.h>
#include <ember/io/image_loader.h>
#include <ember/shaders.h>
#include <webgpu/wgpu.h>
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

namespace ember {

namespace {

WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

std::string fromStringView(WGPUStringView view) {
    return view.data ? std::string(view.data, view.length) : std::string("unknown");
}

constexpr uint64_t kPhysicsBytes = sizeof(PhysicsBlock);
constexpr uint64_t kDispatchBytes = 16;
constexpr uint64_t kAppearanceBytes = sizeof(AppearanceBlock);
constexpr uint64_t kBloomBytes = sizeof(BloomBlock);
constexpr uint64_t kParticleStride = kFloatsPerParticle * sizeof(float);
constexpr uint64_t kVelocityStride = kFloatsPerVelocity * sizeof(float);

} // namespace

// =============================================================================
// WebGpuTexture
// =============================================================================

WebGpuTexture::WebGpuTexture(WGPUTexture texture, WGPUTextureView view, int width, int height)
    : m_texture(texture), m_view(view), m_width(width), m_height(height) {}

// =============================================================================
// WebGpuBackend
// =============================================================================

WebGpuBackend::WebGpuBackend(WGPUDevice device, WGPUQueue queue, uint32_t capacity)
    : m_capacity(std::max<uint32_t>(1, capacity))
    , m_setup(std::make_shared<SetupFlag>()) {
    if (!device || !queue) {
        m_setup->state = SetupState::Failed;
        return;
    }

    m_device = device;
    m_queue = queue;
    wgpuDeviceAddRef(m_device);
    wgpuQueueAddRef(m_queue);

    if (!createBuffers()) {
        std::cerr << "[WebGpuBackend] Buffer allocation failed for " << m_capacity << " slots\n";
        m_setup->state = SetupState::Failed;
    }
}

WebGpuBackend::~WebGpuBackend() {
    release();
}

WGPUBufferUsage WebGpuBackend::usageFor(BufferRole role) {
    switch (role) {
        case BufferRole::Instance:
            return WGPUBufferUsage_Storage | WGPUBufferUsage_Vertex |
                   WGPUBufferUsage_CopyDst | WGPUBufferUsage_CopySrc;
        case BufferRole::Storage:
            return WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst | WGPUBufferUsage_CopySrc;
        case BufferRole::Uniform:
            return WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
        case BufferRole::Readback:
            return WGPUBufferUsage_MapRead | WGPUBufferUsage_CopyDst;
    }
    return WGPUBufferUsage_None;
}

WGPUBuffer WebGpuBackend::createBuffer(BufferRole role, uint64_t size, const char* label) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(label);
    desc.usage = usageFor(role);
    desc.size = size;
    desc.mappedAtCreation = false;
    return wgpuDeviceCreateBuffer(m_device, &desc);
}

bool WebGpuBackend::createBuffers() {
    m_instanceBuffer.reset(createBuffer(BufferRole::Instance, m_capacity * kParticleStride, "Particle Instances"));
    m_velocityBuffer.reset(createBuffer(BufferRole::Storage, m_capacity * kVelocityStride, "Particle Velocities"));
    m_physicsBuffer.reset(createBuffer(BufferRole::Uniform, kPhysicsBytes, "Physics Params"));
    m_dispatchBuffer.reset(createBuffer(BufferRole::Uniform, kDispatchBytes, "Dispatch Info"));
    m_appearanceBuffer.reset(createBuffer(BufferRole::Uniform, kAppearanceBytes, "Appearance"));
    m_bloomBuffer.reset(createBuffer(BufferRole::Uniform, kBloomBytes, "Bloom"));

    return m_instanceBuffer && m_velocityBuffer && m_physicsBuffer &&
           m_dispatchBuffer && m_appearanceBuffer && m_bloomBuffer;
}

void WebGpuBackend::beginPipelineSetup() {
    m_setup->state = SetupState::Building;
    wgpuDevicePushErrorScope(m_device, WGPUErrorFilter_Validation);

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(PHYSICS_COMPUTE_SHADER);

    WGPUShaderModuleDescriptor moduleDesc = {};
    moduleDesc.nextInChain = reinterpret_cast<WGPUChainedStruct*>(&wgslDesc);
    moduleDesc.label = toStringView("Particle Physics");
    ShaderModuleHandle module(wgpuDeviceCreateShaderModule(m_device, &moduleDesc));

    WGPUBindGroupLayoutEntry entries[4] = {};
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Compute;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = kPhysicsBytes;

    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Compute;
    entries[1].buffer.type = WGPUBufferBindingType_Storage;

    entries[2].binding = 2;
    entries[2].visibility = WGPUShaderStage_Compute;
    entries[2].buffer.type = WGPUBufferBindingType_Storage;

    entries[3].binding = 3;
    entries[3].visibility = WGPUShaderStage_Compute;
    entries[3].buffer.type = WGPUBufferBindingType_Uniform;
    entries[3].buffer.minBindingSize = kDispatchBytes;

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = 4;
    layoutDesc.entries = entries;
    m_bindGroupLayout.reset(wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc));

    WGPUBindGroupLayout layouts[] = {m_bindGroupLayout.get()};
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = layouts;
    PipelineLayoutHandle pipelineLayout(wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc));

    WGPUComputePipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView("Particle Physics");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.compute.module = module;
    pipelineDesc.compute.entryPoint = toStringView("main");
    m_pipeline.reset(wgpuDeviceCreateComputePipeline(m_device, &pipelineDesc));

    WGPUBindGroupEntry bindings[4] = {};
    bindings[0].binding = 0;
    bindings[0].buffer = m_physicsBuffer;
    bindings[0].size = kPhysicsBytes;
    bindings[1].binding = 1;
    bindings[1].buffer = m_instanceBuffer;
    bindings[1].size = m_capacity * kParticleStride;
    bindings[2].binding = 2;
    bindings[2].buffer = m_velocityBuffer;
    bindings[2].size = m_capacity * kVelocityStride;
    bindings[3].binding = 3;
    bindings[3].buffer = m_dispatchBuffer;
    bindings[3].size = kDispatchBytes;

    WGPUBindGroupDescriptor bindGroupDesc = {};
    bindGroupDesc.layout = m_bindGroupLayout;
    bindGroupDesc.entryCount = 4;
    bindGroupDesc.entries = bindings;
    m_bindGroup.reset(wgpuDeviceCreateBindGroup(m_device, &bindGroupDesc));

    // The scope callback may fire after this backend is gone; it only
    // touches the shared flag it was handed
    WGPUPopErrorScopeCallbackInfo scopeInfo = {};
    scopeInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    scopeInfo.callback = [](WGPUPopErrorScopeStatus status, WGPUErrorType type,
                            WGPUStringView message, void* userdata1, void* userdata2) {
        auto* flag = static_cast<std::shared_ptr<SetupFlag>*>(userdata1);
        if (status == WGPUPopErrorScopeStatus_Success && type == WGPUErrorType_NoError) {
            (*flag)->state = SetupState::Ready;
            std::cout << "[WebGpuBackend] Physics pipeline ready\n";
        } else {
            (*flag)->state = SetupState::Failed;
            std::cerr << "[WebGpuBackend] Physics pipeline failed: " << fromStringView(message) << "\n";
        }
        delete flag;
    };
    scopeInfo.userdata1 = new std::shared_ptr<SetupFlag>(m_setup);
    scopeInfo.userdata2 = nullptr;
    wgpuDevicePopErrorScope(m_device, scopeInfo);
}

bool WebGpuBackend::isReady() const {
    return m_device && m_setup->state == SetupState::Ready && m_pipeline && m_bindGroup;
}

void WebGpuBackend::poll() {
    if (!m_device) return;

    if (m_setup->state == SetupState::Pending) {
        beginPipelineSetup();
    }

    if (m_readback && m_readback->mapsDone == 2) {
        finishReadback();
    }
}

void WebGpuBackend::writeParticles(uint32_t firstSlot, const float* data, uint32_t count) {
    if (!m_device || !m_instanceBuffer || count == 0) return;
    if (firstSlot + count > m_capacity) {
        std::cerr << "[WebGpuBackend] Particle write out of range\n";
        return;
    }
    wgpuQueueWriteBuffer(m_queue, m_instanceBuffer, firstSlot * kParticleStride,
                         data, count * kParticleStride);
}

void WebGpuBackend::writeVelocities(uint32_t firstSlot, const float* data, uint32_t count) {
    if (!m_device || !m_velocityBuffer || count == 0) return;
    if (firstSlot + count > m_capacity) {
        std::cerr << "[WebGpuBackend] Velocity write out of range\n";
        return;
    }
    wgpuQueueWriteBuffer(m_queue, m_velocityBuffer, firstSlot * kVelocityStride,
                         data, count * kVelocityStride);
}

void WebGpuBackend::writePhysicsParams(const PhysicsBlock& block) {
    if (!m_device || !m_physicsBuffer) return;
    wgpuQueueWriteBuffer(m_queue, m_physicsBuffer, 0, block.data(), kPhysicsBytes);
}

void WebGpuBackend::writeAppearance(const AppearanceBlock& block) {
    if (!m_device || !m_appearanceBuffer) return;
    wgpuQueueWriteBuffer(m_queue, m_appearanceBuffer, 0, block.data(), kAppearanceBytes);
}

void WebGpuBackend::writeBloom(const BloomBlock& block) {
    if (!m_device || !m_bloomBuffer) return;
    wgpuQueueWriteBuffer(m_queue, m_bloomBuffer, 0, block.data(), kBloomBytes);
}

void WebGpuBackend::dispatch(uint32_t activeCount) {
    if (!isReady() || activeCount == 0) return;
    activeCount = std::min(activeCount, m_capacity);

    uint32_t info[4] = {activeCount, 0, 0, 0};
    wgpuQueueWriteBuffer(m_queue, m_dispatchBuffer, 0, info, sizeof(info));

    WGPUCommandEncoderDescriptor encDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encDesc);

    WGPUComputePassDescriptor passDesc = {};
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
    wgpuComputePassEncoderSetPipeline(pass, m_pipeline);
    wgpuComputePassEncoderSetBindGroup(pass, 0, m_bindGroup, 0, nullptr);
    wgpuComputePassEncoderDispatchWorkgroups(pass, workgroupCount(activeCount), 1, 1);
    wgpuComputePassEncoderEnd(pass);

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);

    wgpuCommandBufferRelease(cmdBuffer);
    wgpuComputePassEncoderRelease(pass);
    wgpuCommandEncoderRelease(encoder);
}

bool WebGpuBackend::requestReadback(uint32_t activeCount, ReadbackCallback callback) {
    if (!isReady() || m_readback) return false;
    activeCount = std::min(activeCount, m_capacity);

    auto request = std::make_unique<ReadbackRequest>();
    request->count = activeCount;
    request->particleBytes = activeCount * kParticleStride;
    request->velocityBytes = activeCount * kVelocityStride;
    request->callback = std::move(callback);

    if (activeCount == 0) {
        // Nothing to copy; complete on the next poll
        request->mapsDone = 2;
        request->particleMapped = true;
        request->velocityMapped = true;
        m_readback = std::move(request);
        return true;
    }

    request->particleStaging.reset(createBuffer(BufferRole::Readback, request->particleBytes, "Particle Readback"));
    request->velocityStaging.reset(createBuffer(BufferRole::Readback, request->velocityBytes, "Velocity Readback"));
    if (!request->particleStaging || !request->velocityStaging) {
        std::cerr << "[WebGpuBackend] Could not allocate readback staging buffers\n";
        return false;
    }

    // Both copies in one submission, ordered after every pending dispatch
    WGPUCommandEncoderDescriptor encDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encDesc);
    wgpuCommandEncoderCopyBufferToBuffer(encoder, m_instanceBuffer, 0,
                                         request->particleStaging, 0, request->particleBytes);
    wgpuCommandEncoderCopyBufferToBuffer(encoder, m_velocityBuffer, 0,
                                         request->velocityStaging, 0, request->velocityBytes);
    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    m_readback = std::move(request);
    ReadbackRequest* req = m_readback.get();

    // userdata2 tells the two mappings apart
    WGPUBufferMapCallbackInfo mapInfo = {};
    mapInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    mapInfo.callback = [](WGPUMapAsyncStatus status, WGPUStringView message,
                          void* userdata1, void* userdata2) {
        auto* r = static_cast<ReadbackRequest*>(userdata1);
        bool ok = (status == WGPUMapAsyncStatus_Success);
        if (userdata2) {
            r->velocityMapped = ok;
        } else {
            r->particleMapped = ok;
        }
        r->mapsDone++;
        if (!ok) {
            std::cerr << "[WebGpuBackend] Map failed: " << fromStringView(message) << "\n";
        }
    };
    mapInfo.userdata1 = req;

    mapInfo.userdata2 = nullptr;
    wgpuBufferMapAsync(req->particleStaging, WGPUMapMode_Read, 0, req->particleBytes, mapInfo);

    mapInfo.userdata2 = req;
    wgpuBufferMapAsync(req->velocityStaging, WGPUMapMode_Read, 0, req->velocityBytes, mapInfo);
    return true;
}

void WebGpuBackend::finishReadback() {
    std::unique_ptr<ReadbackRequest> req = std::move(m_readback);
    bool ok = req->particleMapped && req->velocityMapped;

    ReadbackResult result;
    if (ok && req->count > 0) {
        const auto* particles = static_cast<const float*>(
            wgpuBufferGetConstMappedRange(req->particleStaging, 0, req->particleBytes));
        const auto* velocities = static_cast<const float*>(
            wgpuBufferGetConstMappedRange(req->velocityStaging, 0, req->velocityBytes));

        if (particles && velocities) {
            result.count = req->count;
            result.particles.assign(particles, particles + req->count * kFloatsPerParticle);
            result.velocities.assign(velocities, velocities + req->count * kFloatsPerVelocity);
        } else {
            ok = false;
        }
    }

    if (req->particleMapped && req->particleStaging) wgpuBufferUnmap(req->particleStaging);
    if (req->velocityMapped && req->velocityStaging) wgpuBufferUnmap(req->velocityStaging);

    if (req->callback) {
        req->callback(ok, std::move(result));
    }
}

void WebGpuBackend::dropReadback() {
    if (!m_readback) return;

    // Abort outstanding maps, then let their callbacks run while the
    // request they point at is still alive
    if (m_readback->mapsDone < 2) {
        if (m_readback->particleStaging) wgpuBufferDestroy(m_readback->particleStaging);
        if (m_readback->velocityStaging) wgpuBufferDestroy(m_readback->velocityStaging);
        wgpuDevicePoll(m_device, true, nullptr);
    }
    m_readback.reset();
}

void WebGpuBackend::release() {
    if (!m_device) return;

    dropReadback();

    m_bindGroup.reset();
    m_pipeline.reset();
    m_bindGroupLayout.reset();
    m_instanceBuffer.reset();
    m_velocityBuffer.reset();
    m_physicsBuffer.reset();
    m_dispatchBuffer.reset();
    m_appearanceBuffer.reset();
    m_bloomBuffer.reset();

    wgpuQueueRelease(m_queue);
    wgpuDeviceRelease(m_device);
    m_queue = nullptr;
    m_device = nullptr;
}

// =============================================================================
// WebGpuDevice
// =============================================================================

WebGpuDevice::WebGpuDevice() = default;

WebGpuDevice::~WebGpuDevice() {
    shutdown();
}

bool WebGpuDevice::init() {
    WGPUInstanceExtras instanceExtras = {};
    instanceExtras.chain.sType = static_cast<WGPUSType>(WGPUSType_InstanceExtras);
#ifdef __APPLE__
    instanceExtras.backends = WGPUInstanceBackend_Metal;
#else
    instanceExtras.backends = WGPUInstanceBackend_Primary;
#endif
    instanceExtras.flags = WGPUInstanceFlag_Default;

    WGPUInstanceDescriptor instanceDesc = {};
    instanceDesc.nextInChain = reinterpret_cast<WGPUChainedStruct*>(&instanceExtras);

    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        std::cerr << "[WebGpuDevice] Failed to create WebGPU instance\n";
        return false;
    }

    if (!requestAdapter()) {
        std::cerr << "[WebGpuDevice] Failed to get adapter\n";
        return false;
    }

    if (!requestDevice()) {
        std::cerr << "[WebGpuDevice] Failed to get device\n";
        return false;
    }

    m_queue = wgpuDeviceGetQueue(m_device);
    std::cout << "[WebGpuDevice] Device acquired\n";
    return true;
}

bool WebGpuDevice::requestAdapter() {
    WGPURequestAdapterOptions options = {};
    options.powerPreference = WGPUPowerPreference_HighPerformance;

    struct AdapterUserData {
        WGPUAdapter adapter = nullptr;
        bool done = false;
    } userData;

    WGPURequestAdapterCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<AdapterUserData*>(userdata1);
        if (status == WGPURequestAdapterStatus_Success) {
            data->adapter = adapter;
        } else {
            std::cerr << "[WebGpuDevice] Adapter request failed: " << fromStringView(message) << "\n";
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;
    callbackInfo.userdata2 = nullptr;

    wgpuInstanceRequestAdapter(m_instance, &options, callbackInfo);

    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    m_adapter = userData.adapter;
    return m_adapter != nullptr;
}

bool WebGpuDevice::requestDevice() {
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("EmberDevice");

    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const* device, WGPUErrorType type,
                                                          WGPUStringView message, void* userdata1, void* userdata2) {
        std::cerr << "[WebGPU Error] " << fromStringView(message) << "\n";
    };

    struct DeviceUserData {
        WGPUDevice device = nullptr;
        bool done = false;
    } userData;

    WGPURequestDeviceCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<DeviceUserData*>(userdata1);
        if (status == WGPURequestDeviceStatus_Success) {
            data->device = device;
        } else {
            std::cerr << "[WebGpuDevice] Device request failed: " << fromStringView(message) << "\n";
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;
    callbackInfo.userdata2 = nullptr;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, callbackInfo);

    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    m_device = userData.device;
    return m_device != nullptr;
}

std::unique_ptr<ParticleBackend> WebGpuDevice::createBackend(uint32_t capacity) {
    return std::make_unique<WebGpuBackend>(m_device, m_queue, capacity);
}

GpuTexture* WebGpuDevice::defaultTexture() {
    if (!m_defaultTexture && m_device) {
        io::ImageData white = io::solidImage(1, 1, 255, 255, 255, 255);
        std::unique_ptr<GpuTexture> texture = createTexture(white);
        m_defaultTexture.reset(static_cast<WebGpuTexture*>(texture.release()));
    }
    return m_defaultTexture.get();
}

std::unique_ptr<GpuTexture> WebGpuDevice::createTexture(const io::ImageData& image) {
    if (!m_device || !image.valid()) {
        return nullptr;
    }

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView("Particle Texture");
    texDesc.size.width = static_cast<uint32_t>(image.width);
    texDesc.size.height = static_cast<uint32_t>(image.height);
    texDesc.size.depthOrArrayLayers = 1;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_RGBA8Unorm;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;

    WGPUTexture texture = wgpuDeviceCreateTexture(m_device, &texDesc);
    if (!texture) {
        std::cerr << "[WebGpuDevice] Failed to create " << image.width << "x" << image.height
                  << " texture\n";
        return nullptr;
    }

    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout dataLayout = {};
    dataLayout.offset = 0;
    dataLayout.bytesPerRow = static_cast<uint32_t>(image.width * 4);
    dataLayout.rowsPerImage = static_cast<uint32_t>(image.height);

    WGPUExtent3D writeSize = {
        static_cast<uint32_t>(image.width),
        static_cast<uint32_t>(image.height),
        1
    };

    wgpuQueueWriteTexture(m_queue, &destination, image.pixels.data(), image.pixels.size(),
                          &dataLayout, &writeSize);

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = texDesc.format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView view = wgpuTextureCreateView(texture, &viewDesc);

    return std::make_unique<WebGpuTexture>(texture, view, image.width, image.height);
}

void WebGpuDevice::poll() {
    if (!m_device) return;
    wgpuDevicePoll(m_device, false, nullptr);
    wgpuInstanceProcessEvents(m_instance);
}

void WebGpuDevice::shutdown() {
    m_defaultTexture.reset();

    if (m_queue) {
        wgpuQueueRelease(m_queue);
        m_queue = nullptr;
    }
    if (m_device) {
        wgpuDeviceRelease(m_device);
        m_device = nullptr;
    }
    if (m_adapter) {
        wgpuAdapterRelease(m_adapter);
        m_adapter = nullptr;
    }
    if (m_instance) {
        wgpuInstanceRelease(m_instance);
        m_instance = nullptr;
    }
}

} // namespace ember
