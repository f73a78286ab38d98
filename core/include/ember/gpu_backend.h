#pragma once

/**
 * @file gpu_backend.h
 * @brief Boundary between the simulation and the parallel compute stage
 *
 * A Device is created once per application. It hands out one
 * ParticleBackend per particle system and owns the shared 1x1 white
 * texture. Two implementations exist: WebGpuDevice runs the physics kernel
 * on a WebGPU device, HostDevice runs the identical kernel on host memory.
 *
 * All uploads and dispatches of a backend go to one ordered queue, so a
 * write issued before dispatch() is visible to that dispatch.
 */

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace ember {

namespace io { struct ImageData; }

// -----------------------------------------------------------------------------
// Kernel ABI
// -----------------------------------------------------------------------------

constexpr uint32_t kFloatsPerParticle = 8;   ///< pos.xyz, color.rgb, age, lifetime
constexpr uint32_t kFloatsPerVelocity = 4;   ///< vel.xyz, pad
constexpr uint32_t kWorkgroupSize = 64;

/// Physics parameter block: dt, speed, gravity, turbulence, attractor
/// strength, pad, attractor.xyz, pad, pad, pad
using PhysicsBlock = std::array<float, 12>;

/// Appearance block consumed by the render collaborator
using AppearanceBlock = std::array<float, 24>;

/// Bloom block: intensity, enabled, pad, pad
using BloomBlock = std::array<float, 4>;

/// Workgroups needed to cover @p count lanes
inline uint32_t workgroupCount(uint32_t count) {
    return (count + kWorkgroupSize - 1) / kWorkgroupSize;
}

/// Intended use of a GPU buffer
enum class BufferRole {
    Instance,   ///< Particle records, bound as storage and vertex data
    Storage,    ///< Compute read/write data (velocities)
    Uniform,    ///< Parameter blocks
    Readback    ///< Host-mappable staging copy
};

/// Host copy of the first `count` particle and velocity records
struct ReadbackResult {
    std::vector<float> particles;   ///< count * kFloatsPerParticle
    std::vector<float> velocities;  ///< count * kFloatsPerVelocity
    uint32_t count = 0;
};

using ReadbackCallback = std::function<void(bool ok, ReadbackResult result)>;

/// Texture bound to a particle system for rendering
class GpuTexture {
public:
    virtual ~GpuTexture() = default;
    virtual int width() const = 0;
    virtual int height() const = 0;
};

/**
 * @brief GPU-resident state of one particle system
 *
 * Owns the instance, velocity and parameter buffers plus the compute
 * pipeline bound to them. Every operation is a no-op after release().
 */
class ParticleBackend {
public:
    virtual ~ParticleBackend() = default;

    /// True once the compute pipeline is built and buffers are live.
    virtual bool isReady() const = 0;

    /// Slots allocated in the instance and velocity buffers.
    virtual uint32_t capacity() const = 0;

    /// Process finished asynchronous work and fire readback callbacks.
    virtual void poll() = 0;

    // -------------------------------------------------------------------------
    /// @name Uploads
    /// @{

    virtual void writeParticles(uint32_t firstSlot, const float* data, uint32_t count) = 0;
    virtual void writeVelocities(uint32_t firstSlot, const float* data, uint32_t count) = 0;
    virtual void writePhysicsParams(const PhysicsBlock& block) = 0;
    virtual void writeAppearance(const AppearanceBlock& block) = 0;
    virtual void writeBloom(const BloomBlock& block) = 0;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Compute
    /// @{

    /// Run the physics kernel over the first @p activeCount slots.
    virtual void dispatch(uint32_t activeCount) = 0;

    /**
     * @brief Copy the first @p activeCount records back to the host
     *
     * The callback fires from a later poll(). Returns false, without
     * calling the callback, when the backend is not ready or another
     * readback is already in flight.
     */
    virtual bool requestReadback(uint32_t activeCount, ReadbackCallback callback) = 0;

    virtual bool hasPendingReadback() const = 0;

    /// @}

    /// Free every GPU buffer. Pending readbacks are dropped without callback.
    virtual void release() = 0;
};

/**
 * @brief Application-wide compute device
 */
class Device {
public:
    virtual ~Device() = default;

    virtual const char* name() const = 0;

    /// Allocate buffers and pipeline for a system with @p capacity slots.
    virtual std::unique_ptr<ParticleBackend> createBackend(uint32_t capacity) = 0;

    /// Shared 1x1 white texture. Owned by the device, never released by systems.
    virtual GpuTexture* defaultTexture() = 0;

    /// Upload decoded pixels. Returns nullptr on failure.
    virtual std::unique_ptr<GpuTexture> createTexture(const io::ImageData& image) = 0;

    /// Pump device events (pipeline setup, buffer mapping).
    virtual void poll() = 0;
};

} // namespace ember
