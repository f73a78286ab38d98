#pragma once

/**
 * @file particle_system.h
 * @brief One emitter with its buffers, physics and texture
 *
 * ParticleSystem runs the spawn, emit, advance, compact, respawn lifecycle
 * for a single EmissionConfig. Slots [0, activeParticles()) are live.
 *
 * @par Per-frame update
 * @code
 * system.spawnParticles();
 * while (running) {
 *     system.updateParticles(dt);
 *     render(system.renderInputs());
 * }
 * @endcode
 */

#include <ember/emission_config.h>
#include <ember/emitter.h>
#include <ember/gpu_backend.h>
#include <ember/io/image_loader.h>
#include <ember/particle_buffers.h>
#include <ember/physics_engine.h>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <random>
#include <string>

namespace ember {

/// Upload granularity for burst spawns.
constexpr uint32_t kBurstBatchSize = 4096;

/// Default and limits for the readback cadence, in frames.
constexpr int kDefaultReadbackInterval = 60;
constexpr int kMinReadbackInterval = 1;
constexpr int kMaxReadbackInterval = 300;

/**
 * @brief Listener interface for configuration edits
 *
 * A control panel writes EmissionConfig fields directly and then calls the
 * hook matching what it changed.
 */
class ConfigHooks {
public:
    virtual ~ConfigHooks() = default;

    virtual void onRespawn() = 0;
    virtual void onAppearanceChange() = 0;
    virtual void onPhysicsChange() = 0;
    virtual void onSpeedChange() = 0;
    virtual void onBloomIntensityChange() = 0;
};

enum class EmissionState {
    Idle,       ///< Nothing emitting, no burst particles alive
    Bursting,   ///< Burst particles alive, no further emission
    Emitting    ///< Continuous emission in progress
};

struct ParticleStats {
    uint64_t emitted = 0;           ///< New particles from spawn and emission
    uint64_t respawned = 0;         ///< Dead particles refilled in place
    uint64_t compacted = 0;         ///< Dead particles swap-removed
    uint64_t physicsSteps = 0;      ///< Kernel steps dispatched
    uint64_t readbacksCompleted = 0;
    uint64_t readbacksFailed = 0;
    uint64_t readbacksDiscarded = 0; ///< Completed after a respawn, ignored
};

/// What the render collaborator needs to draw one system.
struct RenderInputs {
    const ParticleBackend* backend = nullptr;
    uint32_t instanceCount = 0;
    const GpuTexture* texture = nullptr;
    AppearanceBlock appearance{};
    BloomBlock bloom{};
};

using NoticeHandler = std::function<void(const std::string& message)>;

class ParticleSystem : public ConfigHooks {
public:
    ParticleSystem(Device& device, const EmissionConfig& config);
    ~ParticleSystem() override;

    ParticleSystem(const ParticleSystem&) = delete;
    ParticleSystem& operator=(const ParticleSystem&) = delete;

    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Reset emission and start a new cycle
     *
     * Clears live particles, the emission clock and any readback still in
     * flight, then either bursts particleCount particles or arms continuous
     * emission. Calling it twice in a row leaves the same counts.
     */
    void spawnParticles();

    /// Advance one frame of @p dt seconds.
    void updateParticles(float dt);

    /// Release GPU buffers and the bound texture. Further updates are no-ops.
    void dispose();
    bool isDisposed() const { return m_backend == nullptr; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name ConfigHooks
    /// @{

    void onRespawn() override;
    void onAppearanceChange() override;
    void onPhysicsChange() override;
    void onSpeedChange() override;
    void onBloomIntensityChange() override;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Texture
    /// @{

    /**
     * @brief Decode @p path off the frame loop and bind it when ready
     *
     * Returns false if a load is already in progress. Decode failures are
     * reported through the notice handler.
     */
    bool loadTexture(const std::string& path);

    /// Bind already-decoded pixels immediately.
    bool setTexture(const io::ImageData& image);

    /// Bind the shared default texture, releasing any owned one.
    void clearTexture();

    /// Finish a pending texture load if the decode is done (or wait for it).
    /// Returns true if a texture was bound by this call.
    bool pollTexture(bool wait = false);

    bool textureLoading() const { return m_pendingTexture.valid(); }
    bool hasCustomTexture() const { return m_texture != nullptr; }
    const GpuTexture* boundTexture() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    EmissionConfig& config() { return m_config; }
    const EmissionConfig& config() const { return m_config; }

    uint32_t activeParticles() const { return m_activeParticles; }
    uint32_t particleCount() const { return m_particleCount; }
    uint32_t capacity() const { return m_buffers.capacity(); }
    bool isEmitting() const { return m_emitting; }
    float currentEmissionTime() const { return m_currentEmissionTime; }
    EmissionState state() const;

    const ParticleBuffers& buffers() const { return m_buffers; }
    PhysicsEngine* physics() { return m_physics.get(); }
    const ParticleStats& stats() const { return m_stats; }
    RenderInputs renderInputs() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Settings
    /// @{

    void seed(uint32_t seed) { m_rng.seed(seed); }
    static constexpr uint32_t kDefaultSeed = 42;
    void setReadbackInterval(int frames);
    int readbackInterval() const { return m_readbackInterval; }
    void setNoticeHandler(NoticeHandler handler) { m_notice = std::move(handler); }

    /// @}

private:
    struct TextureLoad {
        io::ImageData image;
        std::string error;
    };

    uint32_t emitInto(uint32_t first, uint32_t count);
    void emitContinuous(float dt);
    void scheduleReadback();
    void onReadback(uint64_t generation, bool ok, ReadbackResult result);
    void uploadAppearance();
    void notify(const std::string& message);

    Device& m_device;
    EmissionConfig m_config;
    std::mt19937 m_rng;
    Emitter m_emitter;
    ParticleBuffers m_buffers;
    std::unique_ptr<ParticleBackend> m_backend;
    std::unique_ptr<PhysicsEngine> m_physics;

    std::unique_ptr<GpuTexture> m_texture;
    std::future<TextureLoad> m_pendingTexture;
    std::string m_pendingTexturePath;

    // Emission state
    uint32_t m_activeParticles = 0;
    uint32_t m_particleCount = 0;
    bool m_emitting = false;
    bool m_burstCycle = false;
    float m_currentEmissionTime = 0.0f;
    float m_emissionBalance = 0.0f;
    float m_lastEmissionTime = 0.0f;

    // Readback
    int m_readbackInterval = kDefaultReadbackInterval;
    int m_framesSinceReadback = 0;
    uint64_t m_generation = 0;
    bool m_readbackFailing = false;
    bool m_recolorPending = false;

    ParticleStats m_stats;
    NoticeHandler m_notice;
};

} // namespace ember
