#pragma once

/**
 * @file particle_buffers.h
 * @brief Host-side particle state and its encoding for the GPU
 *
 * ParticleBuffers holds the CPU copy of every slot (8 floats of particle
 * state, 4 floats of velocity) and knows how to push ranges of it, and the
 * parameter blocks, to a ParticleBackend. Slots at or beyond the active
 * count are garbage and are never read back into meaning.
 */

#include <ember/emission_config.h>
#include <ember/emitter.h>
#include <ember/gpu_backend.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace ember {

/// Outcome of one compaction pass.
struct CompactionResult {
    uint32_t activeCount = 0;   ///< Live slots after the pass
    uint32_t removed = 0;       ///< Dead particles swap-removed
    uint32_t respawned = 0;     ///< Dead particles respawned in place
    uint32_t firstDirty = 0;    ///< First slot whose contents changed
    uint32_t dirtyEnd = 0;      ///< One past the last changed slot
    std::vector<uint32_t> changedSlots;  ///< Respawned or refilled slots, ascending

    bool changed() const { return removed > 0 || respawned > 0; }
};

/// Physics values written into the 12-float parameter block.
struct PhysicsParams {
    float deltaTime = 0.0f;
    float particleSpeed = 1.0f;
    float gravity = 0.0f;
    float turbulence = 0.0f;
    float attractorStrength = 0.0f;
    glm::vec3 attractorPosition{0.0f};
};

class ParticleBuffers {
public:
    explicit ParticleBuffers(uint32_t capacity);

    uint32_t capacity() const { return m_capacity; }

    // -------------------------------------------------------------------------
    /// @name Slot access
    /// @{

    void store(uint32_t slot, const EmittedParticle& p);
    void setVelocity(uint32_t slot, const glm::vec3& v);
    void setColor(uint32_t slot, const glm::vec3& c);

    glm::vec3 position(uint32_t slot) const;
    glm::vec3 color(uint32_t slot) const;
    glm::vec3 velocity(uint32_t slot) const;
    float age(uint32_t slot) const;
    float lifetime(uint32_t slot) const;
    bool isDead(uint32_t slot) const { return age(slot) >= lifetime(slot); }

    const std::vector<float>& particleData() const { return m_particles; }
    const std::vector<float>& velocityData() const { return m_velocities; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Synchronization
    /// @{

    /// Write slots [first, first + count) of both arrays to the backend.
    void upload(ParticleBackend& backend, uint32_t first, uint32_t count) const;

    /// Write the listed slots, one write per run of consecutive slots.
    void uploadSlots(ParticleBackend& backend, const std::vector<uint32_t>& slots) const;

    /// Write only the velocity records of [first, first + count).
    void uploadVelocities(ParticleBackend& backend, uint32_t first, uint32_t count) const;

    /**
     * @brief Overwrite the host copy with a readback snapshot
     *
     * Only slots below both the snapshot count and @p activeCount are
     * replaced; slots emitted after the snapshot was taken keep their host
     * values.
     */
    void applySnapshot(const ReadbackResult& snapshot, uint32_t activeCount);

    /**
     * @brief Remove dead particles in index order
     *
     * For each dead slot, @p respawn is asked first; returning true means it
     * refilled the slot in place. Otherwise the last live slot is moved into
     * the hole and the live count shrinks.
     */
    CompactionResult compact(uint32_t activeCount, const std::function<bool(uint32_t slot)>& respawn);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Block encoding
    /// @{

    static PhysicsBlock encodePhysics(const PhysicsParams& params);
    static AppearanceBlock encodeAppearance(const EmissionConfig& config);
    static BloomBlock encodeBloom(const EmissionConfig& config);

    /// @}

private:
    void copySlot(uint32_t from, uint32_t to);

    uint32_t m_capacity;
    std::vector<float> m_particles;
    std::vector<float> m_velocities;
};

} // namespace ember
