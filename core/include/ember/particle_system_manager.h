#pragma once

/**
 * @file particle_system_manager.h
 * @brief Ordered collection of particle systems making up one scene
 *
 * The manager owns every ParticleSystem, tracks which one the control
 * panel edits (the active system) and hands out ids from a counter that
 * never goes backwards, even across remove() and replaceAll().
 */

#include <ember/emission_config.h>
#include <ember/gpu_backend.h>
#include <ember/particle_system.h>
#include <ember/scene.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ember {

class ParticleSystemManager {
public:
    explicit ParticleSystemManager(Device& device);
    ~ParticleSystemManager();

    ParticleSystemManager(const ParticleSystemManager&) = delete;
    ParticleSystemManager& operator=(const ParticleSystemManager&) = delete;

    // -------------------------------------------------------------------------
    /// @name Collection
    /// @{

    /**
     * @brief Add and spawn a system built from @p config
     * @return The new system's id; the first system added becomes active
     */
    int create(const EmissionConfig& config = EmissionConfig{});

    /// Make system @p index active. False if out of range.
    bool setActive(int index);

    /**
     * @brief Remove and dispose system @p index
     *
     * Refuses (with a notice) to remove the last remaining system. The
     * active index then points at the system that moved into the removed
     * slot, or at the new last system.
     */
    bool remove(int index);

    /**
     * @brief Copy the active system's config into a new system
     *
     * The copy gets a fresh id and a " (Copy)" name suffix. Texture sources
     * are keyed by id and are not carried over.
     * @return The new id, or -1 when there is nothing to duplicate
     */
    int duplicate();

    /**
     * @brief Discard every system and rebuild from @p scene
     *
     * Validation happens first; on failure the current systems are kept and
     * false is returned. Loaded systems get fresh ids.
     */
    bool replaceAll(const SceneData& scene);

    /// Snapshot the current configs for saving.
    SceneData toScene() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Frame loop
    /// @{

    void updateAll(float dt);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Access
    /// @{

    size_t size() const { return m_systems.size(); }
    bool empty() const { return m_systems.empty(); }
    int activeIndex() const { return m_activeIndex; }

    ParticleSystem* activeSystem();
    ParticleSystem* system(int index);
    const ParticleSystem* system(int index) const;
    int indexOf(int id) const;

    /// Total live particles across all systems.
    uint32_t totalActiveParticles() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Textures
    /// @{

    /// Start loading @p path into system @p index and remember it as the source.
    bool loadTexture(int index, const std::string& path);

    /// Path last loaded into the system with id @p id, or empty.
    std::string textureSource(int id) const;

    /// @}

    void setNoticeHandler(NoticeHandler handler);

    /// Readback cadence for existing and future systems.
    void setReadbackInterval(int frames);

    /// Seed for the next system; each created system advances it by one.
    void setSeed(uint32_t seed) { m_seed = seed; }

    /// Next id that create() will hand out.
    int nextId() const { return m_nextId; }

private:
    std::unique_ptr<ParticleSystem> build(EmissionConfig config);
    void notify(const std::string& message);

    Device& m_device;
    std::vector<std::unique_ptr<ParticleSystem>> m_systems;
    int m_activeIndex = 0;
    int m_nextId = 1;
    std::map<int, std::string> m_textureSources;
    NoticeHandler m_notice;
    int m_readbackInterval = kDefaultReadbackInterval;
    uint32_t m_seed = ParticleSystem::kDefaultSeed;
};

} // namespace ember
