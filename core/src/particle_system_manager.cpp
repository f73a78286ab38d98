// Ember - Particle System Manager

#include <ember/particle_system_manager.h>
#include <iostream>

namespace ember {

ParticleSystemManager::ParticleSystemManager(Device& device)
    : m_device(device) {}

ParticleSystemManager::~ParticleSystemManager() = default;

std::unique_ptr<ParticleSystem> ParticleSystemManager::build(EmissionConfig config) {
    config.id = m_nextId++;
    if (config.name.empty()) {
        config.name = "Particle System " + std::to_string(config.id);
    }

    auto system = std::make_unique<ParticleSystem>(m_device, config);
    system->seed(m_seed++);
    system->setReadbackInterval(m_readbackInterval);
    if (m_notice) {
        system->setNoticeHandler(m_notice);
    }
    system->spawnParticles();
    return system;
}

int ParticleSystemManager::create(const EmissionConfig& config) {
    m_systems.push_back(build(config));
    if (m_systems.size() == 1) {
        m_activeIndex = 0;
    }
    return m_systems.back()->config().id;
}

bool ParticleSystemManager::setActive(int index) {
    if (index < 0 || index >= static_cast<int>(m_systems.size())) {
        return false;
    }
    m_activeIndex = index;
    return true;
}

bool ParticleSystemManager::remove(int index) {
    if (index < 0 || index >= static_cast<int>(m_systems.size())) {
        return false;
    }
    if (m_systems.size() == 1) {
        notify("Cannot remove the last particle system");
        return false;
    }

    int id = m_systems[index]->config().id;
    m_systems.erase(m_systems.begin() + index);
    m_textureSources.erase(id);

    int count = static_cast<int>(m_systems.size());
    if (index < m_activeIndex) {
        m_activeIndex--;
    } else if (index == m_activeIndex && m_activeIndex >= count) {
        m_activeIndex = count - 1;
    }

    std::cout << "[ParticleSystemManager] Removed system " << id << " (" << count << " left)\n";
    return true;
}

int ParticleSystemManager::duplicate() {
    ParticleSystem* source = activeSystem();
    if (!source) {
        return -1;
    }

    EmissionConfig copy = source->config();
    copy.name += " (Copy)";
    return create(copy);
}

bool ParticleSystemManager::replaceAll(const SceneData& scene) {
    if (scene.systems.empty()) {
        notify("Scene contains no particle systems; keeping the current scene");
        return false;
    }

    std::vector<std::unique_ptr<ParticleSystem>> rebuilt;
    rebuilt.reserve(scene.systems.size());
    for (const auto& config : scene.systems) {
        rebuilt.push_back(build(config));
    }

    m_systems.swap(rebuilt);
    rebuilt.clear();
    m_textureSources.clear();

    int count = static_cast<int>(m_systems.size());
    m_activeIndex = (scene.activeSystemIndex >= 0 && scene.activeSystemIndex < count)
                        ? scene.activeSystemIndex
                        : 0;

    std::cout << "[ParticleSystemManager] Loaded scene with " << count << " system(s)\n";
    return true;
}

SceneData ParticleSystemManager::toScene() const {
    SceneData scene;
    scene.timestamp = isoTimestamp();
    scene.activeSystemIndex = m_activeIndex;
    for (const auto& system : m_systems) {
        scene.systems.push_back(system->config());
    }
    return scene;
}

void ParticleSystemManager::updateAll(float dt) {
    for (auto& system : m_systems) {
        system->updateParticles(dt);
    }
}

ParticleSystem* ParticleSystemManager::activeSystem() {
    return system(m_activeIndex);
}

ParticleSystem* ParticleSystemManager::system(int index) {
    if (index < 0 || index >= static_cast<int>(m_systems.size())) {
        return nullptr;
    }
    return m_systems[index].get();
}

const ParticleSystem* ParticleSystemManager::system(int index) const {
    if (index < 0 || index >= static_cast<int>(m_systems.size())) {
        return nullptr;
    }
    return m_systems[index].get();
}

int ParticleSystemManager::indexOf(int id) const {
    for (size_t i = 0; i < m_systems.size(); ++i) {
        if (m_systems[i]->config().id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

uint32_t ParticleSystemManager::totalActiveParticles() const {
    uint32_t total = 0;
    for (const auto& system : m_systems) {
        total += system->activeParticles();
    }
    return total;
}

bool ParticleSystemManager::loadTexture(int index, const std::string& path) {
    ParticleSystem* target = system(index);
    if (!target) {
        return false;
    }
    if (!target->loadTexture(path)) {
        return false;
    }
    m_textureSources[target->config().id] = path;
    return true;
}

std::string ParticleSystemManager::textureSource(int id) const {
    auto it = m_textureSources.find(id);
    return it != m_textureSources.end() ? it->second : std::string();
}

void ParticleSystemManager::setNoticeHandler(NoticeHandler handler) {
    m_notice = std::move(handler);
    for (auto& system : m_systems) {
        system->setNoticeHandler(m_notice);
    }
}

void ParticleSystemManager::setReadbackInterval(int frames) {
    m_readbackInterval = frames;
    for (auto& system : m_systems) {
        system->setReadbackInterval(frames);
    }
}

void ParticleSystemManager::notify(const std::string& message) {
    std::cerr << "[ParticleSystemManager] " << message << "\n";
    if (m_notice) {
        m_notice(message);
    }
}

} // namespace ember
