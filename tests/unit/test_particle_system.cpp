/**
 * @file test_particle_system.cpp
 * @brief Unit tests for the particle system lifecycle on the host backend
 *
 * Everything here runs against HostDevice, so the physics kernel, readback
 * latency and compaction behave as they would on a GPU without needing one.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <ember/host_backend.h>
#include <ember/particle_system.h>
#include <string>
#include <vector>

using namespace ember;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float kFrame = 1.0f / 60.0f;

class FailingReadbackBackend : public HostBackend {
public:
    using HostBackend::HostBackend;

protected:
    bool readbackSucceeds() override { return false; }
};

class FailingReadbackDevice : public HostDevice {
public:
    std::unique_ptr<ParticleBackend> createBackend(uint32_t capacity) override {
        return std::make_unique<FailingReadbackBackend>(capacity);
    }
};

class StalledBackend : public HostBackend {
public:
    using HostBackend::HostBackend;
    bool isReady() const override { return false; }
};

class StalledDevice : public HostDevice {
public:
    std::unique_ptr<ParticleBackend> createBackend(uint32_t capacity) override {
        return std::make_unique<StalledBackend>(capacity);
    }
};

// Completes each readback only on the third poll after it was requested
class DelayedReadbackBackend : public HostBackend {
public:
    using HostBackend::HostBackend;

    void poll() override {
        if (hasPendingReadback() && ++m_polls < 3) return;
        m_polls = 0;
        HostBackend::poll();
    }

private:
    int m_polls = 0;
};

class DelayedReadbackDevice : public HostDevice {
public:
    std::unique_ptr<ParticleBackend> createBackend(uint32_t capacity) override {
        return std::make_unique<DelayedReadbackBackend>(capacity);
    }
};

EmissionConfig burstConfig(int count, float lifetime = 5.0f) {
    EmissionConfig config;
    config.name = "Burst";
    config.burstMode = true;
    config.particleCount = count;
    config.lifetime = lifetime;
    return config;
}

EmissionConfig continuousConfig(float rate, float duration, float lifetime) {
    EmissionConfig config;
    config.name = "Stream";
    config.burstMode = false;
    config.emissionRate = rate;
    config.emissionDuration = duration;
    config.lifetime = lifetime;
    return config;
}

void runFrames(ParticleSystem& system, int frames) {
    for (int i = 0; i < frames; ++i) {
        system.updateParticles(kFrame);
    }
}

const HostBackend& hostBackend(const ParticleSystem& system) {
    return static_cast<const HostBackend&>(*system.renderInputs().backend);
}

} // namespace

TEST_CASE("Burst spawn", "[particle_system][burst]") {
    HostDevice device;
    ParticleSystem system(device, burstConfig(500));
    system.spawnParticles();

    SECTION("all particles are live at once") {
        REQUIRE(system.activeParticles() == 500);
        REQUIRE(system.particleCount() == 500);
        REQUIRE_FALSE(system.isEmitting());
        REQUIRE(system.state() == EmissionState::Bursting);
        REQUIRE(system.stats().emitted == 500);
    }

    SECTION("records reach the backend") {
        const HostBackend& backend = hostBackend(system);
        REQUIRE(backend.particles()[499 * kFloatsPerParticle + 7] > 0.0f);
    }

    SECTION("bursts larger than one upload batch") {
        system.config().particleCount = 9000;
        system.spawnParticles();
        REQUIRE(system.activeParticles() == 9000);
        REQUIRE(hostBackend(system).particles()[8999 * kFloatsPerParticle + 7] > 0.0f);
    }

    SECTION("burst size is capped at capacity") {
        EmissionConfig config = burstConfig(50);
        config.maxParticles = 20;
        ParticleSystem small(device, config);
        small.spawnParticles();
        REQUIRE(small.activeParticles() == 20);
        REQUIRE(small.capacity() == 20);
    }

    SECTION("physics advances live particles") {
        runFrames(system, 10);
        REQUIRE(system.stats().physicsSteps >= 9);
        REQUIRE(hostBackend(system).dispatchCount() == system.stats().physicsSteps);
        REQUIRE(hostBackend(system).particles()[6] > 0.0f);
    }
}

TEST_CASE("Continuous emission", "[particle_system][continuous]") {
    HostDevice device;

    SECTION("provisions rate times the longer of duration and lifetime") {
        ParticleSystem system(device, continuousConfig(10.0f, 5.0f, 2.0f));
        system.spawnParticles();
        REQUIRE(system.particleCount() == 50);
        REQUIRE(system.isEmitting());
        REQUIRE(system.activeParticles() == 0);
        REQUIRE(system.state() == EmissionState::Emitting);
    }

    SECTION("emits about rate times duration") {
        ParticleSystem system(device, continuousConfig(10.0f, 5.0f, 2.0f));
        system.spawnParticles();
        runFrames(system, 300);

        uint64_t emitted = system.stats().emitted;
        REQUIRE(emitted >= 49);
        REQUIRE(emitted <= 51);
    }

    SECTION("emission stops at the end of the duration") {
        ParticleSystem system(device, continuousConfig(10.0f, 1.0f, 5.0f));
        system.spawnParticles();
        runFrames(system, 70);

        REQUIRE_FALSE(system.isEmitting());
        uint64_t emitted = system.stats().emitted;
        REQUIRE(emitted >= 9);
        REQUIRE(emitted <= 11);

        runFrames(system, 60);
        REQUIRE(system.stats().emitted == emitted);
        REQUIRE(system.state() == EmissionState::Idle);
    }

    SECTION("live count never exceeds the provisioned count") {
        ParticleSystem system(device, continuousConfig(200.0f, 2.0f, 0.5f));
        system.spawnParticles();
        REQUIRE(system.particleCount() == 400);
        for (int i = 0; i < 150; ++i) {
            system.updateParticles(kFrame);
            REQUIRE(system.activeParticles() <= system.particleCount());
        }
    }

    SECTION("zero rate emits nothing") {
        ParticleSystem system(device, continuousConfig(0.0f, 5.0f, 2.0f));
        system.spawnParticles();
        REQUIRE(system.particleCount() == 0);
        runFrames(system, 60);
        REQUIRE(system.stats().emitted == 0);
    }
}

TEST_CASE("spawnParticles is idempotent", "[particle_system]") {
    HostDevice device;

    SECTION("burst") {
        ParticleSystem system(device, burstConfig(300));
        system.spawnParticles();
        uint32_t active = system.activeParticles();
        uint32_t count = system.particleCount();
        system.spawnParticles();
        REQUIRE(system.activeParticles() == active);
        REQUIRE(system.particleCount() == count);
    }

    SECTION("continuous, mid-emission") {
        ParticleSystem system(device, continuousConfig(30.0f, 4.0f, 2.0f));
        system.spawnParticles();
        runFrames(system, 90);
        REQUIRE(system.activeParticles() > 0);

        system.spawnParticles();
        uint32_t count = system.particleCount();
        REQUIRE(system.activeParticles() == 0);
        REQUIRE(system.currentEmissionTime() == 0.0f);

        system.spawnParticles();
        REQUIRE(system.activeParticles() == 0);
        REQUIRE(system.particleCount() == count);
        REQUIRE(system.isEmitting());
    }
}

TEST_CASE("Readback compaction", "[particle_system][compaction]") {
    HostDevice device;

    SECTION("burst particles are removed as they die") {
        ParticleSystem system(device, burstConfig(200, 0.5f));
        system.setReadbackInterval(1);
        system.spawnParticles();

        for (int i = 0; i < 120; ++i) {
            system.updateParticles(kFrame);
            // Every survivor in the host copy is still alive
            for (uint32_t slot = 0; slot < system.activeParticles(); ++slot) {
                REQUIRE(system.buffers().age(slot) < system.buffers().lifetime(slot));
            }
        }

        REQUIRE(system.activeParticles() == 0);
        REQUIRE(system.stats().compacted == 200);
        REQUIRE(system.stats().respawned == 0);
        REQUIRE(system.stats().readbacksCompleted > 0);
        REQUIRE(system.state() == EmissionState::Idle);
    }

    SECTION("dead particles are respawned in place while emitting") {
        ParticleSystem system(device, continuousConfig(60.0f, 3.0f, 0.5f));
        system.setReadbackInterval(1);
        system.spawnParticles();
        runFrames(system, 120);

        REQUIRE(system.isEmitting());
        REQUIRE(system.stats().respawned > 0);
        REQUIRE(system.activeParticles() <= system.particleCount());
    }

    SECTION("readbacks follow the configured interval") {
        ParticleSystem system(device, burstConfig(10));
        system.setReadbackInterval(30);
        system.spawnParticles();
        runFrames(system, 95);
        REQUIRE(system.stats().readbacksCompleted == 3);
    }

    SECTION("readback interval is clamped") {
        ParticleSystem system(device, burstConfig(10));
        system.setReadbackInterval(0);
        REQUIRE(system.readbackInterval() == kMinReadbackInterval);
        system.setReadbackInterval(100000);
        REQUIRE(system.readbackInterval() == kMaxReadbackInterval);
    }

    SECTION("a readback that lands after a respawn is discarded") {
        ParticleSystem system(device, burstConfig(50));
        system.setReadbackInterval(1);
        system.spawnParticles();
        system.updateParticles(kFrame);   // requests a readback
        system.spawnParticles();
        system.updateParticles(kFrame);   // stale result arrives

        REQUIRE(system.stats().readbacksDiscarded == 1);
        REQUIRE(system.activeParticles() == 50);
    }
}

TEST_CASE("Compaction with late readbacks keeps survivors current", "[particle_system][compaction]") {
    DelayedReadbackDevice device;
    ParticleSystem system(device, burstConfig(200, 0.5f));
    system.setReadbackInterval(1);
    system.spawnParticles();
    const HostBackend& backend = hostBackend(system);

    for (int frame = 0; frame < 60; ++frame) {
        system.updateParticles(kFrame);

        // Every burst particle was born at t=0, so a live slot whose device
        // age trails the step count was rewritten from an older snapshot.
        // Dead slots stop aging; only slots refilled by a swap may trail.
        float expected = static_cast<float>(backend.dispatchCount()) * backend.physicsParams()[0];
        uint64_t trailing = 0;
        for (uint32_t slot = 0; slot < system.activeParticles(); ++slot) {
            float age = backend.particles()[slot * kFloatsPerParticle + 6];
            float lifetime = backend.particles()[slot * kFloatsPerParticle + 7];
            if (age < lifetime && age < expected - 0.5f * kFrame) {
                trailing++;
            }
        }
        REQUIRE(trailing <= system.stats().compacted);
    }

    REQUIRE(system.stats().compacted > 0);
    REQUIRE(system.stats().readbacksCompleted > 0);
}

TEST_CASE("Readback failure leaves particles untouched", "[particle_system][errors]") {
    FailingReadbackDevice device;
    ParticleSystem system(device, burstConfig(100, 0.1f));
    std::vector<std::string> notices;
    system.setNoticeHandler([&](const std::string& message) { notices.push_back(message); });
    system.setReadbackInterval(1);
    system.spawnParticles();

    runFrames(system, 60);

    REQUIRE(system.activeParticles() == 100);
    REQUIRE(system.stats().readbacksFailed > 0);
    REQUIRE(system.stats().compacted == 0);

    // One notice for the whole run of failures
    REQUIRE(system.stats().readbacksFailed > 1);
    REQUIRE(notices.size() == 1);
}

TEST_CASE("Backend that never becomes ready", "[particle_system][errors]") {
    StalledDevice device;
    ParticleSystem system(device, continuousConfig(30.0f, 5.0f, 2.0f));
    system.spawnParticles();

    runFrames(system, 60);

    // Emission bookkeeping continues without physics
    REQUIRE(system.stats().emitted > 0);
    REQUIRE(system.activeParticles() > 0);
    REQUIRE(system.stats().physicsSteps == 0);
    REQUIRE(system.stats().readbacksCompleted == 0);
    REQUIRE(hostBackend(system).dispatchCount() == 0);
}

TEST_CASE("Config hooks", "[particle_system][hooks]") {
    HostDevice device;
    ParticleSystem system(device, burstConfig(20));
    system.spawnParticles();

    SECTION("bloom intensity is pushed to the backend") {
        system.config().bloomIntensity = 3.0f;
        system.onBloomIntensityChange();
        REQUIRE(hostBackend(system).bloom()[0] == 3.0f);
    }

    SECTION("appearance change updates the block and recolors live particles") {
        const glm::vec3 green(0.0f, 1.0f, 0.0f);
        system.config().particleColor = green;
        system.config().particleSize = 0.9f;
        system.onAppearanceChange();
        REQUIRE(hostBackend(system).appearance()[2] == 0.9f);

        // Requested on the next frame, applied when it lands
        runFrames(system, 2);
        const std::vector<float>& gpu = hostBackend(system).particles();
        for (uint32_t i = 0; i < system.activeParticles(); ++i) {
            REQUIRE(system.buffers().color(i) == green);
            REQUIRE(glm::vec3(gpu[i * kFloatsPerParticle + 3], gpu[i * kFloatsPerParticle + 4],
                              gpu[i * kFloatsPerParticle + 5]) == green);
        }

        // Later readbacks copy the new color back
        runFrames(system, 70);
        REQUIRE(system.stats().readbacksCompleted >= 2);
        REQUIRE(system.buffers().color(0) == green);
    }

    SECTION("speed change rescales live velocities") {
        system.config().particleSpeed = 2.0f;
        system.onSpeedChange();
        for (uint32_t i = 0; i < system.activeParticles(); ++i) {
            REQUIRE_THAT(glm::length(system.buffers().velocity(i)), WithinAbs(2.0f, 0.001f));
        }
        const std::vector<float>& v = hostBackend(system).velocities();
        REQUIRE_THAT(glm::length(glm::vec3(v[0], v[1], v[2])), WithinAbs(2.0f, 0.001f));
    }

    SECTION("physics change reaches the next step") {
        system.config().gravityEnabled = true;
        system.config().gravityStrength = 4.0f;
        system.onPhysicsChange();
        runFrames(system, 2);
        REQUIRE(hostBackend(system).physicsParams()[2] == 4.0f);
    }

    SECTION("respawn restarts the cycle") {
        system.config().particleCount = 40;
        system.onRespawn();
        REQUIRE(system.activeParticles() == 40);
    }
}

TEST_CASE("Particle textures", "[particle_system][texture]") {
    HostDevice device;
    ParticleSystem system(device, burstConfig(10));
    std::vector<std::string> notices;
    system.setNoticeHandler([&](const std::string& message) { notices.push_back(message); });

    SECTION("default texture is the shared white texture") {
        REQUIRE_FALSE(system.hasCustomTexture());
        REQUIRE(system.boundTexture() == device.defaultTexture());
        REQUIRE(system.boundTexture()->width() == 1);
    }

    SECTION("decoded pixels are bound and enable texturing") {
        REQUIRE(system.setTexture(io::solidImage(4, 2, 255, 0, 0, 255)));
        REQUIRE(system.hasCustomTexture());
        REQUIRE(system.boundTexture()->width() == 4);
        REQUIRE(system.config().textureEnabled);
        REQUIRE(hostBackend(system).appearance()[3] == 1.0f);

        system.clearTexture();
        REQUIRE(system.boundTexture() == device.defaultTexture());
        REQUIRE_FALSE(system.config().textureEnabled);
    }

    SECTION("a missing file is reported and the old texture kept") {
        REQUIRE(system.loadTexture("does/not/exist.png"));
        REQUIRE(system.textureLoading());
        REQUIRE_FALSE(system.pollTexture(true));
        REQUIRE_FALSE(system.textureLoading());
        REQUIRE_FALSE(system.hasCustomTexture());
        REQUIRE(notices.size() == 1);
    }

    SECTION("empty image is refused") {
        REQUIRE_FALSE(system.setTexture(io::ImageData{}));
        REQUIRE_FALSE(notices.empty());
    }
}

TEST_CASE("Dispose releases the system", "[particle_system]") {
    HostDevice device;
    ParticleSystem system(device, burstConfig(10));
    system.spawnParticles();
    system.dispose();

    REQUIRE(system.isDisposed());
    REQUIRE(system.activeParticles() == 0);

    // Further calls are harmless
    system.updateParticles(kFrame);
    system.spawnParticles();
    system.onAppearanceChange();
    system.dispose();
    REQUIRE(system.activeParticles() == 0);
}
