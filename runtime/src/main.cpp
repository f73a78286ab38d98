// Ember Sandbox - headless frame loop
// Handles: ember-sandbox [--scene file] [--seconds N] [--backend webgpu|host] ...

#include <ember/ember.h>
#include <CLI/CLI.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#ifndef EMBER_VERSION
#define EMBER_VERSION "0.1.0"
#endif

namespace {

struct SandboxOptions {
    std::string scenePath;
    std::string savePath;
    std::string texturePath;
    std::string backend = "webgpu";
    float seconds = 5.0f;
    int fps = 60;
    uint32_t seed = ember::ParticleSystem::kDefaultSeed;
    int readbackInterval = ember::kDefaultReadbackInterval;
};

const char* stateName(ember::EmissionState state) {
    switch (state) {
        case ember::EmissionState::Idle: return "idle";
        case ember::EmissionState::Bursting: return "bursting";
        case ember::EmissionState::Emitting: return "emitting";
    }
    return "unknown";
}

void printStats(const ember::ParticleSystemManager& manager, int second) {
    std::cout << "[Sandbox] t=" << second << "s total=" << manager.totalActiveParticles() << "\n";
    for (size_t i = 0; i < manager.size(); ++i) {
        const ember::ParticleSystem* system = manager.system(static_cast<int>(i));
        const ember::ParticleStats& stats = system->stats();
        std::cout << "  " << std::left << std::setw(24) << system->config().name
                  << " active=" << system->activeParticles()
                  << " state=" << stateName(system->state())
                  << " emitted=" << stats.emitted
                  << " respawned=" << stats.respawned
                  << " compacted=" << stats.compacted
                  << " steps=" << stats.physicsSteps << "\n";
    }
}

std::unique_ptr<ember::Device> createDevice(const std::string& backend) {
    if (backend == "host") {
        return std::make_unique<ember::HostDevice>();
    }

    auto device = std::make_unique<ember::WebGpuDevice>();
    if (!device->init()) {
        std::cerr << "[Sandbox] WebGPU unavailable, continuing without physics\n";
    }
    return device;
}

int run(const SandboxOptions& options) {
    std::unique_ptr<ember::Device> device = createDevice(options.backend);

    ember::ParticleSystemManager manager(*device);
    manager.setSeed(options.seed);
    manager.setReadbackInterval(options.readbackInterval);
    manager.setNoticeHandler([](const std::string& message) {
        std::cout << "[Notice] " << message << "\n";
    });

    if (!options.scenePath.empty()) {
        ember::SceneData scene;
        std::string error;
        if (!ember::loadSceneFile(options.scenePath, scene, &error)) {
            std::cerr << "[Sandbox] " << error << "\n";
            return 1;
        }
        if (!manager.replaceAll(scene)) {
            return 1;
        }
    } else {
        manager.create();
    }

    if (!options.texturePath.empty()) {
        manager.loadTexture(manager.activeIndex(), options.texturePath);
    }

    const float dt = 1.0f / static_cast<float>(options.fps);
    const int frames = static_cast<int>(options.seconds * options.fps);

    for (int frame = 1; frame <= frames; ++frame) {
        manager.updateAll(dt);
        if (frame % options.fps == 0) {
            printStats(manager, frame / options.fps);
        }
    }

    if (!options.savePath.empty()) {
        std::string error;
        if (!ember::saveSceneFile(options.savePath, manager.toScene(), &error)) {
            std::cerr << "[Sandbox] " << error << "\n";
            return 1;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Ember - headless particle simulation sandbox"};
    app.set_version_flag("-v,--version", std::string(EMBER_VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    SandboxOptions options;
    app.add_option("-s,--scene", options.scenePath, "Scene file to load (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("-t,--seconds", options.seconds, "Simulated seconds to run")
        ->check(CLI::PositiveNumber);
    app.add_option("--fps", options.fps, "Frames per simulated second")
        ->check(CLI::Range(1, 1000));
    app.add_option("-b,--backend", options.backend, "Compute backend: webgpu, host")
        ->check(CLI::IsMember({"webgpu", "host"}));
    app.add_option("--seed", options.seed, "Random seed for the first system");
    app.add_option("-o,--save", options.savePath, "Write the final scene to this file");
    app.add_option("--texture", options.texturePath, "Texture for the active system");
    app.add_option("--readback-interval", options.readbackInterval, "Frames between compaction readbacks")
        ->check(CLI::Range(ember::kMinReadbackInterval, ember::kMaxReadbackInterval));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    return run(options);
}
