#pragma once

// Ember - Main Header
// Include this for the whole simulation API

#include <ember/emission_config.h>
#include <ember/emitter.h>
#include <ember/gpu_backend.h>
#include <ember/host_backend.h>
#include <ember/webgpu_backend.h>
#include <ember/particle_buffers.h>
#include <ember/physics_engine.h>
#include <ember/particle_system.h>
#include <ember/particle_system_manager.h>
#include <ember/scene.h>
#include <ember/io/image_loader.h>
