#pragma once

#include <array>
#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "VssTypes.h"

struct RobotConfig {
    float wheelDeadzone = 0.05f;      // m/s, scaled commands below this become 0
};

struct RewardConfig {
    float moveScale = 120.0f;
    float gradScale = 0.75f;
    float energyScale = 40000.0f;
    // Legacy scalar reward = components . legacyWeights
    std::array<float, REWARD_VECTOR_DIM> legacyWeights = {0.6600f, 0.3200f, 0.0053f, 0.0080f};
    // Per-component bounds reported to stratified consumers
    std::array<float, REWARD_VECTOR_DIM> rMin = {0.0f, 0.0f, -2.0f, 0.0f};
    std::array<float, REWARD_VECTOR_DIM> rMax = {0.5f, 1.0f, -1.0f, 1.0f};
};

struct PlacementConfig {
    float minDist = 0.1f;
    float margin = 0.1f;
    int maxAttemptsPerEntity = 10000;
};

struct NoiseConfig {
    float theta = 0.17f;
    float sigma = 0.5f;
    float mu = 0.0f;
};

struct EnvConfig {
    int nRobotsBlue = 3;
    int nRobotsYellow = 3;
    bool stratified = true;
    float timeStep = 0.025f;
    int maxEpisodeSteps = 1200;     // 30 s match time, 0 disables the limit
    uint32_t seed = 42;
};

struct PhysicsConfig {
    int collisionSteps = 2;
    int workerThreads = 1;
    float ballMass = 0.046f;
    float ballLinearDamping = 0.35f;
    float robotMass = 0.18f;
    float wallRestitution = 0.6f;
};

struct DebugConfig {
    bool logRewards = false;        // Per-step reward lines on stdout
};

struct Config {
    FieldParams field;
    RobotConfig robot;
    RewardConfig reward;
    PlacementConfig placement;
    NoiseConfig noise;
    EnvConfig env;
    PhysicsConfig physics;
    DebugConfig debug;
};

// Load JSON config into global cached struct. Returns false if file missing/unreadable.
bool LoadConfig(const std::string& path);

// Overlay the keys present in `j` onto `config`. Returns false on a parse error.
bool LoadConfigFromJson(const nlohmann::json& j, Config& config);

// Access cached config (read-only after LoadConfig).
const Config& GetConfig();
