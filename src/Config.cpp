#include "Config.h"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace {
Config gConfig{};

template <typename T>
void SetIfExists(T& field, const nlohmann::json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it != obj.end()) {
        try {
            field = it->get<T>();
        } catch (const std::exception& e) {
            std::cerr << "[Config] parse error for key '" << key << "': " << e.what() << std::endl;
        }
    }
}
} // namespace

bool LoadConfigFromJson(const nlohmann::json& j, Config& config)
{
    if (!j.is_object()) {
        std::cerr << "[Config] root must be a JSON object. Using defaults." << std::endl;
        return false;
    }

    if (j.contains("field")) {
        const auto& f = j["field"];
        SetIfExists(config.field.length, f, "length");
        SetIfExists(config.field.width, f, "width");
        SetIfExists(config.field.penaltyLength, f, "penalty_length");
        SetIfExists(config.field.penaltyWidth, f, "penalty_width");
        SetIfExists(config.field.goalWidth, f, "goal_width");
        SetIfExists(config.field.goalDepth, f, "goal_depth");
        SetIfExists(config.field.ballRadius, f, "ball_radius");
        SetIfExists(config.field.rbtRadius, f, "rbt_radius");
        SetIfExists(config.field.rbtWheelRadius, f, "rbt_wheel_radius");
        SetIfExists(config.field.rbtWheelBase, f, "rbt_wheel_base");
        SetIfExists(config.field.rbtMotorMaxRpm, f, "rbt_motor_max_rpm");
    }

    if (j.contains("robot")) {
        const auto& r = j["robot"];
        SetIfExists(config.robot.wheelDeadzone, r, "wheel_deadzone");
    }

    if (j.contains("reward")) {
        const auto& r = j["reward"];
        SetIfExists(config.reward.moveScale, r, "move_scale");
        SetIfExists(config.reward.gradScale, r, "grad_scale");
        SetIfExists(config.reward.energyScale, r, "energy_scale");
        SetIfExists(config.reward.legacyWeights, r, "legacy_weights");
        SetIfExists(config.reward.rMin, r, "r_min");
        SetIfExists(config.reward.rMax, r, "r_max");
    }

    if (j.contains("placement")) {
        const auto& p = j["placement"];
        SetIfExists(config.placement.minDist, p, "min_dist");
        SetIfExists(config.placement.margin, p, "margin");
        SetIfExists(config.placement.maxAttemptsPerEntity, p, "max_attempts_per_entity");
    }

    if (j.contains("noise")) {
        const auto& n = j["noise"];
        SetIfExists(config.noise.theta, n, "theta");
        SetIfExists(config.noise.sigma, n, "sigma");
        SetIfExists(config.noise.mu, n, "mu");
    }

    if (j.contains("env")) {
        const auto& e = j["env"];
        SetIfExists(config.env.nRobotsBlue, e, "n_robots_blue");
        SetIfExists(config.env.nRobotsYellow, e, "n_robots_yellow");
        SetIfExists(config.env.stratified, e, "stratified");
        SetIfExists(config.env.timeStep, e, "time_step");
        SetIfExists(config.env.maxEpisodeSteps, e, "max_episode_steps");
        SetIfExists(config.env.seed, e, "seed");
    }

    if (j.contains("physics")) {
        const auto& p = j["physics"];
        SetIfExists(config.physics.collisionSteps, p, "collision_steps");
        SetIfExists(config.physics.workerThreads, p, "worker_threads");
        SetIfExists(config.physics.ballMass, p, "ball_mass");
        SetIfExists(config.physics.ballLinearDamping, p, "ball_linear_damping");
        SetIfExists(config.physics.robotMass, p, "robot_mass");
        SetIfExists(config.physics.wallRestitution, p, "wall_restitution");
    }

    if (j.contains("debug")) {
        const auto& d = j["debug"];
        SetIfExists(config.debug.logRewards, d, "log_rewards");
    }

    return true;
}

bool LoadConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] unable to open " << path << ". Using defaults." << std::endl;
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        return LoadConfigFromJson(j, gConfig);
    } catch (const std::exception& e) {
        std::cerr << "[Config] parse failed: " << e.what() << ". Using defaults." << std::endl;
        return false;
    }
}

const Config& GetConfig()
{
    return gConfig;
}
