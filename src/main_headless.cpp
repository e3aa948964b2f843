// STRICT REQUIREMENT: Jolt.h must be included first
#include <Jolt/Jolt.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ActorNoisePool.h"
#include "Config.h"
#include "JoltSimulator.h"
#include "VectorizedEnv.h"

struct RunConfig {
    std::string configPath = "config/vss_config.json";
    int numEnvs = 1;
    int episodes = 10;
    bool forceLegacy = false;
    bool idle = false;          // learning robot sends [0, 0]
    int seed = -1;
};

static void PrintUsage(const char* prog)
{
    std::cout << "Usage: " << prog << " [--config path] [--envs N] [--episodes N] [--legacy] [--idle] [--seed S]"
              << std::endl;
}

int main(int argc, char* argv[]) {
    RunConfig run;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                run.configPath = argv[++i];
            } else if (arg == "--envs" && i + 1 < argc) {
                run.numEnvs = std::stoi(argv[++i]);
            } else if (arg == "--episodes" && i + 1 < argc) {
                run.episodes = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                run.seed = std::stoi(argv[++i]);
            } else if (arg == "--legacy") {
                run.forceLegacy = true;
            } else if (arg == "--idle") {
                run.idle = true;
            } else if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "[MAIN] Unknown argument: " << arg << std::endl;
                PrintUsage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] Invalid argument value: " << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 2;
    }

    // Load runtime configuration (defaults if missing)
    if (!LoadConfig(run.configPath)) {
        std::cout << "[MAIN] Running with built-in defaults" << std::endl;
    }
    Config config = GetConfig();
    if (run.forceLegacy) config.env.stratified = false;
    if (run.seed >= 0) config.env.seed = static_cast<uint32_t>(run.seed);

    std::cout << "========================================" << std::endl;
    std::cout << "[MAIN] VSS stratified environment runner" << std::endl;
    std::cout << "  envs=" << run.numEnvs << " episodes=" << run.episodes
              << " reward=" << (config.env.stratified ? "stratified" : "legacy")
              << " seed=" << config.env.seed << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        VectorizedEnv vecEnv(run.numEnvs, config, [](const Config& c) -> std::unique_ptr<Simulator> {
            return std::make_unique<JoltSimulator>(c);
        });

        const int actionDim = vecEnv.GetActionDim();
        std::vector<float> actions(run.numEnvs * actionDim, 0.0f);

        // The learning robot is driven by the same correlated noise as the others
        std::vector<OrnsteinUhlenbeckAction> policies;
        for (int i = 0; i < run.numEnvs; ++i) {
            policies.emplace_back(config.noise, config.env.timeStep, config.env.seed + 7919u * (i + 1));
        }

        vecEnv.Reset();

        int finishedEpisodes = 0;
        long totalSteps = 0;
        auto startTime = std::chrono::high_resolution_clock::now();

        while (finishedEpisodes < run.episodes) {
            for (int e = 0; e < run.numEnvs; ++e) {
                if (run.idle) continue;
                const Action a = policies[e].Sample();
                actions[e * actionDim] = a[0];
                actions[e * actionDim + 1] = a[1];
            }

            vecEnv.Step(actions);
            totalSteps += run.numEnvs;

            const auto& dones = vecEnv.GetDones();
            const auto& infos = vecEnv.GetInfos();
            for (int e = 0; e < run.numEnvs; ++e) {
                if (!dones[e]) continue;
                finishedEpisodes++;
                policies[e].Reset();

                nlohmann::json line = infos[e].ToJson();
                line["env"] = e;
                line["episode"] = finishedEpisodes;
                std::cout << "[EPISODE] " << line.dump() << std::endl;
            }
            vecEnv.ResetDoneEnvs();
        }

        auto endTime = std::chrono::high_resolution_clock::now();
        const double seconds = std::chrono::duration<double>(endTime - startTime).count();
        std::cout << "[MAIN] " << finishedEpisodes << " episodes, " << totalSteps << " steps in " << seconds
                  << " s (" << (seconds > 0.0 ? totalSteps / seconds : 0.0) << " SPS)" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
