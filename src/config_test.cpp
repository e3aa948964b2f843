#include <cstdio>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "Config.h"
#include "TestCheck.h"

static void TestDefaults()
{
    const Config config;
    CHECK(config.env.nRobotsBlue == 3);
    CHECK(config.env.nRobotsYellow == 3);
    CHECK(config.env.stratified);
    CHECK(config.env.maxEpisodeSteps == 1200);
    CHECK_NEAR(config.env.timeStep, 0.025, 1e-9);
    CHECK_NEAR(config.field.length, 1.5, 1e-9);
    CHECK_NEAR(config.reward.moveScale, 120.0, 1e-9);
    CHECK_NEAR(config.reward.legacyWeights[REWARD_ENERGY], 0.0053, 1e-7);
    CHECK(config.placement.maxAttemptsPerEntity == 10000);
}

static void TestOverlayFromJson()
{
    const nlohmann::json j = nlohmann::json::parse(R"({
        "field": { "length": 2.2, "goal_width": 0.5 },
        "reward": { "move_scale": 60.0, "legacy_weights": [1.0, 0.5, 0.25, 2.0] },
        "env": { "n_robots_blue": 2, "n_robots_yellow": 0, "stratified": false, "seed": 7 },
        "placement": { "min_dist": 0.2 },
        "debug": { "log_rewards": true }
    })");

    Config config;
    CHECK(LoadConfigFromJson(j, config));
    CHECK_NEAR(config.field.length, 2.2, 1e-6);
    CHECK_NEAR(config.field.goalWidth, 0.5, 1e-6);
    CHECK_NEAR(config.field.width, 1.3, 1e-6);  // untouched
    CHECK_NEAR(config.reward.moveScale, 60.0, 1e-6);
    CHECK(config.reward.legacyWeights[REWARD_GOAL] == 2.0f);
    CHECK(config.env.nRobotsBlue == 2);
    CHECK(config.env.nRobotsYellow == 0);
    CHECK(!config.env.stratified);
    CHECK(config.env.seed == 7u);
    CHECK_NEAR(config.placement.minDist, 0.2, 1e-6);
    CHECK(config.debug.logRewards);
}

static void TestBadValuesKeepDefaults()
{
    const nlohmann::json j = nlohmann::json::parse(R"({
        "env": { "n_robots_blue": "many", "time_step": 0.05 },
        "reward": { "legacy_weights": [1.0, 2.0] }
    })");

    Config config;
    CHECK(LoadConfigFromJson(j, config));
    CHECK(config.env.nRobotsBlue == 3);
    CHECK_NEAR(config.env.timeStep, 0.05, 1e-6);
    CHECK_NEAR(config.reward.legacyWeights[REWARD_MOVE], 0.66, 1e-6);

    Config untouched;
    CHECK(!LoadConfigFromJson(nlohmann::json::array({1, 2, 3}), untouched));
}

static void TestLoadConfigFile()
{
    CHECK(!LoadConfig("this/path/does/not/exist.json"));

    const std::string path = "config_test_tmp.json";
    {
        std::ofstream out(path);
        out << R"({ "env": { "max_episode_steps": 300 }, "noise": { "sigma": 0.25 } })";
    }
    CHECK(LoadConfig(path));
    CHECK(GetConfig().env.maxEpisodeSteps == 300);
    CHECK_NEAR(GetConfig().noise.sigma, 0.25, 1e-6);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK(!LoadConfig(path));
    std::remove(path.c_str());
}

int main()
{
    TestDefaults();
    TestOverlayFromJson();
    TestBadValuesKeepDefaults();
    TestLoadConfigFile();
    return TestExitCode("config_test");
}
