#pragma once

#include <memory>
#include <random>
#include <vector>

#include "ActorNoisePool.h"
#include "ActuatorMapper.h"
#include "Config.h"
#include "ObservationEncoder.h"
#include "PlacementSampler.h"
#include "RewardAggregator.h"
#include "RewardDecomposer.h"
#include "Simulator.h"
#include "VssTypes.h"

struct StepResult
{
    std::vector<float> observation;
    std::vector<float> reward;     // GetRewardDim() floats
    bool done = false;             // goal scored
    bool truncated = false;        // step limit reached
    StepInfo info;
};

enum class EpisodeState
{
    Uninitialized,
    Running,
    Done
};

// Controls blue robot 0 in a VSS match; every other robot is driven by
// Ornstein-Uhlenbeck noise. One instance holds exactly one episode.
class VssStratEnv
{
public:
    VssStratEnv(const Config& config, std::unique_ptr<Simulator> simulator);
    ~VssStratEnv() = default;

    VssStratEnv(const VssStratEnv&) = delete;
    VssStratEnv& operator=(const VssStratEnv&) = delete;
    VssStratEnv(VssStratEnv&&) = default;
    VssStratEnv& operator=(VssStratEnv&&) = default;

    std::vector<float> Reset();
    StepResult Step(const std::vector<float>& action);

    EpisodeState GetState() const { return mState; }
    bool IsDone() const { return mState == EpisodeState::Done; }
    int GetStepCount() const { return mStepCount; }

    int GetObservationDim() const { return mEncoder.GetObservationDim(); }
    float GetObservationBound() const { return mEncoder.GetBound(); }
    int GetActionDim() const { return static_cast<int>(ACTION_DIM); }
    float GetActionLow() const { return -1.0f; }
    float GetActionHigh() const { return 1.0f; }
    int GetRewardDim() const { return mAggregator->GetRewardDim(); }
    RewardMode GetRewardMode() const { return mAggregator->GetMode(); }
    const std::array<float, REWARD_VECTOR_DIM>& GetRewardMin() const { return mConfig.reward.rMin; }
    const std::array<float, REWARD_VECTOR_DIM>& GetRewardMax() const { return mConfig.reward.rMax; }

    const Config& GetConfig() const { return mConfig; }
    const FramePtr& GetFrame() const { return mFrame; }
    const FramePtr& GetLastFrame() const { return mLastFrame; }
    const std::vector<RobotCommand>& GetSentCommands() const { return mSentCommands; }
    const Simulator& GetSimulator() const { return *mSimulator; }

private:
    static const Config& ValidateConfig(const Config& config);
    std::vector<RobotCommand> BuildCommands(const std::vector<float>& action);

    Config mConfig;
    std::unique_ptr<Simulator> mSimulator;
    ActuatorParams mActuator;
    PlacementSampler mSampler;
    ActorNoisePool mNoisePool;
    ObservationEncoder mEncoder;
    RewardDecomposer mDecomposer;
    std::unique_ptr<RewardAggregator> mAggregator;
    std::mt19937 mRng;

    // Per-episode state
    EpisodeState mState = EpisodeState::Uninitialized;
    FramePtr mFrame;
    FramePtr mLastFrame;
    std::vector<RobotCommand> mSentCommands;
    std::unique_ptr<EpisodeAccumulator> mAccumulator;
    int mStepCount = 0;
};
