#pragma once

#include <array>
#include <memory>

#include <nlohmann/json_fwd.hpp>

#include "VssTypes.h"

enum class RewardMode
{
    Stratified,
    Legacy
};

class RewardAggregator
{
public:
    virtual ~RewardAggregator() = default;

    virtual RewardMode GetMode() const = 0;
    // Number of floats written by Aggregate: 4 stratified, 1 legacy
    virtual int GetRewardDim() const = 0;
    virtual void Aggregate(const VectorReward& components, float* out) const = 0;
};

class StratifiedRewardAggregator final : public RewardAggregator
{
public:
    RewardMode GetMode() const override { return RewardMode::Stratified; }
    int GetRewardDim() const override { return static_cast<int>(REWARD_VECTOR_DIM); }
    void Aggregate(const VectorReward& components, float* out) const override;
};

class LegacyRewardAggregator final : public RewardAggregator
{
public:
    explicit LegacyRewardAggregator(const std::array<float, REWARD_VECTOR_DIM>& weights) : mWeights(weights) {}

    RewardMode GetMode() const override { return RewardMode::Legacy; }
    int GetRewardDim() const override { return 1; }
    void Aggregate(const VectorReward& components, float* out) const override;

private:
    std::array<float, REWARD_VECTOR_DIM> mWeights;
};

std::unique_ptr<RewardAggregator> MakeRewardAggregator(RewardMode mode,
                                                       const std::array<float, REWARD_VECTOR_DIM>& legacyWeights);

// Running per-episode totals. Always fed the unweighted components plus the
// legacy-equivalent scalar, whatever the reward mode.
struct EpisodeAccumulator
{
    float rewardMove = 0.0f;
    float rewardBallGrad = 0.0f;
    float rewardEnergy = 0.0f;
    float rewardGoal = 0.0f;
    float originalReward = 0.0f;
    int goalsBlue = 0;
    int goalsYellow = 0;
    int steps = 0;

    void Add(const VectorReward& components, float legacyScalar)
    {
        rewardMove += components.move;
        rewardBallGrad += components.ballGrad;
        rewardEnergy += components.energy;
        rewardGoal += components.goal;
        originalReward += legacyScalar;
        if (components.goal > 0.0f) goalsBlue++;
        if (components.goal < 0.0f) goalsYellow++;
        steps++;
    }
};

struct StepInfo
{
    EpisodeAccumulator totals;
    VectorReward components;      // this step, unweighted
    float originalStepReward = 0.0f;
    int goalBlue = 0;
    int goalYellow = 0;
    int step = 0;
    bool truncated = false;

    nlohmann::json ToJson() const;
};
