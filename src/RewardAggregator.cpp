#include "RewardAggregator.h"

#include <nlohmann/json.hpp>

void StratifiedRewardAggregator::Aggregate(const VectorReward& components, float* out) const
{
    out[REWARD_MOVE] = components.move;
    out[REWARD_BALL_GRAD] = components.ballGrad;
    out[REWARD_ENERGY] = components.energy;
    out[REWARD_GOAL] = components.goal;
}

void LegacyRewardAggregator::Aggregate(const VectorReward& components, float* out) const
{
    out[0] = components.Dot(mWeights);
}

std::unique_ptr<RewardAggregator> MakeRewardAggregator(RewardMode mode,
                                                       const std::array<float, REWARD_VECTOR_DIM>& legacyWeights)
{
    if (mode == RewardMode::Stratified) {
        return std::make_unique<StratifiedRewardAggregator>();
    }
    return std::make_unique<LegacyRewardAggregator>(legacyWeights);
}

nlohmann::json StepInfo::ToJson() const
{
    nlohmann::json j;
    j["reward_move"] = totals.rewardMove;
    j["reward_ball_grad"] = totals.rewardBallGrad;
    j["reward_energy"] = totals.rewardEnergy;
    j["reward_goal"] = totals.rewardGoal;
    j["Original_reward"] = totals.originalReward;
    j["goal_blue"] = goalBlue;
    j["goal_yellow"] = goalYellow;
    j["goals_blue"] = totals.goalsBlue;
    j["goals_yellow"] = totals.goalsYellow;
    j["step"] = step;
    j["step_components"] = components.ToArray();
    j["TimeLimit.truncated"] = truncated;
    return j;
}
