#pragma once

#include "Config.h"
#include "VssTypes.h"

struct RewardStep
{
    VectorReward reward;
    bool done = false;
};

// Per-step reward components for blue robot 0, computed from the current
// frame, the previous frame (nullptr right after reset) and the command last
// sent to that robot. Holds no state between calls.
class RewardDecomposer
{
public:
    RewardDecomposer(const FieldParams& field, const RewardConfig& config);

    RewardStep Compute(const Frame& frame, const Frame* lastFrame, const RobotCommand& learnerCommand) const;

    float GoalReward(const Frame& frame) const;
    float MoveReward(const Frame& frame) const;
    float BallGradReward(const Frame& frame, const Frame& lastFrame) const;
    float EnergyPenalty(const RobotCommand& learnerCommand) const;

private:
    FieldParams mField;
    RewardConfig mConfig;
};
