#include "RewardDecomposer.h"

#include <cmath>
#include <stdexcept>

RewardDecomposer::RewardDecomposer(const FieldParams& field, const RewardConfig& config)
    : mField(field), mConfig(config)
{
    if (mConfig.moveScale <= 0.0f || mConfig.gradScale <= 0.0f || mConfig.energyScale <= 0.0f) {
        throw std::invalid_argument("RewardDecomposer: reward scales must be > 0");
    }
}

RewardStep RewardDecomposer::Compute(const Frame& frame, const Frame* lastFrame,
                                     const RobotCommand& learnerCommand) const
{
    RewardStep step;

    step.reward.goal = GoalReward(frame);
    if (step.reward.goal != 0.0f) {
        // No shaping on the terminal frame
        step.done = true;
        return step;
    }

    if (lastFrame != nullptr) {
        step.reward.move = MoveReward(frame);
        step.reward.ballGrad = BallGradReward(frame, *lastFrame);
    }
    step.reward.energy = EnergyPenalty(learnerCommand);
    return step;
}

float RewardDecomposer::GoalReward(const Frame& frame) const
{
    if (frame.ball.x > mField.HalfLength()) return 1.0f;
    if (frame.ball.x < -mField.HalfLength()) return -1.0f;
    return 0.0f;
}

float RewardDecomposer::MoveReward(const Frame& frame) const
{
    if (frame.robotsBlue.empty()) {
        throw std::invalid_argument("RewardDecomposer: frame has no learning robot");
    }
    const RobotState& robot = frame.robotsBlue[0];

    const float dx = frame.ball.x - robot.x;
    const float dy = frame.ball.y - robot.y;
    const float dist = std::hypot(dx, dy);
    if (dist == 0.0f) return 0.0f;

    // Projection of the robot velocity onto the robot -> ball direction
    const float move = (dx / dist) * robot.vx + (dy / dist) * robot.vy;
    return move / mConfig.moveScale;
}

float RewardDecomposer::BallGradReward(const Frame& frame, const Frame& lastFrame) const
{
    const float goalX = mField.HalfLength();
    const float goalY = 0.0f;

    const float lastBallDist = Distance2D(lastFrame.ball.x, lastFrame.ball.y, goalX, goalY);
    const float ballDist = Distance2D(frame.ball.x, frame.ball.y, goalX, goalY);

    return (lastBallDist - ballDist) / mConfig.gradScale;
}

float RewardDecomposer::EnergyPenalty(const RobotCommand& learnerCommand) const
{
    const float penalty = -(std::abs(learnerCommand.vWheel0) + std::abs(learnerCommand.vWheel1));
    return penalty / mConfig.energyScale;
}
