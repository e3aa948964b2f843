#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

constexpr size_t ACTION_DIM = 2;          // left, right wheel (%)
constexpr size_t REWARD_VECTOR_DIM = 4;   // move, ball_grad, energy, goal
constexpr float NORM_BOUNDS = 1.25f;

constexpr float DEG_TO_RAD = 3.14159265358979323846f / 180.0f;
constexpr float RAD_TO_DEG = 180.0f / 3.14159265358979323846f;

// Reward component order is part of the contract: weight vectors and
// stratified consumers index by position.
enum RewardComponent : size_t
{
    REWARD_MOVE = 0,
    REWARD_BALL_GRAD = 1,
    REWARD_ENERGY = 2,
    REWARD_GOAL = 3
};

struct VectorReward
{
    float move = 0.0f;
    float ballGrad = 0.0f;
    float energy = 0.0f;
    float goal = 0.0f;

    float Dot(const std::array<float, REWARD_VECTOR_DIM>& weights) const
    {
        return move * weights[REWARD_MOVE] +
               ballGrad * weights[REWARD_BALL_GRAD] +
               energy * weights[REWARD_ENERGY] +
               goal * weights[REWARD_GOAL];
    }

    std::array<float, REWARD_VECTOR_DIM> ToArray() const
    {
        return {move, ballGrad, energy, goal};
    }
};

struct BallState
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;
};

struct RobotState
{
    bool yellow = false;
    int id = 0;
    float x = 0.0f;
    float y = 0.0f;
    float theta = 0.0f;   // degrees
    float vx = 0.0f;
    float vy = 0.0f;
    float vTheta = 0.0f;  // degrees / s
};

// One simulated timestep. Produced by the simulator, read-only afterwards.
struct Frame
{
    BallState ball;
    std::vector<RobotState> robotsBlue;
    std::vector<RobotState> robotsYellow;
};

using FramePtr = std::shared_ptr<const Frame>;

struct RobotCommand
{
    bool yellow = false;
    int id = 0;
    float vWheel0 = 0.0f;  // left, rad/s
    float vWheel1 = 0.0f;  // right, rad/s
};

// VSS field geometry (field_type 0). Lengths in meters.
struct FieldParams
{
    float length = 1.5f;
    float width = 1.3f;
    float penaltyLength = 0.15f;
    float penaltyWidth = 0.7f;
    float goalWidth = 0.4f;
    float goalDepth = 0.1f;
    float ballRadius = 0.0215f;
    float rbtRadius = 0.0375f;
    float rbtWheelRadius = 0.026f;
    float rbtWheelBase = 0.08f;
    float rbtMotorMaxRpm = 440.0f;

    bool SameGeometry(const FieldParams& o) const
    {
        return length == o.length && width == o.width && penaltyLength == o.penaltyLength &&
               penaltyWidth == o.penaltyWidth && goalWidth == o.goalWidth && goalDepth == o.goalDepth &&
               ballRadius == o.ballRadius && rbtRadius == o.rbtRadius && rbtWheelRadius == o.rbtWheelRadius &&
               rbtWheelBase == o.rbtWheelBase && rbtMotorMaxRpm == o.rbtMotorMaxRpm;
    }

    float HalfLength() const { return length * 0.5f; }
    float HalfWidth() const { return width * 0.5f; }

    // Maximum linear wheel speed (m/s) reachable by the motor.
    float MaxWheelSpeed() const
    {
        return (rbtMotorMaxRpm / 60.0f) * 2.0f * 3.14159265358979323846f * rbtWheelRadius;
    }
};

inline float Distance2D(float x0, float y0, float x1, float y1)
{
    return std::hypot(x1 - x0, y1 - y0);
}
