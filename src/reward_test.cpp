#include <array>
#include <cmath>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "RewardAggregator.h"
#include "RewardDecomposer.h"
#include "TestCheck.h"

static Frame OneRobotFrame(float ballX, float ballY, float robotX, float robotY, float robotVx, float robotVy)
{
    Frame frame;
    frame.ball.x = ballX;
    frame.ball.y = ballY;
    RobotState r;
    r.x = robotX;
    r.y = robotY;
    r.vx = robotVx;
    r.vy = robotVy;
    frame.robotsBlue.push_back(r);
    return frame;
}

static RobotCommand Wheels(float left, float right)
{
    RobotCommand cmd;
    cmd.vWheel0 = left;
    cmd.vWheel1 = right;
    return cmd;
}

static void TestGoalShortCircuits()
{
    const FieldParams field;
    const RewardDecomposer decomposer(field, RewardConfig{});

    const Frame last = OneRobotFrame(0.7f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f);
    const Frame scored = OneRobotFrame(field.HalfLength() + 0.01f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f);
    const RewardStep blue = decomposer.Compute(scored, &last, Wheels(40.0f, 40.0f));
    CHECK(blue.done);
    CHECK(blue.reward.goal == 1.0f);
    CHECK(blue.reward.move == 0.0f);
    CHECK(blue.reward.ballGrad == 0.0f);
    CHECK(blue.reward.energy == 0.0f);

    const Frame conceded = OneRobotFrame(-field.HalfLength() - 0.01f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f);
    const RewardStep yellow = decomposer.Compute(conceded, &last, Wheels(40.0f, 40.0f));
    CHECK(yellow.done);
    CHECK(yellow.reward.goal == -1.0f);
    CHECK(yellow.reward.move == 0.0f);
    CHECK(yellow.reward.ballGrad == 0.0f);
    CHECK(yellow.reward.energy == 0.0f);

    // Exactly on the line is not a goal
    const Frame onLine = OneRobotFrame(field.HalfLength(), 0.0f, 0.0f, 0.0f, 0.0f, 0.0f);
    CHECK(decomposer.GoalReward(onLine) == 0.0f);
}

static void TestFirstStepHasNoShaping()
{
    const RewardDecomposer decomposer(FieldParams{}, RewardConfig{});
    const Frame frame = OneRobotFrame(0.2f, 0.1f, 0.0f, 0.0f, 0.5f, 0.2f);

    const RewardStep step = decomposer.Compute(frame, nullptr, Wheels(10.0f, -20.0f));
    CHECK(!step.done);
    CHECK(step.reward.move == 0.0f);
    CHECK(step.reward.ballGrad == 0.0f);
    CHECK(step.reward.goal == 0.0f);
    CHECK_NEAR(step.reward.energy, -30.0f / 40000.0f, 1e-9);
}

static void TestMoveReward()
{
    const RewardConfig config;
    const RewardDecomposer decomposer(FieldParams{}, config);

    // Ball straight ahead on +x, robot moving toward it at 0.6 m/s
    const Frame toward = OneRobotFrame(0.5f, 0.0f, 0.0f, 0.0f, 0.6f, 0.0f);
    CHECK_NEAR(decomposer.MoveReward(toward), 0.6f / config.moveScale, 1e-7);

    // Moving away is negative, perpendicular is zero
    const Frame away = OneRobotFrame(0.5f, 0.0f, 0.0f, 0.0f, -0.6f, 0.0f);
    CHECK(decomposer.MoveReward(away) < 0.0f);
    const Frame sideways = OneRobotFrame(0.5f, 0.0f, 0.0f, 0.0f, 0.0f, 0.6f);
    CHECK_NEAR(decomposer.MoveReward(sideways), 0.0, 1e-9);

    // Robot on top of the ball
    const Frame overlap = OneRobotFrame(0.1f, 0.1f, 0.1f, 0.1f, 0.6f, 0.0f);
    CHECK(decomposer.MoveReward(overlap) == 0.0f);

    Frame noRobots;
    CHECK_THROWS(decomposer.MoveReward(noRobots), std::invalid_argument);
}

static void TestBallGradReward()
{
    const FieldParams field;
    const RewardConfig config;
    const RewardDecomposer decomposer(field, config);

    const Frame last = OneRobotFrame(0.0f, 0.0f, -0.3f, 0.0f, 0.0f, 0.0f);
    const Frame closer = OneRobotFrame(0.1f, 0.0f, -0.3f, 0.0f, 0.0f, 0.0f);
    const Frame farther = OneRobotFrame(-0.1f, 0.0f, -0.3f, 0.0f, 0.0f, 0.0f);

    CHECK_NEAR(decomposer.BallGradReward(closer, last), 0.1f / config.gradScale, 1e-6);
    CHECK_NEAR(decomposer.BallGradReward(farther, last), -0.1f / config.gradScale, 1e-6);
    CHECK(decomposer.BallGradReward(last, last) == 0.0f);
}

static void TestEnergyPenalty()
{
    const RewardDecomposer decomposer(FieldParams{}, RewardConfig{});
    CHECK(decomposer.EnergyPenalty(Wheels(0.0f, 0.0f)) == 0.0f);
    CHECK_NEAR(decomposer.EnergyPenalty(Wheels(46.0f, -46.0f)), -92.0f / 40000.0f, 1e-9);
    CHECK(decomposer.EnergyPenalty(Wheels(-5.0f, 3.0f)) < 0.0f);
}

static void TestInvalidScales()
{
    RewardConfig config;
    config.gradScale = 0.0f;
    CHECK_THROWS((void)RewardDecomposer(FieldParams{}, config), std::invalid_argument);
}

static void TestAggregators()
{
    VectorReward components;
    components.move = 0.004f;
    components.ballGrad = -0.02f;
    components.energy = -0.001f;
    components.goal = 0.0f;

    const std::array<float, REWARD_VECTOR_DIM> weights = RewardConfig{}.legacyWeights;

    auto stratified = MakeRewardAggregator(RewardMode::Stratified, weights);
    CHECK(stratified->GetMode() == RewardMode::Stratified);
    CHECK(stratified->GetRewardDim() == 4);
    float vec[4] = {};
    stratified->Aggregate(components, vec);
    CHECK(vec[REWARD_MOVE] == components.move);
    CHECK(vec[REWARD_BALL_GRAD] == components.ballGrad);
    CHECK(vec[REWARD_ENERGY] == components.energy);
    CHECK(vec[REWARD_GOAL] == components.goal);

    auto legacy = MakeRewardAggregator(RewardMode::Legacy, weights);
    CHECK(legacy->GetMode() == RewardMode::Legacy);
    CHECK(legacy->GetRewardDim() == 1);
    float scalar = 0.0f;
    legacy->Aggregate(components, &scalar);
    CHECK(scalar == components.Dot(weights));
    CHECK_NEAR(scalar, 0.66 * 0.004 + 0.32 * -0.02 + 0.0053 * -0.001, 1e-7);
}

static void TestAccumulatorAndInfo()
{
    EpisodeAccumulator acc;
    VectorReward a;
    a.move = 0.001f;
    a.ballGrad = 0.01f;
    a.energy = -0.002f;
    VectorReward b;
    b.goal = 1.0f;
    VectorReward c;
    c.goal = -1.0f;

    acc.Add(a, 0.5f);
    acc.Add(b, 0.008f);
    acc.Add(c, -0.008f);
    CHECK(acc.steps == 3);
    CHECK(acc.goalsBlue == 1);
    CHECK(acc.goalsYellow == 1);
    CHECK(acc.rewardMove == a.move);
    CHECK(acc.rewardGoal == 0.0f);
    CHECK_NEAR(acc.originalReward, 0.5, 1e-6);

    StepInfo info;
    info.totals = acc;
    info.components = c;
    info.goalYellow = 1;
    info.step = 3;
    const nlohmann::json j = info.ToJson();
    CHECK(j.at("goal_yellow").get<int>() == 1);
    CHECK(j.at("goal_blue").get<int>() == 0);
    CHECK(j.at("goals_blue").get<int>() == 1);
    CHECK(j.at("step").get<int>() == 3);
    CHECK(j.at("step_components").size() == REWARD_VECTOR_DIM);
    CHECK(j.at("TimeLimit.truncated").get<bool>() == false);
    CHECK(j.contains("Original_reward"));
    CHECK(j.contains("reward_move"));
    CHECK(j.contains("reward_ball_grad"));
    CHECK(j.contains("reward_energy"));
    CHECK(j.contains("reward_goal"));
}

int main()
{
    TestGoalShortCircuits();
    TestFirstStepHasNoShaping();
    TestMoveReward();
    TestBallGradReward();
    TestEnergyPenalty();
    TestInvalidScales();
    TestAggregators();
    TestAccumulatorAndInfo();
    return TestExitCode("reward_test");
}
