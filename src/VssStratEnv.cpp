#include "VssStratEnv.h"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {
ActuatorParams MakeActuatorParams(const Config& config)
{
    ActuatorParams params;
    params.maxV = config.field.MaxWheelSpeed();
    params.deadzone = config.robot.wheelDeadzone;
    params.wheelRadius = config.field.rbtWheelRadius;
    return params;
}
} // namespace

const Config& VssStratEnv::ValidateConfig(const Config& config)
{
    if (config.env.nRobotsBlue < 1) {
        throw std::invalid_argument("VssStratEnv: n_robots_blue must be >= 1 (blue 0 is the learning robot)");
    }
    if (config.env.nRobotsYellow < 0) {
        throw std::invalid_argument("VssStratEnv: n_robots_yellow must be >= 0");
    }
    if (config.env.timeStep <= 0.0f) {
        throw std::invalid_argument("VssStratEnv: time_step must be > 0");
    }
    if (config.env.maxEpisodeSteps < 0) {
        throw std::invalid_argument("VssStratEnv: max_episode_steps must be >= 0");
    }
    if (config.field.rbtWheelRadius <= 0.0f || config.field.rbtMotorMaxRpm <= 0.0f) {
        throw std::invalid_argument("VssStratEnv: wheel radius and motor rpm must be > 0");
    }
    return config;
}

VssStratEnv::VssStratEnv(const Config& config, std::unique_ptr<Simulator> simulator)
    : mConfig(ValidateConfig(config)),
      mSimulator(std::move(simulator)),
      mActuator(MakeActuatorParams(mConfig)),
      mSampler(mConfig.field, mConfig.placement),
      mNoisePool(mConfig.env.nRobotsBlue, mConfig.env.nRobotsYellow, mConfig.noise, mConfig.env.timeStep,
                 mConfig.env.seed),
      mEncoder(NormScales::FromField(mConfig.field), mConfig.env.nRobotsBlue, mConfig.env.nRobotsYellow),
      mDecomposer(mConfig.field, mConfig.reward),
      mAggregator(MakeRewardAggregator(mConfig.env.stratified ? RewardMode::Stratified : RewardMode::Legacy,
                                       mConfig.reward.legacyWeights)),
      mRng(mConfig.env.seed)
{
    if (!mSimulator) {
        throw std::invalid_argument("VssStratEnv: simulator is null");
    }
    // Goal lines and placement bounds must match the field the physics runs on
    if (!mSimulator->GetField().SameGeometry(mConfig.field)) {
        throw std::invalid_argument("VssStratEnv: simulator field (length " +
                                    std::to_string(mSimulator->GetField().length) +
                                    ") does not match configured field (length " +
                                    std::to_string(mConfig.field.length) + ")");
    }

    std::cout << "[VssStratEnv] initialized: " << mConfig.env.nRobotsBlue << "v" << mConfig.env.nRobotsYellow
              << ", obs_dim=" << GetObservationDim()
              << ", reward=" << (mConfig.env.stratified ? "stratified" : "legacy") << std::endl;
}

std::vector<float> VssStratEnv::Reset()
{
    mSentCommands.clear();
    mAccumulator.reset();
    mLastFrame.reset();
    mNoisePool.Reset();
    mStepCount = 0;

    const Frame placement = mSampler.Sample(mConfig.env.nRobotsBlue, mConfig.env.nRobotsYellow, mRng);
    mSimulator->Reset(placement);
    mFrame = std::make_shared<const Frame>(mSimulator->GetFrame());

    mState = EpisodeState::Running;
    return mEncoder.Encode(*mFrame);
}

std::vector<RobotCommand> VssStratEnv::BuildCommands(const std::vector<float>& action)
{
    std::vector<RobotCommand> commands;
    commands.reserve(mConfig.env.nRobotsBlue + mConfig.env.nRobotsYellow);

    commands.push_back(MakeCommand(false, 0, action.data(), mActuator));

    // Noise-driven teammates and opponents
    for (int i = 1; i < mConfig.env.nRobotsBlue; ++i) {
        const Action a = mNoisePool.SampleBlue(i);
        commands.push_back(MakeCommand(false, i, a.data(), mActuator));
    }
    for (int i = 0; i < mConfig.env.nRobotsYellow; ++i) {
        const Action a = mNoisePool.SampleYellow(i);
        commands.push_back(MakeCommand(true, i, a.data(), mActuator));
    }
    return commands;
}

StepResult VssStratEnv::Step(const std::vector<float>& action)
{
    if (mState == EpisodeState::Uninitialized) {
        throw std::logic_error("VssStratEnv::Step called before Reset");
    }
    if (mState == EpisodeState::Done) {
        throw std::logic_error("VssStratEnv::Step called on a finished episode; call Reset first");
    }
    ValidateAction(action);

    std::vector<RobotCommand> commands = BuildCommands(action);

    try {
        mSimulator->SendCommands(commands);
        mSentCommands = std::move(commands);

        // No previous frame on the first step after reset
        mLastFrame = (mStepCount == 0) ? nullptr : mFrame;
        mFrame = std::make_shared<const Frame>(mSimulator->GetFrame());
    } catch (const std::exception& e) {
        std::cerr << "[VssStratEnv] simulator failure at step " << mStepCount << ": " << e.what() << std::endl;
        mState = EpisodeState::Done;
        throw;
    }
    mStepCount++;

    if (!mAccumulator) {
        mAccumulator = std::make_unique<EpisodeAccumulator>();
    }

    const RewardStep rewardStep = mDecomposer.Compute(*mFrame, mLastFrame.get(), mSentCommands[0]);
    const float originalReward = rewardStep.reward.Dot(mConfig.reward.legacyWeights);
    mAccumulator->Add(rewardStep.reward, originalReward);

    StepResult result;
    result.reward.resize(mAggregator->GetRewardDim());
    mAggregator->Aggregate(rewardStep.reward, result.reward.data());
    result.observation = mEncoder.Encode(*mFrame);
    result.done = rewardStep.done;
    result.truncated = !result.done && mConfig.env.maxEpisodeSteps > 0 && mStepCount >= mConfig.env.maxEpisodeSteps;

    result.info.totals = *mAccumulator;
    result.info.components = rewardStep.reward;
    result.info.originalStepReward = originalReward;
    result.info.goalBlue = rewardStep.reward.goal == 1.0f ? 1 : 0;
    result.info.goalYellow = rewardStep.reward.goal == -1.0f ? 1 : 0;
    result.info.step = mStepCount;
    result.info.truncated = result.truncated;

    if (mConfig.debug.logRewards) {
        std::cout << "[VssStratEnv] step " << mStepCount
                  << " move=" << rewardStep.reward.move
                  << " grad=" << rewardStep.reward.ballGrad
                  << " energy=" << rewardStep.reward.energy
                  << " goal=" << rewardStep.reward.goal
                  << " original=" << originalReward << std::endl;
    }

    if (result.done || result.truncated) {
        mState = EpisodeState::Done;
    }
    return result;
}
