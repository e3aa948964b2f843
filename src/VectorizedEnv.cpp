#include "VectorizedEnv.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

VectorizedEnv::VectorizedEnv(int numEnvs, const Config& config, const SimulatorFactory& makeSimulator)
    : mNumEnvs(numEnvs)
{
    if (mNumEnvs <= 0) {
        throw std::invalid_argument("VectorizedEnv: numEnvs must be > 0");
    }

    std::cout << "[VectorizedEnv] Initializing " << mNumEnvs << " environments" << std::endl;
    mEnvs.reserve(mNumEnvs);
    for (int i = 0; i < mNumEnvs; ++i) {
        Config envConfig = config;
        envConfig.env.seed = config.env.seed + static_cast<uint32_t>(i);
        mEnvs.push_back(std::make_unique<VssStratEnv>(envConfig, makeSimulator(envConfig)));
    }

    mObservationDim = mEnvs[0]->GetObservationDim();
    mActionDim = mEnvs[0]->GetActionDim();
    mRewardDim = mEnvs[0]->GetRewardDim();

    mAllObservations.resize(mNumEnvs * mObservationDim, 0.0f);
    mAllRewards.resize(mNumEnvs * mRewardDim, 0.0f);
    mAllDones.resize(mNumEnvs, false);
    mAllTruncated.resize(mNumEnvs, false);
    mAllInfos.resize(mNumEnvs);
}

void VectorizedEnv::StoreObservation(int envIndex, const std::vector<float>& obs)
{
    std::copy(obs.begin(), obs.end(), mAllObservations.begin() + envIndex * mObservationDim);
}

// Zero reward and info so a finished or fresh env reports nothing for this step
void VectorizedEnv::ClearStepOutput(int envIndex)
{
    std::fill(mAllRewards.begin() + envIndex * mRewardDim, mAllRewards.begin() + (envIndex + 1) * mRewardDim, 0.0f);
    mAllInfos[envIndex] = StepInfo();
}

void VectorizedEnv::ResetEnv(int envIndex)
{
    StoreObservation(envIndex, mEnvs[envIndex]->Reset());
    ClearStepOutput(envIndex);
    mAllDones[envIndex] = false;
    mAllTruncated[envIndex] = false;
}

void VectorizedEnv::Reset(int envIndex)
{
    if (envIndex < 0)
    {
        for (int i = 0; i < mNumEnvs; ++i) ResetEnv(i);
    }
    else
    {
        if (envIndex >= mNumEnvs) {
            throw std::out_of_range("VectorizedEnv::Reset: env index " + std::to_string(envIndex));
        }
        ResetEnv(envIndex);
    }
}

void VectorizedEnv::Step(const std::vector<float>& actions)
{
    if (static_cast<int>(actions.size()) != mNumEnvs * mActionDim) {
        throw std::invalid_argument("VectorizedEnv::Step: expected " + std::to_string(mNumEnvs * mActionDim) +
                                    " actions, got " + std::to_string(actions.size()));
    }

    for (int i = 0; i < mNumEnvs; ++i)
    {
        if (mAllDones[i])
        {
            // Held until reset; its terminal reward was already reported once
            ClearStepOutput(i);
            continue;
        }

        const std::vector<float> action(actions.begin() + i * mActionDim, actions.begin() + (i + 1) * mActionDim);
        StepResult result = mEnvs[i]->Step(action);

        StoreObservation(i, result.observation);
        std::copy(result.reward.begin(), result.reward.end(), mAllRewards.begin() + i * mRewardDim);
        mAllDones[i] = result.done || result.truncated;
        mAllTruncated[i] = result.truncated;
        mAllInfos[i] = result.info;
    }
}

void VectorizedEnv::ResetDoneEnvs()
{
    for (int i = 0; i < mNumEnvs; ++i)
    {
        if (mAllDones[i]) ResetEnv(i);
    }
}
