#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "Config.h"
#include "Simulator.h"
#include "VssStratEnv.h"

// N independent VssStratEnv instances stepped in lockstep. Each instance owns
// its simulator and is seeded with config.env.seed + index.
class VectorizedEnv
{
public:
    using SimulatorFactory = std::function<std::unique_ptr<Simulator>(const Config&)>;

    VectorizedEnv(int numEnvs, const Config& config, const SimulatorFactory& makeSimulator);

    void Reset(int envIndex = -1);
    // actions: GetActionDim() floats per env, env-major
    void Step(const std::vector<float>& actions);
    void ResetDoneEnvs();

    const std::vector<float>& GetObservations() const { return mAllObservations; }
    const std::vector<float>& GetRewards() const { return mAllRewards; }
    // True when the env finished by goal or by time limit
    const std::vector<bool>& GetDones() const { return mAllDones; }
    // True only for time-limit endings
    const std::vector<bool>& GetTruncated() const { return mAllTruncated; }
    const std::vector<StepInfo>& GetInfos() const { return mAllInfos; }

    VssStratEnv& GetEnv(int index) { return *mEnvs[index]; }
    int GetNumEnvs() const { return mNumEnvs; }
    int GetObservationDim() const { return mObservationDim; }
    int GetActionDim() const { return mActionDim; }
    int GetRewardDim() const { return mRewardDim; }

private:
    void StoreObservation(int envIndex, const std::vector<float>& obs);
    void ClearStepOutput(int envIndex);
    void ResetEnv(int envIndex);

    std::vector<std::unique_ptr<VssStratEnv>> mEnvs;

    int mNumEnvs;
    int mObservationDim = 0;
    int mActionDim = 0;
    int mRewardDim = 0;

    std::vector<float> mAllObservations;
    std::vector<float> mAllRewards;
    std::vector<bool> mAllDones;
    std::vector<bool> mAllTruncated;
    std::vector<StepInfo> mAllInfos;
};
