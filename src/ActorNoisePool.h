#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <vector>

#include "Config.h"
#include "VssTypes.h"

using Action = std::array<float, ACTION_DIM>;

// Temporally correlated exploration noise:
// x' = x + theta * (mu - x) * dt + sigma * sqrt(dt) * N(0, 1)
class OrnsteinUhlenbeckAction
{
public:
    OrnsteinUhlenbeckAction(const NoiseConfig& config, float dt, uint32_t seed);

    void Reset();

    // Next action, clipped to [-1, 1]. The correlation state keeps the raw value.
    Action Sample();

    const Action& GetState() const { return mState; }

private:
    NoiseConfig mConfig;
    float mDt;
    Action mState{};
    std::mt19937 mRng;
    std::normal_distribution<float> mNormal{0.0f, 1.0f};
};

// One noise source per non-learning robot: blue 1..n-1 then yellow 0..m-1.
class ActorNoisePool
{
public:
    ActorNoisePool(int nRobotsBlue, int nRobotsYellow, const NoiseConfig& config, float dt, uint32_t seed);

    void Reset();

    Action SampleBlue(int id);
    Action SampleYellow(int id);

    int Size() const { return static_cast<int>(mSources.size()); }

private:
    int SourceIndex(bool yellow, int id) const;

    std::vector<OrnsteinUhlenbeckAction> mSources;
    int mNumBlue;
    int mNumYellow;
};
