#include "ActorNoisePool.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

OrnsteinUhlenbeckAction::OrnsteinUhlenbeckAction(const NoiseConfig& config, float dt, uint32_t seed)
    : mConfig(config), mDt(dt), mRng(seed)
{
    Reset();
}

void OrnsteinUhlenbeckAction::Reset()
{
    mState.fill(0.0f);
    mNormal.reset();
}

Action OrnsteinUhlenbeckAction::Sample()
{
    const float diffusion = mConfig.sigma * std::sqrt(mDt);
    Action out;
    for (size_t i = 0; i < ACTION_DIM; ++i) {
        mState[i] = mState[i] + mConfig.theta * (mConfig.mu - mState[i]) * mDt + diffusion * mNormal(mRng);
        out[i] = std::clamp(mState[i], -1.0f, 1.0f);
    }
    return out;
}

ActorNoisePool::ActorNoisePool(int nRobotsBlue, int nRobotsYellow, const NoiseConfig& config, float dt,
                               uint32_t seed)
    : mNumBlue(nRobotsBlue), mNumYellow(nRobotsYellow)
{
    // Blue 0 is driven by the learning agent and has no source.
    const int numSources = (nRobotsBlue - 1) + nRobotsYellow;
    mSources.reserve(numSources);
    for (int i = 0; i < numSources; ++i) {
        mSources.emplace_back(config, dt, seed + 1000u * static_cast<uint32_t>(i + 1));
    }
}

void ActorNoisePool::Reset()
{
    for (auto& source : mSources) source.Reset();
}

int ActorNoisePool::SourceIndex(bool yellow, int id) const
{
    if (!yellow) {
        if (id < 1 || id >= mNumBlue) {
            throw std::out_of_range("ActorNoisePool: no noise source for blue robot " + std::to_string(id));
        }
        return id - 1;
    }
    if (id < 0 || id >= mNumYellow) {
        throw std::out_of_range("ActorNoisePool: no noise source for yellow robot " + std::to_string(id));
    }
    return (mNumBlue - 1) + id;
}

Action ActorNoisePool::SampleBlue(int id)
{
    return mSources[SourceIndex(false, id)].Sample();
}

Action ActorNoisePool::SampleYellow(int id)
{
    return mSources[SourceIndex(true, id)].Sample();
}
