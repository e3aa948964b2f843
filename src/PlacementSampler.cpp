#include "PlacementSampler.h"

#include <iostream>

PlacementSampler::PlacementSampler(const FieldParams& field, const PlacementConfig& config)
    : mField(field), mConfig(config)
{
    if (mField.HalfLength() - mConfig.margin <= -mField.HalfLength() + mConfig.margin ||
        mField.HalfWidth() - mConfig.margin <= -mField.HalfWidth() + mConfig.margin) {
        throw std::invalid_argument("PlacementSampler: field too small for placement margin");
    }
    if (mConfig.maxAttemptsPerEntity <= 0) {
        throw std::invalid_argument("PlacementSampler: max_attempts_per_entity must be > 0");
    }
}

Point2 PlacementSampler::DrawSeparated(KDTree& places, std::mt19937& rng, const char* entity, int id) const
{
    const float hl = mField.HalfLength();
    const float hw = mField.HalfWidth();
    std::uniform_real_distribution<float> xDist(-hl + mConfig.margin, hl - mConfig.margin);
    std::uniform_real_distribution<float> yDist(-hw + mConfig.margin, hw - mConfig.margin);

    for (int attempt = 0; attempt < mConfig.maxAttemptsPerEntity; ++attempt) {
        Point2 pos{xDist(rng), yDist(rng)};
        if (places.GetNearest(pos).second >= mConfig.minDist) {
            places.Insert(pos);
            return pos;
        }
    }

    std::cerr << "[PlacementSampler] gave up on " << entity << " " << id << " after "
              << mConfig.maxAttemptsPerEntity << " attempts" << std::endl;
    throw PlacementError(std::string("PlacementSampler: cannot place ") + entity + " " +
                         std::to_string(id) + " with min_dist " + std::to_string(mConfig.minDist));
}

Frame PlacementSampler::Sample(int nRobotsBlue, int nRobotsYellow, std::mt19937& rng) const
{
    std::uniform_real_distribution<float> thetaDist(0.0f, 360.0f);

    Frame frame;
    KDTree places;

    const Point2 ballPos = DrawSeparated(places, rng, "ball", 0);
    frame.ball.x = ballPos.x;
    frame.ball.y = ballPos.y;

    frame.robotsBlue.resize(nRobotsBlue);
    for (int i = 0; i < nRobotsBlue; ++i) {
        const Point2 pos = DrawSeparated(places, rng, "blue robot", i);
        RobotState& r = frame.robotsBlue[i];
        r.yellow = false;
        r.id = i;
        r.x = pos.x;
        r.y = pos.y;
        r.theta = thetaDist(rng);
    }

    frame.robotsYellow.resize(nRobotsYellow);
    for (int i = 0; i < nRobotsYellow; ++i) {
        const Point2 pos = DrawSeparated(places, rng, "yellow robot", i);
        RobotState& r = frame.robotsYellow[i];
        r.yellow = true;
        r.id = i;
        r.x = pos.x;
        r.y = pos.y;
        r.theta = thetaDist(rng);
    }

    return frame;
}
