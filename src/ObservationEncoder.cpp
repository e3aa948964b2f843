#include "ObservationEncoder.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

NormScales NormScales::FromField(const FieldParams& field)
{
    NormScales scales;
    scales.maxPos = std::max(field.HalfWidth(), field.HalfLength() + field.penaltyLength);
    scales.maxV = field.MaxWheelSpeed();
    // 0.04 = robot radius (0.0375) + wheel thickness (0.0025)
    scales.maxW = (scales.maxV / 0.04f) * RAD_TO_DEG;
    return scales;
}

ObservationEncoder::ObservationEncoder(const NormScales& scales, int nRobotsBlue, int nRobotsYellow)
    : mScales(scales), mNumBlue(nRobotsBlue), mNumYellow(nRobotsYellow),
      mObservationDim(ObservationDimFor(nRobotsBlue, nRobotsYellow))
{
}

void ObservationEncoder::Encode(const Frame& frame, float* out) const
{
    if (static_cast<int>(frame.robotsBlue.size()) != mNumBlue ||
        static_cast<int>(frame.robotsYellow.size()) != mNumYellow) {
        throw std::invalid_argument("ObservationEncoder: frame robot count does not match encoder");
    }

    int idx = 0;

    out[idx++] = NormPos(frame.ball.x);
    out[idx++] = NormPos(frame.ball.y);
    out[idx++] = NormV(frame.ball.vx);
    out[idx++] = NormV(frame.ball.vy);

    for (const RobotState& r : frame.robotsBlue) {
        const float theta = r.theta * DEG_TO_RAD;
        out[idx++] = NormPos(r.x);
        out[idx++] = NormPos(r.y);
        out[idx++] = std::sin(theta);
        out[idx++] = std::cos(theta);
        out[idx++] = NormV(r.vx);
        out[idx++] = NormV(r.vy);
        out[idx++] = NormW(r.vTheta);
    }

    // Opponent heading is not exposed
    for (const RobotState& r : frame.robotsYellow) {
        out[idx++] = NormPos(r.x);
        out[idx++] = NormPos(r.y);
        out[idx++] = NormV(r.vx);
        out[idx++] = NormV(r.vy);
        out[idx++] = NormW(r.vTheta);
    }
}

std::vector<float> ObservationEncoder::Encode(const Frame& frame) const
{
    std::vector<float> obs(mObservationDim, 0.0f);
    Encode(frame, obs.data());
    return obs;
}
