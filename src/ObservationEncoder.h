#pragma once

#include <vector>

#include "VssTypes.h"

struct NormScales
{
    float maxPos = 0.9f;      // m
    float maxV = 1.198f;      // m/s
    float maxW = 1716.0f;     // deg/s

    // max_pos = max(W/2, L/2 + penalty), max_w = rad2deg(max_v / 0.04)
    static NormScales FromField(const FieldParams& field);
};

// Flattens a Frame into 4 + 7 * nBlue + 5 * nYellow floats:
//   ball x, y, vx, vy
//   per blue robot:   x, y, sin(theta), cos(theta), vx, vy, v_theta
//   per yellow robot: x, y, vx, vy, v_theta
// Values are normalized but never clipped.
class ObservationEncoder
{
public:
    ObservationEncoder(const NormScales& scales, int nRobotsBlue, int nRobotsYellow);

    void Encode(const Frame& frame, float* out) const;
    std::vector<float> Encode(const Frame& frame) const;

    int GetObservationDim() const { return mObservationDim; }
    float GetBound() const { return NORM_BOUNDS; }

    static int ObservationDimFor(int nRobotsBlue, int nRobotsYellow) { return 4 + 7 * nRobotsBlue + 5 * nRobotsYellow; }

private:
    float NormPos(float v) const { return v / mScales.maxPos; }
    float NormV(float v) const { return v / mScales.maxV; }
    float NormW(float v) const { return v / mScales.maxW; }

    NormScales mScales;
    int mNumBlue;
    int mNumYellow;
    int mObservationDim;
};
