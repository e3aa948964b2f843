#pragma once

#include <vector>

#include "VssTypes.h"

struct ActuatorParams
{
    float maxV = 1.198f;          // m/s
    float deadzone = 0.05f;       // m/s
    float wheelRadius = 0.026f;   // m
};

struct WheelSpeeds
{
    float left = 0.0f;   // rad/s
    float right = 0.0f;  // rad/s
};

// Scale a normalized [-1, 1] action pair to wheel angular speeds.
// Saturates at maxV and forces |v| < deadzone to exactly zero before the
// linear -> angular conversion.
WheelSpeeds ActionsToWheelSpeeds(const float* actions, const ActuatorParams& params);

// Throws std::invalid_argument unless the action has ACTION_DIM finite entries.
void ValidateAction(const std::vector<float>& action);

RobotCommand MakeCommand(bool yellow, int id, const float* actions, const ActuatorParams& params);
