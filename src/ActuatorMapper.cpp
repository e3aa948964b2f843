#include "ActuatorMapper.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

WheelSpeeds ActionsToWheelSpeeds(const float* actions, const ActuatorParams& params)
{
    float left = actions[0] * params.maxV;
    float right = actions[1] * params.maxV;

    left = std::clamp(left, -params.maxV, params.maxV);
    right = std::clamp(right, -params.maxV, params.maxV);

    // Deadzone
    if (-params.deadzone < left && left < params.deadzone) left = 0.0f;
    if (-params.deadzone < right && right < params.deadzone) right = 0.0f;

    WheelSpeeds speeds;
    speeds.left = left / params.wheelRadius;
    speeds.right = right / params.wheelRadius;
    return speeds;
}

void ValidateAction(const std::vector<float>& action)
{
    if (action.size() != ACTION_DIM) {
        throw std::invalid_argument("Action must have " + std::to_string(ACTION_DIM) +
                                    " entries, got " + std::to_string(action.size()));
    }
    for (size_t i = 0; i < action.size(); ++i) {
        if (!std::isfinite(action[i])) {
            throw std::invalid_argument("Action entry " + std::to_string(i) + " is not finite");
        }
    }
}

RobotCommand MakeCommand(bool yellow, int id, const float* actions, const ActuatorParams& params)
{
    const WheelSpeeds speeds = ActionsToWheelSpeeds(actions, params);
    RobotCommand cmd;
    cmd.yellow = yellow;
    cmd.id = id;
    cmd.vWheel0 = speeds.left;
    cmd.vWheel1 = speeds.right;
    return cmd;
}
