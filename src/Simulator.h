#pragma once

#include <vector>

#include "VssTypes.h"

// Physics engine boundary. Owns dynamics and collision resolution; the
// environment only sends commands and reads frames back.
class Simulator
{
public:
    virtual ~Simulator() = default;

    virtual const FieldParams& GetField() const = 0;

    // Teleport ball and robots to the given frame. Robots start at rest, the
    // ball keeps the frame's planar velocity.
    virtual void Reset(const Frame& initialFrame) = 0;

    // Apply one command per robot and advance one control interval.
    // Throws on a malformed command list.
    virtual void SendCommands(const std::vector<RobotCommand>& commands) = 0;

    virtual Frame GetFrame() const = 0;
};
