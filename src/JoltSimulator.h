#pragma once

#include <Jolt/Jolt.h>
#include <Jolt/Physics/Body/BodyID.h>

#include <vector>

#include "Config.h"
#include "PhysicsCore.h"
#include "Simulator.h"

// VSS field simulated with Jolt Physics. The ball is a free sphere, robots
// are planar cubes whose velocity is set each control step from the
// differential-drive kinematics of their wheel commands.
class JoltSimulator final : public Simulator
{
public:
    explicit JoltSimulator(const Config& config);
    ~JoltSimulator() override;

    JoltSimulator(const JoltSimulator&) = delete;
    JoltSimulator& operator=(const JoltSimulator&) = delete;

    const FieldParams& GetField() const override { return mField; }
    void Reset(const Frame& initialFrame) override;
    void SendCommands(const std::vector<RobotCommand>& commands) override;
    Frame GetFrame() const override;

private:
    void BuildField();
    void CreateStaticBox(float cx, float cy, float cz, float hx, float hy, float hz);
    JPH::BodyID CreateRobot();
    JPH::BodyID CreateBall();
    void ApplyWheelCommand(const JPH::BodyID& body, const RobotCommand& command);
    RobotState ReadRobot(const JPH::BodyID& body, bool yellow, int id) const;

    PhysicsCore mPhysicsCore;
    FieldParams mField;
    PhysicsConfig mPhysics;
    float mTimeStep;
    int mNumBlue;
    int mNumYellow;

    std::vector<JPH::BodyID> mStaticBodies;
    JPH::BodyID mBallId;
    std::vector<JPH::BodyID> mBlueIds;
    std::vector<JPH::BodyID> mYellowIds;
};
