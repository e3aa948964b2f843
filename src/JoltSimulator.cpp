// MUST BE FIRST
#include <Jolt/Jolt.h>
#include "JoltSimulator.h"

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>

#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyInterface.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>

namespace {
constexpr float WALL_HALF_THICKNESS = 0.025f;
constexpr float WALL_HALF_HEIGHT = 0.05f;
constexpr float SHAPE_CONVEX_RADIUS = 0.005f;

JPH::RefConst<JPH::Shape> CreateShapeOrThrow(const JPH::ShapeSettings& settings, const char* what)
{
    JPH::ShapeSettings::ShapeResult result = settings.Create();
    if (result.HasError()) {
        throw std::runtime_error(std::string("JoltSimulator: failed to create ") + what + " shape: " +
                                 result.GetError().c_str());
    }
    return result.Get();
}
} // namespace

JoltSimulator::JoltSimulator(const Config& config)
    : mField(config.field),
      mPhysics(config.physics),
      mTimeStep(config.env.timeStep),
      mNumBlue(config.env.nRobotsBlue),
      mNumYellow(config.env.nRobotsYellow)
{
    const uint32_t maxBodies = static_cast<uint32_t>(16 + mNumBlue + mNumYellow);
    if (!mPhysicsCore.Init(mPhysics.workerThreads, maxBodies)) {
        throw std::runtime_error("JoltSimulator: PhysicsCore failed to initialize");
    }

    BuildField();

    mBallId = CreateBall();
    for (int i = 0; i < mNumBlue; ++i) mBlueIds.push_back(CreateRobot());
    for (int i = 0; i < mNumYellow; ++i) mYellowIds.push_back(CreateRobot());

    mPhysicsCore.GetPhysicsSystem().OptimizeBroadPhase();
    std::cout << "[JoltSimulator] field " << mField.length << "x" << mField.width << " with "
              << mNumBlue << " blue and " << mNumYellow << " yellow robots" << std::endl;
}

JoltSimulator::~JoltSimulator()
{
    if (!mPhysicsCore.IsInitialized()) return;

    JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();
    auto destroy = [&](const JPH::BodyID& id) {
        if (id.IsInvalid()) return;
        bodyInterface.RemoveBody(id);
        bodyInterface.DestroyBody(id);
    };
    for (const auto& id : mBlueIds) destroy(id);
    for (const auto& id : mYellowIds) destroy(id);
    destroy(mBallId);
    for (const auto& id : mStaticBodies) destroy(id);
}

void JoltSimulator::CreateStaticBox(float cx, float cy, float cz, float hx, float hy, float hz)
{
    JPH::BoxShapeSettings shapeSettings(JPH::Vec3(hx, hy, hz), SHAPE_CONVEX_RADIUS);
    JPH::RefConst<JPH::Shape> shape = CreateShapeOrThrow(shapeSettings, "wall");

    JPH::BodyCreationSettings settings(shape, JPH::RVec3(cx, cy, cz), JPH::Quat::sIdentity(),
                                       JPH::EMotionType::Static, Layers::STATIC);
    settings.mRestitution = mPhysics.wallRestitution;
    settings.mFriction = 0.2f;

    JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();
    JPH::BodyID id = bodyInterface.CreateAndAddBody(settings, JPH::EActivation::DontActivate);
    if (id.IsInvalid()) {
        throw std::runtime_error("JoltSimulator: out of bodies while building the field");
    }
    mStaticBodies.push_back(id);
}

void JoltSimulator::BuildField()
{
    const float hl = mField.HalfLength();
    const float hw = mField.HalfWidth();
    const float gw = mField.goalWidth * 0.5f;
    const float gd = mField.goalDepth;
    const float t = WALL_HALF_THICKNESS;
    const float h = WALL_HALF_HEIGHT;

    // Floor, top face at z = 0
    CreateStaticBox(0.0f, 0.0f, -0.05f, hl + gd + 0.2f, hw + 0.2f, 0.05f);

    // Side walls along the full length, goals included
    CreateStaticBox(0.0f, hw + t, h, hl + gd + 2.0f * t, t, h);
    CreateStaticBox(0.0f, -(hw + t), h, hl + gd + 2.0f * t, t, h);

    // End walls on both sides of each goal mouth
    const float endHalfY = (hw - gw) * 0.5f;
    const float endCenterY = gw + endHalfY;
    for (float sx : {1.0f, -1.0f}) {
        CreateStaticBox(sx * (hl + t), endCenterY, h, t, endHalfY, h);
        CreateStaticBox(sx * (hl + t), -endCenterY, h, t, endHalfY, h);

        // Goal box: back wall and two side walls
        CreateStaticBox(sx * (hl + gd + t), 0.0f, h, t, gw + 2.0f * t, h);
        CreateStaticBox(sx * (hl + gd * 0.5f), gw + t, h, gd * 0.5f, t, h);
        CreateStaticBox(sx * (hl + gd * 0.5f), -(gw + t), h, gd * 0.5f, t, h);
    }
}

JPH::BodyID JoltSimulator::CreateRobot()
{
    const float r = mField.rbtRadius;
    JPH::BoxShapeSettings shapeSettings(JPH::Vec3(r, r, r), SHAPE_CONVEX_RADIUS);
    JPH::RefConst<JPH::Shape> shape = CreateShapeOrThrow(shapeSettings, "robot");

    JPH::BodyCreationSettings settings(shape, JPH::RVec3(0.0f, 0.0f, r), JPH::Quat::sIdentity(),
                                       JPH::EMotionType::Dynamic, Layers::MOVING);
    settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
    settings.mMassPropertiesOverride.mMass = mPhysics.robotMass;
    // Wheeled robots stay on the floor plane
    settings.mAllowedDOFs = JPH::EAllowedDOFs::TranslationX | JPH::EAllowedDOFs::TranslationY |
                            JPH::EAllowedDOFs::RotationZ;
    settings.mFriction = 0.3f;
    settings.mRestitution = 0.1f;
    settings.mGravityFactor = 0.0f;

    JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();
    JPH::BodyID id = bodyInterface.CreateAndAddBody(settings, JPH::EActivation::Activate);
    if (id.IsInvalid()) {
        throw std::runtime_error("JoltSimulator: out of bodies while creating a robot");
    }
    return id;
}

JPH::BodyID JoltSimulator::CreateBall()
{
    JPH::SphereShapeSettings shapeSettings(mField.ballRadius);
    JPH::RefConst<JPH::Shape> shape = CreateShapeOrThrow(shapeSettings, "ball");

    JPH::BodyCreationSettings settings(shape, JPH::RVec3(0.0f, 0.0f, mField.ballRadius), JPH::Quat::sIdentity(),
                                       JPH::EMotionType::Dynamic, Layers::MOVING);
    settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
    settings.mMassPropertiesOverride.mMass = mPhysics.ballMass;
    settings.mMotionQuality = JPH::EMotionQuality::LinearCast;
    settings.mLinearDamping = mPhysics.ballLinearDamping;
    settings.mAngularDamping = mPhysics.ballLinearDamping;
    settings.mRestitution = mPhysics.wallRestitution;
    settings.mFriction = 0.1f;

    JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();
    JPH::BodyID id = bodyInterface.CreateAndAddBody(settings, JPH::EActivation::Activate);
    if (id.IsInvalid()) {
        throw std::runtime_error("JoltSimulator: out of bodies while creating the ball");
    }
    return id;
}

void JoltSimulator::Reset(const Frame& initialFrame)
{
    if (static_cast<int>(initialFrame.robotsBlue.size()) != mNumBlue ||
        static_cast<int>(initialFrame.robotsYellow.size()) != mNumYellow) {
        throw std::invalid_argument("JoltSimulator::Reset: frame robot count does not match the field");
    }

    JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();

    bodyInterface.SetPositionAndRotation(mBallId,
                                         JPH::RVec3(initialFrame.ball.x, initialFrame.ball.y, mField.ballRadius),
                                         JPH::Quat::sIdentity(), JPH::EActivation::Activate);
    bodyInterface.SetLinearAndAngularVelocity(mBallId,
                                              JPH::Vec3(initialFrame.ball.vx, initialFrame.ball.vy, 0.0f),
                                              JPH::Vec3::sZero());

    auto place = [&](const JPH::BodyID& id, const RobotState& r) {
        const JPH::Quat rot = JPH::Quat::sRotation(JPH::Vec3::sAxisZ(), r.theta * DEG_TO_RAD);
        bodyInterface.SetPositionAndRotation(id, JPH::RVec3(r.x, r.y, mField.rbtRadius), rot,
                                             JPH::EActivation::Activate);
        bodyInterface.SetLinearAndAngularVelocity(id, JPH::Vec3::sZero(), JPH::Vec3::sZero());
    };
    for (int i = 0; i < mNumBlue; ++i) place(mBlueIds[i], initialFrame.robotsBlue[i]);
    for (int i = 0; i < mNumYellow; ++i) place(mYellowIds[i], initialFrame.robotsYellow[i]);
}

void JoltSimulator::ApplyWheelCommand(const JPH::BodyID& body, const RobotCommand& command)
{
    JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();

    const JPH::Vec3 forward = bodyInterface.GetRotation(body).RotateAxisX();
    const float heading = std::atan2(forward.GetY(), forward.GetX());

    const float r = mField.rbtWheelRadius;
    const float v = (command.vWheel0 + command.vWheel1) * 0.5f * r;
    const float w = (command.vWheel1 - command.vWheel0) * r / mField.rbtWheelBase;

    bodyInterface.SetLinearAndAngularVelocity(body,
                                              JPH::Vec3(v * std::cos(heading), v * std::sin(heading), 0.0f),
                                              JPH::Vec3(0.0f, 0.0f, w));
}

void JoltSimulator::SendCommands(const std::vector<RobotCommand>& commands)
{
    if (static_cast<int>(commands.size()) != mNumBlue + mNumYellow) {
        throw std::invalid_argument("JoltSimulator::SendCommands: expected " +
                                    std::to_string(mNumBlue + mNumYellow) + " commands, got " +
                                    std::to_string(commands.size()));
    }

    std::vector<bool> seenBlue(mNumBlue, false);
    std::vector<bool> seenYellow(mNumYellow, false);
    for (const RobotCommand& cmd : commands) {
        const int count = cmd.yellow ? mNumYellow : mNumBlue;
        if (cmd.id < 0 || cmd.id >= count) {
            throw std::invalid_argument(std::string("JoltSimulator::SendCommands: unknown ") +
                                        (cmd.yellow ? "yellow" : "blue") + " robot " + std::to_string(cmd.id));
        }
        std::vector<bool>& seen = cmd.yellow ? seenYellow : seenBlue;
        if (seen[cmd.id]) {
            throw std::invalid_argument("JoltSimulator::SendCommands: duplicate command for robot " +
                                        std::to_string(cmd.id));
        }
        seen[cmd.id] = true;
    }

    for (const RobotCommand& cmd : commands) {
        ApplyWheelCommand(cmd.yellow ? mYellowIds[cmd.id] : mBlueIds[cmd.id], cmd);
    }

    mPhysicsCore.Step(mTimeStep, mPhysics.collisionSteps);
}

RobotState JoltSimulator::ReadRobot(const JPH::BodyID& body, bool yellow, int id) const
{
    const JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();

    const JPH::RVec3 pos = bodyInterface.GetPosition(body);
    const JPH::Vec3 forward = bodyInterface.GetRotation(body).RotateAxisX();
    const JPH::Vec3 vel = bodyInterface.GetLinearVelocity(body);
    const JPH::Vec3 angVel = bodyInterface.GetAngularVelocity(body);

    RobotState r;
    r.yellow = yellow;
    r.id = id;
    r.x = static_cast<float>(pos.GetX());
    r.y = static_cast<float>(pos.GetY());
    r.theta = std::atan2(forward.GetY(), forward.GetX()) * RAD_TO_DEG;
    r.vx = vel.GetX();
    r.vy = vel.GetY();
    r.vTheta = angVel.GetZ() * RAD_TO_DEG;
    return r;
}

Frame JoltSimulator::GetFrame() const
{
    const JPH::BodyInterface& bodyInterface = mPhysicsCore.GetPhysicsSystem().GetBodyInterface();

    Frame frame;
    const JPH::RVec3 ballPos = bodyInterface.GetPosition(mBallId);
    const JPH::Vec3 ballVel = bodyInterface.GetLinearVelocity(mBallId);
    frame.ball.x = static_cast<float>(ballPos.GetX());
    frame.ball.y = static_cast<float>(ballPos.GetY());
    frame.ball.z = static_cast<float>(ballPos.GetZ());
    frame.ball.vx = ballVel.GetX();
    frame.ball.vy = ballVel.GetY();

    frame.robotsBlue.reserve(mNumBlue);
    for (int i = 0; i < mNumBlue; ++i) frame.robotsBlue.push_back(ReadRobot(mBlueIds[i], false, i));
    frame.robotsYellow.reserve(mNumYellow);
    for (int i = 0; i < mNumYellow; ++i) frame.robotsYellow.push_back(ReadRobot(mYellowIds[i], true, i));
    return frame;
}
