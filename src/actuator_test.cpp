#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "ActuatorMapper.h"
#include "TestCheck.h"

static ActuatorParams DefaultParams()
{
    FieldParams field;
    ActuatorParams params;
    params.maxV = field.MaxWheelSpeed();
    params.deadzone = 0.05f;
    params.wheelRadius = field.rbtWheelRadius;
    return params;
}

static void TestSpeedsStayWithinMotorLimit()
{
    const ActuatorParams params = DefaultParams();
    const float limit = params.maxV / params.wheelRadius + 1e-3f;

    for (float a = -3.0f; a <= 3.0f; a += 0.05f) {
        const float action[2] = {a, -a};
        const WheelSpeeds speeds = ActionsToWheelSpeeds(action, params);
        CHECK(std::fabs(speeds.left) <= limit);
        CHECK(std::fabs(speeds.right) <= limit);
    }
}

static void TestSaturation()
{
    const ActuatorParams params = DefaultParams();
    const float full[2] = {1.0f, -1.0f};
    const float beyond[2] = {2.5f, -7.0f};

    const WheelSpeeds a = ActionsToWheelSpeeds(full, params);
    const WheelSpeeds b = ActionsToWheelSpeeds(beyond, params);
    CHECK_NEAR(a.left, params.maxV / params.wheelRadius, 1e-3);
    CHECK_NEAR(a.right, -params.maxV / params.wheelRadius, 1e-3);
    CHECK(a.left == b.left);
    CHECK(a.right == b.right);
}

static void TestDeadzone()
{
    const ActuatorParams params = DefaultParams();

    // 0.04 * 1.198 = 0.048 m/s, inside the dead-zone
    const float small[2] = {0.04f, -0.04f};
    const WheelSpeeds s = ActionsToWheelSpeeds(small, params);
    CHECK(s.left == 0.0f);
    CHECK(s.right == 0.0f);

    // 0.05 * 1.198 = 0.0599 m/s, outside
    const float above[2] = {0.05f, -0.05f};
    const WheelSpeeds t = ActionsToWheelSpeeds(above, params);
    CHECK_NEAR(t.left, 0.05f * params.maxV / params.wheelRadius, 1e-4);
    CHECK_NEAR(t.right, -0.05f * params.maxV / params.wheelRadius, 1e-4);

    const float zero[2] = {0.0f, 0.0f};
    const WheelSpeeds z = ActionsToWheelSpeeds(zero, params);
    CHECK(z.left == 0.0f);
    CHECK(z.right == 0.0f);
}

static void TestMakeCommand()
{
    const ActuatorParams params = DefaultParams();
    const float action[2] = {0.5f, 0.25f};
    const RobotCommand cmd = MakeCommand(true, 2, action, params);
    CHECK(cmd.yellow);
    CHECK(cmd.id == 2);
    CHECK_NEAR(cmd.vWheel0, 0.5f * params.maxV / params.wheelRadius, 1e-4);
    CHECK_NEAR(cmd.vWheel1, 0.25f * params.maxV / params.wheelRadius, 1e-4);
}

static void TestValidateAction()
{
    ValidateAction({0.3f, -0.9f});
    CHECK_THROWS(ValidateAction({}), std::invalid_argument);
    CHECK_THROWS(ValidateAction({0.1f}), std::invalid_argument);
    CHECK_THROWS(ValidateAction({0.1f, 0.2f, 0.3f}), std::invalid_argument);
    CHECK_THROWS(ValidateAction({std::numeric_limits<float>::quiet_NaN(), 0.0f}), std::invalid_argument);
    CHECK_THROWS(ValidateAction({0.0f, std::numeric_limits<float>::infinity()}), std::invalid_argument);
}

int main()
{
    TestSpeedsStayWithinMotorLimit();
    TestSaturation();
    TestDeadzone();
    TestMakeCommand();
    TestValidateAction();
    return TestExitCode("actuator_test");
}
