#pragma once

#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "Simulator.h"

// In-memory Simulator for tests. The frame only changes through the script
// callback, so a test fully controls ball and robot motion.
class ScriptedSimulator final : public Simulator
{
public:
    // Called once per SendCommands with the frame to mutate, the commands and
    // the 1-based index of the control step since the last Reset.
    using Script = std::function<void(Frame&, const std::vector<RobotCommand>&, int)>;

    struct Log
    {
        int resets = 0;
        int sendCalls = 0;
        std::vector<RobotCommand> lastCommands;
    };

    explicit ScriptedSimulator(const FieldParams& field, Script script = nullptr, Log* log = nullptr)
        : mField(field), mScript(std::move(script)), mLog(log)
    {
    }

    const FieldParams& GetField() const override { return mField; }

    void Reset(const Frame& initialFrame) override
    {
        mFrame = initialFrame;
        mStep = 0;
        if (mLog) mLog->resets++;
    }

    void SendCommands(const std::vector<RobotCommand>& commands) override
    {
        if (commands.size() != mFrame.robotsBlue.size() + mFrame.robotsYellow.size()) {
            throw std::invalid_argument("ScriptedSimulator: command count does not match robot count");
        }
        mStep++;
        if (mLog) {
            mLog->sendCalls++;
            mLog->lastCommands = commands;
        }
        if (mScript) mScript(mFrame, commands, mStep);
    }

    Frame GetFrame() const override { return mFrame; }

private:
    FieldParams mField;
    Script mScript;
    Log* mLog;
    Frame mFrame;
    int mStep = 0;
};
