#pragma once

// STRICT REQUIREMENT: Jolt.h must be included first
#include <Jolt/Jolt.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseLayer.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Core/TempAllocator.h>

#include <cstdint>

namespace Layers
{
    // Field floor and walls
    static constexpr JPH::ObjectLayer STATIC = 0;
    // Ball and robots
    static constexpr JPH::ObjectLayer MOVING = 1;
    static constexpr JPH::ObjectLayer NUM_LAYERS = 2;
}

namespace BroadPhaseLayers
{
    static constexpr JPH::BroadPhaseLayer STATIC(0);
    static constexpr JPH::BroadPhaseLayer DYNAMIC(1);
    static constexpr JPH::uint NUM_LAYERS = 2;
}

class BPLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface
{
public:
    virtual JPH::uint GetNumBroadPhaseLayers() const override { return BroadPhaseLayers::NUM_LAYERS; }

    virtual JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override
    {
        if (inLayer == Layers::STATIC) return BroadPhaseLayers::STATIC;
        return BroadPhaseLayers::DYNAMIC;
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    virtual const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override
    {
        return inLayer == BroadPhaseLayers::STATIC ? "STATIC" : "DYNAMIC";
    }
#endif
};

class ObjectVsBroadPhaseLayerFilterImpl final : public JPH::ObjectVsBroadPhaseLayerFilter
{
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::BroadPhaseLayer inLayer2) const override
    {
        if (inLayer1 == Layers::STATIC) return inLayer2 == BroadPhaseLayers::DYNAMIC;
        return true;
    }
};

class ObjectLayerPairFilterImpl final : public JPH::ObjectLayerPairFilter
{
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inObject1, JPH::ObjectLayer inObject2) const override
    {
        // Static geometry never collides with itself
        return !(inObject1 == Layers::STATIC && inObject2 == Layers::STATIC);
    }
};

// Owns one Jolt PhysicsSystem plus its allocator and job system.
// One instance per environment; instances share nothing but the Jolt factory.
class PhysicsCore
{
public:
    PhysicsCore() = default;
    ~PhysicsCore();

    PhysicsCore(const PhysicsCore&) = delete;
    PhysicsCore& operator=(const PhysicsCore&) = delete;
    PhysicsCore(PhysicsCore&&) = delete;
    PhysicsCore& operator=(PhysicsCore&&) = delete;

    bool Init(int workerThreads, uint32_t maxBodies);
    // Throws std::runtime_error when Jolt reports an update error
    void Step(float deltaTime, int collisionSteps);
    void Shutdown();

    bool IsInitialized() const { return mInitialized; }

    JPH::PhysicsSystem& GetPhysicsSystem() { return *mPhysicsSystem; }
    const JPH::PhysicsSystem& GetPhysicsSystem() const { return *mPhysicsSystem; }

private:
    JPH::TempAllocatorImpl* mTempAllocator = nullptr;
    JPH::JobSystemThreadPool* mJobSystem = nullptr;
    BPLayerInterfaceImpl* mBroadPhaseLayerInterface = nullptr;
    ObjectVsBroadPhaseLayerFilterImpl* mObjectVsBroadPhaseLayerFilter = nullptr;
    ObjectLayerPairFilterImpl* mObjectLayerPairFilter = nullptr;
    JPH::PhysicsSystem* mPhysicsSystem = nullptr;

    bool mInitialized = false;
};
