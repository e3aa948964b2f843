// STRICT REQUIREMENT: Jolt.h must be included first
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include "PhysicsCore.h"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

PhysicsCore::~PhysicsCore()
{
    Shutdown();
}

bool PhysicsCore::Init(int workerThreads, uint32_t maxBodies)
{
    if (mInitialized) return true;

    // The Jolt factory is process-wide and outlives every PhysicsCore.
    static std::once_flag joltInitFlag;
    std::call_once(joltInitFlag, []() {
        JPH::RegisterDefaultAllocator();
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();
    });

    // A VSS field holds at most a few dozen bodies
    const uint32_t tempAllocSize = 4 * 1024 * 1024;
    mTempAllocator = new JPH::TempAllocatorImpl(tempAllocSize);

    mJobSystem = new JPH::JobSystemThreadPool(
        JPH::cMaxPhysicsJobs,
        JPH::cMaxPhysicsBarriers,
        std::max(1, workerThreads)
    );

    mBroadPhaseLayerInterface = new BPLayerInterfaceImpl();
    mObjectVsBroadPhaseLayerFilter = new ObjectVsBroadPhaseLayerFilterImpl();
    mObjectLayerPairFilter = new ObjectLayerPairFilterImpl();

    const uint32_t bodies = std::max<uint32_t>(64, maxBodies);
    const uint32_t numBodyMutexes = 0; // Jolt default
    const uint32_t maxBodyPairs = bodies * 8;
    const uint32_t maxContactConstraints = bodies * 8;

    mPhysicsSystem = new JPH::PhysicsSystem();
    mPhysicsSystem->Init(
        bodies,
        numBodyMutexes,
        maxBodyPairs,
        maxContactConstraints,
        *mBroadPhaseLayerInterface,
        *mObjectVsBroadPhaseLayerFilter,
        *mObjectLayerPairFilter
    );

    // Z-up so that field coordinates map directly onto world X/Y
    mPhysicsSystem->SetGravity(JPH::Vec3(0.0f, 0.0f, -9.81f));

    JPH::PhysicsSettings physicsSettings;
    physicsSettings.mNumVelocitySteps = 8;
    physicsSettings.mNumPositionSteps = 2;
    physicsSettings.mBaumgarte = 0.2f;
    mPhysicsSystem->SetPhysicsSettings(physicsSettings);

    mInitialized = true;
    std::cout << "[PhysicsCore] initialized with " << std::max(1, workerThreads) << " worker thread(s), "
              << bodies << " max bodies" << std::endl;
    return true;
}

void PhysicsCore::Shutdown()
{
    if (!mInitialized) return;

    delete mPhysicsSystem;
    mPhysicsSystem = nullptr;

    delete mObjectLayerPairFilter;
    mObjectLayerPairFilter = nullptr;

    delete mObjectVsBroadPhaseLayerFilter;
    mObjectVsBroadPhaseLayerFilter = nullptr;

    delete mBroadPhaseLayerInterface;
    mBroadPhaseLayerInterface = nullptr;

    delete mJobSystem;
    mJobSystem = nullptr;

    delete mTempAllocator;
    mTempAllocator = nullptr;

    mInitialized = false;
}

void PhysicsCore::Step(float deltaTime, int collisionSteps)
{
    if (!mInitialized) return;

    const JPH::EPhysicsUpdateError error =
        mPhysicsSystem->Update(deltaTime, std::max(1, collisionSteps), mTempAllocator, mJobSystem);
    if (error != JPH::EPhysicsUpdateError::None) {
        throw std::runtime_error("PhysicsCore: Jolt update failed with error code " +
                                 std::to_string(static_cast<uint32_t>(error)));
    }
}
