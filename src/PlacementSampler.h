#pragma once

#include <random>
#include <stdexcept>
#include <string>

#include "Config.h"
#include "KDTree.h"
#include "VssTypes.h"

// Raised when minimum separation cannot be met within max_attempts_per_entity draws.
class PlacementError : public std::runtime_error
{
public:
    explicit PlacementError(const std::string& what) : std::runtime_error(what) {}
};

class PlacementSampler
{
public:
    PlacementSampler(const FieldParams& field, const PlacementConfig& config);

    // Ball first, then blue robots by id, then yellow robots by id.
    // Every pair of placed points is at least minDist apart.
    Frame Sample(int nRobotsBlue, int nRobotsYellow, std::mt19937& rng) const;

private:
    Point2 DrawSeparated(KDTree& places, std::mt19937& rng, const char* entity, int id) const;

    FieldParams mField;
    PlacementConfig mConfig;
};
