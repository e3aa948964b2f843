// Included first so the header is checked for its own includes
#include "KDTree.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include "PlacementSampler.h"
#include "TestCheck.h"

static void TestKDTreeEmpty()
{
    KDTree tree;
    CHECK(tree.Empty());
    const auto nearest = tree.GetNearest({0.3f, -0.2f});
    CHECK(std::isinf(nearest.second));
}

static void TestKDTreeMatchesBruteForce()
{
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    KDTree tree;
    std::vector<Point2> points;
    for (int i = 0; i < 200; ++i) {
        Point2 p{dist(rng), dist(rng)};
        tree.Insert(p);
        points.push_back(p);
    }
    CHECK(tree.Size() == 200);

    for (int q = 0; q < 100; ++q) {
        const Point2 query{dist(rng), dist(rng)};
        float best = std::numeric_limits<float>::infinity();
        for (const Point2& p : points) {
            best = std::min(best, std::hypot(p.x - query.x, p.y - query.y));
        }
        const auto nearest = tree.GetNearest(query);
        CHECK_NEAR(nearest.second, best, 1e-6);
        CHECK_NEAR(std::hypot(nearest.first.x - query.x, nearest.first.y - query.y), best, 1e-6);
    }

    tree.Clear();
    CHECK(tree.Empty());
}

static std::vector<Point2> PlacedPoints(const Frame& frame)
{
    std::vector<Point2> points;
    points.push_back({frame.ball.x, frame.ball.y});
    for (const RobotState& r : frame.robotsBlue) points.push_back({r.x, r.y});
    for (const RobotState& r : frame.robotsYellow) points.push_back({r.x, r.y});
    return points;
}

static void TestSeparationAndBounds()
{
    FieldParams field;
    PlacementConfig config;
    PlacementSampler sampler(field, config);
    std::mt19937 rng(42);

    const float xMax = field.HalfLength() - config.margin;
    const float yMax = field.HalfWidth() - config.margin;

    for (int trial = 0; trial < 200; ++trial) {
        const Frame frame = sampler.Sample(3, 3, rng);
        CHECK(frame.robotsBlue.size() == 3);
        CHECK(frame.robotsYellow.size() == 3);

        const std::vector<Point2> points = PlacedPoints(frame);
        for (size_t i = 0; i < points.size(); ++i) {
            CHECK(std::fabs(points[i].x) <= xMax);
            CHECK(std::fabs(points[i].y) <= yMax);
            for (size_t j = i + 1; j < points.size(); ++j) {
                CHECK(Distance2D(points[i].x, points[i].y, points[j].x, points[j].y) >= config.minDist);
            }
        }

        for (int i = 0; i < 3; ++i) {
            CHECK(!frame.robotsBlue[i].yellow);
            CHECK(frame.robotsBlue[i].id == i);
            CHECK(frame.robotsYellow[i].yellow);
            CHECK(frame.robotsYellow[i].id == i);
            CHECK(frame.robotsBlue[i].theta >= 0.0f && frame.robotsBlue[i].theta < 360.0f);
            CHECK(frame.robotsYellow[i].theta >= 0.0f && frame.robotsYellow[i].theta < 360.0f);
        }
    }
}

static void TestSameSeedSamePlacement()
{
    FieldParams field;
    PlacementSampler sampler(field, PlacementConfig{});
    std::mt19937 a(1234);
    std::mt19937 b(1234);

    const Frame fa = sampler.Sample(3, 3, a);
    const Frame fb = sampler.Sample(3, 3, b);
    CHECK(fa.ball.x == fb.ball.x);
    CHECK(fa.ball.y == fb.ball.y);
    for (int i = 0; i < 3; ++i) {
        CHECK(fa.robotsBlue[i].x == fb.robotsBlue[i].x);
        CHECK(fa.robotsYellow[i].theta == fb.robotsYellow[i].theta);
    }
}

static void TestImpossiblePlacementThrows()
{
    FieldParams field;
    PlacementConfig config;
    config.minDist = 5.0f;
    config.maxAttemptsPerEntity = 50;
    PlacementSampler sampler(field, config);
    std::mt19937 rng(3);

    CHECK_THROWS(sampler.Sample(1, 0, rng), PlacementError);
}

static void TestInvalidSamplerConfig()
{
    FieldParams field;
    PlacementConfig wideMargin;
    wideMargin.margin = 1.0f;
    CHECK_THROWS((void)PlacementSampler(field, wideMargin), std::invalid_argument);

    PlacementConfig noAttempts;
    noAttempts.maxAttemptsPerEntity = 0;
    CHECK_THROWS((void)PlacementSampler(field, noAttempts), std::invalid_argument);
}

int main()
{
    TestKDTreeEmpty();
    TestKDTreeMatchesBruteForce();
    TestSeparationAndBounds();
    TestSameSeedSamePlacement();
    TestImpossiblePlacementThrows();
    TestInvalidSamplerConfig();
    return TestExitCode("placement_test");
}
