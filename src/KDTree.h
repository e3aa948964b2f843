#pragma once

#include <cstddef>
#include <utility>
#include <vector>

struct Point2
{
    float x = 0.0f;
    float y = 0.0f;
};

// Unbalanced 2-D k-d tree. Points are only ever inserted; used as a
// minimum-distance query service while sampling initial placements.
class KDTree
{
public:
    KDTree() = default;

    void Insert(const Point2& point);
    void Clear();

    // Nearest stored point and its distance. On an empty tree the distance is
    // +infinity and the point is the query itself.
    std::pair<Point2, float> GetNearest(const Point2& query) const;

    std::size_t Size() const { return mNodes.size(); }
    bool Empty() const { return mNodes.empty(); }

private:
    struct Node
    {
        Point2 point;
        int left = -1;
        int right = -1;
    };

    void Search(int nodeIdx, int depth, const Point2& query, int& bestIdx, float& bestDistSq) const;

    std::vector<Node> mNodes;
};
