#include "KDTree.h"

#include <cmath>
#include <limits>

namespace {
inline float AxisValue(const Point2& p, int axis)
{
    return axis == 0 ? p.x : p.y;
}
} // namespace

void KDTree::Insert(const Point2& point)
{
    Node node;
    node.point = point;
    const int newIdx = static_cast<int>(mNodes.size());

    if (mNodes.empty()) {
        mNodes.push_back(node);
        return;
    }

    int idx = 0;
    int depth = 0;
    while (true) {
        const int axis = depth % 2;
        Node& cur = mNodes[idx];
        const bool goLeft = AxisValue(point, axis) < AxisValue(cur.point, axis);
        int& child = goLeft ? cur.left : cur.right;
        if (child < 0) {
            child = newIdx;
            break;
        }
        idx = child;
        ++depth;
    }
    mNodes.push_back(node);
}

void KDTree::Clear()
{
    mNodes.clear();
}

std::pair<Point2, float> KDTree::GetNearest(const Point2& query) const
{
    if (mNodes.empty()) {
        return {query, std::numeric_limits<float>::infinity()};
    }

    int bestIdx = -1;
    float bestDistSq = std::numeric_limits<float>::infinity();
    Search(0, 0, query, bestIdx, bestDistSq);
    return {mNodes[bestIdx].point, std::sqrt(bestDistSq)};
}

void KDTree::Search(int nodeIdx, int depth, const Point2& query, int& bestIdx, float& bestDistSq) const
{
    if (nodeIdx < 0) return;

    const Node& node = mNodes[nodeIdx];
    const float dx = node.point.x - query.x;
    const float dy = node.point.y - query.y;
    const float distSq = dx * dx + dy * dy;
    if (distSq < bestDistSq) {
        bestDistSq = distSq;
        bestIdx = nodeIdx;
    }

    const int axis = depth % 2;
    const float diff = AxisValue(query, axis) - AxisValue(node.point, axis);
    const int nearChild = diff < 0.0f ? node.left : node.right;
    const int farChild = diff < 0.0f ? node.right : node.left;

    Search(nearChild, depth + 1, query, bestIdx, bestDistSq);
    // Only cross the splitting line if the best sphere straddles it
    if (diff * diff < bestDistSq) {
        Search(farChild, depth + 1, query, bestIdx, bestDistSq);
    }
}
