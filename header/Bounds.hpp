#pragma once
#include <Eigen/Core>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace qbvh {

using Point2 = Eigen::Vector2f;

// Axis-aligned box. The default-constructed box is Empty: min = +inf, max = -inf,
// which is the identity for join().
struct AABB {
    Point2 min;
    Point2 max;

    AABB()
        : min(std::numeric_limits<float>::infinity(), std::numeric_limits<float>::infinity())
        , max(-std::numeric_limits<float>::infinity(), -std::numeric_limits<float>::infinity())
    {}
    AABB(const Point2& min_pt, const Point2& max_pt) : min(min_pt), max(max_pt) {}
    AABB(float min_x, float min_y, float max_x, float max_y)
        : min(min_x, min_y), max(max_x, max_y) {}

    static AABB empty() { return AABB(); }
    static AABB from_center(const Point2& center, const Point2& half_extents) {
        return AABB(center - half_extents, center + half_extents);
    }

    Point2 size()   const { return max - min; }
    Point2 center() const { return min + size() / 2.0f; }
    float width()  const noexcept { return max.x() - min.x(); }
    float height() const noexcept { return max.y() - min.y(); }

    bool is_empty() const noexcept { return min.x() > max.x() || min.y() > max.y(); }
    bool valid() const noexcept {
        return std::isfinite(min.x()) && std::isfinite(min.y()) &&
               std::isfinite(max.x()) && std::isfinite(max.y());
    }

    void join_mut(const AABB& other) {
        min = min.cwiseMin(other.min);
        max = max.cwiseMax(other.max);
    }

    void grow_mut(const Point2& point) {
        min = min.cwiseMin(point);
        max = max.cwiseMax(point);
    }

    // Closed intervals on both axes
    bool contains(const Point2& p) const noexcept {
        return p.x() >= min.x() && p.x() <= max.x() &&
               p.y() >= min.y() && p.y() <= max.y();
    }

    // Touching edges count as intersecting
    bool intersects(const AABB& other) const noexcept {
        return min.x() <= other.max.x() && max.x() >= other.min.x() &&
               min.y() <= other.max.y() && max.y() >= other.min.y();
    }

    bool operator==(const AABB& other) const { return min == other.min && max == other.max; }
    bool operator!=(const AABB& other) const { return !(*this == other); }
};

inline AABB join(const AABB& a, const AABB& b) {
    AABB out = a;
    out.join_mut(b);
    return out;
}

inline AABB grow(const AABB& box, const Point2& point) {
    AABB out = box;
    out.grow_mut(point);
    return out;
}

inline bool contains(const AABB& box, const Point2& point) noexcept { return box.contains(point); }
inline bool intersects(const AABB& a, const AABB& b) noexcept { return a.intersects(b); }

// Fold join() over bounds[indices[0..count)], starting from Empty.
inline AABB joint_bounds_of(const int32_t* indices, std::size_t count, const AABB* bounds) {
    AABB out;
    for (std::size_t i = 0; i < count; ++i) {
        out.join_mut(bounds[indices[i]]);
    }
    return out;
}

} // namespace qbvh
