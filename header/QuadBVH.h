#pragma once
#include "Bounds.hpp"
#include "BatchPredicates.hpp"
#include "ContainsIterator.h"
#include "EventSystem.h"
#include "QuadBVHNode.h"
#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef QBVH_TESTING
struct QBVHTestHooks;
#endif

namespace qbvh {

// The only capability the index needs from a caller's shape type.
template<typename S>
concept Bounded = requires(const S& shape) {
    { shape.get_bounds() } -> std::convertible_to<AABB>;
};

class QuadBVHBuilder;

// Immutable 4-ary bounding volume tree over a caller-owned shape array.
// Queries return indices into that array; the tree never holds shape data.
// Trees are values: rebuild into a new QuadBVH and swap, never patch one that
// may be queried concurrently.
class QuadBVH {
public:
    struct Stats {
        size_t node_count;
        size_t leaf_count;
        size_t internal_count;
        size_t max_depth;
    };

    struct NodeBox {
        AABB box;
        int depth;
        bool is_leaf;
        int32_t shape_index;  // -1 for internal nodes

        NodeBox(const AABB& b, int d, bool leaf, int32_t shape)
            : box(b), depth(d), is_leaf(leaf), shape_index(shape) {}
    };

    QuadBVH();

    template<Bounded Shape>
    static QuadBVH build(const Shape* shapes, size_t count);
    template<Bounded Shape>
    static QuadBVH build(const std::vector<Shape>& shapes);
    static QuadBVH build_from_bounds(const std::vector<AABB>& bounds);

    // Point queries. All four forms visit matches in the same order.
    ContainsIterator contains_iterator(const Point2& point) const;
    std::vector<int32_t> query_point(const Point2& point) const;
    // Writes at most `capacity` matches and returns how many were written.
    size_t query_point(const Point2& point, int32_t* results, size_t capacity) const;
    void query_point(const Point2& point, std::vector<int32_t>& results) const;

    std::vector<int32_t> query_region(const AABB& region) const;

    size_t node_count() const noexcept { return node_count_; }
    size_t shape_count() const noexcept { return shape_count_; }
    bool empty() const noexcept { return node_count_ == 0; }
    const AABB& bounds() const noexcept { return bounds_; }
    const QuadBVHNode* nodes() const noexcept { return nodes_.data(); }
    bool simd_enabled() const noexcept { return use_simd_; }

    Stats stats() const;
    std::vector<NodeBox> get_node_boxes() const;

private:
    friend class QuadBVHBuilder;
    friend class ContainsIterator;
    #ifdef QBVH_TESTING
        friend struct ::QBVHTestHooks;
    #endif

    int contains_mask(const QuadBVHNode& node, const Point2& point) const noexcept {
        const int mask = use_simd_
            ? contains4(point, node.child0_box(), node.child1_box(), node.child2_box(), node.child3_box())
            : contains4_scalar(point, node.child0_box(), node.child1_box(), node.child2_box(), node.child3_box());
        return mask & node.child_mask();
    }

    int intersects_mask(const QuadBVHNode& node, const AABB& region) const noexcept {
        const int mask = use_simd_
            ? intersects4(region, node.child0_box(), node.child1_box(), node.child2_box(), node.child3_box())
            : intersects4_scalar(region, node.child0_box(), node.child1_box(), node.child2_box(), node.child3_box());
        return mask & node.child_mask();
    }

    void query_region_recursive(int32_t node_index, const AABB& region, std::vector<int32_t>& results) const;
    void collect_node_boxes(int32_t node_index, const AABB& box, int depth, std::vector<NodeBox>& boxes) const;

    // Sized to QuadBVHBuilder::max_node_count(); only [0, node_count_) is written.
    std::vector<QuadBVHNode> nodes_;
    size_t node_count_;
    size_t shape_count_;
    AABB bounds_;
    bool use_simd_;
    size_t iterator_stack_reserve_;
};

// Builds QuadBVH trees. Holds the scratch reused between builds, so one
// builder must not run two builds at once; give each thread its own.
class QuadBVHBuilder {
public:
    static constexpr size_t MAX_LEAF_GROUP = 4;

    struct Config {
        float centroid_epsilon;            // below this on both axes, centers are treated as coincident
        bool enable_simd;                  // route queries through the vector batch tests
        bool enable_threading;             // OpenMP for the per-shape bounds pass (if available)
        size_t parallel_bounds_threshold;  // shape count above which the bounds pass goes parallel
        size_t iterator_stack_reserve;     // initial stack capacity of each ContainsIterator
        bool verbose;                      // print a line per build to stdout

        Config()
            : centroid_epsilon(1e-5f)
            , enable_simd(true)
            , enable_threading(true)
            , parallel_bounds_threshold(1000)
            , iterator_stack_reserve(64)
            , verbose(false)
        {}
    };

    explicit QuadBVHBuilder(const Config& config = Config{});
    explicit QuadBVHBuilder(EventBus& event_bus, const Config& config = Config{});

    // Throws std::invalid_argument if `shapes` is null.
    template<Bounded Shape>
    QuadBVH build(const Shape* shapes, size_t count);

    template<Bounded Shape>
    QuadBVH build(const std::vector<Shape>& shapes) {
        return build_shapes(shapes.data(), shapes.size());
    }

    QuadBVH build_from_bounds(const std::vector<AABB>& bounds);

    const Config& get_config() const { return config_; }
    void set_config(const Config& config) { config_ = config; }

    // Node array size reserved before a build of `shape_count` shapes.
    static size_t max_node_count(size_t shape_count);
    static constexpr size_t max_shape_count() {
        return static_cast<size_t>(std::numeric_limits<int32_t>::max() / 2);
    }

private:
    template<Bounded Shape>
    QuadBVH build_shapes(const Shape* shapes, size_t count);

    void check_count(size_t count) const;
    [[noreturn]] void reject(const char* reason, size_t count) const;

    QuadBVH build_cached();
    int32_t build_node(std::vector<QuadBVHNode>& nodes, size_t& node_count, size_t first, size_t count);
    int32_t build_leaf_group(std::vector<QuadBVHNode>& nodes, size_t& node_count, size_t first, size_t count);
    int32_t build_by_splitting(std::vector<QuadBVHNode>& nodes, size_t& node_count,
                               int32_t node_index, size_t first, size_t count);
    int32_t build_internal(std::vector<QuadBVHNode>& nodes, size_t& node_count, int32_t node_index,
                           size_t first, const std::array<size_t, 4>& sizes);
    void report(const QuadBVH& tree, std::chrono::high_resolution_clock::time_point start) const;

    // SW(0), SE(1), NW(2), NE(3) around the split point
    static inline int get_quadrant(const Point2& p, const Point2& split) {
        const int east  = (p.x() >= split.x()) ? 1 : 0;
        const int north = (p.y() >= split.y()) ? 1 : 0;
        return (north << 1) | east;
    }

    Config config_;
    EventBus* event_bus_;

    std::vector<AABB> bounds_;      // one per shape, read once per build
    std::vector<int32_t> indices_;  // shape indices, partitioned in place
    std::vector<int32_t> scratch_;  // partition staging, same length as indices_
};

//===========================================================================================
//==                                 TEMPLATE DEFINITIONS                                  ==
//===========================================================================================

template<Bounded Shape>
QuadBVH QuadBVH::build(const Shape* shapes, size_t count) {
    QuadBVHBuilder builder;
    return builder.build(shapes, count);
}

template<Bounded Shape>
QuadBVH QuadBVH::build(const std::vector<Shape>& shapes) {
    QuadBVHBuilder builder;
    return builder.build(shapes);
}

template<Bounded Shape>
QuadBVH QuadBVHBuilder::build(const Shape* shapes, size_t count) {
    if (shapes == nullptr) {
        reject("shape array is null", count);
    }
    return build_shapes(shapes, count);
}

template<Bounded Shape>
QuadBVH QuadBVHBuilder::build_shapes(const Shape* shapes, size_t count) {
    check_count(count);
    bounds_.resize(count);

    #ifdef _OPENMP
    if (config_.enable_threading && count > config_.parallel_bounds_threshold) {
        #pragma omp parallel for schedule(static)
        for (long long i = 0; i < static_cast<long long>(count); ++i) {
            bounds_[static_cast<size_t>(i)] = shapes[i].get_bounds();
        }
        return build_cached();
    }
    #endif

    for (size_t i = 0; i < count; ++i) {
        bounds_[i] = shapes[i].get_bounds();
    }
    return build_cached();
}

} // namespace qbvh
