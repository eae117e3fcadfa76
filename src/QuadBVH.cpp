#include "QuadBVH.h"
#include <algorithm>

namespace qbvh {

QuadBVH::QuadBVH()
    : node_count_(0), shape_count_(0), bounds_(AABB::empty()),
      use_simd_(true), iterator_stack_reserve_(64) {}

QuadBVH QuadBVH::build_from_bounds(const std::vector<AABB>& bounds) {
    QuadBVHBuilder builder;
    return builder.build_from_bounds(bounds);
}


//===========================================================================================
//==                                    POINT QUERIES                                      ==
//===========================================================================================

ContainsIterator QuadBVH::contains_iterator(const Point2& point) const {
    return ContainsIterator(*this, point);
}

std::vector<int32_t> QuadBVH::query_point(const Point2& point) const {
    std::vector<int32_t> results;
    results.reserve(16);
    query_point(point, results);
    return results;
}

size_t QuadBVH::query_point(const Point2& point, int32_t* results, size_t capacity) const {
    if (results == nullptr || capacity == 0) return 0;

    size_t count = 0;
    ContainsIterator it(*this, point);
    while (count < capacity && it.next()) {
        results[count++] = it.current();
    }
    return count;
}

void QuadBVH::query_point(const Point2& point, std::vector<int32_t>& results) const {
    for (int32_t shape : contains_iterator(point)) {
        results.push_back(shape);
    }
}


//===========================================================================================
//==                                    REGION QUERY                                       ==
//===========================================================================================

std::vector<int32_t> QuadBVH::query_region(const AABB& region) const {
    std::vector<int32_t> results;
    results.reserve(32);
    if (node_count_ == 0 || !bounds_.intersects(region)) {
        return results;
    }
    query_region_recursive(0, region, results);
    return results;
}

void QuadBVH::query_region_recursive(int32_t node_index, const AABB& region,
                                     std::vector<int32_t>& results) const
{
    const QuadBVHNode& node = nodes_[node_index];
    if (node.is_leaf()) {
        results.push_back(node.shape_index());
        return;
    }

    const int mask = intersects_mask(node, region);
    for (int slot = 0; slot < QuadBVHNode::BRANCHING; ++slot) {
        if (mask & (1 << slot)) {
            query_region_recursive(node.child_index(slot), region, results);
        }
    }
}


//===========================================================================================
//==                                   INTROSPECTION                                       ==
//===========================================================================================

QuadBVH::Stats QuadBVH::stats() const {
    Stats out{node_count_, 0, 0, 0};
    if (node_count_ == 0) return out;

    struct StackItem {
        int32_t node_index;
        size_t depth;
    };
    std::vector<StackItem> stack;
    stack.reserve(iterator_stack_reserve_);
    stack.push_back({0, 0});

    while (!stack.empty()) {
        const StackItem item = stack.back();
        stack.pop_back();

        out.max_depth = std::max(out.max_depth, item.depth);
        const QuadBVHNode& node = nodes_[item.node_index];
        if (node.is_leaf()) {
            ++out.leaf_count;
            continue;
        }

        ++out.internal_count;
        for (int slot = QuadBVHNode::BRANCHING - 1; slot >= 0; --slot) {
            if (node.has_child(slot)) {
                stack.push_back({node.child_index(slot), item.depth + 1});
            }
        }
    }
    return out;
}

std::vector<QuadBVH::NodeBox> QuadBVH::get_node_boxes() const {
    std::vector<NodeBox> boxes;
    if (node_count_ == 0) return boxes;

    boxes.reserve(node_count_);
    collect_node_boxes(0, bounds_, 0, boxes);
    return boxes;
}

void QuadBVH::collect_node_boxes(int32_t node_index, const AABB& box, int depth,
                                 std::vector<NodeBox>& boxes) const
{
    const QuadBVHNode& node = nodes_[node_index];
    boxes.emplace_back(box, depth, node.is_leaf(), node.is_leaf() ? node.shape_index() : -1);

    if (node.is_leaf()) return;
    for (int slot = 0; slot < QuadBVHNode::BRANCHING; ++slot) {
        if (node.has_child(slot)) {
            collect_node_boxes(node.child_index(slot), node.child_box(slot), depth + 1, boxes);
        }
    }
}

} // namespace qbvh
