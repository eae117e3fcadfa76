#include "QuadBVH.h"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <numeric>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace qbvh {

QuadBVHBuilder::QuadBVHBuilder(const Config& config)
    : config_(config), event_bus_(nullptr) {}

QuadBVHBuilder::QuadBVHBuilder(EventBus& event_bus, const Config& config)
    : config_(config), event_bus_(&event_bus) {}

size_t QuadBVHBuilder::max_node_count(size_t shape_count) {
    if (shape_count == 0) return 0;

    // levels = ceil(log4 n) + 1, worked out in integers
    size_t levels = 1;
    for (size_t reach = 1; reach < shape_count; reach *= 4) {
        ++levels;
    }
    size_t full = 1;
    for (size_t l = 0; l < levels; ++l) {
        full *= 4;
    }
    return (full - 1) / 3 + shape_count;
}

void QuadBVHBuilder::check_count(size_t count) const {
    if (count > max_shape_count()) {
        if (event_bus_) {
            event_bus_->emit(Events::BUILD_REJECTED, BuildRejectedEvent{"too many shapes", count});
        }
        throw std::length_error("QuadBVHBuilder: " + std::to_string(count) +
                                " shapes exceeds the 32-bit node index range");
    }
}

void QuadBVHBuilder::reject(const char* reason, size_t count) const {
    if (event_bus_) {
        event_bus_->emit(Events::BUILD_REJECTED, BuildRejectedEvent{reason, count});
    }
    throw std::invalid_argument(std::string("QuadBVHBuilder: ") + reason);
}

QuadBVH QuadBVHBuilder::build_from_bounds(const std::vector<AABB>& bounds) {
    check_count(bounds.size());
    bounds_ = bounds;
    return build_cached();
}


//===========================================================================================
//==                                       BUILD                                           ==
//===========================================================================================

QuadBVH QuadBVHBuilder::build_cached() {
    const auto start = std::chrono::high_resolution_clock::now();

    QuadBVH tree;
    tree.use_simd_ = config_.enable_simd;
    tree.iterator_stack_reserve_ = std::max<size_t>(config_.iterator_stack_reserve, 1);

    const size_t n = bounds_.size();
    tree.shape_count_ = n;
    if (n == 0) {
        report(tree, start);
        return tree;
    }

    indices_.resize(n);
    std::iota(indices_.begin(), indices_.end(), 0);
    scratch_.resize(n);

    tree.nodes_.resize(max_node_count(n));
    size_t node_count = 0;
    const int32_t root = build_node(tree.nodes_, node_count, 0, n);
    assert(root == 0);
    (void)root;

    tree.node_count_ = node_count;
    tree.bounds_ = joint_bounds_of(indices_.data(), n, bounds_.data());

    report(tree, start);
    return tree;
}

namespace {

int32_t reserve_node(size_t& node_count, const std::vector<QuadBVHNode>& nodes) {
    assert(node_count < nodes.size() && "node array under-allocated");
    (void)nodes;
    return static_cast<int32_t>(node_count++);
}

} // namespace

int32_t QuadBVHBuilder::build_node(std::vector<QuadBVHNode>& nodes, size_t& node_count,
                                   size_t first, size_t count)
{
    if (count <= MAX_LEAF_GROUP) {
        if (count == 1) {
            const int32_t leaf = reserve_node(node_count, nodes);
            nodes[leaf] = QuadBVHNode::make_leaf(indices_[first]);
            return leaf;
        }
        return build_leaf_group(nodes, node_count, first, count);
    }

    AABB centroid_bounds;
    for (size_t i = first; i < first + count; ++i) {
        centroid_bounds.grow_mut(bounds_[indices_[i]].center());
    }

    const int32_t node_index = reserve_node(node_count, nodes);

    const Point2 spread = centroid_bounds.size();
    if (spread.x() < config_.centroid_epsilon && spread.y() < config_.centroid_epsilon) {
        return build_by_splitting(nodes, node_count, node_index, first, count);
    }

    const Point2 split = centroid_bounds.center();

    std::array<size_t, 4> sizes{};
    for (size_t i = first; i < first + count; ++i) {
        ++sizes[get_quadrant(bounds_[indices_[i]].center(), split)];
    }

    // Rounding of the split point can leave every center on one side
    if (*std::max_element(sizes.begin(), sizes.end()) == count) {
        return build_by_splitting(nodes, node_count, node_index, first, count);
    }

    // Stable counting partition through scratch_, so each bucket keeps input order
    std::array<size_t, 4> cursor{};
    cursor[0] = first;
    for (int q = 1; q < 4; ++q) {
        cursor[q] = cursor[q - 1] + sizes[q - 1];
    }
    for (size_t i = first; i < first + count; ++i) {
        const int32_t shape = indices_[i];
        scratch_[cursor[get_quadrant(bounds_[shape].center(), split)]++] = shape;
    }
    std::copy(scratch_.begin() + first, scratch_.begin() + first + count, indices_.begin() + first);

    return build_internal(nodes, node_count, node_index, first, sizes);
}

int32_t QuadBVHBuilder::build_leaf_group(std::vector<QuadBVHNode>& nodes, size_t& node_count,
                                         size_t first, size_t count)
{
    const int32_t node_index = reserve_node(node_count, nodes);

    std::array<int32_t, 4> children{{QuadBVHNode::NO_CHILD, QuadBVHNode::NO_CHILD,
                                     QuadBVHNode::NO_CHILD, QuadBVHNode::NO_CHILD}};
    std::array<AABB, 4> boxes;

    for (size_t slot = 0; slot < count && slot < 4; ++slot) {
        const int32_t shape = indices_[first + slot];
        const int32_t leaf = reserve_node(node_count, nodes);
        nodes[leaf] = QuadBVHNode::make_leaf(shape);
        children[slot] = leaf;
        boxes[slot] = bounds_[shape];
    }

    nodes[node_index] = QuadBVHNode::make_internal(children, boxes);
    return node_index;
}

// Centers coincide, so position in the index list is the only thing left to
// split on: quarters of ceil/floor size, remainder going to the first slots.
int32_t QuadBVHBuilder::build_by_splitting(std::vector<QuadBVHNode>& nodes, size_t& node_count,
                                           int32_t node_index, size_t first, size_t count)
{
    const size_t quarter = count / 4;
    const size_t remainder = count % 4;
    const std::array<size_t, 4> sizes{{
        quarter + (remainder > 0 ? 1 : 0),
        quarter + (remainder > 1 ? 1 : 0),
        quarter + (remainder > 2 ? 1 : 0),
        quarter
    }};
    return build_internal(nodes, node_count, node_index, first, sizes);
}

int32_t QuadBVHBuilder::build_internal(std::vector<QuadBVHNode>& nodes, size_t& node_count,
                                       int32_t node_index, size_t first,
                                       const std::array<size_t, 4>& sizes)
{
    std::array<int32_t, 4> children{{QuadBVHNode::NO_CHILD, QuadBVHNode::NO_CHILD,
                                     QuadBVHNode::NO_CHILD, QuadBVHNode::NO_CHILD}};
    std::array<AABB, 4> boxes;

    size_t offset = first;
    for (int slot = 0; slot < 4; ++slot) {
        if (sizes[slot] == 0) continue;
        boxes[slot] = joint_bounds_of(indices_.data() + offset, sizes[slot], bounds_.data());
        children[slot] = build_node(nodes, node_count, offset, sizes[slot]);
        offset += sizes[slot];
    }

    nodes[node_index] = QuadBVHNode::make_internal(children, boxes);
    return node_index;
}


//===========================================================================================
//==                                     REPORTING                                         ==
//===========================================================================================

void QuadBVHBuilder::report(const QuadBVH& tree,
                            std::chrono::high_resolution_clock::time_point start) const
{
    const bool publish = event_bus_ && event_bus_->has_subscribers(Events::TREE_BUILT);
    if (!publish && !config_.verbose) return;

    const double build_ms = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    const QuadBVH::Stats stats = tree.stats();

    if (config_.verbose) {
        std::cout << "QuadBVH built: " << tree.shape_count() << " shapes, "
                  << stats.node_count << " nodes (" << stats.leaf_count << " leaves), depth "
                  << stats.max_depth << ", " << build_ms << " ms, batch tests: "
                  << (config_.enable_simd ? simd_backend_name() : "scalar") << "\n";
        #ifdef _OPENMP
        if (config_.enable_threading && tree.shape_count() > config_.parallel_bounds_threshold) {
            std::cout << "  bounds pass used " << omp_get_max_threads() << " OpenMP threads\n";
        }
        #endif
    }

    if (publish) {
        TreeBuiltEvent event{tree.shape_count(), stats.node_count, stats.leaf_count,
                             stats.max_depth, build_ms};
        event_bus_->emit(Events::TREE_BUILT, event);
    }
}

} // namespace qbvh
