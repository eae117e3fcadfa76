#include "ContainsIterator.h"
#include "QuadBVH.h"

namespace qbvh {

ContainsIterator::ContainsIterator(const QuadBVH& tree, const Point2& point)
    : tree_(&tree), point_(point), current_(-1)
{
    stack_.reserve(tree.iterator_stack_reserve_);
    seed_root();
}

void ContainsIterator::seed_root() {
    // The root box gates the walk, so a tree whose root is a single leaf
    // still only yields that shape when its box holds the point.
    if (tree_->node_count_ > 0 && tree_->bounds_.contains(point_)) {
        stack_.push_back(0);
    }
}

bool ContainsIterator::next() {
    while (!stack_.empty()) {
        const int32_t node_index = stack_.back();
        stack_.pop_back();

        const QuadBVHNode& node = tree_->nodes_[node_index];
        if (node.is_leaf()) {
            current_ = node.shape_index();
            return true;
        }

        // Push 3..0 so slot 0 is popped first
        const int mask = tree_->contains_mask(node, point_);
        if (mask & 8) stack_.push_back(node.child_index(3));
        if (mask & 4) stack_.push_back(node.child_index(2));
        if (mask & 2) stack_.push_back(node.child_index(1));
        if (mask & 1) stack_.push_back(node.child_index(0));
    }
    return false;
}

void ContainsIterator::reset() {
    stack_.clear();
    current_ = -1;
    seed_root();
}

} // namespace qbvh
