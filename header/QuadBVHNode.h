#pragma once
#include "Bounds.hpp"
#include <array>
#include <cassert>
#include <cstdint>

namespace qbvh {

// One record per tree node, either a Leaf (one shape index) or an Internal
// node with up to four (child index, child box) slots.
class QuadBVHNode {
public:
    static constexpr int BRANCHING = 4;
    static constexpr int32_t NO_CHILD = -1;

    QuadBVHNode()
        : shape_index_(-1), flags_(0)
        , children_{{NO_CHILD, NO_CHILD, NO_CHILD, NO_CHILD}}
    {}

    static QuadBVHNode make_leaf(int32_t shape_index) {
        QuadBVHNode node;
        node.shape_index_ = shape_index;
        node.flags_ = LEAF_BIT;
        return node;
    }

    // A slot exists iff its child index is non-negative. Absent slots keep the
    // Empty box they were given.
    static QuadBVHNode make_internal(const std::array<int32_t, BRANCHING>& children,
                                     const std::array<AABB, BRANCHING>& boxes) {
        QuadBVHNode node;
        node.children_ = children;
        node.child0_box_ = boxes[0];
        node.child1_box_ = boxes[1];
        node.child2_box_ = boxes[2];
        node.child3_box_ = boxes[3];
        for (int slot = 0; slot < BRANCHING; ++slot) {
            if (children[slot] >= 0) node.flags_ |= static_cast<uint8_t>(1u << slot);
        }
        return node;
    }

    bool is_leaf() const noexcept { return (flags_ & LEAF_BIT) != 0; }
    int32_t shape_index() const noexcept { return shape_index_; }

    int child_mask() const noexcept { return flags_ & CHILD_BITS; }
    bool has_child(int slot) const noexcept { return (flags_ & (1u << slot)) != 0; }

    int child_count() const noexcept {
        int count = 0;
        for (int slot = 0; slot < BRANCHING; ++slot) count += has_child(slot) ? 1 : 0;
        return count;
    }

    int32_t child_index(int slot) const noexcept {
        if (slot < 0 || slot >= BRANCHING) return NO_CHILD;
        return children_[slot];
    }

    const AABB& child_box(int slot) const noexcept {
        assert(slot >= 0 && slot < BRANCHING);
        switch (slot) {
            case 0:  return child0_box_;
            case 1:  return child1_box_;
            case 2:  return child2_box_;
            default: return child3_box_;
        }
    }

    const AABB& child0_box() const noexcept { return child0_box_; }
    const AABB& child1_box() const noexcept { return child1_box_; }
    const AABB& child2_box() const noexcept { return child2_box_; }
    const AABB& child3_box() const noexcept { return child3_box_; }

private:
    static constexpr uint8_t CHILD_BITS = 0x0F;  // bits 0-3: slot occupied
    static constexpr uint8_t LEAF_BIT   = 0x10;

    // Leaf payload and flags (8 bytes with padding)
    int32_t shape_index_;
    uint8_t flags_;

    // Child links (16 bytes)
    std::array<int32_t, BRANCHING> children_;

    // Child boxes (64 bytes). Separate fields, not an array, so the 4-wide
    // tests can take all four by reference in one call.
    AABB child0_box_;
    AABB child1_box_;
    AABB child2_box_;
    AABB child3_box_;
};

} // namespace qbvh
