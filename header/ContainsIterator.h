#pragma once
#include "Bounds.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace qbvh {

class QuadBVH;

// Lazy depth-first walk yielding the shape index of every leaf whose box
// contains the point. Siblings are visited in slot order 0..3.
//
// The iterator borrows the tree; the tree must outlive it. Abandoning it
// part-way is fine, and reset() restarts from the root.
class ContainsIterator {
public:
    ContainsIterator(const QuadBVH& tree, const Point2& point);

    // Advance to the next match. Returns false once the walk is exhausted.
    bool next();

    // Shape index of the last match; -1 before the first next() or after reset().
    int32_t current() const noexcept { return current_; }

    void reset();

    const Point2& point() const noexcept { return point_; }
    size_t pending() const noexcept { return stack_.size(); }

    // Input iterator over the same state, for range-for. begin() continues
    // from wherever next() left off.
    class Cursor {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = int32_t;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const int32_t*;
        using reference         = int32_t;

        Cursor() : owner_(nullptr) {}
        explicit Cursor(ContainsIterator* owner) : owner_(owner) {}

        int32_t operator*() const { return owner_->current(); }
        Cursor& operator++() {
            if (!owner_->next()) owner_ = nullptr;
            return *this;
        }
        void operator++(int) { ++*this; }

        bool operator==(const Cursor& other) const { return owner_ == other.owner_; }
        bool operator!=(const Cursor& other) const { return owner_ != other.owner_; }

    private:
        ContainsIterator* owner_;
    };

    Cursor begin() { return next() ? Cursor(this) : Cursor(); }
    Cursor end() { return Cursor(); }

private:
    void seed_root();

    const QuadBVH* tree_;
    Point2 point_;
    std::vector<int32_t> stack_;
    int32_t current_;
};

} // namespace qbvh
