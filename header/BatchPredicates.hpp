#pragma once
#include "Bounds.hpp"

#if defined(__ARM_NEON)
#include <arm_neon.h>
#define QBVH_SIMD_NEON 1
#elif defined(__SSE2__) || defined(_M_X64) || (defined(_M_IX86_FP) && _M_IX86_FP >= 2)
#include <xmmintrin.h>
#define QBVH_SIMD_SSE 1
#endif

// 4-wide box tests. Bit i of the returned mask is set iff box i satisfies the
// predicate. The vector paths must agree bit-for-bit with the *_scalar
// versions, NaN lanes included (every compare is ordered, so NaN -> false).

namespace qbvh {

inline int contains4_scalar(const Point2& point,
                            const AABB& b0, const AABB& b1,
                            const AABB& b2, const AABB& b3) noexcept
{
    int mask = 0;
    if (b0.contains(point)) mask |= 1;
    if (b1.contains(point)) mask |= 2;
    if (b2.contains(point)) mask |= 4;
    if (b3.contains(point)) mask |= 8;
    return mask;
}

inline int intersects4_scalar(const AABB& query,
                              const AABB& b0, const AABB& b1,
                              const AABB& b2, const AABB& b3) noexcept
{
    int mask = 0;
    if (query.intersects(b0)) mask |= 1;
    if (query.intersects(b1)) mask |= 2;
    if (query.intersects(b2)) mask |= 4;
    if (query.intersects(b3)) mask |= 8;
    return mask;
}

#if defined(QBVH_SIMD_NEON)
namespace detail {

// NEON has no movemask; select one bit per lane and sum horizontally.
inline int movemask_u32x4(uint32x4_t lanes) noexcept {
    const uint32x4_t lane_bits = {1u, 2u, 4u, 8u};
    const uint32x4_t selected = vandq_u32(lanes, lane_bits);
#if defined(__aarch64__)
    return static_cast<int>(vaddvq_u32(selected));
#else
    const uint32x2_t half = vadd_u32(vget_low_u32(selected), vget_high_u32(selected));
    return static_cast<int>(vget_lane_u32(vpadd_u32(half, half), 0));
#endif
}

} // namespace detail
#endif

inline int contains4(const Point2& point,
                     const AABB& b0, const AABB& b1,
                     const AABB& b2, const AABB& b3) noexcept
{
#if defined(QBVH_SIMD_NEON)
    const float32x4_t px = vdupq_n_f32(point.x());
    const float32x4_t py = vdupq_n_f32(point.y());

    alignas(16) const float min_x[4] = {b0.min.x(), b1.min.x(), b2.min.x(), b3.min.x()};
    alignas(16) const float min_y[4] = {b0.min.y(), b1.min.y(), b2.min.y(), b3.min.y()};
    alignas(16) const float max_x[4] = {b0.max.x(), b1.max.x(), b2.max.x(), b3.max.x()};
    alignas(16) const float max_y[4] = {b0.max.y(), b1.max.y(), b2.max.y(), b3.max.y()};

    const uint32x4_t in_x = vandq_u32(vcgeq_f32(px, vld1q_f32(min_x)),
                                      vcleq_f32(px, vld1q_f32(max_x)));
    const uint32x4_t in_y = vandq_u32(vcgeq_f32(py, vld1q_f32(min_y)),
                                      vcleq_f32(py, vld1q_f32(max_y)));
    return detail::movemask_u32x4(vandq_u32(in_x, in_y));
#elif defined(QBVH_SIMD_SSE)
    const __m128 px = _mm_set1_ps(point.x());
    const __m128 py = _mm_set1_ps(point.y());

    const __m128 min_x = _mm_setr_ps(b0.min.x(), b1.min.x(), b2.min.x(), b3.min.x());
    const __m128 min_y = _mm_setr_ps(b0.min.y(), b1.min.y(), b2.min.y(), b3.min.y());
    const __m128 max_x = _mm_setr_ps(b0.max.x(), b1.max.x(), b2.max.x(), b3.max.x());
    const __m128 max_y = _mm_setr_ps(b0.max.y(), b1.max.y(), b2.max.y(), b3.max.y());

    const __m128 in_x = _mm_and_ps(_mm_cmpge_ps(px, min_x), _mm_cmple_ps(px, max_x));
    const __m128 in_y = _mm_and_ps(_mm_cmpge_ps(py, min_y), _mm_cmple_ps(py, max_y));
    return _mm_movemask_ps(_mm_and_ps(in_x, in_y));
#else
    return contains4_scalar(point, b0, b1, b2, b3);
#endif
}

inline int intersects4(const AABB& query,
                       const AABB& b0, const AABB& b1,
                       const AABB& b2, const AABB& b3) noexcept
{
#if defined(QBVH_SIMD_NEON)
    const float32x4_t q_min_x = vdupq_n_f32(query.min.x());
    const float32x4_t q_min_y = vdupq_n_f32(query.min.y());
    const float32x4_t q_max_x = vdupq_n_f32(query.max.x());
    const float32x4_t q_max_y = vdupq_n_f32(query.max.y());

    alignas(16) const float min_x[4] = {b0.min.x(), b1.min.x(), b2.min.x(), b3.min.x()};
    alignas(16) const float min_y[4] = {b0.min.y(), b1.min.y(), b2.min.y(), b3.min.y()};
    alignas(16) const float max_x[4] = {b0.max.x(), b1.max.x(), b2.max.x(), b3.max.x()};
    alignas(16) const float max_y[4] = {b0.max.y(), b1.max.y(), b2.max.y(), b3.max.y()};

    const uint32x4_t overlap_x = vandq_u32(vcleq_f32(q_min_x, vld1q_f32(max_x)),
                                           vcgeq_f32(q_max_x, vld1q_f32(min_x)));
    const uint32x4_t overlap_y = vandq_u32(vcleq_f32(q_min_y, vld1q_f32(max_y)),
                                           vcgeq_f32(q_max_y, vld1q_f32(min_y)));
    return detail::movemask_u32x4(vandq_u32(overlap_x, overlap_y));
#elif defined(QBVH_SIMD_SSE)
    const __m128 q_min_x = _mm_set1_ps(query.min.x());
    const __m128 q_min_y = _mm_set1_ps(query.min.y());
    const __m128 q_max_x = _mm_set1_ps(query.max.x());
    const __m128 q_max_y = _mm_set1_ps(query.max.y());

    const __m128 min_x = _mm_setr_ps(b0.min.x(), b1.min.x(), b2.min.x(), b3.min.x());
    const __m128 min_y = _mm_setr_ps(b0.min.y(), b1.min.y(), b2.min.y(), b3.min.y());
    const __m128 max_x = _mm_setr_ps(b0.max.x(), b1.max.x(), b2.max.x(), b3.max.x());
    const __m128 max_y = _mm_setr_ps(b0.max.y(), b1.max.y(), b2.max.y(), b3.max.y());

    const __m128 overlap_x = _mm_and_ps(_mm_cmple_ps(q_min_x, max_x), _mm_cmpge_ps(q_max_x, min_x));
    const __m128 overlap_y = _mm_and_ps(_mm_cmple_ps(q_min_y, max_y), _mm_cmpge_ps(q_max_y, min_y));
    return _mm_movemask_ps(_mm_and_ps(overlap_x, overlap_y));
#else
    return intersects4_scalar(query, b0, b1, b2, b3);
#endif
}

constexpr const char* simd_backend_name() noexcept {
#if defined(QBVH_SIMD_NEON)
    return "neon";
#elif defined(QBVH_SIMD_SSE)
    return "sse2";
#else
    return "scalar";
#endif
}

} // namespace qbvh
