/**
 * Vector operations shared by matching, clustering and anomaly analysis
 *
 * - Cosine similarity (AVX2 when available)
 * - L2 distance
 * - Dimension conformance for vectors that do not have length D
 * - Brute-force top-k cosine search with stable tie order
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "counselscript/types.hpp"

#if defined(__AVX2__)
#include <immintrin.h>
#endif

namespace counselscript {
namespace vecops {

// =============================================================================
// Cosine Similarity
// =============================================================================

#if defined(__AVX2__)
inline double cosine_similarity_avx2(const float* a, const float* b, size_t n) noexcept {
    __m256 dot_sum = _mm256_setzero_ps();
    __m256 norm_a_sum = _mm256_setzero_ps();
    __m256 norm_b_sum = _mm256_setzero_ps();

    size_t i = 0;
    for (; i + 8 <= n; i += 8) {
        __m256 va = _mm256_loadu_ps(&a[i]);
        __m256 vb = _mm256_loadu_ps(&b[i]);

        dot_sum = _mm256_fmadd_ps(va, vb, dot_sum);
        norm_a_sum = _mm256_fmadd_ps(va, va, norm_a_sum);
        norm_b_sum = _mm256_fmadd_ps(vb, vb, norm_b_sum);
    }

    auto hsum = [](const __m256 v) -> double {
        __m128 lo = _mm256_extractf128_ps(v, 0);
        __m128 hi = _mm256_extractf128_ps(v, 1);
        __m128 sum = _mm_add_ps(lo, hi);
        sum = _mm_hadd_ps(sum, sum);
        sum = _mm_hadd_ps(sum, sum);
        return _mm_cvtss_f32(sum);
    };

    double dot = hsum(dot_sum);
    double norm_a = hsum(norm_a_sum);
    double norm_b = hsum(norm_b_sum);

    for (; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a == 0 || norm_b == 0) return 0.0;
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}
#endif

inline double cosine_similarity_portable(const float* a, const float* b, size_t n) noexcept {
    double dot = 0, norm_a = 0, norm_b = 0;
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a == 0 || norm_b == 0) return 0.0;
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

inline double cosine_similarity(const float* a, const float* b, size_t n) noexcept {
#if defined(__AVX2__)
    return cosine_similarity_avx2(a, b, n);
#else
    return cosine_similarity_portable(a, b, n);
#endif
}

// Compares the common prefix; callers conform dimensions first
inline double cosine_similarity(const Vector& a, const Vector& b) noexcept {
    return cosine_similarity(a.data(), b.data(), std::min(a.size(), b.size()));
}

// =============================================================================
// L2 Distance
// =============================================================================

inline double l2_distance(const float* a, const float* b, size_t n) noexcept {
    double sum = 0;
    for (size_t i = 0; i < n; ++i) {
        double diff = static_cast<double>(a[i]) - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

inline double l2_distance(const Vector& a, const Vector& b) noexcept {
    return l2_distance(a.data(), b.data(), std::min(a.size(), b.size()));
}

// =============================================================================
// Dimension conformance
// =============================================================================

enum class DimensionPolicy {
    Reject,          // mismatched vectors are an input error
    PadOrTruncate    // zero-pad short vectors, drop trailing components of long ones
};

// Returns false (and leaves v untouched) when policy is Reject and the size differs
inline bool conform_dimension(Vector& v, size_t dimension, DimensionPolicy policy) {
    if (v.size() == dimension) return true;
    if (policy == DimensionPolicy::Reject) return false;
    v.resize(dimension, 0.0f);
    return true;
}

// =============================================================================
// Top-k search
// =============================================================================

struct SimilarityResult {
    size_t index;
    double similarity;
};

// Descending by similarity; equal similarities keep candidate order
inline std::vector<SimilarityResult> find_top_k_cosine(
    const Vector& query,
    const std::vector<const Vector*>& candidates,
    size_t k,
    double threshold
) {
    std::vector<SimilarityResult> results;
    results.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        double sim = cosine_similarity(query, *candidates[i]);
        if (sim >= threshold) {
            results.push_back({i, sim});
        }
    }

    std::stable_sort(results.begin(), results.end(),
        [](const SimilarityResult& a, const SimilarityResult& b) {
            return a.similarity > b.similarity;
        });

    if (results.size() > k) {
        results.resize(k);
    }
    return results;
}

} // namespace vecops
} // namespace counselscript
