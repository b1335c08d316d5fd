#pragma once

#include <functional>
#include <vector>

#include "DataStructs.hpp"

namespace DmrScan {

/**
 * @brief Locates the strongest sub-span of each candidate region.
 *
 * Starting from the full candidate, each step scores the two spans obtained
 * by dropping the leftmost or the rightmost site and moves to the better one
 * if its |z| is strictly larger than the current |z|. The walk stops when
 * neither trim improves or a single site remains. This costs O(K) score
 * evaluations per candidate instead of the O(K^2) exhaustive search, and
 * every evaluation is reported as one statistical test.
 *
 * Candidates are independent and are shrunk in parallel; the score function
 * must therefore be safe to call concurrently.
 *
 * @code
 * RegionShrinker shrinker(num_threads);
 * auto shrunk = shrinker.shrink(candidates, [&](int s, int e) { return engine_z(s, e); });
 * @endcode
 */
class RegionShrinker {
public:
    /// Returns the z-score of the inclusive span [start, end].
    using ScoreFunction = std::function<double(int, int)>;

    explicit RegionShrinker(int num_threads = 1) : num_threads_(num_threads) {}

    /**
     * @brief Shrinks every candidate; result i belongs to candidate i.
     *
     * @throws Rethrows the first exception raised by the score function.
     */
    std::vector<ShrunkRegion> shrink(const std::vector<CandidateRegion>& candidates,
                                     const ScoreFunction& score) const;

    /**
     * @brief Greedy trim search for one candidate.
     *
     * Size-1 candidates are returned unchanged with zero evaluations.
     */
    static ShrunkRegion shrink_one(const CandidateRegion& candidate, const ScoreFunction& score);

    /**
     * @brief Total evaluations across a shrink() result.
     */
    static long long total_tests(const std::vector<ShrunkRegion>& regions);

private:
    int num_threads_;
};

}  // namespace DmrScan
