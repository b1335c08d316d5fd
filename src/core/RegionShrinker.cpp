#include "core/RegionShrinker.hpp"

#include <omp.h>

#include <cmath>
#include <exception>
#include <string>

#include "utils/Logger.hpp"

namespace DmrScan {

ShrunkRegion RegionShrinker::shrink_one(const CandidateRegion& candidate, const ScoreFunction& score) {
    ShrunkRegion region;
    region.start_idx = candidate.start_idx;
    region.end_idx = candidate.end_idx;

    if (candidate.size() <= 1) {
        return region;
    }

    int start = candidate.start_idx;
    int end = candidate.end_idx;
    double z = score(start, end);
    region.n_tests = 1;

    while (end > start) {
        double z_left = score(start + 1, end);
        double z_right = score(start, end - 1);
        region.n_tests += 2;

        // Ties between the two trims go to the left trim
        bool take_left = std::abs(z_left) >= std::abs(z_right);
        double z_next = take_left ? z_left : z_right;

        if (!(std::abs(z_next) > std::abs(z))) {
            break;
        }

        if (take_left) {
            start++;
        } else {
            end--;
        }
        z = z_next;
        region.n_steps++;
    }

    region.start_idx = start;
    region.end_idx = end;
    region.z = z;
    return region;
}

std::vector<ShrunkRegion> RegionShrinker::shrink(const std::vector<CandidateRegion>& candidates,
                                                 const ScoreFunction& score) const {
    const int n = static_cast<int>(candidates.size());
    std::vector<ShrunkRegion> results(n);

    int threads = num_threads_ > 0 ? num_threads_ : omp_get_max_threads();
    std::exception_ptr first_error;

#pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (int i = 0; i < n; ++i) {
        try {
            results[i] = shrink_one(candidates[i], score);
        } catch (...) {
#pragma omp critical(shrinker_error)
            {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    LOG_DEBUG("Shrunk " + std::to_string(n) + " candidates with " + std::to_string(total_tests(results)) +
              " evaluations");

    return results;
}

long long RegionShrinker::total_tests(const std::vector<ShrunkRegion>& regions) {
    long long total = 0;
    for (const auto& region : regions) {
        total += region.n_tests;
    }
    return total;
}

}  // namespace DmrScan
