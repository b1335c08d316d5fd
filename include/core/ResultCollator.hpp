#pragma once

#include <vector>

#include "DataStructs.hpp"
#include "Types.hpp"

namespace DmrScan {

/**
 * @brief Builds the final DMR records and applies the multiplicity correction.
 *
 * The correction is global: its denominator is the number of per-site tests
 * plus every shrinker evaluation across all candidates, so collation must
 * run after all candidates are finished.
 */
class ResultCollator {
public:
    explicit ResultCollator(AdjustMethod method = AdjustMethod::BONFERRONI) : method_(method) {}

    /**
     * @brief Assembles one record per shrunk region, in candidate order.
     *
     * @param shrunk Shrinker output, one entry per candidate.
     * @param stats Final (B, S) of each shrunk span, same order as @p shrunk.
     * @param sites Sorted site table the spans index into.
     * @throws std::invalid_argument if @p shrunk and @p stats differ in length.
     */
    std::vector<DmrRecord> collate(const std::vector<ShrunkRegion>& shrunk, const std::vector<MetaStats>& stats,
                                   const std::vector<Site>& sites) const;

    /**
     * @brief Number of tests used as the correction denominator.
     */
    static long long num_tests(const std::vector<ShrunkRegion>& shrunk, size_t num_sites);

    /**
     * @brief Adjusts p-values as if @p n tests had been performed (n >= p.size()).
     *
     * Matches R's p.adjust(p, method, n).
     */
    static std::vector<double> adjust_pvalues(const std::vector<double>& p, AdjustMethod method, long long n);

    AdjustMethod method() const { return method_; }

private:
    AdjustMethod method_;
};

}  // namespace DmrScan
