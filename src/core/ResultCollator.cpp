#include "core/ResultCollator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

#include "core/MetaAnalysis.hpp"
#include "core/RegionShrinker.hpp"
#include "utils/Logger.hpp"

namespace DmrScan {

long long ResultCollator::num_tests(const std::vector<ShrunkRegion>& shrunk, size_t num_sites) {
    return static_cast<long long>(num_sites) + RegionShrinker::total_tests(shrunk);
}

std::vector<double> ResultCollator::adjust_pvalues(const std::vector<double>& p, AdjustMethod method, long long n) {
    const size_t m = p.size();
    if (n < static_cast<long long>(m)) {
        throw std::invalid_argument("adjust_pvalues: n (" + std::to_string(n) + ") is smaller than the number of p-values");
    }

    std::vector<double> adjusted(m);
    const double dn = static_cast<double>(n);

    switch (method) {
        case AdjustMethod::BONFERRONI: {
            for (size_t i = 0; i < m; ++i) {
                adjusted[i] = std::min(1.0, p[i] * dn);
            }
            break;
        }
        case AdjustMethod::FDR: {
            // Step-up from the largest p-value: cummin(n / rank * p)
            std::vector<size_t> order(m);
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [&p](size_t a, size_t b) { return p[a] > p[b]; });

            double running = 1.0;
            for (size_t k = 0; k < m; ++k) {
                double rank = static_cast<double>(m - k);
                running = std::min(running, dn / rank * p[order[k]]);
                adjusted[order[k]] = std::min(1.0, running);
            }
            break;
        }
        default:
            throw std::invalid_argument("Unknown multiplicity correction method");
    }

    return adjusted;
}

std::vector<DmrRecord> ResultCollator::collate(const std::vector<ShrunkRegion>& shrunk,
                                               const std::vector<MetaStats>& stats,
                                               const std::vector<Site>& sites) const {
    if (shrunk.size() != stats.size()) {
        throw std::invalid_argument("ResultCollator: " + std::to_string(shrunk.size()) + " regions but " +
                                    std::to_string(stats.size()) + " statistics");
    }

    std::vector<DmrRecord> records(shrunk.size());
    std::vector<double> p_values(shrunk.size());

    for (size_t i = 0; i < shrunk.size(); ++i) {
        const ShrunkRegion& region = shrunk[i];
        MetaResult result = to_result(stats[i]);

        DmrRecord& record = records[i];
        record.chr = sites[region.start_idx].chr;
        record.start = sites[region.start_idx].pos;
        record.end = sites[region.end_idx].pos;
        record.n_sites = region.size();
        record.estimate = result.estimate;
        record.se = result.se;
        record.z = result.z;
        record.p_value = result.p_value;
        record.start_idx = region.start_idx;
        record.end_idx = region.end_idx;
        record.n_tests = region.n_tests;

        p_values[i] = result.p_value;
    }

    long long n = num_tests(shrunk, sites.size());
    std::vector<double> adjusted = adjust_pvalues(p_values, method_, n);
    for (size_t i = 0; i < records.size(); ++i) {
        records[i].p_adjust = adjusted[i];
    }

    LOG_INFO("Collated " + std::to_string(records.size()) + " regions; " + adjust_method_to_string(method_) +
             " correction over " + std::to_string(n) + " tests");

    return records;
}

}  // namespace DmrScan
