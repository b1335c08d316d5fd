#include "core/CandidateDetector.hpp"

#include <stdexcept>
#include <string>

#include "utils/Logger.hpp"

namespace DmrScan {

std::vector<CandidateRegion> CandidateDetector::find(const std::vector<Site>& sites) const {
    const size_t n = sites.size();
    std::vector<double> estimates(n);
    std::vector<double> p_values(n);
    std::vector<std::string> chrs(n);
    std::vector<int64_t> positions(n);

    for (size_t i = 0; i < n; ++i) {
        estimates[i] = sites[i].estimate;
        p_values[i] = sites[i].p_value;
        chrs[i] = sites[i].chr;
        positions[i] = sites[i].pos;
    }
    return find(estimates, p_values, chrs, positions);
}

std::vector<CandidateRegion> CandidateDetector::find(const std::vector<double>& estimates,
                                                     const std::vector<double>& p_values,
                                                     const std::vector<std::string>& chrs,
                                                     const std::vector<int64_t>& positions) const {
    const int n = static_cast<int>(estimates.size());
    if (static_cast<int>(p_values.size()) != n || static_cast<int>(chrs.size()) != n ||
        static_cast<int>(positions.size()) != n) {
        throw std::invalid_argument("CandidateDetector: estimate, p-value, chromosome and position lengths differ");
    }

    std::vector<CandidateRegion> candidates;

    // NaN p-values never qualify
    auto qualifies = [&](int i) { return p_values[i] < config_.p_cutoff; };

    int i = 0;
    while (i < n) {
        if (!qualifies(i)) {
            ++i;
            continue;
        }

        CandidateRegion region;
        region.start_idx = i;
        EffectSign sign = sign_of(estimates[i]);

        int j = i + 1;
        while (j < n && qualifies(j) && sign_of(estimates[j]) == sign && chrs[j] == chrs[j - 1] &&
               positions[j] - positions[j - 1] <= config_.max_gap) {
            ++j;
        }

        region.end_idx = j - 1;
        candidates.push_back(region);
        i = j;
    }

    LOG_DEBUG("Candidate scan: " + std::to_string(candidates.size()) + " candidates from " + std::to_string(n) +
              " sites (p < " + std::to_string(config_.p_cutoff) + ", max gap " + std::to_string(config_.max_gap) +
              ")");

    return candidates;
}

}  // namespace DmrScan
