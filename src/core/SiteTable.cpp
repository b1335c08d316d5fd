#include "core/SiteTable.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <unordered_set>

#include "core/MetaAnalysis.hpp"

namespace DmrScan {

// Ties on (chr, pos) fall back to id so the order does not depend on input order
static bool site_less(const Site& a, const Site& b) {
    if (a.chr != b.chr) return a.chr < b.chr;
    if (a.pos != b.pos) return a.pos < b.pos;
    return a.id < b.id;
}

std::vector<int> SiteTable::sort_order(const std::vector<Site>& sites) {
    std::vector<int> order(sites.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&sites](int a, int b) { return site_less(sites[a], sites[b]); });
    return order;
}

bool SiteTable::is_sorted(const std::vector<Site>& sites) {
    return std::is_sorted(sites.begin(), sites.end(), site_less);
}

std::vector<Site> SiteTable::permute(const std::vector<Site>& sites, const std::vector<int>& order) {
    std::vector<Site> sorted;
    sorted.reserve(order.size());
    for (int idx : order) {
        sorted.push_back(sites[idx]);
    }
    return sorted;
}

void SiteTable::validate(const std::vector<Site>& sites) {
    std::unordered_set<std::string> seen;
    seen.reserve(sites.size());

    for (const auto& site : sites) {
        if (!seen.insert(site.id).second) {
            throw std::invalid_argument("Duplicate site id: " + site.id);
        }
        if (!std::isfinite(site.se) || site.se <= 0.0) {
            throw std::invalid_argument("Standard error must be positive and finite for site " + site.id);
        }
        if (!std::isfinite(site.estimate)) {
            throw std::invalid_argument("Estimate must be finite for site " + site.id);
        }
        if (site.has_p_value() && (site.p_value < 0.0 || site.p_value > 1.0)) {
            throw std::invalid_argument("p-value outside [0,1] for site " + site.id);
        }
    }
}

int SiteTable::fill_missing_pvalues(std::vector<Site>& sites) {
    int filled = 0;
    for (auto& site : sites) {
        if (!site.has_p_value()) {
            site.p_value = two_sided_pvalue(site.estimate / site.se);
            filled++;
        }
    }
    return filled;
}

}  // namespace DmrScan
