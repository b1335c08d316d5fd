#pragma once

#include <string>
#include <vector>

#include "DataStructs.hpp"

namespace DmrScan {

/**
 * @brief Helpers that establish and check the ordering invariants of a site table.
 *
 * Every downstream step assumes sites are ordered by (chromosome, position).
 * Chromosomes compare as strings; ties keep their input order.
 */
class SiteTable {
public:
    /**
     * @brief Returns the permutation that sorts the sites by (chr, pos, id).
     *
     * order[k] is the input index of the k-th site in sorted order.
     */
    static std::vector<int> sort_order(const std::vector<Site>& sites);

    /**
     * @brief True if sites are already in (chr, pos, id) order.
     */
    static bool is_sorted(const std::vector<Site>& sites);

    /**
     * @brief Reorders sites by a permutation from sort_order().
     */
    static std::vector<Site> permute(const std::vector<Site>& sites, const std::vector<int>& order);

    /**
     * @brief Checks ids are unique and standard errors are positive and finite.
     *
     * @throws std::invalid_argument on the first offending site.
     */
    static void validate(const std::vector<Site>& sites);

    /**
     * @brief Derives missing p-values as 2 * Phi(-|estimate / se|).
     *
     * @return Number of p-values filled in.
     */
    static int fill_missing_pvalues(std::vector<Site>& sites);
};

}  // namespace DmrScan
