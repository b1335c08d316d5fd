/**
 * @file test_result_collator.cpp
 * @brief Unit tests for ResultCollator and multiplicity correction
 */

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "core/MetaAnalysis.hpp"
#include "core/ResultCollator.hpp"

using namespace DmrScan;

class ResultCollatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 10; ++i) {
            Site s;
            s.id = "cg" + std::to_string(i);
            s.chr = i < 5 ? "chr1" : "chr2";
            s.pos = 1000 + 100 * i;
            s.estimate = 0.1;
            s.se = 0.02;
            sites.push_back(s);
        }

        ShrunkRegion a;
        a.start_idx = 1;
        a.end_idx = 3;
        a.n_tests = 7;
        ShrunkRegion b;
        b.start_idx = 6;
        b.end_idx = 6;
        b.n_tests = 0;
        shrunk = {a, b};

        MetaStats sa;
        sa.B = 0.3;
        sa.S = 0.01;  // z = 3
        MetaStats sb;
        sb.B = -0.1;
        sb.S = 0.04;  // z = -0.5
        stats = {sa, sb};
    }

    std::vector<Site> sites;
    std::vector<ShrunkRegion> shrunk;
    std::vector<MetaStats> stats;
};

TEST_F(ResultCollatorTest, TestCountIsSitesPlusEvaluations) {
    EXPECT_EQ(ResultCollator::num_tests(shrunk, sites.size()), 10 + 7);
    EXPECT_EQ(ResultCollator::num_tests({}, 0), 0);
}

TEST_F(ResultCollatorTest, CollateFillsRecords) {
    auto records = ResultCollator().collate(shrunk, stats, sites);
    ASSERT_EQ(records.size(), 2u);

    const DmrRecord& r = records[0];
    EXPECT_EQ(r.chr, "chr1");
    EXPECT_EQ(r.start, 1100);
    EXPECT_EQ(r.end, 1300);
    EXPECT_EQ(r.n_sites, 3);
    EXPECT_EQ(r.start_idx, 1);
    EXPECT_EQ(r.end_idx, 3);
    EXPECT_EQ(r.n_tests, 7);
    EXPECT_NEAR(r.estimate, 0.3, 1e-12);
    EXPECT_NEAR(r.se, 0.1, 1e-12);
    EXPECT_NEAR(r.z, 3.0, 1e-12);
    EXPECT_NEAR(r.p_value, two_sided_pvalue(3.0), 1e-15);
    EXPECT_NEAR(r.p_adjust, std::min(1.0, r.p_value * 17), 1e-15);

    EXPECT_EQ(records[1].chr, "chr2");
    EXPECT_EQ(records[1].start, records[1].end);
    EXPECT_DOUBLE_EQ(records[1].p_adjust, 1.0);  // capped
}

TEST_F(ResultCollatorTest, AdjustedNeverBelowRaw) {
    for (AdjustMethod method : {AdjustMethod::BONFERRONI, AdjustMethod::FDR}) {
        auto records = ResultCollator(method).collate(shrunk, stats, sites);
        for (const auto& r : records) {
            EXPECT_GE(r.p_adjust, r.p_value);
            EXPECT_LE(r.p_adjust, 1.0);
        }
    }
}

TEST_F(ResultCollatorTest, SizeMismatchThrows) {
    stats.pop_back();
    EXPECT_THROW(ResultCollator().collate(shrunk, stats, sites), std::invalid_argument);
}

TEST(AdjustPValuesTest, Bonferroni) {
    std::vector<double> p = {0.001, 0.01, 0.2};
    auto adj = ResultCollator::adjust_pvalues(p, AdjustMethod::BONFERRONI, 10);
    EXPECT_NEAR(adj[0], 0.01, 1e-15);
    EXPECT_NEAR(adj[1], 0.1, 1e-15);
    EXPECT_DOUBLE_EQ(adj[2], 1.0);
}

TEST(AdjustPValuesTest, BenjaminiHochbergByHand) {
    // n = 5, sorted p: 0.01 0.02 0.03 0.04
    // raw n/rank * p: 0.05 0.05 0.05 0.05 -> all 0.05
    std::vector<double> p = {0.04, 0.01, 0.03, 0.02};
    auto adj = ResultCollator::adjust_pvalues(p, AdjustMethod::FDR, 5);
    for (double a : adj) {
        EXPECT_NEAR(a, 0.05, 1e-12);
    }

    // n = 3: 0.01*3/1 = 0.03, 0.04*3/2 = 0.06, 0.05*3/3 = 0.05 -> cummin from top: 0.05, 0.05, 0.03
    std::vector<double> q = {0.05, 0.01, 0.04};
    auto adj_q = ResultCollator::adjust_pvalues(q, AdjustMethod::FDR, 3);
    EXPECT_NEAR(adj_q[0], 0.05, 1e-12);
    EXPECT_NEAR(adj_q[1], 0.03, 1e-12);
    EXPECT_NEAR(adj_q[2], 0.05, 1e-12);
}

TEST(AdjustPValuesTest, MonotoneInRawPValue) {
    std::vector<double> p = {0.3, 0.0001, 0.02, 0.5, 0.004, 0.02};
    for (AdjustMethod method : {AdjustMethod::BONFERRONI, AdjustMethod::FDR}) {
        auto adj = ResultCollator::adjust_pvalues(p, method, 40);
        for (size_t i = 0; i < p.size(); ++i) {
            for (size_t j = 0; j < p.size(); ++j) {
                if (p[i] <= p[j]) {
                    EXPECT_LE(adj[i], adj[j]) << adjust_method_to_string(method);
                }
            }
        }
    }
}

TEST(AdjustPValuesTest, DenominatorSmallerThanCountThrows) {
    std::vector<double> p = {0.1, 0.2, 0.3};
    EXPECT_THROW(ResultCollator::adjust_pvalues(p, AdjustMethod::BONFERRONI, 2), std::invalid_argument);
    EXPECT_TRUE(ResultCollator::adjust_pvalues({}, AdjustMethod::FDR, 0).empty());
}
