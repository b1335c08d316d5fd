/**
 * @file test_candidate_detector.cpp
 * @brief Unit tests for CandidateDetector
 *
 * Tests cover:
 * 1. Gap threshold boundaries
 * 2. Sign changes and chromosome changes closing a candidate
 * 3. Size-1 candidates and zero estimates
 * 4. Exact coverage of qualifying sites on a randomized table
 */

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "core/CandidateDetector.hpp"
#include "core/DataStructs.hpp"

using namespace DmrScan;

static Site make_site(const std::string& chr, int64_t pos, double estimate, double p) {
    Site site;
    site.id = chr + ":" + std::to_string(pos);
    site.chr = chr;
    site.pos = pos;
    site.estimate = estimate;
    site.se = 0.1;
    site.p_value = p;
    return site;
}

// ============================================================================
// Gap threshold
// ============================================================================

TEST(CandidateDetectorTest, GapOf500MergesAllThreeSites) {
    std::vector<Site> sites = {
        make_site("1", 100, 0.5, 0.01),
        make_site("1", 150, 0.4, 0.02),
        make_site("1", 600, 0.3, 0.01),
    };

    CandidateConfig config;
    config.max_gap = 500;
    auto candidates = CandidateDetector(config).find(sites);

    // 150 -> 600 is a gap of 450 <= 500
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].start_idx, 0);
    EXPECT_EQ(candidates[0].end_idx, 2);
    EXPECT_EQ(candidates[0].size(), 3);
}

TEST(CandidateDetectorTest, GapOf400SplitsAfterPosition150) {
    std::vector<Site> sites = {
        make_site("1", 100, 0.5, 0.01),
        make_site("1", 150, 0.4, 0.02),
        make_site("1", 600, 0.3, 0.01),
    };

    CandidateConfig config;
    config.max_gap = 400;
    auto candidates = CandidateDetector(config).find(sites);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].start_idx, 0);
    EXPECT_EQ(candidates[0].end_idx, 1);
    EXPECT_EQ(candidates[1].start_idx, 2);
    EXPECT_EQ(candidates[1].end_idx, 2);
}

TEST(CandidateDetectorTest, GapEqualToThresholdIsInclusive) {
    std::vector<Site> sites = {
        make_site("1", 1000, 0.5, 0.01),
        make_site("1", 1500, 0.5, 0.01),
    };
    auto candidates = CandidateDetector().find(sites);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].size(), 2);
}

// ============================================================================
// Sign, chromosome and significance rules
// ============================================================================

TEST(CandidateDetectorTest, SignChangeClosesCandidate) {
    std::vector<Site> sites = {
        make_site("1", 100, 0.5, 0.01),
        make_site("1", 120, 0.5, 0.01),
        make_site("1", 140, -0.5, 0.01),
        make_site("1", 160, -0.5, 0.01),
    };
    auto candidates = CandidateDetector().find(sites);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].end_idx, 1);
    EXPECT_EQ(candidates[1].start_idx, 2);
    EXPECT_EQ(candidates[1].end_idx, 3);
}

TEST(CandidateDetectorTest, ZeroEstimateIsItsOwnSign) {
    std::vector<Site> sites = {
        make_site("1", 100, -0.5, 0.01),
        make_site("1", 110, 0.0, 0.01),
        make_site("1", 120, -0.4, 0.01),
    };
    auto candidates = CandidateDetector().find(sites);
    ASSERT_EQ(candidates.size(), 3u);
    for (int c = 0; c < 3; ++c) {
        EXPECT_EQ(candidates[c].start_idx, c);
        EXPECT_EQ(candidates[c].end_idx, c);
    }

    std::vector<Site> zeros = {
        make_site("1", 100, 0.0, 0.01),
        make_site("1", 110, 0.0, 0.01),
    };
    auto zero_run = CandidateDetector().find(zeros);
    ASSERT_EQ(zero_run.size(), 1u);
    EXPECT_EQ(zero_run[0].size(), 2);

    EXPECT_EQ(sign_of(0.0), EffectSign::ZERO);
    EXPECT_EQ(sign_of(-1e-300), EffectSign::NEGATIVE);
    EXPECT_EQ(sign_of(1e-300), EffectSign::POSITIVE);
}

TEST(CandidateDetectorTest, ChromosomeChangeClosesCandidate) {
    std::vector<Site> sites = {
        make_site("1", 100, 0.5, 0.01),
        make_site("2", 110, 0.5, 0.01),
    };
    auto candidates = CandidateDetector().find(sites);
    ASSERT_EQ(candidates.size(), 2u);
}

TEST(CandidateDetectorTest, NonSignificantSiteBreaksRun) {
    std::vector<Site> sites = {
        make_site("1", 100, 0.5, 0.01),
        make_site("1", 110, 0.5, 0.20),
        make_site("1", 120, 0.5, 0.01),
        make_site("1", 130, 0.5, 0.05),  // p must be strictly below the cutoff
    };
    auto candidates = CandidateDetector().find(sites);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].start_idx, 0);
    EXPECT_EQ(candidates[0].end_idx, 0);
    EXPECT_EQ(candidates[1].start_idx, 2);
    EXPECT_EQ(candidates[1].end_idx, 2);
}

TEST(CandidateDetectorTest, NoQualifyingSites) {
    std::vector<Site> sites = {
        make_site("1", 100, 0.5, 0.5),
        make_site("1", 110, 0.5, 0.9),
    };
    EXPECT_TRUE(CandidateDetector().find(sites).empty());
    EXPECT_TRUE(CandidateDetector().find(std::vector<Site>()).empty());
}

TEST(CandidateDetectorTest, MissingPValueNeverQualifies) {
    Site site = make_site("1", 100, 0.5, 0.01);
    site.p_value = NAN;
    EXPECT_TRUE(CandidateDetector().find(std::vector<Site>{site}).empty());
}

TEST(CandidateDetectorTest, MismatchedArraysThrow) {
    CandidateDetector detector;
    EXPECT_THROW(detector.find({0.1, 0.2}, {0.01}, {"1", "1"}, {1, 2}), std::invalid_argument);
}

// ============================================================================
// Coverage property
// ============================================================================

TEST(CandidateDetectorTest, SpansCoverExactlyTheQualifyingSites) {
    std::mt19937 rng(20240611);
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    std::uniform_int_distribution<int> gap(1, 900);

    std::vector<Site> sites;
    int64_t pos = 0;
    for (int i = 0; i < 2000; ++i) {
        std::string chr = i < 1000 ? "1" : "2";
        if (i == 1000) pos = 0;
        pos += gap(rng);
        double estimate = unif(rng) < 0.5 ? -0.2 : 0.2;
        double p = unif(rng) < 0.6 ? unif(rng) * 0.05 : unif(rng);
        sites.push_back(make_site(chr, pos, estimate, p));
    }

    CandidateConfig config;
    auto candidates = CandidateDetector(config).find(sites);

    std::vector<int> owner(sites.size(), -1);
    int previous_end = -1;
    for (size_t c = 0; c < candidates.size(); ++c) {
        const auto& region = candidates[c];
        ASSERT_LE(region.start_idx, region.end_idx);
        ASSERT_GT(region.start_idx, previous_end) << "spans must be ordered and disjoint";
        previous_end = region.end_idx;

        for (int i = region.start_idx; i <= region.end_idx; ++i) {
            owner[i] = static_cast<int>(c);
            if (i > region.start_idx) {
                EXPECT_EQ(sites[i].chr, sites[i - 1].chr);
                EXPECT_LE(sites[i].pos - sites[i - 1].pos, config.max_gap);
                EXPECT_EQ(sign_of(sites[i].estimate), sign_of(sites[i - 1].estimate));
            }
        }

        // Maximality: the site after the span could not have extended it
        int next = region.end_idx + 1;
        if (next < static_cast<int>(sites.size()) && sites[next].p_value < config.p_cutoff) {
            bool joinable = sites[next].chr == sites[next - 1].chr &&
                            sites[next].pos - sites[next - 1].pos <= config.max_gap &&
                            sign_of(sites[next].estimate) == sign_of(sites[next - 1].estimate);
            EXPECT_FALSE(joinable) << "candidate ending at " << region.end_idx << " is not maximal";
        }
    }

    for (size_t i = 0; i < sites.size(); ++i) {
        bool qualifies = sites[i].p_value < config.p_cutoff;
        EXPECT_EQ(owner[i] >= 0, qualifies) << "site " << i;
    }
}
