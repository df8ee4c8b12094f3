/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

/**
 * Tests for qvalue.hpp: pi0 estimation and Storey q-values.
 */

#include <gtest/gtest.h>
#include "qvalue.hpp"
#include "errors.hpp"

#include <algorithm>
#include <numeric>
#include <random>

static std::vector<double> uniform_pvalues(size_t n) {
    std::vector<double> p(n);
    for (size_t i = 0; i < n; ++i) {
        p[i] = (static_cast<double>(i) + 0.5) / static_cast<double>(n);
    }
    return p;
}

// ============================================================================
// pi0
// ============================================================================

TEST(QvalueTest, DefaultLambdaGrid) {
    auto grid = qvalue::default_lambda_grid();
    ASSERT_EQ(grid.size(), 19u);
    EXPECT_DOUBLE_EQ(grid.front(), 0.0);
    EXPECT_NEAR(grid.back(), 0.90, 1e-12);
}

TEST(QvalueTest, FixedLambdaEstimate) {
    qvalue_config config;
    config.vlambda = 0.5;
    std::vector<double> p = {0.01, 0.02, 0.03, 0.04, 0.6, 0.9};
    EXPECT_NEAR(qvalue::estimate_pi0(p, config), 2.0 / 3.0, 1e-12);
}

TEST(QvalueTest, PvalueAtLambdaCountsAsNull) {
    qvalue_config config;
    config.vlambda = 0.5;
    std::vector<double> p = {0.1, 0.2, 0.3, 0.5};
    EXPECT_NEAR(qvalue::estimate_pi0(p, config), 0.5, 1e-12);
}

TEST(QvalueTest, SmootherOnUniformPvalues) {
    qvalue_config config;
    EXPECT_NEAR(qvalue::estimate_pi0(uniform_pvalues(1000), config), 1.0, 0.02);
}

TEST(QvalueTest, SmootherOnMixture) {
    std::vector<double> p = uniform_pvalues(800);
    p.insert(p.end(), 200, 1e-4);

    qvalue_config config;
    EXPECT_NEAR(qvalue::estimate_pi0(p, config), 0.8, 0.03);
}

TEST(QvalueTest, BootstrapOnMixtureIsReproducible) {
    std::vector<double> p = uniform_pvalues(800);
    p.insert(p.end(), 200, 1e-4);

    qvalue_config config;
    config.pi0 = pi0_method::BOOTSTRAP;

    double first = qvalue::estimate_pi0(p, config);
    double second = qvalue::estimate_pi0(p, config);
    EXPECT_DOUBLE_EQ(first, second);
    EXPECT_NEAR(first, 0.8, 0.1);
}

TEST(QvalueTest, InfeasiblePi0Throws) {
    qvalue_config config;
    config.vlambda = 0.5;
    std::vector<double> p(10, 1e-5);
    EXPECT_THROW(qvalue::estimate_pi0(p, config), degenerate_statistic_error);
}

TEST(QvalueTest, InvalidLambdaThrows) {
    qvalue_config config;
    config.vlambda = 1.0;
    EXPECT_THROW(qvalue::estimate_pi0({0.1, 0.2}, config), configuration_error);
}

// ============================================================================
// q-values
// ============================================================================

TEST(QvalueTest, FullPi0MatchesStepUp) {
    auto q = qvalue::compute_qvalues({0.5, 0.01, 0.03, 0.02}, 1.0);
    EXPECT_DOUBLE_EQ(q[0], 0.5);
    EXPECT_DOUBLE_EQ(q[1], 0.04);
    EXPECT_DOUBLE_EQ(q[2], 0.04);
    EXPECT_DOUBLE_EQ(q[3], 0.04);
}

TEST(QvalueTest, TiesShareLargestRank) {
    auto q = qvalue::compute_qvalues({0.01, 0.5, 0.01}, 1.0);
    EXPECT_DOUBLE_EQ(q[0], 0.015);
    EXPECT_DOUBLE_EQ(q[2], 0.015);
    EXPECT_DOUBLE_EQ(q[1], 0.5);
}

TEST(QvalueTest, CappedAtOne) {
    auto q = qvalue::compute_qvalues({0.9, 0.95, 1.0}, 1.0);
    for (double v : q) {
        EXPECT_DOUBLE_EQ(v, 1.0);
    }
}

TEST(QvalueTest, MonotonicInPvalues) {
    std::mt19937 rng(13);
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    for (int round = 0; round < 20; ++round) {
        std::vector<double> p(200);
        for (auto& v : p) {
            v = unif(rng);
            v = v * v * v;
        }
        qvalue_config config;
        double pi0 = 1.0;
        try {
            pi0 = qvalue::estimate_pi0(p, config);
        } catch (const degenerate_statistic_error&) {
            pi0 = 1.0;
        }
        auto q = qvalue::compute_qvalues(p, pi0);

        std::vector<size_t> order(p.size());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&p](size_t a, size_t b) { return p[a] < p[b]; });

        for (size_t i = 1; i < order.size(); ++i) {
            EXPECT_LE(q[order[i - 1]], q[order[i]]);
        }
        for (double v : q) {
            EXPECT_GE(v, 0.0);
            EXPECT_LE(v, 1.0);
        }
    }
}

TEST(QvalueTest, PvalueOutOfRangeThrows) {
    EXPECT_THROW(qvalue::compute_qvalues({0.5, 1.5}, 1.0), input_error);
}

TEST(QvalueTest, UpdateFallsBackToFullPi0) {
    std::vector<pair_result> results(4);
    for (auto& r : results) {
        r.pvalue = 1e-5;
    }

    qvalue_config config;
    config.vlambda = 0.5;
    qvalue::update_qvalues(results, config);

    for (const auto& r : results) {
        EXPECT_DOUBLE_EQ(r.qvalue, 1e-5);
    }
}

TEST(QvalueTest, ParseMethodNames) {
    EXPECT_EQ(parse_qvalue_method("storey"), qvalue_method::STOREY);
    EXPECT_EQ(parse_pi0_method("bootstrap"), pi0_method::BOOTSTRAP);
    EXPECT_THROW(parse_qvalue_method("bh"), configuration_error);
    EXPECT_THROW(parse_pi0_method("spline"), configuration_error);
}
