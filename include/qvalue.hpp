/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_QVALUE_HPP
#define SEGENRICH_QVALUE_HPP

// standard
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// class
#include "statistics.hpp"

enum class qvalue_method {
    STOREY
};

enum class pi0_method {
    SMOOTHER,
    BOOTSTRAP
};

qvalue_method parse_qvalue_method(const std::string& name);
pi0_method parse_pi0_method(const std::string& name);
std::string pi0_method_name(pi0_method method);

struct qvalue_config {
    qvalue_method method = qvalue_method::STOREY;
    // fixed tuning point; the default grid 0.00..0.90 is scanned when unset
    std::optional<double> vlambda;
    pi0_method pi0 = pi0_method::SMOOTHER;
    // resampling stream of the bootstrap estimate, independent of the run seed
    uint64_t bootstrap_seed = 5489;
    size_t bootstrap_iterations = 100;
};

namespace qvalue {
    /**
     * Default tuning grid 0.00, 0.05, ..., 0.90
     */
    std::vector<double> default_lambda_grid();

    /**
     * Estimate the proportion of true null hypotheses.
     *
     * With a single tuning point pi0 = #{p >= lambda} / (m * (1 - lambda)).
     * Across a grid, the per-lambda estimates are either smoothed by a least
     * squares cubic and read off at the largest lambda, or the estimate with
     * the smallest bootstrap mean squared error is chosen.
     *
     * @throws degenerate_statistic_error if no pi0 in (0, 1] can be found
     * @throws configuration_error for a lambda outside [0, 1)
     */
    double estimate_pi0(const std::vector<double>& pvalues, const qvalue_config& config);

    /**
     * Storey q-values for the given p-values and pi0. q-values are
     * non-decreasing in p and capped at 1.
     */
    std::vector<double> compute_qvalues(const std::vector<double>& pvalues, double pi0);

    /**
     * Global q-value step over all results. An infeasible pi0 estimate is
     * logged and replaced by pi0 = 1.
     */
    void update_qvalues(std::vector<pair_result>& results, const qvalue_config& config);
}

#endif //SEGENRICH_QVALUE_HPP
