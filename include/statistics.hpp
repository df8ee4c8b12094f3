/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_STATISTICS_HPP
#define SEGENRICH_STATISTICS_HPP

// standard
#include <string>
#include <vector>

enum class pvalue_method {
    EMPIRICAL,
    NORM
};

/**
 * @throws configuration_error for an unknown method name
 */
pvalue_method parse_pvalue_method(const std::string& name);
std::string pvalue_method_name(pvalue_method method);

struct statistics_config {
    pvalue_method method = pvalue_method::EMPIRICAL;
    // fold reported when the expected value is zero
    double fold_sentinel = 1.0;
};

/**
 * Result of one (segment track, annotation track) pair
 */
struct pair_result {
    std::string track;
    std::string annotation;
    double observed = 0.0;
    double expected = 0.0;
    double ci_low = 0.0;
    double ci_high = 0.0;
    double stddev = 0.0;
    double fold = 0.0;
    double pvalue = 1.0;
    double qvalue = 1.0;
    // sampled statistics, empty when read from a result table
    std::vector<double> samples;
    size_t num_samples = 0;
};

namespace statistics {
    /**
     * Aggregate the observed statistic and its sampled distribution.
     *
     * expected is the mean and stddev the sample standard deviation of the
     * samples. The 95% interval uses the order statistics at 2.5% and 97.5%
     * of the sorted samples, clamped to the available range.
     */
    pair_result summarize(const std::string& track, const std::string& annotation,
                          double observed, std::vector<double> samples,
                          const statistics_config& config);

    /**
     * Two-sided empirical p-value: samples at least as extreme as observed,
     * in the direction away from expected, with +1 smoothing.
     */
    double empirical_pvalue(double observed, double expected, const std::vector<double>& samples);

    /**
     * Normal approximation using expected and stddev, one tail in the
     * direction away from expected. Floored at 1 / (num_samples + 1) when
     * num_samples is known.
     */
    double norm_pvalue(double observed, double expected, double stddev, size_t num_samples);

    /**
     * Recompute p-values with the given method. Results without samples
     * are only supported for the norm method.
     */
    void update_pvalues(std::vector<pair_result>& results, pvalue_method method);
}

#endif //SEGENRICH_STATISTICS_HPP
