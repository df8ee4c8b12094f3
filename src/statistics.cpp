/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "statistics.hpp"

// standard
#include <algorithm>
#include <cmath>
#include <numeric>

// class
#include "errors.hpp"

pvalue_method parse_pvalue_method(const std::string& name) {
    if (name == "empirical") return pvalue_method::EMPIRICAL;
    if (name == "norm") return pvalue_method::NORM;
    throw configuration_error("unknown p-value method '" + name + "' (expected empirical or norm)");
}

std::string pvalue_method_name(pvalue_method method) {
    switch (method) {
        case pvalue_method::EMPIRICAL: return "empirical";
        case pvalue_method::NORM: return "norm";
    }
    return "unknown";
}

namespace statistics {

pair_result summarize(const std::string& track, const std::string& annotation,
                      double observed, std::vector<double> samples,
                      const statistics_config& config) {
    pair_result r;
    r.track = track;
    r.annotation = annotation;
    r.observed = observed;
    r.num_samples = samples.size();

    const size_t n = samples.size();
    if (n > 0) {
        double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
        r.expected = sum / static_cast<double>(n);

        if (n > 1) {
            double ss = 0.0;
            for (double x : samples) {
                ss += (x - r.expected) * (x - r.expected);
            }
            r.stddev = std::sqrt(ss / static_cast<double>(n - 1));
        }

        std::vector<double> sorted = samples;
        std::sort(sorted.begin(), sorted.end());
        size_t tail = static_cast<size_t>(std::floor(0.025 * static_cast<double>(n)));
        size_t low = std::min(tail, n - 1);
        size_t high = n - 1 - std::min(tail, n - 1);
        r.ci_low = sorted[low];
        r.ci_high = sorted[std::max(low, high)];
    }

    r.fold = r.expected != 0.0 ? observed / r.expected : config.fold_sentinel;

    if (config.method == pvalue_method::NORM) {
        r.pvalue = norm_pvalue(observed, r.expected, r.stddev, n);
    } else {
        r.pvalue = empirical_pvalue(observed, r.expected, samples);
    }

    r.samples = std::move(samples);
    return r;
}

double empirical_pvalue(double observed, double expected, const std::vector<double>& samples) {
    size_t count = 0;
    if (observed > expected) {
        count = static_cast<size_t>(std::count_if(samples.begin(), samples.end(),
            [observed](double x) { return x >= observed; }));
    } else {
        count = static_cast<size_t>(std::count_if(samples.begin(), samples.end(),
            [observed](double x) { return x <= observed; }));
    }
    return static_cast<double>(count + 1) / static_cast<double>(samples.size() + 1);
}

double norm_pvalue(double observed, double expected, double stddev, size_t num_samples) {
    // sample count is unknown for results read back from a table
    double floor_value = num_samples > 0 ? 1.0 / static_cast<double>(num_samples + 1) : 0.0;

    if (stddev <= 0.0) {
        return observed == expected ? 1.0 : floor_value;
    }

    // upper tail for enrichment, lower tail for depletion
    double z = std::fabs(observed - expected) / stddev;
    double p = 0.5 * std::erfc(z / std::sqrt(2.0));
    return std::max(p, floor_value);
}

void update_pvalues(std::vector<pair_result>& results, pvalue_method method) {
    for (auto& r : results) {
        if (method == pvalue_method::NORM) {
            r.pvalue = norm_pvalue(r.observed, r.expected, r.stddev, r.num_samples);
        } else {
            if (r.samples.empty()) {
                throw configuration_error("empirical p-values need the sampled distribution of " +
                                          r.track + "/" + r.annotation);
            }
            r.pvalue = empirical_pvalue(r.observed, r.expected, r.samples);
        }
    }
}

} // namespace statistics
