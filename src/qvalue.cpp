/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "qvalue.hpp"

// standard
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <sstream>

// Eigen
#include <Eigen/Dense>

// class
#include "errors.hpp"
#include "utility.hpp"

qvalue_method parse_qvalue_method(const std::string& name) {
    if (name == "storey") return qvalue_method::STOREY;
    throw configuration_error("unknown q-value method '" + name + "' (expected storey)");
}

pi0_method parse_pi0_method(const std::string& name) {
    if (name == "smoother") return pi0_method::SMOOTHER;
    if (name == "bootstrap") return pi0_method::BOOTSTRAP;
    throw configuration_error("unknown pi0 method '" + name + "' (expected smoother or bootstrap)");
}

std::string pi0_method_name(pi0_method method) {
    switch (method) {
        case pi0_method::SMOOTHER: return "smoother";
        case pi0_method::BOOTSTRAP: return "bootstrap";
    }
    return "unknown";
}

namespace qvalue {

namespace {

std::vector<double> pi0_per_lambda(const std::vector<double>& pvalues,
                                   const std::vector<double>& lambdas) {
    std::vector<double> pi0(lambdas.size(), 0.0);
    const double m = static_cast<double>(pvalues.size());
    for (size_t i = 0; i < lambdas.size(); ++i) {
        double lambda = lambdas[i];
        size_t above = static_cast<size_t>(std::count_if(pvalues.begin(), pvalues.end(),
            [lambda](double p) { return p >= lambda; }));
        pi0[i] = static_cast<double>(above) / (m * (1.0 - lambda));
    }
    return pi0;
}

// least squares cubic in lambda, evaluated at the largest lambda
double smooth_pi0(const std::vector<double>& lambdas, const std::vector<double>& pi0) {
    const Eigen::Index n = static_cast<Eigen::Index>(lambdas.size());
    const Eigen::Index degree = std::min<Eigen::Index>(3, n - 1);

    Eigen::MatrixXd X(n, degree + 1);
    Eigen::VectorXd y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        double power = 1.0;
        for (Eigen::Index j = 0; j <= degree; ++j) {
            X(i, j) = power;
            power *= lambdas[static_cast<size_t>(i)];
        }
        y(i) = pi0[static_cast<size_t>(i)];
    }

    Eigen::HouseholderQR<Eigen::MatrixXd> qr(X);
    Eigen::VectorXd coef = qr.solve(y);

    double at = lambdas.back();
    double value = 0.0;
    double power = 1.0;
    for (Eigen::Index j = 0; j <= degree; ++j) {
        value += coef(j) * power;
        power *= at;
    }
    return value;
}

double bootstrap_pi0(const std::vector<double>& pvalues, const std::vector<double>& lambdas,
                     const std::vector<double>& pi0, const qvalue_config& config) {
    const double min_pi0 = *std::min_element(pi0.begin(), pi0.end());
    std::vector<double> mse(lambdas.size(), 0.0);

    std::mt19937_64 rng(config.bootstrap_seed);
    std::uniform_int_distribution<size_t> pick(0, pvalues.size() - 1);
    std::vector<double> resampled(pvalues.size());

    for (size_t b = 0; b < config.bootstrap_iterations; ++b) {
        for (auto& p : resampled) {
            p = pvalues[pick(rng)];
        }
        std::vector<double> boot = pi0_per_lambda(resampled, lambdas);
        for (size_t i = 0; i < lambdas.size(); ++i) {
            mse[i] += (boot[i] - min_pi0) * (boot[i] - min_pi0);
        }
    }

    // smallest pi0 among the lambdas with minimal error
    const double min_mse = *std::min_element(mse.begin(), mse.end());
    double best = std::numeric_limits<double>::max();
    for (size_t i = 0; i < lambdas.size(); ++i) {
        if (mse[i] == min_mse) {
            best = std::min(best, pi0[i]);
        }
    }
    return best;
}

} // namespace

std::vector<double> default_lambda_grid() {
    std::vector<double> grid;
    for (int i = 0; i <= 18; ++i) {
        grid.push_back(i * 0.05);
    }
    return grid;
}

double estimate_pi0(const std::vector<double>& pvalues, const qvalue_config& config) {
    if (pvalues.empty()) {
        throw degenerate_statistic_error("no p-values to estimate pi0 from");
    }

    std::vector<double> lambdas = config.vlambda
        ? std::vector<double>{*config.vlambda}
        : default_lambda_grid();

    for (double lambda : lambdas) {
        if (lambda < 0.0 || lambda >= 1.0) {
            throw configuration_error("q-value lambda must lie in [0, 1), got " + std::to_string(lambda));
        }
    }

    std::vector<double> pi0 = pi0_per_lambda(pvalues, lambdas);

    double estimate = 0.0;
    if (lambdas.size() == 1) {
        estimate = pi0.front();
    } else if (config.pi0 == pi0_method::SMOOTHER) {
        estimate = smooth_pi0(lambdas, pi0);
    } else {
        estimate = bootstrap_pi0(pvalues, lambdas, pi0, config);
    }

    estimate = std::min(estimate, 1.0);
    if (!(estimate > 0.0)) {
        std::ostringstream msg;
        msg << "pi0 estimate " << estimate << " is not positive, check the p-value distribution";
        throw degenerate_statistic_error(msg.str());
    }
    return estimate;
}

std::vector<double> compute_qvalues(const std::vector<double>& pvalues, double pi0) {
    const size_t m = pvalues.size();
    std::vector<double> qvalues(m, 1.0);
    if (m == 0) return qvalues;

    for (double p : pvalues) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw input_error("p-values must lie in [0, 1], got " + std::to_string(p));
        }
    }

    std::vector<size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&pvalues](size_t a, size_t b) { return pvalues[a] < pvalues[b]; });

    // ties share the largest rank of their group
    std::vector<double> sorted_q(m);
    for (size_t i = 0; i < m;) {
        size_t j = i;
        while (j + 1 < m && pvalues[order[j + 1]] == pvalues[order[i]]) ++j;
        double rank = static_cast<double>(j + 1);
        for (size_t k = i; k <= j; ++k) {
            sorted_q[k] = pi0 * static_cast<double>(m) * pvalues[order[k]] / rank;
        }
        i = j + 1;
    }

    sorted_q[m - 1] = std::min(sorted_q[m - 1], 1.0);
    for (size_t i = m - 1; i > 0; --i) {
        sorted_q[i - 1] = std::min(sorted_q[i - 1], sorted_q[i]);
    }

    for (size_t i = 0; i < m; ++i) {
        qvalues[order[i]] = sorted_q[i];
    }
    return qvalues;
}

void update_qvalues(std::vector<pair_result>& results, const qvalue_config& config) {
    if (results.empty()) return;

    std::vector<double> pvalues;
    pvalues.reserve(results.size());
    for (const auto& r : results) {
        pvalues.push_back(r.pvalue);
    }

    double pi0 = 1.0;
    try {
        pi0 = estimate_pi0(pvalues, config);
    } catch (const degenerate_statistic_error& e) {
        logging::warning(std::string(e.what()) + "; using pi0 = 1");
        pi0 = 1.0;
    }
    logging::info("Estimated pi0 = " + std::to_string(pi0) + " from " +
                  std::to_string(pvalues.size()) + " p-values (" + pi0_method_name(config.pi0) + ")");

    std::vector<double> qvalues = compute_qvalues(pvalues, pi0);
    for (size_t i = 0; i < results.size(); ++i) {
        results[i].qvalue = qvalues[i];
    }
}

} // namespace qvalue
