/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <thread>

#include "errors.hpp"
#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Common")
        ("o,output", "Result table (default: stdout)",
            cxxopts::value<std::string>())
        ("order", "Order results by track, annotation, fold, pvalue or qvalue",
            cxxopts::value<std::string>()->default_value("fold"))
        ("t,threads", "Number of threads (0 = auto-detect)",
            cxxopts::value<uint32_t>()->default_value("1"))
        ("progress", "Show progress output")
        ("h,help", "Show help message")
        ;

    options.add_options("Statistics")
        ("p,pvalue-method", "P-value method: empirical or norm",
            cxxopts::value<std::string>()->default_value("empirical"))
        ("fold-sentinel", "Fold reported when the expected value is zero",
            cxxopts::value<double>()->default_value("1.0"))
        ("q,qvalue-method", "Multiple testing correction: storey",
            cxxopts::value<std::string>()->default_value("storey"))
        ("qvalue-lambda", "Fixed lambda for pi0 estimation (default: scan 0.00..0.90)",
            cxxopts::value<double>())
        ("qvalue-pi0-method", "Method for estimating pi0: smoother or bootstrap",
            cxxopts::value<std::string>()->default_value("smoother"))
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("progress")) {
        logging::set_progress_enabled(true);
    }

    stats_cfg.method = parse_pvalue_method(args["pvalue-method"].as<std::string>());
    stats_cfg.fold_sentinel = args["fold-sentinel"].as<double>();

    qvalue_cfg.method = parse_qvalue_method(args["qvalue-method"].as<std::string>());
    qvalue_cfg.pi0 = parse_pi0_method(args["qvalue-pi0-method"].as<std::string>());
    if (args.count("qvalue-lambda")) {
        qvalue_cfg.vlambda = args["qvalue-lambda"].as<double>();
    }

    order = parse_result_order(args["order"].as<std::string>());


    threads = args["threads"].as<uint32_t>();
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
        logging::info("Auto-detected " + std::to_string(threads) + " thread(s)");
    }
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    execute(args);
    finalize(args);
}

void subcall::finalize(const cxxopts::ParseResult& args) {
    if (stats_cfg.method != pvalue_method::EMPIRICAL) {
        logging::info("Updating p-values to " + pvalue_method_name(stats_cfg.method));
        statistics::update_pvalues(results, stats_cfg.method);
    }

    logging::info("Computing FDR statistics");
    qvalue::update_qvalues(results, qvalue_cfg);

    result_table::sort(results, order);

    if (args.count("output")) {
        std::string path = args["output"].as<std::string>();
        std::ofstream out(path);
        if (!out.is_open()) {
            throw input_error("cannot open output file: " + path);
        }
        result_table::write(out, results);
        logging::info("Wrote " + std::to_string(results.size()) + " results to " + path);
    } else {
        result_table::write(std::cout, results);
    }
}

std::filesystem::path subcall::output_prefix(const cxxopts::ParseResult& args) const {
    std::filesystem::path dir;
    std::string stem = "segenrich";

    if (args.count("output")) {
        std::filesystem::path output(args["output"].as<std::string>());
        dir = output.parent_path();
        stem = output.stem().string();
    }

    if (dir.empty()) {
        dir = std::filesystem::current_path();
    }

    std::filesystem::create_directories(dir);
    return dir / stem;
}

void subcall::require_file(const std::string& path, filetype expected, const std::string& what) {
    if (!std::filesystem::exists(path)) {
        throw input_error(what + " not found: " + path);
    }

    filetype_detector detector;
    auto [detected, gzipped] = detector.detect_filetype(path);

    if (gzipped && expected != filetype::BED) {
        throw input_error(what + " must not be compressed: " + path);
    }
    if (detected == filetype::UNKNOWN) {
        logging::warning("Could not recognize " + what + " " + path + ", reading it as " +
                         filetype_name(expected));
        return;
    }
    if (detected != expected) {
        throw input_error(what + " " + path + " looks like a " + filetype_name(detected) +
                          ", expected a " + filetype_name(expected));
    }
}

} // namespace subcall
