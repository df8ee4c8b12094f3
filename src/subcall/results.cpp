/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/results.hpp"

#include "errors.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options results_command::parse_args(int argc, char** argv) {
    cxxopts::Options options("segenrich " + name(), description());

    options.add_options("Input")
        ("results-file", "Result table written by a previous run",
            cxxopts::value<std::string>())
        ;

    add_common_options(options);

    return options;
}

void results_command::validate(const cxxopts::ParseResult& args) {
    if (!args.count("results-file")) {
        throw input_error("Must provide --results-file");
    }
    require_file(args["results-file"].as<std::string>(), filetype::RESULTS, "Results file");
}

void results_command::execute(const cxxopts::ParseResult& args) {
    std::string path = args["results-file"].as<std::string>();
    logging::info("Reading annotator results from " + path);
    results = result_table::read(path);
}

} // namespace subcall
