/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/counts.hpp"

#include "errors.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options counts_command::parse_args(int argc, char** argv) {
    cxxopts::Options options("segenrich " + name(), description());

    options.add_options("Input")
        ("counts-file", "Counts table written by 'segenrich run --output-counts-file'",
            cxxopts::value<std::string>())
        ;

    add_common_options(options);

    return options;
}

void counts_command::validate(const cxxopts::ParseResult& args) {
    if (!args.count("counts-file")) {
        throw input_error("Must provide --counts-file");
    }
    require_file(args["counts-file"].as<std::string>(), filetype::COUNTS, "Counts file");
}

void counts_command::execute(const cxxopts::ParseResult& args) {
    std::string path = args["counts-file"].as<std::string>();
    logging::info("Reading counts from " + path);
    results = result_table::read_counts(path, stats_cfg);
}

} // namespace subcall
