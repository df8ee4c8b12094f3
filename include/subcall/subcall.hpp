/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_SUBCALL_HPP
#define SEGENRICH_SUBCALL_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "filetype_detector.hpp"
#include "qvalue.hpp"
#include "result_table.hpp"
#include "statistics.hpp"

namespace subcall {

/**
 * Abstract base class for all segenrich subcommands.
 *
 * Every subcommand produces a set of pair results; the base class takes care
 * of the shared tail: p-value update, global q-values, ordering and output.
 */
class subcall {
public:
    virtual ~subcall() = default;

    /**
     * Build the options object of the subcommand.
     * Should call add_common_options() to include shared options.
     */
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    /**
     * Validate parsed arguments. Throws on invalid input.
     */
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    /**
     * Fill results (called after common options are applied).
     */
    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * Template method: validate → apply_common_options → execute → finalize.
     */
    void run(const cxxopts::ParseResult& args);

    /**
     * Add common options shared across all subcommands.
     * Call this in parse_args() implementations.
     */
    static void add_common_options(cxxopts::Options& options);

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

protected:
    std::vector<pair_result> results;
    statistics_config stats_cfg;
    qvalue_config qvalue_cfg;
    result_order order = result_order::FOLD;
    size_t threads = 1;

    /**
     * Directory and file name stem for auxiliary output, derived from
     * --output (current directory and "segenrich" when writing to stdout)
     */
    std::filesystem::path output_prefix(const cxxopts::ParseResult& args) const;

    /**
     * Check that an input file exists and looks like the expected type
     * @throws input_error for a missing file or a different table type
     */
    static void require_file(const std::string& path, filetype expected, const std::string& what);

private:
    /**
     * Parse method names, resolve threads, enable progress output
     */
    void apply_common_options(const cxxopts::ParseResult& args);

    /**
     * p-value update, q-values, ordering and writing the result table
     */
    void finalize(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // SEGENRICH_SUBCALL_HPP
