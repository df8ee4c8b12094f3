/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_SUBCALL_RUN_HPP
#define SEGENRICH_SUBCALL_RUN_HPP

#include "subcall/subcall.hpp"

#include <cstdint>
#include <filesystem>
#include <set>

#include "interval_collection.hpp"

namespace subcall {

/**
 * Run subcommand: full enrichment pipeline from interval files.
 *
 * Pipeline:
 * 1. Loads segments, annotations, workspaces and optional isochores
 * 2. Normalizes, collapses the workspace and stratifies by isochores,
 *    writing --output-stats summaries after each stage
 * 3. Samples randomized segment sets, or takes them from --sample-file,
 *    and counts overlaps per annotation
 * 4. Aggregates observed and sampled counts into pair results
 */
class run_command : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "run"; }
    std::string description() const override {
        return "Test segments for enrichment in annotations by randomized sampling";
    }

private:
    std::set<std::string> stats_sections;
    uint64_t seed = 0;

    // <prefix>.stats_<collection>_<stage>.tsv if the collection was requested
    void write_stats(const std::filesystem::path& prefix, const interval_collection& collection,
                     const std::string& stage) const;

    // seed 0 is replaced by the clock and logged
    void resolve_seed(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // SEGENRICH_SUBCALL_RUN_HPP
