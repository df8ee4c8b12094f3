/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_SUBCALL_COUNTS_HPP
#define SEGENRICH_SUBCALL_COUNTS_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Counts subcommand: statistics from precomputed counts.
 *
 * The sampled distributions are taken from the table instead of sampling;
 * p-values, q-values and summaries are recomputed.
 */
class counts_command : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "counts"; }
    std::string description() const override {
        return "Recompute statistics from a counts table";
    }
};

} // namespace subcall

#endif // SEGENRICH_SUBCALL_COUNTS_HPP
