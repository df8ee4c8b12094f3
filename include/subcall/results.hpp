/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_SUBCALL_RESULTS_HPP
#define SEGENRICH_SUBCALL_RESULTS_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Results subcommand: q-values (and norm p-values) of an existing table.
 *
 * Sampling and counting are skipped entirely.
 */
class results_command : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "results"; }
    std::string description() const override {
        return "Recompute q-values of a result table";
    }
};

} // namespace subcall

#endif // SEGENRICH_SUBCALL_RESULTS_HPP
