/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// cxxopts
#include <cxxopts.hpp>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/counts.hpp"
#include "subcall/results.hpp"
#include "subcall/run.hpp"

void showVersion(std::ostream& _str) {
    _str << "segenrich v" << segenrich_VERSION_MAJOR;
    _str << "." << segenrich_VERSION_MINOR << ".";
    _str << segenrich_VERSION_PATCH << " - ";
    _str << "Enrichment of genomic segments in annotations ";
    _str << "by randomized sampling";
    _str << std::endl;
}

const std::vector<std::string> SUBCOMMANDS = {"run", "counts", "results"};

std::unique_ptr<subcall::subcall> make_subcall(const std::string& name) {
    if (name == "run") return std::make_unique<subcall::run_command>();
    if (name == "counts") return std::make_unique<subcall::counts_command>();
    if (name == "results") return std::make_unique<subcall::results_command>();
    return nullptr;
}

void showUsage(std::ostream& _str) {
    _str << "Usage: segenrich <subcommand> [options]\n\n";
    _str << "Subcommands:\n";
    for (const auto& name : SUBCOMMANDS) {
        auto cmd = make_subcall(name);
        _str << "  " << std::left << std::setw(9) << cmd->name() << cmd->description() << "\n";
    }
    _str << "\nRun 'segenrich <subcommand> --help' for subcommand options." << std::endl;
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            showUsage(std::cout);
            return 1;
        }

        std::string command = argv[1];
        if (command == "-h" || command == "--help") {
            showUsage(std::cout);
            return 0;
        }
        if (command == "-v" || command == "--version") {
            showVersion(std::cout);
            return 0;
        }

        auto cmd = make_subcall(command);
        if (!cmd) {
            logging::error("Unknown subcommand: " + command);
            showUsage(std::cerr);
            return 1;
        }

        // the subcommand sees its own name as argv[0]
        auto options = cmd->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        cmd->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch(const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
