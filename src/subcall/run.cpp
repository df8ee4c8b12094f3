/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/run.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>

#include "counter.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "sample_cache.hpp"
#include "sampler.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options run_command::parse_args(int argc, char** argv) {
    cxxopts::Options options("segenrich " + name(), description());

    options.add_options("Input")
        ("s,segment-file", "BED file(s) with segments",
            cxxopts::value<std::vector<std::string>>())
        ("a,annotation-file", "BED file(s) with annotations",
            cxxopts::value<std::vector<std::string>>())
        ("w,workspace-file", "BED file(s) with the workspace",
            cxxopts::value<std::vector<std::string>>())
        ("i,isochore-file", "BED file(s) with isochores, one track per isochore",
            cxxopts::value<std::vector<std::string>>())
        ("l,sample-file", "BED file(s) with precomputed samples, one track <track>.<trial> per sample",
            cxxopts::value<std::vector<std::string>>())
        ;

    options.add_options("Sampling")
        ("c,counter", "Statistic: nucleotide-overlap, nucleotide-density or segment-overlap",
            cxxopts::value<std::string>()->default_value("nucleotide-overlap"))
        ("n,num-samples", "Number of samples",
            cxxopts::value<size_t>()->default_value("1000"))
        ("bucket-size", "Bin width of the segment length histogram",
            cxxopts::value<size_t>()->default_value("1"))
        ("nbuckets", "Number of bins of the segment length histogram",
            cxxopts::value<size_t>()->default_value("100000"))
        ("max-retries", "Random placement attempts per segment before an exact search",
            cxxopts::value<size_t>()->default_value("100"))
        ("seed", "Random seed (0 = derive from clock)",
            cxxopts::value<uint64_t>()->default_value("0"))
        ("k,grove-order", "Genogrove tree order of the annotation index",
            cxxopts::value<int>()->default_value("3"))
        ;

    options.add_options("Output")
        ("output-counts-file", "Write observed and sampled counts to this file",
            cxxopts::value<std::string>())
        ("output-samples-pattern", "Write samples as BED, %s is replaced by <track>.<trial>",
            cxxopts::value<std::string>())
        ("e,cache", "Directory to cache samples in",
            cxxopts::value<std::string>())
        ("output-stats", "Input summaries: all, segments, annotations, workspaces, isochores or overlap",
            cxxopts::value<std::vector<std::string>>())
        ;

    add_common_options(options);

    return options;
}

void run_command::validate(const cxxopts::ParseResult& args) {
    const std::vector<std::pair<std::string, std::string>> required = {
        {"segment-file", "segment"},
        {"annotation-file", "annotation"},
        {"workspace-file", "workspace"}
    };

    for (const auto& [option, what] : required) {
        if (!args.count(option)) {
            throw input_error("Must provide at least one " + what + " file (--" + option + ")");
        }
        for (const auto& f : args[option].as<std::vector<std::string>>()) {
            require_file(f, filetype::BED, what + " file");
        }
    }
    for (const std::string option : {"isochore-file", "sample-file"}) {
        if (!args.count(option)) continue;
        for (const auto& f : args[option].as<std::vector<std::string>>()) {
            require_file(f, filetype::BED, option.substr(0, option.find('-')) + " file");
        }
    }
    if (args.count("sample-file") && args.count("cache")) {
        throw configuration_error("--sample-file and --cache cannot be combined");
    }

    parse_counter_type(args["counter"].as<std::string>());

    if (args["num-samples"].as<size_t>() == 0) {
        throw configuration_error("--num-samples must be positive");
    }
    if (args["bucket-size"].as<size_t>() == 0 || args["nbuckets"].as<size_t>() == 0) {
        throw configuration_error("--bucket-size and --nbuckets must be positive");
    }

    stats_sections.clear();
    if (args.count("output-stats")) {
        for (const auto& section : args["output-stats"].as<std::vector<std::string>>()) {
            if (section == "all") {
                stats_sections.insert({"segments", "annotations", "workspaces", "isochores", "overlap"});
            } else if (section == "segments" || section == "annotations" || section == "workspaces" ||
                       section == "isochores" || section == "overlap") {
                stats_sections.insert(section);
            } else {
                throw configuration_error("unknown --output-stats section '" + section + "'");
            }
        }
    }
}

void run_command::execute(const cxxopts::ParseResult& args) {
    auto start = std::chrono::steady_clock::now();
    logging::info("Starting enrichment pipeline...");

    interval_collection segments("segments");
    interval_collection annotations("annotations");
    interval_collection workspace("workspaces");
    std::unique_ptr<interval_collection> isochores;

    segments.load(args["segment-file"].as<std::vector<std::string>>());
    annotations.load(args["annotation-file"].as<std::vector<std::string>>());
    workspace.load(args["workspace-file"].as<std::vector<std::string>>());
    if (args.count("isochore-file")) {
        isochores = std::make_unique<interval_collection>("isochores");
        isochores->load(args["isochore-file"].as<std::vector<std::string>>());
    }

    std::filesystem::path prefix = output_prefix(args);
    prepare_inputs(segments, annotations, workspace, isochores.get(),
        [this, &prefix](const interval_collection& collection, const std::string& stage) {
            write_stats(prefix, collection, stage);
        });

    if (stats_sections.count("overlap")) {
        for (const auto& track : segments.track_names()) {
            std::string path = prefix.string() + ".overlap_" + sanitize_filename(track) + ".tsv";
            std::ofstream out(path);
            if (!out.is_open()) {
                throw input_error("cannot open stats file: " + path);
            }
            workspace.write_overlap_stats(out, segments.get(track));
            logging::info("Wrote workspace overlap of " + track + " to " + path);
        }
    }

    sampler_config sampling;
    sampling.bucket_size = args["bucket-size"].as<size_t>();
    sampling.nbuckets = args["nbuckets"].as<size_t>();
    sampling.max_retries = args["max-retries"].as<size_t>();

    resolve_seed(args);

    run_config config;
    config.num_samples = args["num-samples"].as<size_t>();
    config.seed = seed;
    config.threads = threads;
    config.order = args["grove-order"].as<int>();
    if (args.count("output-samples-pattern")) {
        config.output_samples_pattern = args["output-samples-pattern"].as<std::string>();
    }

    std::unique_ptr<sample_cache> cache;
    if (args.count("cache")) {
        cache = std::make_unique<file_sample_cache>(args["cache"].as<std::string>());
    } else if (args.count("sample-file")) {
        auto store = std::make_unique<sample_file_store>(args["sample-file"].as<std::vector<std::string>>());
        for (const auto& track : segments.track_names()) {
            size_t stored = std::min(store->trials(track), config.num_samples);
            if (stored < config.num_samples) {
                logging::warning(track + ": " + std::to_string(stored) + " of " +
                                 std::to_string(config.num_samples) +
                                 " samples found in sample files, drawing the rest");
            }
        }
        cache = std::move(store);
    }

    counter count(parse_counter_type(args["counter"].as<std::string>()));
    orchestrator pipeline(config, sampling, count, stats_cfg, cache.get());
    results = pipeline.run(segments, annotations, workspace);

    if (args.count("output-counts-file")) {
        std::string path = args["output-counts-file"].as<std::string>();
        std::ofstream out(path);
        if (!out.is_open()) {
            throw input_error("cannot open counts file: " + path);
        }
        result_table::write_counts(out, results);
        logging::info("Wrote counts to " + path);
    }

    logging::info("Sampling finished in " + std::to_string(utility::seconds_since(start)) + "s");
}

void run_command::write_stats(const std::filesystem::path& prefix, const interval_collection& collection,
                              const std::string& stage) const {
    if (stats_sections.find(collection.name()) == stats_sections.end()) return;

    std::string path = prefix.string() + ".stats_" + collection.name() + "_" + stage + ".tsv";
    std::ofstream out(path);
    if (!out.is_open()) {
        throw input_error("cannot open stats file: " + path);
    }
    collection.write_stats(out);
    logging::info("Wrote " + collection.name() + " " + stage + " statistics to " + path);
}

void run_command::resolve_seed(const cxxopts::ParseResult& args) {
    seed = args["seed"].as<uint64_t>();
    if (seed != 0) return;
    seed = static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
    if (seed == 0) seed = 1;
    logging::info("Using random seed " + std::to_string(seed) +
                  " (pass --seed to reproduce this run)");
}

} // namespace subcall
