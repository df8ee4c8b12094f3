/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "orchestrator.hpp"

// standard
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

// class
#include "errors.hpp"
#include "utility.hpp"

namespace {

void require_input(const interval_collection& collection) {
    if (collection.empty() || collection.sum() == 0) {
        throw input_error("no intervals in " + collection.name());
    }
}

void log_collection(const interval_collection& collection, const std::string& stage) {
    size_t intervals = 0;
    for (const auto& [track, n] : collection.counts_per_track()) {
        intervals += n;
    }
    logging::info(collection.name() + " " + stage + ": " + std::to_string(collection.size()) +
                  " track(s), " + std::to_string(intervals) + " intervals, " +
                  std::to_string(collection.sum()) + " bp");
}

} // namespace

void prepare_inputs(interval_collection& segments, interval_collection& annotations,
                    interval_collection& workspace, interval_collection* isochores,
                    const stats_callback& dump) {
    require_input(segments);
    require_input(annotations);
    require_input(workspace);

    auto stage = [&dump](const interval_collection& collection, const std::string& name) {
        if (dump) dump(collection, name);
    };

    for (auto* collection : {&segments, &annotations, &workspace}) {
        stage(*collection, "raw");
        collection->normalize();
        stage(*collection, "normed");
    }
    log_collection(segments, "after normalization");
    log_collection(annotations, "after normalization");

    workspace.collapse();
    stage(workspace, "collapsed");
    workspace.restrict(interval_collection::COLLAPSED_TRACK);
    log_collection(workspace, "after collapsing");

    if (isochores != nullptr) {
        require_input(*isochores);
        stage(*isochores, "raw");
        isochores->sort();
        isochores->check();
        isochores->normalize();

        segments.to_isochores(*isochores);
        annotations.to_isochores(*isochores);
        workspace.to_isochores(*isochores);

        if (workspace.sum() == 0) {
            throw input_error("workspace and isochores do not overlap");
        }
        if (segments.sum() == 0) {
            throw input_error("segments and isochores do not overlap");
        }
        if (annotations.sum() == 0) {
            throw input_error("annotations and isochores do not overlap");
        }
        log_collection(workspace, "split by " + std::to_string(isochores->size()) + " isochore(s)");

        stage(workspace, "isochores");
        stage(annotations, "isochores");
        stage(segments, "isochores");
    }

    const stratum_map& ws = workspace.get(interval_collection::COLLAPSED_TRACK);
    segments.filter(ws);
    annotations.filter(ws);

    if (segments.sum() == 0) {
        throw input_error("segments and workspace do not overlap");
    }
    if (annotations.sum() == 0) {
        logging::warning("annotations and workspace do not overlap, all observed counts will be zero");
    }
    log_collection(segments, "within workspace");
    log_collection(annotations, "within workspace");

    stage(annotations, "pruned");
    stage(segments, "pruned");
}

orchestrator::orchestrator(run_config config, sampler_config sampling, counter count,
                           statistics_config stats, sample_cache* samples_cache)
    : cfg{std::move(config)}, sampler_{sampling}, counter_{count}, stats_cfg{stats}, cache{samples_cache} {
    if (cfg.num_samples == 0) {
        throw configuration_error("number of samples must be positive");
    }
    cfg.threads = std::max<size_t>(1, cfg.threads);
}

std::vector<pair_result> orchestrator::run(const interval_collection& segments,
                                           const interval_collection& annotations,
                                           const interval_collection& workspace) const {
    const stratum_map& ws = workspace.get(interval_collection::COLLAPSED_TRACK);

    std::vector<std::string> annotation_names = annotations.track_names();
    std::vector<std::unique_ptr<annotation_index>> indexes;
    indexes.reserve(annotation_names.size());
    for (const auto& name : annotation_names) {
        indexes.push_back(std::make_unique<annotation_index>(annotations.get(name), cfg.order));
    }
    for (size_t a = 0; a < indexes.size(); ++a) {
        logging::info("Indexed " + annotation_names[a] + ": " + std::to_string(indexes[a]->size()) +
                      " intervals, " + std::to_string(indexes[a]->sum()) + " bp");
    }

    log_memory_estimate(segments);

    std::vector<std::string> tracks = segments.track_names();
    logging::info("Testing " + std::to_string(tracks.size() * annotation_names.size()) +
                  " pair(s) with " + std::to_string(cfg.num_samples) + " samples each (" +
                  counter_.name() + ", " + std::to_string(cfg.threads) + " thread(s))");

    std::vector<pair_result> results;
    results.reserve(tracks.size() * annotation_names.size());

    for (const auto& track : tracks) {
        auto start = std::chrono::steady_clock::now();
        const stratum_map& observed_segments = segments.get(track);

        sampling_plan plan = sampler_.prepare(track, observed_segments, ws);
        if (plan.capacity() < plan.target()) {
            logging::warning(track + ": workspace (" + std::to_string(plan.capacity()) +
                             " bp) is smaller than the segments (" + std::to_string(plan.target()) +
                             " bp), samples will be truncated");
        }

        std::vector<std::vector<double>> samples = sample_track(plan, indexes);

        for (size_t a = 0; a < indexes.size(); ++a) {
            double observed = counter_.count(observed_segments, *indexes[a]);
            results.push_back(statistics::summarize(track, annotation_names[a], observed,
                                                    std::move(samples[a]), stats_cfg));
        }

        logging::info(track + ": " + std::to_string(plan.segments()) + " segments in " +
                      std::to_string(plan.strata.size()) + " strata sampled in " +
                      std::to_string(utility::seconds_since(start)) + "s");
    }
    return results;
}

std::vector<std::vector<double>> orchestrator::sample_track(
    const sampling_plan& plan,
    const std::vector<std::unique_ptr<annotation_index>>& indexes) const {

    const size_t n = cfg.num_samples;
    // [annotation][trial]
    std::vector<std::vector<double>> values(indexes.size(), std::vector<double>(n, 0.0));

    std::atomic<size_t> next_trial{0};
    std::atomic<size_t> done{0};
    std::mutex error_mutex;
    std::exception_ptr error;

    logging::progress_start();

    auto worker = [&]() {
        while (true) {
            size_t trial = next_trial.fetch_add(1, std::memory_order_relaxed);
            if (trial >= n) break;

            try {
                stratum_map sample = draw(plan, trial);
                for (size_t a = 0; a < indexes.size(); ++a) {
                    values[a][trial] = counter_.count(sample, *indexes[a]);
                }
                write_sample(plan.track, trial, sample);
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!error) error = std::current_exception();
                // stop the other workers
                next_trial.store(n);
                break;
            }

            size_t finished = done.fetch_add(1) + 1;
            if (finished % 100 == 0) {
                logging::progress(finished, plan.track + " samples");
            }
        }
    };

    size_t nthreads = std::min(cfg.threads, n);
    if (nthreads <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(nthreads);
        for (size_t t = 0; t < nthreads; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& th : workers) th.join();
    }

    if (error) {
        std::rethrow_exception(error);
    }

    logging::progress_done(done.load(), plan.track + " samples");
    return values;
}

stratum_map orchestrator::draw(const sampling_plan& plan, size_t trial) const {
    sample_key key(plan.track, trial, cfg.seed);
    if (cache != nullptr) {
        if (auto hit = cache->get(key)) {
            return std::move(*hit);
        }
    }

    rng_type rng = make_trial_rng(cfg.seed, plan.track, trial);
    stratum_map sample = sampler_.sample(plan, rng);

    if (cache != nullptr) {
        cache->put(key, sample);
    }
    return sample;
}

void orchestrator::write_sample(const std::string& track, size_t trial, const stratum_map& sample) const {
    if (cfg.output_samples_pattern.empty()) return;

    std::string sample_name = track + "." + std::to_string(trial);
    std::string id = sanitize_filename(sample_name);
    std::string filename = cfg.output_samples_pattern;
    size_t pos = 0;
    while ((pos = filename.find("%s", pos)) != std::string::npos) {
        filename.replace(pos, 2, id);
        pos += id.size();
    }

    std::filesystem::path path(filename);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        throw input_error("cannot write sample file " + filename);
    }
    // named <track>.<trial> so the file can be read back with --sample-file
    write_strata_bed(out, sample_name, sample);
}

void orchestrator::log_memory_estimate(const interval_collection& segments) const {
    size_t intervals = 0;
    for (const auto& [track, n] : segments.counts_per_track()) {
        intervals += n;
    }
    size_t sample_bytes = intervals * cfg.num_samples * sizeof(interval);
    logging::info("Keeping all samples would need about " + utility::format_bytes(sample_bytes) +
                  "; samples are counted as they are drawn");
}
