/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_ORCHESTRATOR_HPP
#define SEGENRICH_ORCHESTRATOR_HPP

// standard
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// class
#include "annotation_index.hpp"
#include "counter.hpp"
#include "interval_collection.hpp"
#include "sample_cache.hpp"
#include "sampler.hpp"
#include "statistics.hpp"

struct run_config {
    size_t num_samples = 1000;
    uint64_t seed = 0;
    size_t threads = 1;
    // genogrove order of the annotation indexes
    int order = 3;
    // BED file per track and trial, "%s" is replaced by <track>.<trial>; the
    // track line names the sample <track>.<trial>
    std::string output_samples_pattern;
};

/**
 * Receives a collection and the name of the preparation stage it just went
 * through: raw, normed, collapsed, isochores or pruned
 */
using stats_callback = std::function<void(const interval_collection&, const std::string&)>;

/**
 * Bring loaded inputs into the state the sampler works on.
 *
 * All collections are normalized and the workspace is collapsed into its
 * single "collapsed" track. With isochores, every collection is split into
 * (isochore, contig) strata. Segments and annotations are then clipped to the
 * workspace.
 *
 * @throws input_error if any input is empty, or if segments and workspace do
 *         not overlap after stratification and filtering
 * @throws consistency_error for overlapping isochores
 */
void prepare_inputs(interval_collection& segments, interval_collection& annotations,
                    interval_collection& workspace, interval_collection* isochores,
                    const stats_callback& dump = stats_callback());

/**
 * Runs the resampling loop for every segment track against every annotation
 * track and hands the distributions to the statistics engine.
 *
 * Trials of a track are distributed over worker threads; every trial uses its
 * own random stream derived from (seed, track, trial) and writes only to its
 * own slot, so results do not depend on the number of threads.
 */
class orchestrator {
public:
    orchestrator(run_config config, sampler_config sampling, counter count,
                 statistics_config stats, sample_cache* cache = nullptr);

    /**
     * @param workspace collection holding the collapsed workspace track
     * @return one result per (track, annotation) pair, p-values set, q-values
     *         not yet computed
     */
    std::vector<pair_result> run(const interval_collection& segments,
                                 const interval_collection& annotations,
                                 const interval_collection& workspace) const;

private:
    run_config cfg;
    sampler sampler_;
    counter counter_;
    statistics_config stats_cfg;
    sample_cache* cache;

    stratum_map draw(const sampling_plan& plan, size_t trial) const;

    void write_sample(const std::string& track, size_t trial, const stratum_map& sample) const;

    // trials x annotations sampled statistics of one track
    std::vector<std::vector<double>> sample_track(
        const sampling_plan& plan,
        const std::vector<std::unique_ptr<annotation_index>>& indexes) const;

    void log_memory_estimate(const interval_collection& segments) const;
};

#endif //SEGENRICH_ORCHESTRATOR_HPP
