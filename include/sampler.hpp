/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_SAMPLER_HPP
#define SEGENRICH_SAMPLER_HPP

// standard
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

// class
#include "interval_collection.hpp"

using rng_type = std::mt19937_64;

/**
 * Random stream of one sampling trial, derived from (seed, track, trial).
 * Independent of the order in which trials are executed.
 */
rng_type make_trial_rng(uint64_t seed, const std::string& track, size_t trial);

struct sampler_config {
    size_t bucket_size = 1;
    size_t nbuckets = 100000;
    // placement attempts for a drawn length before an exact search
    size_t max_retries = 100;
};

/**
 * Binned distribution of segment lengths.
 *
 * Lengths are put into nbuckets bins of bucket_size; the last bin collects
 * everything longer. Only occupied bins are stored. A draw picks a bin with
 * probability proportional to its count and then a length uniformly between
 * the shortest and longest length seen in that bin.
 */
class length_histogram {
public:
    length_histogram() = default;
    length_histogram(const interval_set& segments, size_t bucket_size, size_t nbuckets);

    size_t draw(rng_type& rng) const;

    bool empty() const { return total == 0; }
    size_t count() const { return total; }
    size_t bins() const { return buckets.size(); }

private:
    struct bucket {
        size_t index;
        size_t count;
        size_t min_length;
        size_t max_length;
    };
    std::vector<bucket> buckets;
    std::vector<size_t> cumulative;
    size_t total = 0;
};

/**
 * Free positions of a workspace stratum during one trial.
 *
 * Gaps are kept in slots with a Fenwick tree over their lengths, so the gap
 * holding the n-th free base is found in O(log gaps). Claiming bases from a
 * gap shrinks its slot and appends the right-hand remainder as a new slot.
 */
class free_space {
public:
    explicit free_space(const interval_set& workspace);

    size_t total() const { return total_; }

    /**
     * Slot and offset of the pos-th free base, pos < total()
     */
    std::pair<size_t, size_t> locate(size_t pos) const;

    const interval& gap(size_t slot) const { return gaps[slot]; }

    size_t slots() const { return gaps.size(); }

    size_t largest_slot() const;

    /**
     * Remove [start, start + length) from a slot; must lie inside the gap
     */
    void claim(size_t slot, size_t start, size_t length);

private:
    std::vector<interval> gaps;
    std::vector<size_t> tree;   // 1-based Fenwick tree over gap lengths
    size_t total_ = 0;

    void add(size_t slot, size_t value);
    void subtract(size_t slot, size_t value);
    void rebuild(size_t capacity);
};

/**
 * Per stratum sampling input of one segment track
 */
struct stratum_plan {
    stratum_key key;
    const interval_set* workspace = nullptr;
    length_histogram lengths;
    size_t target = 0;      // observed bases to place
    size_t segments = 0;    // observed segment count
};

/**
 * Everything needed to sample one segment track. Refers to the workspace
 * collection, which must outlive the plan.
 */
struct sampling_plan {
    std::string track;
    std::vector<stratum_plan> strata;

    size_t target() const;
    size_t capacity() const;
    size_t segments() const;
};

/**
 * Places randomized segments inside the workspace, preserving the length
 * distribution and total size of the observed segments per stratum.
 *
 * Placement is uniform over all start positions at which a segment of the
 * drawn length fits into the remaining free workspace; sampled segments
 * never overlap each other. When a stratum has less free space than the
 * observed size, segments are placed until the space is used up and the last
 * one is truncated to the gap it is put in.
 */
class sampler {
public:
    explicit sampler(sampler_config config = sampler_config());

    /**
     * Build the sampling plan of a track from its (workspace filtered)
     * segments. Strata without a workspace counterpart are skipped.
     */
    sampling_plan prepare(const std::string& track, const stratum_map& segments,
                          const stratum_map& workspace) const;

    /**
     * Draw one randomized segment set. Every stratum of the result is sorted
     * and free of overlaps.
     */
    stratum_map sample(const sampling_plan& plan, rng_type& rng) const;

    interval_set sample_stratum(const stratum_plan& stratum, rng_type& rng) const;

private:
    sampler_config cfg;

    // exact uniform placement over all gaps that fit; false if none does
    bool place_exact(free_space& space, size_t length, rng_type& rng,
                     interval_set& sampled) const;
};

#endif //SEGENRICH_SAMPLER_HPP
