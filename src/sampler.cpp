/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "sampler.hpp"

// standard
#include <algorithm>
#include <map>

// class
#include "errors.hpp"

rng_type make_trial_rng(uint64_t seed, const std::string& track, size_t trial) {
    // FNV-1a, stable across platforms unlike std::hash
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : track) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    uint64_t t = static_cast<uint64_t>(trial);

    std::seed_seq seq{
        static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(h), static_cast<uint32_t>(h >> 32),
        static_cast<uint32_t>(t), static_cast<uint32_t>(t >> 32)
    };
    return rng_type(seq);
}

// --- length_histogram ---

length_histogram::length_histogram(const interval_set& segments, size_t bucket_size, size_t nbuckets) {
    if (bucket_size == 0 || nbuckets == 0) {
        throw configuration_error("bucket size and number of buckets must be positive");
    }

    std::map<size_t, bucket> binned;
    for (const auto& iv : segments) {
        size_t length = iv.length();
        size_t index = std::min(length / bucket_size, nbuckets - 1);

        auto it = binned.find(index);
        if (it == binned.end()) {
            binned.emplace(index, bucket{index, 1, length, length});
        } else {
            it->second.count++;
            it->second.min_length = std::min(it->second.min_length, length);
            it->second.max_length = std::max(it->second.max_length, length);
        }
    }

    for (const auto& [index, b] : binned) {
        total += b.count;
        buckets.push_back(b);
        cumulative.push_back(total);
    }
}

size_t length_histogram::draw(rng_type& rng) const {
    if (total == 0) {
        throw consistency_error("cannot draw a length from an empty histogram");
    }

    std::uniform_int_distribution<size_t> pick(0, total - 1);
    size_t r = pick(rng);
    auto it = std::upper_bound(cumulative.begin(), cumulative.end(), r);
    const bucket& b = buckets[static_cast<size_t>(it - cumulative.begin())];

    if (b.min_length == b.max_length) {
        return b.min_length;
    }
    std::uniform_int_distribution<size_t> length(b.min_length, b.max_length);
    return length(rng);
}

// --- free_space ---

free_space::free_space(const interval_set& workspace) {
    if (workspace.is_normalized()) {
        gaps = workspace.intervals();
    } else {
        interval_set normalized = workspace;
        normalized.normalize();
        gaps = normalized.intervals();
    }

    for (const auto& g : gaps) {
        total_ += g.length();
    }
    rebuild(std::max<size_t>(gaps.size() * 2, 16));
}

void free_space::rebuild(size_t capacity) {
    tree.assign(capacity + 1, 0);
    for (size_t i = 0; i < gaps.size(); ++i) {
        tree[i + 1] = gaps[i].length();
    }
    // linear time Fenwick construction
    for (size_t i = 1; i <= capacity; ++i) {
        size_t parent = i + (i & (~i + 1));
        if (parent <= capacity) {
            tree[parent] += tree[i];
        }
    }
}

void free_space::add(size_t slot, size_t value) {
    for (size_t i = slot + 1; i < tree.size(); i += i & (~i + 1)) {
        tree[i] += value;
    }
}

void free_space::subtract(size_t slot, size_t value) {
    for (size_t i = slot + 1; i < tree.size(); i += i & (~i + 1)) {
        tree[i] -= value;
    }
}

std::pair<size_t, size_t> free_space::locate(size_t pos) const {
    size_t n = tree.size() - 1;
    size_t step = 1;
    while (step * 2 <= n) step *= 2;

    size_t idx = 0;
    size_t remaining = pos;
    for (; step > 0; step >>= 1) {
        size_t next = idx + step;
        if (next <= n && tree[next] <= remaining) {
            idx = next;
            remaining -= tree[next];
        }
    }
    return {idx, remaining};
}

size_t free_space::largest_slot() const {
    size_t best = 0;
    for (size_t i = 1; i < gaps.size(); ++i) {
        if (gaps[i].length() > gaps[best].length()) {
            best = i;
        }
    }
    return best;
}

void free_space::claim(size_t slot, size_t start, size_t length) {
    const interval g = gaps[slot];
    if (start < g.start || start + length > g.end || length == 0) {
        throw consistency_error("claimed range [" + std::to_string(start) + ", " +
                                std::to_string(start + length) + ") outside of free gap");
    }

    // left remainder stays in the slot, right remainder gets a new one
    gaps[slot] = interval(g.start, start);
    subtract(slot, g.end - start);
    total_ -= length;

    if (start + length < g.end) {
        if (gaps.size() + 1 > tree.size() - 1) {
            rebuild(2 * (tree.size() - 1));
        }
        gaps.emplace_back(start + length, g.end);
        add(gaps.size() - 1, g.end - start - length);
    }
}

// --- sampling_plan ---

size_t sampling_plan::target() const {
    size_t n = 0;
    for (const auto& s : strata) n += s.target;
    return n;
}

size_t sampling_plan::capacity() const {
    size_t n = 0;
    for (const auto& s : strata) n += s.workspace ? s.workspace->sum() : 0;
    return n;
}

size_t sampling_plan::segments() const {
    size_t n = 0;
    for (const auto& s : strata) n += s.segments;
    return n;
}

// --- sampler ---

sampler::sampler(sampler_config config) : cfg{config} {
    if (cfg.bucket_size == 0 || cfg.nbuckets == 0) {
        throw configuration_error("bucket size and number of buckets must be positive");
    }
}

sampling_plan sampler::prepare(const std::string& track, const stratum_map& segments,
                               const stratum_map& workspace) const {
    sampling_plan plan;
    plan.track = track;

    for (const auto& [key, intervals] : segments) {
        if (intervals.empty()) continue;

        auto ws = workspace.find(key);
        if (ws == workspace.end() || ws->second.empty()) continue;

        stratum_plan stratum;
        stratum.key = key;
        stratum.workspace = &ws->second;
        stratum.lengths = length_histogram(intervals, cfg.bucket_size, cfg.nbuckets);
        stratum.target = intervals.sum();
        stratum.segments = intervals.size();
        plan.strata.push_back(std::move(stratum));
    }
    return plan;
}

stratum_map sampler::sample(const sampling_plan& plan, rng_type& rng) const {
    stratum_map result;
    for (const auto& stratum : plan.strata) {
        interval_set sampled = sample_stratum(stratum, rng);
        if (!sampled.empty()) {
            result[stratum.key] = std::move(sampled);
        }
    }
    return result;
}

interval_set sampler::sample_stratum(const stratum_plan& stratum, rng_type& rng) const {
    interval_set sampled;
    if (stratum.workspace == nullptr || stratum.lengths.empty() || stratum.target == 0) {
        return sampled;
    }

    free_space space(*stratum.workspace);
    size_t remaining = stratum.target;

    while (remaining > 0 && space.total() > 0) {
        size_t length = std::min(stratum.lengths.draw(rng), remaining);
        bool placed = false;

        // rejection sampling: uniform free base as start, keep if it fits
        std::uniform_int_distribution<size_t> position(0, space.total() - 1);
        for (size_t attempt = 0; attempt < cfg.max_retries; ++attempt) {
            auto [slot, offset] = space.locate(position(rng));
            const interval g = space.gap(slot);
            size_t start = g.start + offset;
            if (start + length <= g.end) {
                space.claim(slot, start, length);
                sampled.add(start, start + length);
                placed = true;
                break;
            }
        }

        if (!placed && !place_exact(space, length, rng, sampled)) {
            // no gap is long enough: truncate to the largest one
            size_t slot = space.largest_slot();
            const interval g = space.gap(slot);
            length = g.length();
            space.claim(slot, g.start, length);
            sampled.add(g.start, g.end);
        }

        remaining -= length;
    }

    sampled.sort();
    return sampled;
}

bool sampler::place_exact(free_space& space, size_t length, rng_type& rng,
                          interval_set& sampled) const {
    size_t weight = 0;
    for (size_t i = 0; i < space.slots(); ++i) {
        size_t gap_length = space.gap(i).length();
        if (gap_length >= length) weight += gap_length - length + 1;
    }
    if (weight == 0) return false;

    std::uniform_int_distribution<size_t> pick(0, weight - 1);
    size_t r = pick(rng);

    for (size_t i = 0; i < space.slots(); ++i) {
        const interval g = space.gap(i);
        if (g.length() < length) continue;
        size_t offsets = g.length() - length + 1;
        if (r < offsets) {
            space.claim(i, g.start + r, length);
            sampled.add(g.start + r, g.start + r + length);
            return true;
        }
        r -= offsets;
    }
    return false;
}
