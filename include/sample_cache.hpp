/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_SAMPLE_CACHE_HPP
#define SEGENRICH_SAMPLE_CACHE_HPP

// standard
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// class
#include "interval_collection.hpp"

struct sample_key {
    std::string track;
    size_t trial = 0;
    uint64_t seed = 0;

    sample_key() = default;
    sample_key(std::string track, size_t trial, uint64_t seed)
        : track{std::move(track)}, trial{trial}, seed{seed} {}

    bool operator<(const sample_key& other) const {
        return std::tie(track, trial, seed) < std::tie(other.track, other.trial, other.seed);
    }
};

/**
 * Store of generated samples. A hit replaces drawing the sample again, so
 * implementations must return exactly what was put. Called from worker
 * threads concurrently.
 */
class sample_cache {
public:
    virtual ~sample_cache() = default;

    virtual std::optional<stratum_map> get(const sample_key& key) = 0;
    virtual void put(const sample_key& key, const stratum_map& sample) = 0;
    virtual size_t size() const = 0;
};

class memory_sample_cache : public sample_cache {
public:
    std::optional<stratum_map> get(const sample_key& key) override;
    void put(const sample_key& key, const stratum_map& sample) override;
    size_t size() const override;

private:
    mutable std::mutex mutex;
    std::map<sample_key, stratum_map> samples;
};

/**
 * One BED file per sample in a directory, named <track>.<trial>.<seed>.bed.
 * Samples survive the process, so a rerun with the same seed reads them
 * back instead of sampling.
 */
class file_sample_cache : public sample_cache {
public:
    explicit file_sample_cache(const std::filesystem::path& directory);

    std::optional<stratum_map> get(const sample_key& key) override;
    void put(const sample_key& key, const stratum_map& sample) override;
    size_t size() const override;

    const std::filesystem::path& directory() const { return dir; }
    std::filesystem::path path_for(const sample_key& key) const;

private:
    std::filesystem::path dir;
};

/**
 * Replace characters that are unsafe in file names by '_'
 */
/**
 * Precomputed samples read from BED files, such as those written with
 * --output-samples-pattern.
 *
 * Each sample is a track named <track>.<trial>; the 4th column carries the
 * isochore of stratified samples. Lookups match track and trial whatever the
 * seed. The store is read-only: trials missing from the files are drawn by
 * the sampler and not added.
 */
class sample_file_store : public sample_cache {
public:
    /**
     * @throws input_error, format_error
     */
    explicit sample_file_store(const std::vector<std::string>& files);

    std::optional<stratum_map> get(const sample_key& key) override;
    void put(const sample_key& key, const stratum_map& sample) override;
    size_t size() const override { return samples.size(); }

    /**
     * Number of stored trials of a track
     */
    size_t trials(const std::string& track) const;

private:
    std::map<std::pair<std::string, size_t>, stratum_map> samples;
};

std::string sanitize_filename(const std::string& name);

#endif //SEGENRICH_SAMPLE_CACHE_HPP
