/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_INTERVAL_COLLECTION_HPP
#define SEGENRICH_INTERVAL_COLLECTION_HPP

// standard
#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// class
#include "interval_set.hpp"

/**
 * Key of one independently sampled region of a track: the isochore cell
 * (empty when the collection is not stratified) and the contig.
 */
struct stratum_key {
    std::string isochore;
    std::string contig;

    stratum_key() = default;
    stratum_key(std::string isochore, std::string contig)
        : isochore{std::move(isochore)}, contig{std::move(contig)} {}

    bool operator<(const stratum_key& other) const {
        return std::tie(isochore, contig) < std::tie(other.isochore, other.contig);
    }

    bool operator==(const stratum_key& other) const {
        return isochore == other.isochore && contig == other.contig;
    }

    std::string to_string() const {
        return isochore.empty() ? contig : isochore + ":" + contig;
    }
};

using stratum_map = std::map<stratum_key, interval_set>;

// total bases over all strata
size_t stratum_sum(const stratum_map& strata);

/**
 * Named tracks of intervals across contigs and, once stratified, isochores.
 *
 * A collection is built once from input files and then moved through
 * normalize / collapse / restrict / filter / to_isochores before it is
 * used read-only by the sampling stage.
 */
class interval_collection {
public:
    using container = std::map<std::string, stratum_map>;
    using const_iterator = container::const_iterator;

    static const std::string COLLAPSED_TRACK;

    explicit interval_collection(std::string name);

    const std::string& name() const { return name_; }

    /**
     * Read BED files into named tracks; several files may add to one track
     * @throws input_error, format_error
     */
    void load(const std::vector<std::string>& files);

    void add(const std::string& track, const std::string& contig, size_t start, size_t end,
             const std::string& isochore = "");

    /**
     * Replace a whole stratum of a track
     */
    void set(const std::string& track, const stratum_key& key, interval_set intervals);

    void sort();
    void normalize();

    /**
     * @throws consistency_error if intervals within any stratum overlap
     */
    void check() const;

    /**
     * Add the track COLLAPSED_TRACK holding the union of all tracks
     */
    void collapse();

    /**
     * Discard all tracks except the given one
     * @throws input_error if the track does not exist
     */
    void restrict(const std::string& track);

    /**
     * Clip all intervals against a normalized reference with matching strata.
     * Intervals outside the reference are dropped, as are emptied strata.
     */
    void filter(const stratum_map& reference);

    /**
     * Split every track by the cells of the isochore tracks. Intervals are
     * clipped to cells and re-keyed by (isochore, contig); parts outside all
     * cells are discarded.
     * @throws consistency_error if isochore cells overlap each other or the
     *         collection is already stratified
     */
    void to_isochores(const interval_collection& isochores);

    bool is_stratified() const;

    size_t sum() const;
    std::map<std::string, size_t> counts_per_track() const;

    size_t size() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }
    bool contains(const std::string& track) const { return tracks_.count(track) > 0; }
    std::vector<std::string> track_names() const;

    /**
     * @throws input_error if the track does not exist
     */
    const stratum_map& get(const std::string& track) const;
    const stratum_map& operator[](const std::string& track) const { return get(track); }

    const_iterator begin() const { return tracks_.begin(); }
    const_iterator end() const { return tracks_.end(); }

    /**
     * Per track and isochore summary: contigs, intervals, bases, min/max/mean length
     */
    void write_stats(std::ostream& out) const;

    /**
     * Per track and stratum: bases of the track, bases of other within the
     * stratum, their overlap and the share of the track covered by other.
     * Both sides must be normalized.
     */
    void write_overlap_stats(std::ostream& out, const stratum_map& other) const;

    void write_bed(std::ostream& out, const std::string& track) const;

private:
    std::string name_;
    container tracks_;
};

/**
 * Write a single stratified interval set as BED
 */
void write_strata_bed(std::ostream& out, const std::string& track, const stratum_map& strata);

#endif //SEGENRICH_INTERVAL_COLLECTION_HPP
