/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_INTERVAL_SET_HPP
#define SEGENRICH_INTERVAL_SET_HPP

// standard
#include <cstddef>
#include <vector>

/**
 * Half-open interval [start, end) on a contig, start < end
 */
struct interval {
    size_t start;
    size_t end;

    interval() : start(0), end(0) {}
    interval(size_t start, size_t end) : start{start}, end{end} {}

    size_t length() const { return end - start; }

    bool overlaps(const interval& other) const {
        return start < other.end && other.start < end;
    }

    bool operator<(const interval& other) const {
        return start < other.start || (start == other.start && end < other.end);
    }

    bool operator==(const interval& other) const {
        return start == other.start && end == other.end;
    }

    bool operator!=(const interval& other) const { return !(*this == other); }
};

/**
 * Ordered collection of intervals on a single contig.
 *
 * After normalize() the set is sorted and free of overlapping or touching
 * intervals: for all i < j, intervals[i].end < intervals[j].start.
 * Operations taking a second set as reference require that reference to be
 * normalized.
 */
class interval_set {
public:
    using container = std::vector<interval>;
    using const_iterator = container::const_iterator;

    interval_set() = default;
    explicit interval_set(container intervals);

    /**
     * Append an interval
     * @throws consistency_error if start >= end
     */
    void add(size_t start, size_t end);
    void add(const interval& iv);

    void sort();

    /**
     * Sort and merge intervals with end_i >= start_j. Idempotent.
     */
    void normalize();

    bool is_normalized() const;

    /**
     * True if any two intervals share at least one base (touching is fine).
     * Sorts a copy, the set itself is left untouched.
     */
    bool has_overlaps() const;

    // total number of bases covered by the intervals (counts overlaps twice)
    size_t sum() const;

    size_t size() const { return intervals_.size(); }
    bool empty() const { return intervals_.empty(); }
    void clear() { intervals_.clear(); }

    size_t min_length() const;
    size_t max_length() const;

    const interval& operator[](size_t i) const { return intervals_[i]; }
    const_iterator begin() const { return intervals_.begin(); }
    const_iterator end() const { return intervals_.end(); }
    const container& intervals() const { return intervals_; }

    /**
     * Clip every interval against a normalized reference.
     * Intervals crossing reference boundaries are split, intervals without
     * any overlap are dropped. Order of this set is preserved.
     */
    interval_set intersect(const interval_set& reference) const;

    /**
     * Normalized union of this set and another
     */
    interval_set unite(const interval_set& other) const;

    /**
     * Bases shared between two normalized sets
     */
    size_t overlap(const interval_set& other) const;

    bool operator==(const interval_set& other) const { return intervals_ == other.intervals_; }
    bool operator!=(const interval_set& other) const { return !(*this == other); }

private:
    container intervals_;
};

#endif //SEGENRICH_INTERVAL_SET_HPP
