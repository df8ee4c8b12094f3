/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "interval_set.hpp"

// standard
#include <algorithm>
#include <numeric>
#include <string>

// class
#include "errors.hpp"

interval_set::interval_set(container intervals) : intervals_{std::move(intervals)} {
    for (const auto& iv : intervals_) {
        if (iv.start >= iv.end) {
            throw consistency_error("Empty or inverted interval [" + std::to_string(iv.start) +
                                    ", " + std::to_string(iv.end) + ")");
        }
    }
}

void interval_set::add(size_t start, size_t end) {
    if (start >= end) {
        throw consistency_error("Empty or inverted interval [" + std::to_string(start) +
                                ", " + std::to_string(end) + ")");
    }
    intervals_.emplace_back(start, end);
}

void interval_set::add(const interval& iv) {
    add(iv.start, iv.end);
}

void interval_set::sort() {
    std::sort(intervals_.begin(), intervals_.end());
}

void interval_set::normalize() {
    if (intervals_.empty()) return;
    sort();

    size_t last = 0;
    for (size_t i = 1; i < intervals_.size(); ++i) {
        if (intervals_[last].end >= intervals_[i].start) {
            intervals_[last].end = std::max(intervals_[last].end, intervals_[i].end);
        } else {
            intervals_[++last] = intervals_[i];
        }
    }
    intervals_.resize(last + 1);
}

bool interval_set::is_normalized() const {
    for (size_t i = 1; i < intervals_.size(); ++i) {
        if (intervals_[i - 1].end >= intervals_[i].start) {
            return false;
        }
    }
    return true;
}

bool interval_set::has_overlaps() const {
    container sorted = intervals_;
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i - 1].end > sorted[i].start) {
            return true;
        }
    }
    return false;
}

size_t interval_set::sum() const {
    return std::accumulate(intervals_.begin(), intervals_.end(), size_t{0},
        [](size_t acc, const interval& iv) { return acc + iv.length(); });
}

size_t interval_set::min_length() const {
    if (intervals_.empty()) return 0;
    size_t result = intervals_.front().length();
    for (const auto& iv : intervals_) {
        result = std::min(result, iv.length());
    }
    return result;
}

size_t interval_set::max_length() const {
    size_t result = 0;
    for (const auto& iv : intervals_) {
        result = std::max(result, iv.length());
    }
    return result;
}

interval_set interval_set::intersect(const interval_set& reference) const {
    interval_set result;
    const auto& ref = reference.intervals_;

    for (const auto& iv : intervals_) {
        // first reference interval ending after iv.start
        auto it = std::upper_bound(ref.begin(), ref.end(), iv.start,
            [](size_t pos, const interval& r) { return pos < r.end; });

        for (; it != ref.end() && it->start < iv.end; ++it) {
            size_t start = std::max(iv.start, it->start);
            size_t end = std::min(iv.end, it->end);
            if (start < end) {
                result.intervals_.emplace_back(start, end);
            }
        }
    }
    return result;
}

interval_set interval_set::unite(const interval_set& other) const {
    interval_set result;
    result.intervals_.reserve(intervals_.size() + other.intervals_.size());
    result.intervals_.insert(result.intervals_.end(), intervals_.begin(), intervals_.end());
    result.intervals_.insert(result.intervals_.end(), other.intervals_.begin(), other.intervals_.end());
    result.normalize();
    return result;
}

size_t interval_set::overlap(const interval_set& other) const {
    size_t total = 0;
    auto a = intervals_.begin();
    auto b = other.intervals_.begin();

    while (a != intervals_.end() && b != other.intervals_.end()) {
        size_t start = std::max(a->start, b->start);
        size_t end = std::min(a->end, b->end);
        if (start < end) {
            total += end - start;
        }
        if (a->end < b->end) {
            ++a;
        } else {
            ++b;
        }
    }
    return total;
}
