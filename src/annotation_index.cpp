/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "annotation_index.hpp"

// standard
#include <algorithm>

annotation_index::annotation_index(const stratum_map& strata, int order)
    : grove{std::make_unique<annotation_grove>(order)}, annotations{strata} {

    for (auto& [key, intervals] : annotations) {
        intervals.normalize();
        if (intervals.empty()) continue;

        std::string name = index_name(key);
        for (size_t i = 0; i < intervals.size(); ++i) {
            gdt::interval coord(intervals[i].start, intervals[i].end - 1);
            grove->insert_data(name, coord, i);
        }
        indexed.insert(name);
        interval_count += intervals.size();
    }
}

std::string annotation_index::index_name(const stratum_key& key) {
    return key.isochore + "\t" + key.contig;
}

bool annotation_index::has_stratum(const stratum_key& key) const {
    return indexed.count(index_name(key)) > 0;
}

size_t annotation_index::overlap(const stratum_key& key, size_t start, size_t end) const {
    if (start >= end) return 0;

    std::string name = index_name(key);
    if (indexed.find(name) == indexed.end()) return 0;
    const interval_set& intervals = annotations.at(key);

    gdt::interval query(start, end - 1);
    auto result = grove->intersect(query, name);

    size_t total = 0;
    for (auto* hit : result.get_keys()) {
        // payload is the position of the half-open interval in its stratum
        const interval& iv = intervals[hit->get_data()];
        size_t overlap_start = std::max(start, iv.start);
        size_t overlap_end = std::min(end, iv.end);
        if (overlap_end > overlap_start) {
            total += overlap_end - overlap_start;
        }
    }
    return total;
}

bool annotation_index::overlaps(const stratum_key& key, size_t start, size_t end) const {
    if (start >= end) return false;

    std::string name = index_name(key);
    if (indexed.find(name) == indexed.end()) return false;

    gdt::interval query(start, end - 1);
    auto result = grove->intersect(query, name);

    for (auto* hit : result.get_keys()) {
        const auto& coord = hit->get_value();
        if (static_cast<size_t>(coord.get_start()) < end &&
            start <= static_cast<size_t>(coord.get_end())) {
            return true;
        }
    }
    return false;
}
