/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "counter.hpp"

// class
#include "errors.hpp"

counter_type parse_counter_type(const std::string& name) {
    if (name == "nucleotide-overlap") return counter_type::NUCLEOTIDE_OVERLAP;
    if (name == "nucleotide-density") return counter_type::NUCLEOTIDE_DENSITY;
    if (name == "segment-overlap") return counter_type::SEGMENT_OVERLAP;
    throw configuration_error("unknown counter '" + name +
                              "' (expected nucleotide-overlap, nucleotide-density or segment-overlap)");
}

std::string counter_name(counter_type type) {
    switch (type) {
        case counter_type::NUCLEOTIDE_OVERLAP: return "nucleotide-overlap";
        case counter_type::NUCLEOTIDE_DENSITY: return "nucleotide-density";
        case counter_type::SEGMENT_OVERLAP: return "segment-overlap";
    }
    return "unknown";
}

double counter::count(const stratum_map& segments, const annotation_index& annotations) const {
    switch (type_) {
        case counter_type::NUCLEOTIDE_OVERLAP:
            return static_cast<double>(nucleotide_overlap(segments, annotations));

        case counter_type::NUCLEOTIDE_DENSITY: {
            size_t length = stratum_sum(segments);
            if (length == 0) return 0.0;
            return static_cast<double>(nucleotide_overlap(segments, annotations)) /
                   static_cast<double>(length);
        }

        case counter_type::SEGMENT_OVERLAP:
            return static_cast<double>(segment_overlap(segments, annotations));
    }
    throw configuration_error("unhandled counter type");
}

size_t counter::nucleotide_overlap(const stratum_map& segments, const annotation_index& annotations) {
    size_t total = 0;
    for (const auto& [key, intervals] : segments) {
        if (!annotations.has_stratum(key)) continue;
        for (const auto& iv : intervals) {
            total += annotations.overlap(key, iv.start, iv.end);
        }
    }
    return total;
}

size_t counter::segment_overlap(const stratum_map& segments, const annotation_index& annotations) {
    size_t total = 0;
    for (const auto& [key, intervals] : segments) {
        if (!annotations.has_stratum(key)) continue;
        for (const auto& iv : intervals) {
            if (annotations.overlaps(key, iv.start, iv.end)) {
                total++;
            }
        }
    }
    return total;
}
