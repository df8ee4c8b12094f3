/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_ANNOTATION_INDEX_HPP
#define SEGENRICH_ANNOTATION_INDEX_HPP

// standard
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>

// genogrove
#include <genogrove/structure/grove/grove.hpp>
#include <genogrove/data_type/interval.hpp>

// class
#include "interval_collection.hpp"

namespace gdt = genogrove::data_type;
namespace gst = genogrove::structure;

// grove payload is the position of the interval within its stratum
using annotation_grove = gst::grove<gdt::interval, size_t>;

/**
 * Spatial index over one annotation track.
 *
 * Each stratum (isochore, contig) becomes its own grove index. Annotation
 * intervals are normalized before insertion, so summing per-hit overlaps
 * counts every annotated base at most once.
 *
 * Half-open intervals [start, end) are stored in the grove as the closed
 * interval [start, end - 1].
 */
class annotation_index {
public:
    explicit annotation_index(const stratum_map& annotations, int order = 3);

    annotation_index(const annotation_index&) = delete;
    annotation_index& operator=(const annotation_index&) = delete;

    /**
     * Annotated bases within [start, end) of a stratum
     */
    size_t overlap(const stratum_key& key, size_t start, size_t end) const;

    /**
     * True if [start, end) shares at least one base with an annotation
     */
    bool overlaps(const stratum_key& key, size_t start, size_t end) const;

    bool has_stratum(const stratum_key& key) const;

    size_t size() const { return interval_count; }

    size_t sum() const { return stratum_sum(annotations); }

private:
    std::unique_ptr<annotation_grove> grove;
    stratum_map annotations;
    std::unordered_set<std::string> indexed;
    size_t interval_count = 0;

    static std::string index_name(const stratum_key& key);
};

#endif //SEGENRICH_ANNOTATION_INDEX_HPP
