/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_COUNTER_HPP
#define SEGENRICH_COUNTER_HPP

// standard
#include <string>

// class
#include "annotation_index.hpp"
#include "interval_collection.hpp"

enum class counter_type {
    NUCLEOTIDE_OVERLAP,
    NUCLEOTIDE_DENSITY,
    SEGMENT_OVERLAP
};

/**
 * @throws configuration_error for an unknown counter name
 */
counter_type parse_counter_type(const std::string& name);
std::string counter_name(counter_type type);

/**
 * Reduces a segment set and an annotation track to one scalar.
 *
 * Segments of a stratum are compared to annotations of the same stratum only.
 * Every segment is counted on its own, so two segments overlapping the same
 * annotation both contribute. Annotations are normalized in the index, so a
 * base covered by two annotations counts once.
 */
class counter {
public:
    explicit counter(counter_type type = counter_type::NUCLEOTIDE_OVERLAP) : type_{type} {}

    counter_type type() const { return type_; }
    std::string name() const { return counter_name(type_); }

    double count(const stratum_map& segments, const annotation_index& annotations) const;

private:
    counter_type type_;

    static size_t nucleotide_overlap(const stratum_map& segments, const annotation_index& annotations);
    static size_t segment_overlap(const stratum_map& segments, const annotation_index& annotations);
};

#endif //SEGENRICH_COUNTER_HPP
