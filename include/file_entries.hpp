/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_FILE_ENTRIES_HPP
#define SEGENRICH_FILE_ENTRIES_HPP

#include <cstddef>
#include <string>
#include <utility>

// represents a single BED record, resolved to the track it belongs to
struct bed_entry {
    std::string track;
    std::string contig;
    size_t start;
    size_t end;
    std::string name;

    bed_entry() : start(0), end(0) {}
    bed_entry(std::string track, std::string contig, size_t start, size_t end,
        std::string name = "")
        : track{std::move(track)}, contig{std::move(contig)}, start{start}, end{end},
        name{std::move(name)} {}
};

#endif //SEGENRICH_FILE_ENTRIES_HPP
