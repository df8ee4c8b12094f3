/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_RESULT_TABLE_HPP
#define SEGENRICH_RESULT_TABLE_HPP

// standard
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

// class
#include "statistics.hpp"

enum class result_order {
    TRACK,
    ANNOTATION,
    FOLD,
    PVALUE,
    QVALUE
};

/**
 * @throws configuration_error for an unknown order
 */
result_order parse_result_order(const std::string& name);

/**
 * Tab separated result and counts tables.
 *
 * Result table columns: track annotation observed expected CI95low CI95high
 * stddev fold pvalue qvalue. p- and q-values are written with enough digits to
 * read back the identical double. Counts table columns: track annotation
 * observed counts, where counts holds the sampled statistics separated by
 * commas. Lines starting with '#' are ignored on reading.
 */
namespace result_table {
    extern const std::vector<std::string> RESULT_COLUMNS;
    extern const std::vector<std::string> COUNTS_COLUMNS;

    /**
     * Stable sort: track and annotation lexicographically, fold, p- and
     * q-values ascending
     */
    void sort(std::vector<pair_result>& results, result_order order);

    void write(std::ostream& out, const std::vector<pair_result>& results);

    /**
     * @throws input_error if the file cannot be opened
     * @throws format_error for a missing column or a non-numeric value
     */
    std::vector<pair_result> read(const std::filesystem::path& path);

    void write_counts(std::ostream& out, const std::vector<pair_result>& results);

    /**
     * Read a counts table and rebuild every result through the statistics
     * engine
     */
    std::vector<pair_result> read_counts(const std::filesystem::path& path,
                                         const statistics_config& config);
}

#endif //SEGENRICH_RESULT_TABLE_HPP
