/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "result_table.hpp"

// standard
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <unordered_map>

// class
#include "errors.hpp"
#include "utility.hpp"

result_order parse_result_order(const std::string& name) {
    if (name == "track") return result_order::TRACK;
    if (name == "annotation") return result_order::ANNOTATION;
    if (name == "fold") return result_order::FOLD;
    if (name == "pvalue") return result_order::PVALUE;
    if (name == "qvalue") return result_order::QVALUE;
    throw configuration_error("unknown order '" + name +
                              "' (expected track, annotation, fold, pvalue or qvalue)");
}

namespace result_table {

const std::vector<std::string> RESULT_COLUMNS = {
    "track", "annotation", "observed", "expected", "CI95low", "CI95high",
    "stddev", "fold", "pvalue", "qvalue"
};

const std::vector<std::string> COUNTS_COLUMNS = {
    "track", "annotation", "observed", "counts"
};

namespace {

constexpr int ROUND_TRIP_DIGITS = std::numeric_limits<double>::max_digits10;

std::string format_exact(double value) {
    std::ostringstream ss;
    ss << std::setprecision(ROUND_TRIP_DIGITS) << value;
    return ss.str();
}

std::string format_fixed(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

double parse_double(const std::string& field, const std::filesystem::path& path, size_t line_num) {
    std::string value = utility::trim(field);
    try {
        size_t consumed = 0;
        double d = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw format_error(path.string(), line_num, "not a number: '" + value + "'");
        }
        return d;
    } catch (const std::invalid_argument&) {
        throw format_error(path.string(), line_num, "not a number: '" + value + "'");
    } catch (const std::out_of_range&) {
        throw format_error(path.string(), line_num, "number out of range: '" + value + "'");
    }
}

/**
 * Column positions from the header line; every required column must exist
 */
std::unordered_map<std::string, size_t> parse_header(const std::string& line,
                                                     const std::vector<std::string>& required,
                                                     const std::filesystem::path& path,
                                                     size_t line_num) {
    std::unordered_map<std::string, size_t> indices;
    auto columns = utility::split(line, '\t');
    for (size_t i = 0; i < columns.size(); ++i) {
        std::string name = utility::trim(columns[i]);
        if (!name.empty()) {
            indices[name] = i;
        }
    }
    for (const auto& col : required) {
        if (indices.find(col) == indices.end()) {
            throw format_error(path.string(), line_num, "missing column '" + col + "'");
        }
    }
    return indices;
}

/**
 * Calls handle(fields, line_num) for every data row after the header
 */
template<typename Handler>
void read_table(const std::filesystem::path& path, const std::vector<std::string>& required,
                Handler handle) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw input_error("cannot open table: " + path.string());
    }

    std::string line;
    size_t line_num = 0;
    std::unordered_map<std::string, size_t> indices;
    bool header = false;

    while (std::getline(file, line)) {
        line_num++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        if (!header) {
            indices = parse_header(line, required, path, line_num);
            header = true;
            continue;
        }

        auto fields = utility::split(line, '\t');
        std::vector<std::string> row;
        row.reserve(required.size());
        for (const auto& col : required) {
            size_t idx = indices[col];
            if (idx >= fields.size()) {
                throw format_error(path.string(), line_num, "missing value for column '" + col + "'");
            }
            row.push_back(fields[idx]);
        }
        handle(row, line_num);
    }

    if (!header) {
        throw format_error(path.string(), line_num, "no header line");
    }
}

} // namespace

void sort(std::vector<pair_result>& results, result_order order) {
    switch (order) {
        case result_order::TRACK:
            std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
                return std::tie(a.track, a.annotation) < std::tie(b.track, b.annotation);
            });
            break;
        case result_order::ANNOTATION:
            std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
                return std::tie(a.annotation, a.track) < std::tie(b.annotation, b.track);
            });
            break;
        case result_order::FOLD:
            std::stable_sort(results.begin(), results.end(),
                [](const auto& a, const auto& b) { return a.fold < b.fold; });
            break;
        case result_order::PVALUE:
            std::stable_sort(results.begin(), results.end(),
                [](const auto& a, const auto& b) { return a.pvalue < b.pvalue; });
            break;
        case result_order::QVALUE:
            std::stable_sort(results.begin(), results.end(),
                [](const auto& a, const auto& b) { return a.qvalue < b.qvalue; });
            break;
    }
}

void write(std::ostream& out, const std::vector<pair_result>& results) {
    for (size_t i = 0; i < RESULT_COLUMNS.size(); ++i) {
        out << (i > 0 ? "\t" : "") << RESULT_COLUMNS[i];
    }
    out << "\n";

    for (const auto& r : results) {
        out << r.track << "\t"
            << r.annotation << "\t"
            << format_exact(r.observed) << "\t"
            << format_fixed(r.expected) << "\t"
            << format_fixed(r.ci_low) << "\t"
            << format_fixed(r.ci_high) << "\t"
            << format_fixed(r.stddev) << "\t"
            << format_fixed(r.fold) << "\t"
            << format_exact(r.pvalue) << "\t"
            << format_exact(r.qvalue) << "\n";
    }
}

std::vector<pair_result> read(const std::filesystem::path& path) {
    std::vector<pair_result> results;

    read_table(path, RESULT_COLUMNS, [&](const std::vector<std::string>& row, size_t line_num) {
        pair_result r;
        r.track = row[0];
        r.annotation = row[1];
        r.observed = parse_double(row[2], path, line_num);
        r.expected = parse_double(row[3], path, line_num);
        r.ci_low = parse_double(row[4], path, line_num);
        r.ci_high = parse_double(row[5], path, line_num);
        r.stddev = parse_double(row[6], path, line_num);
        r.fold = parse_double(row[7], path, line_num);
        r.pvalue = parse_double(row[8], path, line_num);
        r.qvalue = parse_double(row[9], path, line_num);
        results.push_back(std::move(r));
    });

    logging::info("Read " + std::to_string(results.size()) + " results from " + path.string());
    return results;
}

void write_counts(std::ostream& out, const std::vector<pair_result>& results) {
    for (size_t i = 0; i < COUNTS_COLUMNS.size(); ++i) {
        out << (i > 0 ? "\t" : "") << COUNTS_COLUMNS[i];
    }
    out << "\n";

    for (const auto& r : results) {
        out << r.track << "\t" << r.annotation << "\t" << format_exact(r.observed) << "\t";
        for (size_t i = 0; i < r.samples.size(); ++i) {
            out << (i > 0 ? "," : "") << format_exact(r.samples[i]);
        }
        out << "\n";
    }
}

std::vector<pair_result> read_counts(const std::filesystem::path& path,
                                     const statistics_config& config) {
    std::vector<pair_result> results;

    read_table(path, COUNTS_COLUMNS, [&](const std::vector<std::string>& row, size_t line_num) {
        double observed = parse_double(row[2], path, line_num);

        std::vector<double> samples;
        std::string counts = utility::trim(row[3]);
        if (!counts.empty()) {
            for (const auto& field : utility::split(counts, ',')) {
                samples.push_back(parse_double(field, path, line_num));
            }
        }
        if (samples.empty()) {
            throw format_error(path.string(), line_num, "no sampled counts");
        }

        results.push_back(statistics::summarize(row[0], row[1], observed, std::move(samples), config));
    });

    logging::info("Read counts of " + std::to_string(results.size()) + " pairs from " + path.string());
    return results;
}

} // namespace result_table
