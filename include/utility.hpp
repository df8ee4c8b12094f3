/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_UTILITY_HPP
#define SEGENRICH_UTILITY_HPP

// standard
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// all log output goes to stderr, stdout is reserved for the result table
namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // progress output is suppressed unless enabled (--progress)
    void set_progress_enabled(bool enabled);
    void progress_start();
    void progress(size_t done, const std::string& prefix);
    void progress_done(size_t total, const std::string& message);
}

namespace utility {
    /**
     * Split a line on a single delimiter, keeping empty fields
     */
    std::vector<std::string> split(const std::string& line, char delim);

    /**
     * Split a line on runs of tabs and spaces
     */
    std::vector<std::string> split_whitespace(const std::string& line);

    std::string trim(const std::string& s);

    /**
     * Format a byte count as a human readable string (e.g. "12 MB")
     */
    std::string format_bytes(size_t bytes);

    /**
     * Seconds elapsed since a steady_clock time point
     */
    double seconds_since(std::chrono::steady_clock::time_point start);
}

#endif //SEGENRICH_UTILITY_HPP
