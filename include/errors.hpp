/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_ERRORS_HPP
#define SEGENRICH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * Missing or empty required interval set, missing input file
 */
class input_error : public std::runtime_error {
public:
    explicit input_error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Malformed record in an interval, counts or results file
 */
class format_error : public std::runtime_error {
public:
    format_error(const std::string& file, size_t line, const std::string& message)
        : std::runtime_error(file + ":" + std::to_string(line) + ": " + message),
          file_(file), line_(line) {}

    const std::string& file() const { return file_; }
    size_t line() const { return line_; }

private:
    std::string file_;
    size_t line_;
};

/**
 * Overlapping isochore cells or a violated internal invariant
 */
class consistency_error : public std::runtime_error {
public:
    explicit consistency_error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Unknown counter, statistic or ordering requested
 */
class configuration_error : public std::runtime_error {
public:
    explicit configuration_error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Statistic that cannot be estimated from the data at hand.
 * Never fatal: the caller catches it and applies a fallback value.
 */
class degenerate_statistic_error : public std::runtime_error {
public:
    explicit degenerate_statistic_error(const std::string& message)
        : std::runtime_error(message) {}
};

#endif //SEGENRICH_ERRORS_HPP
