/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_BED_READER_HPP
#define SEGENRICH_BED_READER_HPP

// standard
#include <filesystem>
#include <string>

// zlib
#include <zlib.h>

// class
#include "file_reader.hpp"
#include "file_entries.hpp"

/**
 * Reader for BED files, plain or gzip compressed.
 *
 * Track assignment of a record: the name= value of the most recent
 * "track" line, otherwise the 4th (name) column, otherwise "default".
 * Comment ('#'), "browser" and blank lines are skipped.
 */
class bed_reader : public file_reader<bed_entry> {
public:
    static const std::string DEFAULT_TRACK;

    explicit bed_reader(const std::filesystem::path& filepath);
    ~bed_reader() override;

    bed_reader(const bed_reader&) = delete;
    bed_reader& operator=(const bed_reader&) = delete;

    /**
     * Read next record
     * @return false at end of file
     * @throws format_error on a malformed record
     */
    bool read_next(bed_entry& entry) override;

    bool has_next() const override { return !eof_reached; }

    size_t get_current_line() const override { return line_num; }

    const std::string& get_path() const override { return path; }

    bool is_gzipped() const { return gzipped; }

private:
    std::string path;
    gzFile file;
    size_t line_num;
    bool eof_reached;
    bool gzipped;
    std::string current_track;

    bool read_line(std::string& line);
    void parse_track_line(const std::string& line);
    void parse_line(const std::string& line, bed_entry& entry);
};

#endif //SEGENRICH_BED_READER_HPP
