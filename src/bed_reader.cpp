/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "bed_reader.hpp"

// standard
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

// class
#include "errors.hpp"
#include "filetype_detector.hpp"
#include "utility.hpp"

const std::string bed_reader::DEFAULT_TRACK = "default";

namespace {

size_t parse_coordinate(const std::string& field, const std::string& path, size_t line_num,
                        const std::string& what) {
    if (field.empty() || !std::all_of(field.begin(), field.end(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw format_error(path, line_num, "invalid " + what + " coordinate '" + field + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(field));
    } catch (const std::out_of_range&) {
        throw format_error(path, line_num, what + " coordinate out of range '" + field + "'");
    }
}

} // anonymous namespace

bed_reader::bed_reader(const std::filesystem::path& filepath)
    : path{filepath.string()}, file{nullptr}, line_num(0), eof_reached(false), gzipped(false) {

    if (!std::filesystem::exists(filepath)) {
        throw input_error("BED file not found: " + path);
    }

    filetype_detector detector;
    auto [ftype, is_gzipped] = detector.detect_filetype(filepath);
    gzipped = is_gzipped;
    if (ftype == filetype::UNKNOWN) {
        logging::warning("Could not recognise " + path + " as BED, reading anyway");
    }

    // gzopen reads uncompressed files transparently
    file = gzopen(path.c_str(), "rb");
    if (!file) {
        throw input_error("Failed to open BED file: " + path);
    }
}

bed_reader::~bed_reader() {
    if (file) {
        gzclose(file);
    }
}

bool bed_reader::read_line(std::string& line) {
    line.clear();
    char buffer[8192];

    while (gzgets(file, buffer, sizeof(buffer)) != nullptr) {
        size_t len = std::strlen(buffer);
        line.append(buffer, len);
        if (len > 0 && buffer[len - 1] == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
    }

    int errnum = 0;
    const char* message = gzerror(file, &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END) {
        throw input_error("Error reading " + path + ": " + message);
    }

    // last line without trailing newline
    if (!line.empty()) {
        if (line.back() == '\r') line.pop_back();
        return true;
    }
    return false;
}

bool bed_reader::read_next(bed_entry& entry) {
    std::string line;

    while (read_line(line)) {
        line_num++;

        // Skip empty lines, comments and browser directives
        if (utility::trim(line).empty() || line[0] == '#' || line.rfind("browser", 0) == 0) {
            continue;
        }

        if (line.rfind("track", 0) == 0 &&
            (line.size() == 5 || std::isspace(static_cast<unsigned char>(line[5])))) {
            parse_track_line(line);
            continue;
        }

        parse_line(line, entry);
        return true;
    }

    eof_reached = true;
    return false;
}

void bed_reader::parse_track_line(const std::string& line) {
    // track name=foo description="..." ; name may be quoted
    size_t pos = line.find("name=");
    if (pos == std::string::npos) {
        current_track.clear();
        return;
    }
    pos += 5;

    std::string name;
    if (pos < line.size() && line[pos] == '"') {
        size_t close = line.find('"', pos + 1);
        if (close == std::string::npos) {
            throw format_error(path, line_num, "unterminated quote in track line");
        }
        name = line.substr(pos + 1, close - pos - 1);
    } else {
        size_t end = line.find_first_of(" \t", pos);
        name = line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    }
    current_track = name;
}

void bed_reader::parse_line(const std::string& line, bed_entry& entry) {
    // BED is tab separated; tolerate space separated files
    auto fields = line.find('\t') != std::string::npos
        ? utility::split(line, '\t')
        : utility::split_whitespace(line);

    if (fields.size() < 3) {
        throw format_error(path, line_num, "expected at least 3 columns, found " +
                           std::to_string(fields.size()));
    }

    entry = bed_entry();
    entry.contig = utility::trim(fields[0]);
    if (entry.contig.empty()) {
        throw format_error(path, line_num, "empty contig name");
    }

    entry.start = parse_coordinate(utility::trim(fields[1]), path, line_num, "start");
    entry.end = parse_coordinate(utility::trim(fields[2]), path, line_num, "end");
    if (entry.start >= entry.end) {
        throw format_error(path, line_num, "start (" + std::to_string(entry.start) +
                           ") must be smaller than end (" + std::to_string(entry.end) + ")");
    }

    if (fields.size() >= 4) {
        entry.name = utility::trim(fields[3]);
    }

    if (!current_track.empty()) {
        entry.track = current_track;
    } else if (!entry.name.empty()) {
        entry.track = entry.name;
    } else {
        entry.track = DEFAULT_TRACK;
    }
}
