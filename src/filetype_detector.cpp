/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "filetype_detector.hpp"

// standard
#include <cctype>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

// zlib
#include <zlib.h>

// class
#include "utility.hpp"

std::string filetype_name(filetype ftype) {
    switch (ftype) {
        case filetype::BED:     return "BED";
        case filetype::COUNTS:  return "counts table";
        case filetype::RESULTS: return "results table";
        default:                return "UNKNOWN";
    }
}

namespace {

bool is_unsigned_integer(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

std::tuple<filetype, bool> filetype_detector::detect_filetype(
    const std::filesystem::path& filepath) {

    std::ifstream file(filepath, std::ios::binary);
    if(!file) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }

    // Read first few bytes to check magic numbers
    char buffer[4096];
    file.read(buffer, sizeof(buffer));
    std::streamsize bytes_read = file.gcount();
    file.close();

    if (bytes_read < 2) {
        return std::make_tuple(filetype::UNKNOWN, false);
    }

    // Check if the file is gzipped (magic bytes: 0x1f 0x8b)
    bool is_gzipped = (static_cast<unsigned char>(buffer[0]) == 0x1f &&
                       static_cast<unsigned char>(buffer[1]) == 0x8b);

    if (is_gzipped) {
        // For gzipped files, we need to decompress and check content
        return detect_gzipped_filetype(filepath);
    } else {
        // For plain files, check content directly
        return detect_plain_filetype(buffer, bytes_read);
    }
}

std::tuple<filetype, bool> filetype_detector::detect_plain_filetype(const char* buffer, std::streamsize size) {
    std::istringstream iss(std::string(buffer, static_cast<size_t>(size)));
    std::string line;

    while (std::getline(iss, line)) {
        if (line.empty() || line[0] == '#') continue;

        // Table headers written by segenrich
        if (line.rfind("track\tannotation\tobserved\tcounts", 0) == 0) {
            return std::make_tuple(filetype::COUNTS, false);
        }
        if (line.rfind("track\tannotation\tobserved\texpected", 0) == 0) {
            return std::make_tuple(filetype::RESULTS, false);
        }

        // BED header lines
        if (line.rfind("track", 0) == 0 || line.rfind("browser", 0) == 0) {
            return std::make_tuple(filetype::BED, false);
        }

        // BED record: contig, start, end
        auto fields = utility::split_whitespace(line);
        if (fields.size() >= 3 && is_unsigned_integer(fields[1]) && is_unsigned_integer(fields[2])) {
            return std::make_tuple(filetype::BED, false);
        }
        break;
    }

    return std::make_tuple(filetype::UNKNOWN, false);
}

std::tuple<filetype, bool> filetype_detector::detect_gzipped_filetype(const std::filesystem::path& filepath) {
    // Open gzipped file
    gzFile gzfile = gzopen(filepath.string().c_str(), "rb");
    if (!gzfile) {
        throw std::runtime_error("Failed to open gzipped file: " + filepath.string());
    }

    // Read decompressed header
    char buffer[4096];
    int bytes_read = gzread(gzfile, buffer, sizeof(buffer));
    gzclose(gzfile);

    if (bytes_read < 4) {
        return std::make_tuple(filetype::UNKNOWN, true);
    }

    auto [ftype, _] = detect_plain_filetype(buffer, bytes_read);
    return std::make_tuple(ftype, true);
}
