/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef SEGENRICH_FILETYPE_DETECTOR_HPP
#define SEGENRICH_FILETYPE_DETECTOR_HPP

// standard
#include <filesystem>
#include <ios>
#include <string>
#include <tuple>

enum class filetype {
    BED, COUNTS, RESULTS, UNKNOWN
};

std::string filetype_name(filetype ftype);

class filetype_detector {
public:
    /**
     * Detect the table type of a (possibly gzipped) file from its first bytes
     * @return file type and whether the file is gzip compressed
     */
    std::tuple<filetype, bool> detect_filetype(const std::filesystem::path& filepath);

private:
    std::tuple<filetype, bool> detect_plain_filetype(const char* buffer, std::streamsize size);
    std::tuple<filetype, bool> detect_gzipped_filetype(const std::filesystem::path& filepath);
};

#endif //SEGENRICH_FILETYPE_DETECTOR_HPP
