/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "sample_cache.hpp"

// standard
#include <cctype>
#include <fstream>
#include <set>

// class
#include "bed_reader.hpp"
#include "errors.hpp"
#include "utility.hpp"

std::string sanitize_filename(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '-' && c != '_' && c != '.') {
            c = '_';
        }
    }
    return out;
}

// --- memory_sample_cache ---

std::optional<stratum_map> memory_sample_cache::get(const sample_key& key) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = samples.find(key);
    if (it == samples.end()) return std::nullopt;
    return it->second;
}

void memory_sample_cache::put(const sample_key& key, const stratum_map& sample) {
    std::lock_guard<std::mutex> lock(mutex);
    samples[key] = sample;
}

size_t memory_sample_cache::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return samples.size();
}

// --- file_sample_cache ---

file_sample_cache::file_sample_cache(const std::filesystem::path& directory) : dir{directory} {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir)) {
        throw input_error("cannot create sample cache directory " + dir.string() +
                          (ec ? ": " + ec.message() : ""));
    }
    logging::info("Using sample cache in " + dir.string() + " (" + std::to_string(size()) +
                  " cached samples)");
}

std::filesystem::path file_sample_cache::path_for(const sample_key& key) const {
    return dir / (sanitize_filename(key.track) + "." + std::to_string(key.trial) + "." +
                  std::to_string(key.seed) + ".bed");
}

std::optional<stratum_map> file_sample_cache::get(const sample_key& key) {
    std::filesystem::path path = path_for(key);
    if (!std::filesystem::exists(path)) return std::nullopt;

    stratum_map sample;
    bed_reader reader(path);
    bed_entry entry;
    while (reader.read_next(entry)) {
        // 4th column carries the isochore of stratified samples
        sample[stratum_key(entry.name, entry.contig)].add(entry.start, entry.end);
    }
    for (auto& [k, intervals] : sample) {
        intervals.sort();
    }
    return sample;
}

void file_sample_cache::put(const sample_key& key, const stratum_map& sample) {
    std::filesystem::path path = path_for(key);
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp);
        if (!out.is_open()) {
            throw input_error("cannot write sample cache file " + tmp.string());
        }
        write_strata_bed(out, key.track, sample);
        if (!out) {
            throw input_error("error writing sample cache file " + tmp.string());
        }
    }
    // readers never see a partially written sample
    std::filesystem::rename(tmp, path);
}

size_t file_sample_cache::size() const {
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".bed") {
            n++;
        }
    }
    return n;
}

// --- sample_file_store ---

sample_file_store::sample_file_store(const std::vector<std::string>& files) {
    for (const auto& file : files) {
        bed_reader reader(file);
        bed_entry entry;
        while (reader.read_next(entry)) {
            size_t dot = entry.track.rfind('.');
            std::string trial = dot == std::string::npos ? "" : entry.track.substr(dot + 1);
            if (dot == 0 || trial.empty() ||
                trial.find_first_not_of("0123456789") != std::string::npos) {
                throw format_error(file, reader.get_current_line(), "sample track '" + entry.track +
                                   "' is not named <track>.<trial>");
            }
            auto& sample = samples[{entry.track.substr(0, dot), std::stoull(trial)}];
            sample[stratum_key(entry.name, entry.contig)].add(entry.start, entry.end);
        }
    }

    std::set<std::string> tracks;
    for (auto& [key, sample] : samples) {
        tracks.insert(key.first);
        for (auto& [k, intervals] : sample) {
            intervals.sort();
        }
    }
    logging::info("Read " + std::to_string(samples.size()) + " samples of " +
                  std::to_string(tracks.size()) + " track(s) from " +
                  std::to_string(files.size()) + " sample file(s)");
}

std::optional<stratum_map> sample_file_store::get(const sample_key& key) {
    auto it = samples.find({key.track, key.trial});
    if (it == samples.end()) return std::nullopt;
    return it->second;
}

void sample_file_store::put(const sample_key&, const stratum_map&) {
    // samples from files are never extended
}

size_t sample_file_store::trials(const std::string& track) const {
    size_t n = 0;
    for (const auto& [key, sample] : samples) {
        if (key.first == track) n++;
    }
    return n;
}
