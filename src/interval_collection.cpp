/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "interval_collection.hpp"

// standard
#include <algorithm>
#include <iomanip>
#include <set>

// class
#include "bed_reader.hpp"
#include "errors.hpp"
#include "utility.hpp"

const std::string interval_collection::COLLAPSED_TRACK = "collapsed";

size_t stratum_sum(const stratum_map& strata) {
    size_t total = 0;
    for (const auto& [key, intervals] : strata) {
        total += intervals.sum();
    }
    return total;
}

interval_collection::interval_collection(std::string name) : name_{std::move(name)} {}

void interval_collection::load(const std::vector<std::string>& files) {
    for (const auto& filepath : files) {
        bed_reader reader(filepath);
        bed_entry entry;
        size_t records = 0;

        while (reader.read_next(entry)) {
            add(entry.track, entry.contig, entry.start, entry.end);
            records++;
        }

        logging::info(name_ + ": read " + std::to_string(records) + " intervals from " + filepath +
                      (reader.is_gzipped() ? " (gzipped)" : ""));
    }
}

void interval_collection::add(const std::string& track, const std::string& contig,
                              size_t start, size_t end, const std::string& isochore) {
    tracks_[track][stratum_key(isochore, contig)].add(start, end);
}

void interval_collection::set(const std::string& track, const stratum_key& key,
                              interval_set intervals) {
    tracks_[track][key] = std::move(intervals);
}

void interval_collection::sort() {
    for (auto& [track, strata] : tracks_) {
        for (auto& [key, intervals] : strata) {
            intervals.sort();
        }
    }
}

void interval_collection::normalize() {
    for (auto& [track, strata] : tracks_) {
        for (auto& [key, intervals] : strata) {
            intervals.normalize();
        }
    }
}

void interval_collection::check() const {
    for (const auto& [track, strata] : tracks_) {
        for (const auto& [key, intervals] : strata) {
            if (intervals.has_overlaps()) {
                throw consistency_error(name_ + ": overlapping intervals in track '" + track +
                                        "' on " + key.to_string());
            }
        }
    }
}

void interval_collection::collapse() {
    stratum_map collapsed;
    for (const auto& [track, strata] : tracks_) {
        for (const auto& [key, intervals] : strata) {
            collapsed[key] = collapsed[key].unite(intervals);
        }
    }
    tracks_[COLLAPSED_TRACK] = std::move(collapsed);
}

void interval_collection::restrict(const std::string& track) {
    auto it = tracks_.find(track);
    if (it == tracks_.end()) {
        throw input_error(name_ + ": track '" + track + "' not found");
    }
    stratum_map kept = std::move(it->second);
    tracks_.clear();
    tracks_[track] = std::move(kept);
}

void interval_collection::filter(const stratum_map& reference) {
    for (auto& [track, strata] : tracks_) {
        stratum_map filtered;
        for (auto& [key, intervals] : strata) {
            auto ref = reference.find(key);
            if (ref == reference.end()) continue;

            interval_set clipped = intervals.intersect(ref->second);
            if (!clipped.empty()) {
                filtered[key] = std::move(clipped);
            }
        }
        strata = std::move(filtered);
    }
}

bool interval_collection::is_stratified() const {
    for (const auto& [track, strata] : tracks_) {
        for (const auto& [key, intervals] : strata) {
            if (!key.isochore.empty()) return true;
        }
    }
    return false;
}

void interval_collection::to_isochores(const interval_collection& isochores) {
    if (is_stratified()) {
        throw consistency_error(name_ + ": collection is already split by isochores");
    }
    if (isochores.is_stratified()) {
        throw consistency_error(isochores.name() + ": isochore collection must not be stratified");
    }

    // cells per isochore and contig, and a check that no two cells overlap
    std::map<std::string, std::vector<std::pair<interval, std::string>>> cells_by_contig;
    std::map<std::string, stratum_map> cells;

    for (const auto& [iso, strata] : isochores) {
        for (const auto& [key, intervals] : strata) {
            if (intervals.has_overlaps()) {
                throw consistency_error(isochores.name() + ": overlapping cells within isochore '" +
                                        iso + "' on " + key.contig);
            }
            interval_set normalized = intervals;
            normalized.normalize();
            for (const auto& iv : normalized) {
                cells_by_contig[key.contig].emplace_back(iv, iso);
            }
            cells[iso][stratum_key("", key.contig)] = std::move(normalized);
        }
    }

    for (auto& [contig, contig_cells] : cells_by_contig) {
        std::sort(contig_cells.begin(), contig_cells.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
        for (size_t i = 1; i < contig_cells.size(); ++i) {
            const auto& prev = contig_cells[i - 1];
            const auto& cur = contig_cells[i];
            if (prev.first.end > cur.first.start) {
                throw consistency_error(isochores.name() + ": isochores '" + prev.second + "' and '" +
                                        cur.second + "' overlap on " + contig + " at " +
                                        std::to_string(cur.first.start));
            }
        }
    }

    for (auto& [track, strata] : tracks_) {
        stratum_map split;
        for (const auto& [key, intervals] : strata) {
            for (const auto& [iso, iso_strata] : cells) {
                auto cell = iso_strata.find(stratum_key("", key.contig));
                if (cell == iso_strata.end()) continue;

                interval_set clipped = intervals.intersect(cell->second);
                if (!clipped.empty()) {
                    split[stratum_key(iso, key.contig)] = std::move(clipped);
                }
            }
        }
        strata = std::move(split);
    }
}

size_t interval_collection::sum() const {
    size_t total = 0;
    for (const auto& [track, strata] : tracks_) {
        total += stratum_sum(strata);
    }
    return total;
}

std::map<std::string, size_t> interval_collection::counts_per_track() const {
    std::map<std::string, size_t> counts;
    for (const auto& [track, strata] : tracks_) {
        size_t n = 0;
        for (const auto& [key, intervals] : strata) {
            n += intervals.size();
        }
        counts[track] = n;
    }
    return counts;
}

std::vector<std::string> interval_collection::track_names() const {
    std::vector<std::string> names;
    names.reserve(tracks_.size());
    for (const auto& [track, strata] : tracks_) {
        names.push_back(track);
    }
    return names;
}

const stratum_map& interval_collection::get(const std::string& track) const {
    auto it = tracks_.find(track);
    if (it == tracks_.end()) {
        throw input_error(name_ + ": track '" + track + "' not found");
    }
    return it->second;
}

void interval_collection::write_stats(std::ostream& out) const {
    out << "track\tisochore\tcontigs\tintervals\tbases\tmin_length\tmax_length\tmean_length\n";

    for (const auto& [track, strata] : tracks_) {
        // group strata of one track by isochore
        struct isochore_summary {
            std::set<std::string> contigs;
            size_t intervals = 0;
            size_t bases = 0;
            size_t min_length = 0;
            size_t max_length = 0;
        };
        std::map<std::string, isochore_summary> summaries;

        for (const auto& [key, intervals] : strata) {
            if (intervals.empty()) continue;
            auto& s = summaries[key.isochore];
            if (s.intervals == 0 || intervals.min_length() < s.min_length) {
                s.min_length = intervals.min_length();
            }
            s.max_length = std::max(s.max_length, intervals.max_length());
            s.contigs.insert(key.contig);
            s.intervals += intervals.size();
            s.bases += intervals.sum();
        }

        for (const auto& [iso, s] : summaries) {
            double mean = s.intervals > 0
                ? static_cast<double>(s.bases) / static_cast<double>(s.intervals) : 0.0;
            out << track << "\t"
                << (iso.empty() ? "all" : iso) << "\t"
                << s.contigs.size() << "\t"
                << s.intervals << "\t"
                << s.bases << "\t"
                << s.min_length << "\t"
                << s.max_length << "\t"
                << std::fixed << std::setprecision(2) << mean << std::defaultfloat << "\n";
        }
    }
}

void interval_collection::write_overlap_stats(std::ostream& out, const stratum_map& other) const {
    out << "track\tisochore\tcontig\tlength\tother_length\toverlap\tpercent_overlap\tdensity\n";

    static const interval_set none;
    for (const auto& [track, strata] : tracks_) {
        for (const auto& [key, intervals] : strata) {
            auto it = other.find(key);
            const interval_set& counterpart = it != other.end() ? it->second : none;

            size_t length = intervals.sum();
            size_t other_length = counterpart.sum();
            size_t shared = intervals.overlap(counterpart);
            double percent = length > 0 ? 100.0 * shared / static_cast<double>(length) : 0.0;
            double density = length > 0 ? static_cast<double>(other_length) / length : 0.0;

            out << track << "\t"
                << (key.isochore.empty() ? "all" : key.isochore) << "\t"
                << key.contig << "\t"
                << length << "\t"
                << other_length << "\t"
                << shared << "\t"
                << std::fixed << std::setprecision(2) << percent << "\t"
                << std::setprecision(4) << density << std::defaultfloat << "\n";
        }
    }
}

void interval_collection::write_bed(std::ostream& out, const std::string& track) const {
    write_strata_bed(out, track, get(track));
}

void write_strata_bed(std::ostream& out, const std::string& track, const stratum_map& strata) {
    out << "track name=" << track << "\n";
    for (const auto& [key, intervals] : strata) {
        for (const auto& iv : intervals) {
            out << key.contig << "\t" << iv.start << "\t" << iv.end;
            if (!key.isochore.empty()) {
                out << "\t" << key.isochore;
            }
            out << "\n";
        }
    }
}
