/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

/**
 * Tests for sample_cache.hpp: in-memory and on-disk caches of sampled
 * segment sets.
 */

#include <gtest/gtest.h>
#include "sample_cache.hpp"
#include "errors.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static stratum_map make_sample() {
    stratum_map sample;
    sample[stratum_key("", "chr1")].add(100, 200);
    sample[stratum_key("", "chr1")].add(500, 510);
    sample[stratum_key("", "chr2")].add(0, 40);
    return sample;
}

static fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    return dir;
}

// ============================================================================
// sanitize_filename
// ============================================================================

TEST(SanitizeFilenameTest, KeepsSafeCharacters) {
    EXPECT_EQ(sanitize_filename("chip-seq_peaks.v2"), "chip-seq_peaks.v2");
}

TEST(SanitizeFilenameTest, ReplacesSeparatorsAndSpaces) {
    EXPECT_EQ(sanitize_filename("a/b c:d"), "a_b_c_d");
}

// ============================================================================
// memory_sample_cache
// ============================================================================

TEST(MemorySampleCacheTest, MissReturnsNothing) {
    memory_sample_cache cache;
    EXPECT_FALSE(cache.get(sample_key("segs", 0, 1)).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(MemorySampleCacheTest, PutThenGet) {
    memory_sample_cache cache;
    stratum_map sample = make_sample();
    cache.put(sample_key("segs", 3, 7), sample);

    auto hit = cache.get(sample_key("segs", 3, 7));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, sample);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MemorySampleCacheTest, KeyIncludesSeedAndTrial) {
    memory_sample_cache cache;
    cache.put(sample_key("segs", 3, 7), make_sample());

    EXPECT_FALSE(cache.get(sample_key("segs", 3, 8)).has_value());
    EXPECT_FALSE(cache.get(sample_key("segs", 4, 7)).has_value());
    EXPECT_FALSE(cache.get(sample_key("other", 3, 7)).has_value());
}

// ============================================================================
// file_sample_cache
// ============================================================================

TEST(FileSampleCacheTest, CreatesDirectory) {
    fs::path dir = fresh_dir("segenrich_cache_create") / "nested";
    file_sample_cache cache(dir);
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_EQ(cache.size(), 0u);
    fs::remove_all(dir.parent_path());
}

TEST(FileSampleCacheTest, RoundTrip) {
    fs::path dir = fresh_dir("segenrich_cache_roundtrip");
    file_sample_cache cache(dir);
    stratum_map sample = make_sample();

    cache.put(sample_key("segs", 0, 42), sample);
    EXPECT_TRUE(fs::exists(cache.path_for(sample_key("segs", 0, 42))));
    EXPECT_EQ(cache.size(), 1u);

    auto hit = cache.get(sample_key("segs", 0, 42));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, sample);
    fs::remove_all(dir);
}

TEST(FileSampleCacheTest, RoundTripKeepsIsochores) {
    fs::path dir = fresh_dir("segenrich_cache_isochores");
    file_sample_cache cache(dir);

    stratum_map sample;
    sample[stratum_key("gc_low", "chr1")].add(10, 20);
    sample[stratum_key("gc_high", "chr1")].add(600, 650);
    cache.put(sample_key("segs", 1, 5), sample);

    auto hit = cache.get(sample_key("segs", 1, 5));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, sample);
    fs::remove_all(dir);
}

TEST(FileSampleCacheTest, MissReturnsNothing) {
    fs::path dir = fresh_dir("segenrich_cache_miss");
    file_sample_cache cache(dir);
    EXPECT_FALSE(cache.get(sample_key("segs", 0, 1)).has_value());
    fs::remove_all(dir);
}

TEST(FileSampleCacheTest, SharedAcrossInstances) {
    fs::path dir = fresh_dir("segenrich_cache_shared");
    {
        file_sample_cache writer(dir);
        writer.put(sample_key("segs", 9, 1), make_sample());
    }
    file_sample_cache reader(dir);
    EXPECT_EQ(reader.size(), 1u);
    EXPECT_TRUE(reader.get(sample_key("segs", 9, 1)).has_value());
    fs::remove_all(dir);
}

TEST(FileSampleCacheTest, TrackNameIsSanitized) {
    fs::path dir = fresh_dir("segenrich_cache_sanitize");
    file_sample_cache cache(dir);
    fs::path p = cache.path_for(sample_key("a/b", 2, 3));
    EXPECT_EQ(p.filename().string(), "a_b.2.3.bed");
    EXPECT_EQ(p.parent_path(), dir);
    fs::remove_all(dir);
}

TEST(FileSampleCacheTest, PathIsAFileThrows) {
    fs::path file = fresh_dir("segenrich_cache_not_a_dir");
    { std::ofstream out(file); out << "x\n"; }
    EXPECT_THROW(file_sample_cache cache(file), input_error);
    fs::remove_all(file);
}

// ============================================================================
// sample_file_store
// ============================================================================

static fs::path write_samples(const std::string& name, const std::string& content) {
    fs::path p = fs::temp_directory_path() / name;
    std::ofstream out(p);
    out << content;
    return p;
}

TEST(SampleFileStoreTest, ReadsTracksAsTrials) {
    fs::path p = write_samples("segenrich_samples_store.bed",
        "track name=segs.0\n"
        "chr1\t500\t510\n"
        "chr1\t100\t200\n"
        "track name=segs.1\n"
        "chr1\t10\t20\tgc_low\n"
        "track name=my.track.0\n"
        "chr2\t0\t5\n");

    sample_file_store store({p.string()});
    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(store.trials("segs"), 2u);
    EXPECT_EQ(store.trials("my.track"), 1u);

    auto first = store.get(sample_key("segs", 0, 99));
    ASSERT_TRUE(first.has_value());
    const interval_set& chr1 = first->at(stratum_key("", "chr1"));
    ASSERT_EQ(chr1.size(), 2u);
    EXPECT_EQ(chr1[0], interval(100, 200));

    auto second = store.get(sample_key("segs", 1, 0));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->count(stratum_key("gc_low", "chr1")), 1u);

    EXPECT_FALSE(store.get(sample_key("segs", 2, 0)).has_value());
    fs::remove(p);
}

TEST(SampleFileStoreTest, PutDoesNotAddSamples) {
    fs::path p = write_samples("segenrich_samples_readonly.bed",
        "track name=segs.0\nchr1\t0\t10\n");
    sample_file_store store({p.string()});

    store.put(sample_key("segs", 5, 1), make_sample());
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(store.get(sample_key("segs", 5, 1)).has_value());
    fs::remove(p);
}

TEST(SampleFileStoreTest, TrackWithoutTrialThrows) {
    fs::path p = write_samples("segenrich_samples_unnamed.bed",
        "track name=segs\nchr1\t0\t10\n");
    EXPECT_THROW(sample_file_store store({p.string()}), format_error);
    fs::remove(p);
}

TEST(SampleFileStoreTest, MissingFileThrows) {
    EXPECT_THROW(sample_file_store store({"/nonexistent/segenrich_samples.bed"}), input_error);
}
