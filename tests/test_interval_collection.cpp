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
 * Tests for interval_collection.hpp: loading, collapsing, filtering and
 * isochore stratification.
 */

#include <gtest/gtest.h>
#include "interval_collection.hpp"
#include "errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static fs::path write_temp(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / ("segenrich_collection_" + name);
    std::ofstream out(path);
    out << content;
    return path;
}

// ============================================================================
// Loading
// ============================================================================

TEST(IntervalCollectionTest, LoadMergesFilesIntoNamedTracks) {
    auto f1 = write_temp("a.bed", "track name=genes\nchr1\t0\t10\nchr2\t5\t15\n");
    auto f2 = write_temp("b.bed", "track name=genes\nchr1\t100\t110\ntrack name=other\nchr1\t0\t5\n");

    interval_collection c("annotations");
    c.load({f1.string(), f2.string()});

    EXPECT_EQ(c.size(), 2u);
    EXPECT_TRUE(c.contains("genes"));
    EXPECT_TRUE(c.contains("other"));
    EXPECT_EQ(c.counts_per_track().at("genes"), 3u);
    EXPECT_EQ(c.sum(), 35u);

    fs::remove(f1);
    fs::remove(f2);
}

TEST(IntervalCollectionTest, LoadMalformedRecordThrows) {
    auto f = write_temp("bad.bed", "chr1\t10\t5\n");
    interval_collection c("segments");
    EXPECT_THROW(c.load({f.string()}), format_error);
    fs::remove(f);
}

// ============================================================================
// Collapse / restrict / filter
// ============================================================================

TEST(IntervalCollectionTest, CollapseUnitesAllTracks) {
    interval_collection ws("workspace");
    ws.add("a", "chr1", 0, 100);
    ws.add("b", "chr1", 50, 150);
    ws.add("b", "chr2", 0, 10);

    ws.collapse();
    ws.restrict(interval_collection::COLLAPSED_TRACK);

    ASSERT_EQ(ws.size(), 1u);
    const auto& strata = ws.get(interval_collection::COLLAPSED_TRACK);
    ASSERT_EQ(strata.size(), 2u);
    EXPECT_EQ(strata.at(stratum_key("", "chr1")).sum(), 150u);
    EXPECT_EQ(strata.at(stratum_key("", "chr2")).sum(), 10u);
}

TEST(IntervalCollectionTest, RestrictUnknownTrackThrows) {
    interval_collection c("segments");
    c.add("a", "chr1", 0, 10);
    EXPECT_THROW(c.restrict("missing"), input_error);
    EXPECT_THROW(c.get("missing"), input_error);
}

TEST(IntervalCollectionTest, FilterClipsToReference) {
    interval_collection segments("segments");
    segments.add("s", "chr1", 0, 100);
    segments.add("s", "chr1", 500, 600);
    segments.add("s", "chr2", 0, 100);

    stratum_map reference;
    reference[stratum_key("", "chr1")].add(50, 550);

    size_t before = segments.sum();
    segments.filter(reference);

    EXPECT_LE(segments.sum(), before);
    EXPECT_EQ(segments.sum(), 100u);
    EXPECT_EQ(segments.get("s").count(stratum_key("", "chr2")), 0u);
}

TEST(IntervalCollectionTest, FilterWithoutOverlapLeavesNothing) {
    interval_collection segments("segments");
    segments.add("s", "chr1", 0, 100);

    stratum_map reference;
    reference[stratum_key("", "chr1")].add(100, 200);

    segments.filter(reference);
    EXPECT_EQ(segments.sum(), 0u);
}

TEST(IntervalCollectionTest, CheckDetectsOverlaps) {
    interval_collection c("isochores");
    c.add("iso1", "chr1", 0, 100);
    c.add("iso1", "chr1", 100, 200);
    EXPECT_NO_THROW(c.check());

    c.add("iso1", "chr1", 150, 250);
    EXPECT_THROW(c.check(), consistency_error);
}

// ============================================================================
// Isochores
// ============================================================================

TEST(IntervalCollectionTest, ToIsochoresSplitsAtCellBoundaries) {
    interval_collection isochores("isochores");
    isochores.add("low", "chr1", 0, 50);
    isochores.add("high", "chr1", 50, 200);

    interval_collection segments("segments");
    segments.add("s", "chr1", 0, 100);
    segments.add("s", "chr1", 300, 400);

    segments.to_isochores(isochores);

    EXPECT_TRUE(segments.is_stratified());
    const auto& strata = segments.get("s");
    ASSERT_EQ(strata.size(), 2u);
    EXPECT_EQ(strata.at(stratum_key("low", "chr1"))[0], interval(0, 50));
    EXPECT_EQ(strata.at(stratum_key("high", "chr1"))[0], interval(50, 100));
    EXPECT_EQ(segments.sum(), 100u);
}

TEST(IntervalCollectionTest, ToIsochoresRejectsOverlappingCells) {
    interval_collection isochores("isochores");
    isochores.add("low", "chr1", 0, 60);
    isochores.add("high", "chr1", 50, 100);

    interval_collection segments("segments");
    segments.add("s", "chr1", 0, 100);

    EXPECT_THROW(segments.to_isochores(isochores), consistency_error);
}

TEST(IntervalCollectionTest, ToIsochoresTwiceThrows) {
    interval_collection isochores("isochores");
    isochores.add("low", "chr1", 0, 100);

    interval_collection segments("segments");
    segments.add("s", "chr1", 0, 100);

    segments.to_isochores(isochores);
    EXPECT_THROW(segments.to_isochores(isochores), consistency_error);
}

// ============================================================================
// Output
// ============================================================================

TEST(IntervalCollectionTest, WriteStatsSummarizesTracks) {
    interval_collection c("segments");
    c.add("s", "chr1", 0, 10);
    c.add("s", "chr2", 0, 30);

    std::ostringstream out;
    c.write_stats(out);

    std::string text = out.str();
    EXPECT_NE(text.find("track\tisochore\tcontigs\tintervals\tbases"), std::string::npos);
    EXPECT_NE(text.find("s\tall\t2\t2\t40\t10\t30\t20.00"), std::string::npos);
}

TEST(IntervalCollectionTest, WriteBedIncludesIsochoreColumn) {
    stratum_map strata;
    strata[stratum_key("gc1", "chr1")].add(5, 10);

    std::ostringstream out;
    write_strata_bed(out, "sample", strata);
    EXPECT_EQ(out.str(), "track name=sample\nchr1\t5\t10\tgc1\n");
}

TEST(IntervalCollectionTest, WriteBedDumpsOneTrack) {
    interval_collection c("segments");
    c.add("s", "chr1", 20, 30);
    c.add("s", "chr1", 0, 10);
    c.add("t", "chr2", 0, 5);
    c.sort();

    std::ostringstream out;
    c.write_bed(out, "s");
    EXPECT_EQ(out.str(), "track name=s\nchr1\t0\t10\nchr1\t20\t30\n");
}

TEST(IntervalCollectionTest, WriteOverlapStatsPerStratum) {
    interval_collection workspace("workspaces");
    workspace.add("collapsed", "chr1", 0, 1000);
    workspace.add("collapsed", "chr2", 0, 500);

    stratum_map segments;
    segments[stratum_key("", "chr1")].add(100, 200);
    segments[stratum_key("", "chr1")].add(900, 1000);

    std::ostringstream out;
    workspace.write_overlap_stats(out, segments);

    std::string text = out.str();
    EXPECT_EQ(text.rfind("track\tisochore\tcontig\tlength\tother_length\toverlap\tpercent_overlap\tdensity\n", 0), 0u);
    EXPECT_NE(text.find("collapsed\tall\tchr1\t1000\t200\t200\t20.00\t0.2000\n"), std::string::npos);
    EXPECT_NE(text.find("collapsed\tall\tchr2\t500\t0\t0\t0.00\t0.0000\n"), std::string::npos);
}
