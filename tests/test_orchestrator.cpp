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
 * Tests for orchestrator.hpp: input preparation and the full sampling
 * pipeline on small synthetic inputs.
 */

#include <gtest/gtest.h>
#include "orchestrator.hpp"
#include "errors.hpp"

#include <filesystem>

namespace fs = std::filesystem;

struct pipeline_inputs {
    interval_collection segments{"segments"};
    interval_collection annotations{"annotations"};
    interval_collection workspace{"workspace"};
};

static run_config make_config(size_t num_samples, size_t threads = 1) {
    run_config config;
    config.num_samples = num_samples;
    config.seed = 42;
    config.threads = threads;
    return config;
}

static std::vector<pair_result> run_pipeline(pipeline_inputs& in, const run_config& config,
                                             sample_cache* cache = nullptr,
                                             counter_type type = counter_type::NUCLEOTIDE_OVERLAP) {
    prepare_inputs(in.segments, in.annotations, in.workspace, nullptr);
    orchestrator pipeline(config, sampler_config(), counter(type), statistics_config(), cache);
    return pipeline.run(in.segments, in.annotations, in.workspace);
}

// ============================================================================
// prepare_inputs
// ============================================================================

TEST(PrepareInputsTest, CollapsesWorkspaceAndFilters) {
    pipeline_inputs in;
    in.workspace.add("w1", "chr1", 0, 500);
    in.workspace.add("w2", "chr1", 400, 1000);
    in.segments.add("segs", "chr1", 900, 1100);
    in.segments.add("segs", "chr2", 0, 100);
    in.annotations.add("genes", "chr1", 0, 50);

    prepare_inputs(in.segments, in.annotations, in.workspace, nullptr);

    EXPECT_EQ(in.workspace.track_names(),
              std::vector<std::string>{interval_collection::COLLAPSED_TRACK});
    EXPECT_EQ(in.workspace.sum(), 1000u);
    EXPECT_EQ(in.segments.sum(), 100u);
    EXPECT_EQ(in.annotations.sum(), 50u);
}

TEST(PrepareInputsTest, DisjointSegmentsThrow) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 100);
    in.segments.add("segs", "chr2", 0, 100);
    in.annotations.add("genes", "chr1", 0, 50);

    EXPECT_THROW(prepare_inputs(in.segments, in.annotations, in.workspace, nullptr), input_error);
}

TEST(PrepareInputsTest, EmptyAnnotationsThrow) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 100);
    in.segments.add("segs", "chr1", 0, 10);

    EXPECT_THROW(prepare_inputs(in.segments, in.annotations, in.workspace, nullptr), input_error);
}

TEST(PrepareInputsTest, IsochoresStratifyAllInputs) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 400, 600);
    in.annotations.add("genes", "chr1", 0, 1000);

    interval_collection isochores("isochores");
    isochores.add("gc_low", "chr1", 0, 500);
    isochores.add("gc_high", "chr1", 500, 800);

    prepare_inputs(in.segments, in.annotations, in.workspace, &isochores);

    EXPECT_TRUE(in.segments.is_stratified());
    EXPECT_EQ(in.workspace.sum(), 800u);
    EXPECT_EQ(in.annotations.sum(), 800u);

    const auto& segs = in.segments.get("segs");
    EXPECT_EQ(segs.at(stratum_key("gc_low", "chr1")).sum(), 100u);
    EXPECT_EQ(segs.at(stratum_key("gc_high", "chr1")).sum(), 100u);
}

TEST(PrepareInputsTest, IsochoresOutsideWorkspaceThrow) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 400, 600);
    in.annotations.add("genes", "chr1", 0, 1000);

    interval_collection isochores("isochores");
    isochores.add("gc_low", "chr2", 0, 500);

    EXPECT_THROW(prepare_inputs(in.segments, in.annotations, in.workspace, &isochores), input_error);
}

TEST(PrepareInputsTest, OverlappingIsochoresThrow) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 400, 600);
    in.annotations.add("genes", "chr1", 0, 1000);

    interval_collection isochores("isochores");
    isochores.add("gc_low", "chr1", 0, 500);
    isochores.add("gc_high", "chr1", 450, 800);

    EXPECT_THROW(prepare_inputs(in.segments, in.annotations, in.workspace, &isochores),
                 consistency_error);
}

TEST(PrepareInputsTest, ReportsEveryStage) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 100, 200);
    in.annotations.add("genes", "chr1", 150, 250);

    std::vector<std::string> stages;
    prepare_inputs(in.segments, in.annotations, in.workspace, nullptr,
        [&stages](const interval_collection& c, const std::string& stage) {
            stages.push_back(c.name() + ":" + stage);
        });

    std::vector<std::string> expected = {
        "segments:raw", "segments:normed",
        "annotations:raw", "annotations:normed",
        "workspace:raw", "workspace:normed",
        "workspace:collapsed",
        "annotations:pruned", "segments:pruned"
    };
    EXPECT_EQ(stages, expected);
}

TEST(PrepareInputsTest, ReportsIsochoreStages) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 100, 200);
    in.annotations.add("genes", "chr1", 150, 250);
    interval_collection isochores("isochores");
    isochores.add("gc_low", "chr1", 0, 500);

    std::vector<std::string> stages;
    prepare_inputs(in.segments, in.annotations, in.workspace, &isochores,
        [&stages](const interval_collection& c, const std::string& stage) {
            stages.push_back(c.name() + ":" + stage);
        });

    std::vector<std::string> expected = {
        "segments:raw", "segments:normed",
        "annotations:raw", "annotations:normed",
        "workspace:raw", "workspace:normed",
        "workspace:collapsed",
        "isochores:raw",
        "workspace:isochores", "annotations:isochores", "segments:isochores",
        "annotations:pruned", "segments:pruned"
    };
    EXPECT_EQ(stages, expected);
}

// ============================================================================
// orchestrator
// ============================================================================

TEST(OrchestratorTest, SingleSegmentEnrichment) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 100, 200);
    in.annotations.add("genes", "chr1", 150, 250);

    auto results = run_pipeline(in, make_config(1000));
    ASSERT_EQ(results.size(), 1u);
    const auto& r = results[0];

    EXPECT_EQ(r.track, "segs");
    EXPECT_EQ(r.annotation, "genes");
    EXPECT_DOUBLE_EQ(r.observed, 50.0);
    // 10000 overlapping bases summed over 901 start positions
    EXPECT_NEAR(r.expected, 10000.0 / 901.0, 3.0);
    EXPECT_GT(r.fold, 3.5);
    EXPECT_LT(r.fold, 6.0);
    // placements overlapping by >= 50 bp start within [100, 200]
    EXPECT_NEAR(r.pvalue, 101.0 / 901.0, 0.04);
    EXPECT_LE(r.ci_low, r.expected);
    EXPECT_GE(r.ci_high, r.expected);
    EXPECT_EQ(r.samples.size(), 1000u);
}

TEST(OrchestratorTest, SegmentsIdenticalToAnnotations) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 10000);
    in.segments.add("segs", "chr1", 1000, 1100);
    in.segments.add("segs", "chr1", 5000, 5100);
    in.annotations.add("genes", "chr1", 1000, 1100);
    in.annotations.add("genes", "chr1", 5000, 5100);

    auto results = run_pipeline(in, make_config(200));
    ASSERT_EQ(results.size(), 1u);

    EXPECT_DOUBLE_EQ(results[0].observed, 200.0);
    EXPECT_GT(results[0].fold, 1.0);
    EXPECT_DOUBLE_EQ(results[0].pvalue, 1.0 / 201.0);
}

TEST(OrchestratorTest, AllPairsReported) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 10000);
    in.segments.add("a", "chr1", 100, 200);
    in.segments.add("b", "chr1", 300, 400);
    in.annotations.add("x", "chr1", 0, 500);
    in.annotations.add("y", "chr1", 5000, 6000);
    in.annotations.add("z", "chr1", 9000, 9100);

    auto results = run_pipeline(in, make_config(50));
    EXPECT_EQ(results.size(), 6u);
}

TEST(OrchestratorTest, ResultsIndependentOfThreadCount) {
    auto build = []() {
        pipeline_inputs in;
        in.workspace.add("w", "chr1", 0, 50000);
        in.workspace.add("w", "chr2", 0, 20000);
        in.segments.add("segs", "chr1", 100, 300);
        in.segments.add("segs", "chr1", 1000, 1050);
        in.segments.add("segs", "chr2", 500, 900);
        in.annotations.add("genes", "chr1", 0, 10000);
        in.annotations.add("genes", "chr2", 5000, 6000);
        return in;
    };

    pipeline_inputs single = build();
    pipeline_inputs multi = build();

    auto a = run_pipeline(single, make_config(200, 1));
    auto b = run_pipeline(multi, make_config(200, 4));

    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(a[0].samples, b[0].samples);
    EXPECT_DOUBLE_EQ(a[0].pvalue, b[0].pvalue);
}

TEST(OrchestratorTest, CacheHitsReproduceStatistics) {
    auto build = []() {
        pipeline_inputs in;
        in.workspace.add("w", "chr1", 0, 20000);
        in.segments.add("segs", "chr1", 100, 300);
        in.segments.add("segs", "chr1", 4000, 4010);
        in.annotations.add("genes", "chr1", 0, 5000);
        return in;
    };

    memory_sample_cache cache;
    pipeline_inputs first = build();
    pipeline_inputs second = build();

    auto a = run_pipeline(first, make_config(100), &cache);
    EXPECT_EQ(cache.size(), 100u);
    auto b = run_pipeline(second, make_config(100), &cache);
    EXPECT_EQ(cache.size(), 100u);

    EXPECT_EQ(a[0].samples, b[0].samples);
}

TEST(OrchestratorTest, SegmentOverlapCounter) {
    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 100, 110);
    in.segments.add("segs", "chr1", 200, 210);
    in.segments.add("segs", "chr1", 800, 810);
    in.annotations.add("genes", "chr1", 100, 300);

    auto results = run_pipeline(in, make_config(100), nullptr, counter_type::SEGMENT_OVERLAP);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_DOUBLE_EQ(results[0].observed, 2.0);
    for (double s : results[0].samples) {
        EXPECT_GE(s, 0.0);
        EXPECT_LE(s, 3.0);
    }
}

TEST(OrchestratorTest, WritesSampleFiles) {
    fs::path dir = fs::temp_directory_path() / "segenrich_orchestrator_samples";
    fs::remove_all(dir);

    pipeline_inputs in;
    in.workspace.add("w", "chr1", 0, 1000);
    in.segments.add("segs", "chr1", 100, 200);
    in.annotations.add("genes", "chr1", 150, 250);

    run_config config = make_config(3);
    config.output_samples_pattern = (dir / "sample_%s.bed").string();
    run_pipeline(in, config);

    EXPECT_TRUE(fs::exists(dir / "sample_segs.0.bed"));
    EXPECT_TRUE(fs::exists(dir / "sample_segs.2.bed"));
    fs::remove_all(dir);
}

TEST(OrchestratorTest, ZeroSamplesRejected) {
    EXPECT_THROW(orchestrator(make_config(0), sampler_config(), counter(), statistics_config()),
                 configuration_error);
}

TEST(OrchestratorTest, WrittenSamplesCanBeReadBack) {
    fs::path dir = fs::temp_directory_path() / "segenrich_orchestrator_reuse";
    fs::remove_all(dir);

    auto build = []() {
        pipeline_inputs in;
        in.workspace.add("w", "chr1", 0, 5000);
        in.segments.add("segs", "chr1", 100, 200);
        in.segments.add("segs", "chr1", 700, 730);
        in.annotations.add("genes", "chr1", 0, 1000);
        return in;
    };

    pipeline_inputs first = build();
    run_config config = make_config(20);
    config.output_samples_pattern = (dir / "sample_%s.bed").string();
    auto written = run_pipeline(first, config);

    std::vector<std::string> files;
    for (size_t trial = 0; trial < 20; ++trial) {
        files.push_back((dir / ("sample_segs." + std::to_string(trial) + ".bed")).string());
    }
    sample_file_store store(files);
    EXPECT_EQ(store.trials("segs"), 20u);

    // a different seed would draw different samples; stored ones win
    pipeline_inputs second = build();
    run_config replay = make_config(20);
    replay.seed = 7;
    auto reread = run_pipeline(second, replay, &store);

    ASSERT_EQ(reread.size(), 1u);
    EXPECT_EQ(reread[0].samples, written[0].samples);
    fs::remove_all(dir);
}
