/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "core/parameters.hpp"
#include "test_helpers.hpp"

using namespace mva;

TEST(ParametersTest, MissingKeysKeepDefaults) {
    auto params = param::parse_parameters(R"({"dataset": {"roots": ["/data/re10k"]}})");
    ASSERT_TRUE(params.has_value()) << params.error();

    const auto& d = params->dataset;
    ASSERT_EQ(d.roots.size(), 1u);
    EXPECT_EQ(d.roots[0].string(), "/data/re10k");
    EXPECT_FLOAT_EQ(d.baseline_epsilon, 1e-3f);
    EXPECT_FLOAT_EQ(d.max_fov, 100.0f);
    EXPECT_TRUE(d.make_baseline_1);
    EXPECT_FALSE(d.guard_pole_alignment);
    EXPECT_FALSE(d.overfit_to_scene.has_value());
    EXPECT_FALSE(d.override_context_indices.has_value());
    EXPECT_EQ(params->view_sampler.name, "bounded");
}

TEST(ParametersTest, ParsesEveryDatasetOption) {
    auto params = param::parse_parameters(R"({
        // comments are accepted
        "dataset": {
            "roots": ["a", "/abs"],
            "baseline_epsilon": 0.01,
            "max_fov": 150.0,
            "make_baseline_1": false,
            "augment": false,
            "test_len": 20,
            "test_chunk_interval": 3,
            "test_times_per_scene": 2,
            "skip_bad_shape": false,
            "near": 0.5,
            "far": 50.0,
            "baseline_scale_bounds": false,
            "shuffle_val": false,
            "overfit_to_scene": "scene_0",
            "image_shape": [128, 192],
            "expected_image_shape": [256, 256],
            "override_context_indices": [0, 1],
            "guard_pole_alignment": true,
            "seed": 7
        },
        "view_sampler": {"name": "arbitrary", "context_indices": [0, 4], "target_indices": [2]}
    })",
                                          "/configs");
    ASSERT_TRUE(params.has_value()) << params.error();

    const auto& d = params->dataset;
    EXPECT_EQ(d.roots[0].string(), std::filesystem::path("/configs/a").string());
    EXPECT_EQ(d.roots[1].string(), "/abs");
    EXPECT_FLOAT_EQ(d.baseline_epsilon, 0.01f);
    EXPECT_FLOAT_EQ(d.max_fov, 150.0f);
    EXPECT_FALSE(d.make_baseline_1);
    EXPECT_EQ(d.test_len, 20);
    EXPECT_EQ(d.test_chunk_interval, 3);
    EXPECT_EQ(d.test_times_per_scene, 2);
    EXPECT_EQ(d.overfit_to_scene, "scene_0");
    EXPECT_EQ(d.image_shape[0], 128);
    EXPECT_EQ(d.image_shape[1], 192);
    EXPECT_EQ(*d.override_context_indices, (std::vector<int64_t>{0, 1}));
    EXPECT_TRUE(d.guard_pole_alignment);
    EXPECT_EQ(d.seed, 7u);

    EXPECT_EQ(params->view_sampler.name, "arbitrary");
    EXPECT_EQ(params->view_sampler.target_indices, (std::vector<int64_t>{2}));
}

TEST(ParametersTest, RejectsInvalidConfigs) {
    EXPECT_FALSE(param::parse_parameters(R"({"dataset": {}})").has_value());
    EXPECT_FALSE(param::parse_parameters(R"({"dataset": {"roots": ["x"], "test_chunk_interval": 0}})").has_value());
    EXPECT_FALSE(param::parse_parameters(R"({"dataset": {"roots": ["x"]}, "view_sampler": {"name": "nope"}})")
                     .has_value());
    EXPECT_FALSE(param::parse_parameters(R"({"dataset": {"roots": ["x"]}, "view_sampler": {"name": "arbitrary"}})")
                     .has_value());
    EXPECT_FALSE(param::parse_parameters("{ not json").has_value());

    const auto empty_override =
        param::parse_parameters(R"({"dataset": {"roots": ["x"], "override_context_indices": []}})");
    ASSERT_FALSE(empty_override.has_value());
    EXPECT_NE(empty_override.error().find("override_context_indices"), std::string::npos);
    EXPECT_TRUE(param::parse_parameters(R"({"dataset": {"roots": ["x"], "override_context_indices": null}})")
                    .has_value());
}

TEST(ParametersTest, BoundsResolveOnce) {
    param::DatasetConfig config;
    auto bounds = param::resolve_bounds(config);
    EXPECT_FLOAT_EQ(bounds.near, 0.1f);
    EXPECT_FLOAT_EQ(bounds.far, 1000.0f);

    config.near = 1.0f;
    config.far = 100.0f;
    bounds = param::resolve_bounds(config);
    EXPECT_FLOAT_EQ(bounds.near, 1.0f);
    EXPECT_FLOAT_EQ(bounds.far, 100.0f);
}

TEST(ParametersTest, ReadsFileRelativeToItsDirectory) {
    test::TempDir dir;
    std::ofstream(dir.path() / "config.json") << R"({"dataset": {"roots": ["data"]}})";

    auto params = param::read_parameters(dir.path() / "config.json");
    ASSERT_TRUE(params.has_value()) << params.error();
    EXPECT_EQ(params->dataset.roots[0].string(), (dir.path() / "data").string());

    EXPECT_FALSE(param::read_parameters(dir.path() / "missing.json").has_value());
}

TEST(ParametersTest, StageNames) {
    EXPECT_EQ(parse_stage("val"), Stage::Val);
    EXPECT_FALSE(parse_stage("eval").has_value());
    EXPECT_STREQ(stage_name(Stage::Test), "test");
}
