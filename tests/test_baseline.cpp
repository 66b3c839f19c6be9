/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <array>
#include <gtest/gtest.h>
#include <torch/torch.h>

#include "training/baseline.hpp"

using namespace mva::training;
using torch::indexing::Slice;

namespace {

    torch::Tensor extrinsics_at(const std::vector<std::array<float, 3>>& translations) {
        const auto n = static_cast<int64_t>(translations.size());
        auto extrinsics = torch::eye(4).repeat({n, 1, 1});
        for (int64_t i = 0; i < n; ++i) {
            const auto& t = translations[static_cast<size_t>(i)];
            extrinsics.index_put_({i, Slice(0, 3), 3}, torch::tensor({t[0], t[1], t[2]}));
        }
        return extrinsics;
    }

    torch::Tensor indices(std::vector<int64_t> values) {
        return torch::tensor(values, torch::kInt64);
    }

} // namespace

TEST(BaselineTest, ContextCamerasEndUpOneUnitApart) {
    auto extrinsics = extrinsics_at({{0.0f, 0.0f, 0.0f}, {2.0f, 0.0f, 0.0f}, {4.0f, 2.0f, 0.0f}});
    const BaselineOptions options;

    const auto scale = normalize_baseline("s", extrinsics, indices({0, 1}), options);
    ASSERT_TRUE(scale.has_value());
    EXPECT_FLOAT_EQ(*scale, 2.0f);

    EXPECT_TRUE(torch::allclose(extrinsics[0].index({Slice(0, 3), 3}), torch::tensor({0.0f, 0.0f, 0.0f})));
    EXPECT_TRUE(torch::allclose(extrinsics[1].index({Slice(0, 3), 3}), torch::tensor({1.0f, 0.0f, 0.0f})));
    // Every frame is rescaled, not only the context views
    EXPECT_TRUE(torch::allclose(extrinsics[2].index({Slice(0, 3), 3}), torch::tensor({2.0f, 1.0f, 0.0f})));
    // Rotation is untouched
    EXPECT_TRUE(torch::allclose(extrinsics.index({Slice(), Slice(0, 3), Slice(0, 3)}), torch::eye(3).expand({3, 3, 3})));

    EXPECT_FLOAT_EQ(bounds_divisor(*scale, options), 2.0f);
}

TEST(BaselineTest, BoundsKeepTheirScaleWhenDisabled) {
    BaselineOptions options;
    options.baseline_scale_bounds = false;
    EXPECT_FLOAT_EQ(bounds_divisor(2.0f, options), 1.0f);
}

TEST(BaselineTest, NarrowBaselineIsSkipped) {
    auto extrinsics = extrinsics_at({{0.0f, 0.0f, 0.0f}, {0.001f, 0.0f, 0.0f}});
    const auto before = extrinsics.clone();
    BaselineOptions options;
    options.baseline_epsilon = 0.01f;

    const auto scale = normalize_baseline("narrow", extrinsics, indices({0, 1}), options);
    ASSERT_FALSE(scale.has_value());
    EXPECT_EQ(scale.error().reason, SkipReason::Baseline);
    EXPECT_EQ(scale.error().scene, "narrow");
    EXPECT_TRUE(torch::equal(extrinsics, before));
}

TEST(BaselineTest, OtherContextCountsAreLeftAlone) {
    auto extrinsics = extrinsics_at({{0.0f, 0.0f, 0.0f}, {3.0f, 0.0f, 0.0f}, {6.0f, 0.0f, 0.0f}});
    const auto before = extrinsics.clone();

    const auto scale = normalize_baseline("three", extrinsics, indices({0, 1, 2}), BaselineOptions{});
    ASSERT_TRUE(scale.has_value());
    EXPECT_FLOAT_EQ(*scale, 1.0f);
    EXPECT_TRUE(torch::equal(extrinsics, before));
}

TEST(BaselineTest, DisabledNormalizationKeepsTranslations) {
    auto extrinsics = extrinsics_at({{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}});
    BaselineOptions options;
    options.make_baseline_1 = false;

    const auto scale = normalize_baseline("off", extrinsics, indices({0, 1}), options);
    ASSERT_TRUE(scale.has_value());
    EXPECT_FLOAT_EQ(*scale, 1.0f);
}
