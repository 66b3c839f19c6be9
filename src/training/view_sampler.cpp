/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training/view_sampler.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <format>

namespace mva::training {

    namespace {
        torch::Tensor index_tensor(const std::vector<int64_t>& indices) {
            return torch::tensor(indices, torch::kInt64);
        }
    } // namespace

    BoundedViewSampler::BoundedViewSampler(const param::ViewSamplerConfig& config, Stage stage, uint64_t seed)
        : config_(config),
          stage_(stage),
          gen_(static_cast<std::mt19937::result_type>(seed)) {
        TORCH_CHECK(config_.num_target_views > 0, "Bounded sampler needs at least one target view");
        TORCH_CHECK(config_.min_distance_between_context_views >= 0 &&
                        config_.min_distance_to_context_views >= 0,
                    "View distances must be non-negative");
    }

    int64_t BoundedViewSampler::uniform(int64_t lo, int64_t hi) {
        std::uniform_int_distribution<int64_t> dist(lo, hi);
        return dist(gen_);
    }

    ViewIndices BoundedViewSampler::sample(const std::string& scene,
                                           const torch::Tensor& extrinsics,
                                           [[maybe_unused]] const torch::Tensor& intrinsics) {
        const int64_t num_views = extrinsics.size(0);
        const int64_t margin = config_.min_distance_to_context_views;

        // Targets need room between the two context views
        const int64_t min_gap = std::max<int64_t>(config_.min_distance_between_context_views, 2 * margin);
        const int64_t max_gap = std::min<int64_t>(config_.max_distance_between_context_views, num_views - 1);
        if (num_views < 2 || max_gap < min_gap) {
            throw InsufficientFramesError(std::format(
                "Scene {} has {} frames, context gap needs [{}, {}]",
                scene, num_views, min_gap, config_.max_distance_between_context_views));
        }

        const int64_t gap = uniform(min_gap, max_gap);
        const int64_t left = stage_ == Stage::Test ? 0 : uniform(0, num_views - 1 - gap);
        const int64_t right = left + gap;

        std::vector<int64_t> targets(static_cast<size_t>(config_.num_target_views));
        for (auto& t : targets) {
            t = uniform(left + margin, right - margin);
        }

        return {index_tensor({left, right}), index_tensor(targets)};
    }

    ArbitraryViewSampler::ArbitraryViewSampler(const param::ViewSamplerConfig& config)
        : context_(config.context_indices),
          target_(config.target_indices) {
        TORCH_CHECK(!context_.empty() && !target_.empty(),
                    "Arbitrary sampler needs context_indices and target_indices");
    }

    ViewIndices ArbitraryViewSampler::sample(const std::string& scene,
                                             const torch::Tensor& extrinsics,
                                             [[maybe_unused]] const torch::Tensor& intrinsics) {
        const int64_t num_views = extrinsics.size(0);
        auto out_of_range = [num_views](int64_t i) { return i < 0 || i >= num_views; };

        if (std::ranges::any_of(context_, out_of_range) || std::ranges::any_of(target_, out_of_range)) {
            throw InsufficientFramesError(std::format(
                "Scene {} has {} frames, fixed view indices exceed it", scene, num_views));
        }
        return {index_tensor(context_), index_tensor(target_)};
    }

    std::unique_ptr<ViewSampler> make_view_sampler(const param::ViewSamplerConfig& config,
                                                   Stage stage,
                                                   uint64_t seed) {
        if (config.name == "bounded") {
            return std::make_unique<BoundedViewSampler>(config, stage, seed);
        }
        if (config.name == "arbitrary") {
            return std::make_unique<ArbitraryViewSampler>(config);
        }
        LOG_ERROR("Unknown view sampler: {}", config.name);
        throw std::invalid_argument(std::format("Unknown view sampler: {}", config.name));
    }

} // namespace mva::training
