/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <torch/torch.h>

namespace mva::training {

    // The scene has too few frames for the requested views
    class InsufficientFramesError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ViewIndices {
        torch::Tensor context; // int64 [V_c]
        torch::Tensor target;  // int64 [V_t]
    };

    /**
     * @brief Policy choosing context and target frames of a scene
     *
     * Implementations throw InsufficientFramesError when the scene cannot
     * supply the views they need.
     */
    class ViewSampler {
    public:
        virtual ~ViewSampler() = default;

        /**
         * @param scene Scene key, for diagnostics
         * @param extrinsics [N, 4, 4] world-to-camera
         * @param intrinsics [N, 3, 3] normalized
         */
        virtual ViewIndices sample(const std::string& scene,
                                   const torch::Tensor& extrinsics,
                                   const torch::Tensor& intrinsics) = 0;

        virtual int num_context_views() const = 0;
        virtual int num_target_views() const = 0;
    };

    /**
     * @brief Two context views a bounded gap apart, targets drawn between them
     *
     * The gap is drawn from [min_distance_between_context_views,
     * max_distance_between_context_views], with the upper bound clamped to N - 1.
     * Targets keep at least min_distance_to_context_views frames from both
     * context views. In the test stage the left context view is frame 0.
     */
    class BoundedViewSampler : public ViewSampler {
    public:
        BoundedViewSampler(const param::ViewSamplerConfig& config, Stage stage, uint64_t seed);

        ViewIndices sample(const std::string& scene,
                           const torch::Tensor& extrinsics,
                           const torch::Tensor& intrinsics) override;

        int num_context_views() const override { return 2; }
        int num_target_views() const override { return config_.num_target_views; }

    private:
        int64_t uniform(int64_t lo, int64_t hi);

        param::ViewSamplerConfig config_;
        Stage stage_;
        std::mt19937 gen_;
    };

    // Fixed context and target lists from the configuration
    class ArbitraryViewSampler : public ViewSampler {
    public:
        explicit ArbitraryViewSampler(const param::ViewSamplerConfig& config);

        ViewIndices sample(const std::string& scene,
                           const torch::Tensor& extrinsics,
                           const torch::Tensor& intrinsics) override;

        int num_context_views() const override { return static_cast<int>(context_.size()); }
        int num_target_views() const override { return static_cast<int>(target_.size()); }

    private:
        std::vector<int64_t> context_;
        std::vector<int64_t> target_;
    };

    /**
     * @brief Create the sampler named in the configuration
     * @throws std::invalid_argument for unknown sampler names
     */
    std::unique_ptr<ViewSampler> make_view_sampler(const param::ViewSamplerConfig& config,
                                                   Stage stage,
                                                   uint64_t seed);

} // namespace mva::training
