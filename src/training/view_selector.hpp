/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "training/scene_skip.hpp"
#include "training/view_sampler.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace mva::training {

    struct ViewSplit {
        torch::Tensor context; // int64 [V_c]
        torch::Tensor target;  // int64 [V_t]
    };

    struct ViewSelectorOptions {
        float max_fov = 100.0f; // degrees
        std::optional<std::vector<int64_t>> override_context_indices;
    };

    /**
     * @brief Wraps a ViewSampler with the per-scene acceptance checks
     *
     * Sampler failures, out-of-range overrides and frames wider than max_fov
     * come back as a SceneSkip instead of an exception.
     */
    class ViewSelector {
    public:
        ViewSelector(std::unique_ptr<ViewSampler> sampler, ViewSelectorOptions options);

        std::expected<ViewSplit, SceneSkip> select(const std::string& scene,
                                                   const torch::Tensor& extrinsics,
                                                   const torch::Tensor& intrinsics);

        const ViewSampler& sampler() const { return *_sampler; }

    private:
        std::unique_ptr<ViewSampler> _sampler;
        ViewSelectorOptions _options;
    };

} // namespace mva::training
