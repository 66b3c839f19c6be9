/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "training/scene_skip.hpp"
#include <expected>
#include <string>
#include <torch/torch.h>

namespace mva::training {

    struct BaselineOptions {
        bool make_baseline_1 = true;
        float baseline_epsilon = 1e-3f;
        bool baseline_scale_bounds = true;
    };

    /**
     * @brief Rescale translations so the two context cameras are one unit apart
     * @param extrinsics [N, 4, 4], translation columns are divided in place
     * @param context_indices int64 indices of the context views
     * @return The applied scale, or a Baseline skip when the context cameras
     *         are closer than baseline_epsilon
     *
     * Only applies with exactly two context views and make_baseline_1 set;
     * otherwise the scale is 1 and the extrinsics are left untouched.
     */
    std::expected<float, SceneSkip> normalize_baseline(const std::string& scene,
                                                       torch::Tensor& extrinsics,
                                                       const torch::Tensor& context_indices,
                                                       const BaselineOptions& options);

    // Divisor applied to near/far after normalization
    inline float bounds_divisor(float scale, const BaselineOptions& options) noexcept {
        return options.baseline_scale_bounds ? scale : 1.0f;
    }

} // namespace mva::training
