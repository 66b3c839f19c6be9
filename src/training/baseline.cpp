/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training/baseline.hpp"
#include "core/logger.hpp"
#include <format>

namespace mva::training {

    using torch::indexing::Slice;

    std::expected<float, SceneSkip> normalize_baseline(const std::string& scene,
                                                       torch::Tensor& extrinsics,
                                                       const torch::Tensor& context_indices,
                                                       const BaselineOptions& options) {
        if (!options.make_baseline_1 || context_indices.numel() != 2) {
            return 1.0f;
        }

        const auto ctx = context_indices.to(torch::kInt64);
        const auto a = extrinsics[ctx[0].item<int64_t>()].index({Slice(0, 3), 3});
        const auto b = extrinsics[ctx[1].item<int64_t>()].index({Slice(0, 3), 3});
        const float scale = (a - b).norm().item<float>();

        if (scale < options.baseline_epsilon) {
            return std::unexpected(SceneSkip{
                scene, SkipReason::Baseline,
                std::format("context baseline {:.6f} is below {:.6f}", scale, options.baseline_epsilon)});
        }

        extrinsics.index({Slice(), Slice(0, 3), 3}).div_(scale);
        LOG_TRACE("Scene {} baseline normalized by {}", scene, scale);
        return scale;
    }

} // namespace mva::training
