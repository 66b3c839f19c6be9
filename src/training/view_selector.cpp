/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training/view_selector.hpp"
#include "core/camera_geometry.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <format>

namespace mva::training {

    ViewSelector::ViewSelector(std::unique_ptr<ViewSampler> sampler, ViewSelectorOptions options)
        : _sampler(std::move(sampler)),
          _options(std::move(options)) {
        if (!_sampler) {
            throw std::invalid_argument("ViewSelector requires a sampler");
        }
    }

    std::expected<ViewSplit, SceneSkip> ViewSelector::select(const std::string& scene,
                                                             const torch::Tensor& extrinsics,
                                                             const torch::Tensor& intrinsics) {
        ViewIndices indices;
        try {
            indices = _sampler->sample(scene, extrinsics, intrinsics);
        } catch (const InsufficientFramesError& e) {
            return std::unexpected(SceneSkip{scene, SkipReason::InsufficientFrames, e.what()});
        }

        if (_options.override_context_indices) {
            const auto& override_indices = *_options.override_context_indices;
            const int64_t num_views = extrinsics.size(0);
            if (override_indices.empty()) {
                return std::unexpected(SceneSkip{scene, SkipReason::InsufficientFrames,
                                                 "context override names no frames"});
            }
            const bool in_range = std::ranges::all_of(override_indices, [num_views](int64_t i) {
                return i >= 0 && i < num_views;
            });
            if (!in_range) {
                return std::unexpected(SceneSkip{
                    scene, SkipReason::InsufficientFrames,
                    std::format("context override exceeds the {} frames of the scene", num_views)});
            }
            indices.context = torch::tensor(override_indices, torch::kInt64);
        }

        // Every retained frame must stay within the field of view cap
        const auto retained = torch::cat({indices.context, indices.target});
        const auto fov = geometry::field_of_view_degrees(intrinsics.index_select(0, retained));
        const float widest = fov.max().item<float>();
        if (widest > _options.max_fov) {
            return std::unexpected(SceneSkip{
                scene, SkipReason::FieldOfView,
                std::format("{:.1f} degrees exceeds the {:.1f} degree limit", widest, _options.max_fov)});
        }

        return ViewSplit{std::move(indices.context), std::move(indices.target)};
    }

} // namespace mva::training
