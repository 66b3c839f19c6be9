/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "training/camera_builder.hpp"
#include "training/scene_skip.hpp"
#include "training/view_selector.hpp"
#include <ATen/core/ivalue.h>
#include <array>
#include <expected>
#include <string>
#include <torch/torch.h>

namespace mva::training {

    /**
     * @brief Views of one role (context or target) of an example
     *
     * Every defined field has the same leading dimension V.
     */
    struct ViewGroup {
        torch::Tensor extrinsics; // [V, 4, 4]
        torch::Tensor intrinsics; // [V, 3, 3]
        torch::Tensor image;      // [V, 3, H, W]
        torch::Tensor depth;      // [V, 1, H, W] or undefined
        torch::Tensor position;   // [V, 3, H, W] or undefined
        torch::Tensor near;       // [V]
        torch::Tensor far;        // [V]
        torch::Tensor index;      // int64 [V]

        int64_t size() const { return index.size(0); }
        c10::IValue to_ivalue() const;
    };

    struct Example {
        ViewGroup context;
        ViewGroup target;
        std::string scene;

        // {"context": {...}, "target": {...}, "scene": str}; undefined fields are omitted
        c10::IValue to_ivalue() const;
    };

    struct AssemblyOptions {
        bool skip_bad_shape = true;
        std::array<int, 2> expected_image_shape{360, 640};
    };

    /**
     * @brief Images of the selected frames as float [V, 3, H, W]
     *
     * Dense frames are indexed directly. Encoded frames are decoded here; a
     * decoded image that is not 3 x expected_image_shape (when skip_bad_shape is
     * set) or that differs in size from the others yields a BadImageShape skip.
     */
    std::expected<torch::Tensor, SceneSkip> gather_images(const std::string& scene,
                                                          const CanonicalFrames& frames,
                                                          const torch::Tensor& indices,
                                                          const AssemblyOptions& options);

    /**
     * @brief Gather every per-view field of the split into an Example
     * @param nf_divisor near and far are divided by it and repeated per view
     */
    std::expected<Example, SceneSkip> assemble_example(const std::string& scene,
                                                       const CanonicalFrames& frames,
                                                       const ViewSplit& split,
                                                       const param::ResolvedBounds& bounds,
                                                       float nf_divisor,
                                                       const AssemblyOptions& options);

} // namespace mva::training
