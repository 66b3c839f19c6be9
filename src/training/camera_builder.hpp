/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loader/chunk.hpp"
#include <torch/torch.h>
#include <vector>

namespace mva::training {

    /**
     * @brief Per-scene frames in one camera convention
     *
     * Extrinsics are world-to-camera, intrinsics are normalized to the unit
     * image. Dense sources fill `images`; pose-vector sources keep the encoded
     * bytes in `encoded_images` and are decoded only for the selected views.
     */
    struct CanonicalFrames {
        torch::Tensor extrinsics; // [N, 4, 4]
        torch::Tensor intrinsics; // [N, 3, 3]
        torch::Tensor images;     // [N, 3, H, W] or undefined
        std::vector<torch::Tensor> encoded_images;
        torch::Tensor depths;    // [N, 1, H, W] or undefined
        torch::Tensor positions; // [N, 3, H, W] or undefined

        int64_t num_frames() const { return extrinsics.size(0); }
        bool has_dense_images() const { return images.defined(); }
    };

    struct CameraBuilderOptions {
        bool guard_pole_alignment = false;
    };

    CanonicalFrames build_canonical_frames(const loader::RawScene& scene,
                                           const CameraBuilderOptions& options = {});

    // Exposed for tests
    CanonicalFrames build_direction_frames(const loader::DirectionEncodedScene& scene,
                                           const CameraBuilderOptions& options);
    CanonicalFrames build_pose_vector_frames(const loader::PoseVectorScene& scene);

} // namespace mva::training
