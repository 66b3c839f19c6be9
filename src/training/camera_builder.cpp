/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training/camera_builder.hpp"
#include "core/camera_geometry.hpp"
#include "core/logger.hpp"
#include <variant>

namespace mva::training {

    namespace {
        // Pixel whose direction vector defines the optical axis
        constexpr int64_t PRINCIPAL_PIXEL = loader::TILE_SIZE / 2 - 1;

        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
    } // namespace

    CanonicalFrames build_direction_frames(const loader::DirectionEncodedScene& scene,
                                           const CameraBuilderOptions& options) {
        const int64_t n = scene.num_frames();
        TORCH_CHECK(scene.direction.dim() == 4 && scene.direction.size(0) == n && scene.direction.size(3) == 3,
                    "Direction array must be [N, H, W, 3], got ", scene.direction.sizes());

        auto principal = scene.direction.index({torch::indexing::Slice(), PRINCIPAL_PIXEL, PRINCIPAL_PIXEL})
                             .to(torch::kFloat32)
                             .contiguous();
        auto dirs = principal.accessor<float, 2>();

        CanonicalFrames frames;
        frames.extrinsics = torch::empty({n, 4, 4}, torch::kFloat32);
        frames.intrinsics = torch::empty({n, 3, 3}, torch::kFloat32);

        for (int64_t i = 0; i < n; ++i) {
            const glm::vec3 direction(dirs[i][0], dirs[i][1], dirs[i][2]);
            const auto basis = geometry::basis_from_forward(-direction, options.guard_pole_alignment);
            const glm::vec3 center = direction * geometry::CAMERA_CENTER_SCALE;

            const glm::mat4 c2w = geometry::camera_to_world(basis, center);
            frames.extrinsics[i].copy_(geometry::tensor_from_mat4(geometry::invert(c2w)));
            frames.intrinsics[i].copy_(geometry::normalized_intrinsics(0.5f, 0.5f, 0.5f, 0.5f));
        }

        // Per-channel maximum over every frame of the chunk
        auto radiance = scene.radiance.to(torch::kFloat32);
        auto channel_max = std::get<0>(radiance.reshape({-1, radiance.size(-1)}).max(0));
        frames.images = (radiance / channel_max).permute({0, 3, 1, 2}).contiguous();
        frames.depths = scene.depth.to(torch::kFloat32).permute({0, 3, 1, 2}).contiguous();
        frames.positions = scene.position.to(torch::kFloat32).permute({0, 3, 1, 2}).contiguous();

        LOG_TRACE("Built {} direction-encoded frames for {}", n, scene.key);
        return frames;
    }

    CanonicalFrames build_pose_vector_frames(const loader::PoseVectorScene& scene) {
        const int64_t n = scene.num_frames();
        TORCH_CHECK(scene.cameras.dim() == 2 && scene.cameras.size(1) == loader::POSE_VECTOR_SIZE,
                    "Pose vectors must be [N, 18], got ", scene.cameras.sizes());

        auto cameras = scene.cameras.to(torch::kFloat32).contiguous();
        auto v = cameras.accessor<float, 2>();

        CanonicalFrames frames;
        frames.intrinsics = torch::empty({n, 3, 3}, torch::kFloat32);
        for (int64_t i = 0; i < n; ++i) {
            frames.intrinsics[i].copy_(geometry::normalized_intrinsics(v[i][0], v[i][1], v[i][2], v[i][3]));
        }

        // v[6..17] is the row-major top 3x4 of the stored pose matrix
        auto stored = torch::eye(4, torch::kFloat32).repeat({n, 1, 1});
        stored.index_put_({torch::indexing::Slice(), torch::indexing::Slice(0, 3)},
                          cameras.index({torch::indexing::Slice(), torch::indexing::Slice(6, 18)}).reshape({n, 3, 4}));
        frames.extrinsics = geometry::invert_batched(stored);

        frames.encoded_images = scene.images;
        if (scene.depths.defined()) {
            auto depths = scene.depths.to(torch::kFloat32);
            frames.depths = depths.dim() == 3 ? depths.unsqueeze(1) : depths;
        }

        LOG_TRACE("Built {} pose-vector frames for {}", n, scene.key);
        return frames;
    }

    CanonicalFrames build_canonical_frames(const loader::RawScene& scene, const CameraBuilderOptions& options) {
        return std::visit(overloaded{
                              [&](const loader::DirectionEncodedScene& s) { return build_direction_frames(s, options); },
                              [](const loader::PoseVectorScene& s) { return build_pose_vector_frames(s); },
                          },
                          scene);
    }

} // namespace mva::training
