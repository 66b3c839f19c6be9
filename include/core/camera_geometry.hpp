/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cmath>
#include <glm/glm.hpp>
#include <torch/torch.h>

namespace mva::geometry {

    // World units per direction-array unit for camera centers
    inline constexpr float CAMERA_CENTER_SCALE = 0.8f;
    // |dot(forward, +Z)| above which the pole guard switches the up reference
    inline constexpr float POLE_ALIGNMENT_THRESHOLD = 1.0f - 1e-6f;

    struct CameraBasis {
        glm::vec3 right;
        glm::vec3 up;
        glm::vec3 forward;
    };

    /**
     * @brief Orthonormal camera basis from a viewing direction
     *
     * forward = normalize(forward_dir), right = normalize(forward x up_ref),
     * up = normalize(forward x right), with up_ref = +Z. When the viewing axis
     * is parallel to +Z the cross product vanishes and the basis is NaN, unless
     * guard_pole_alignment is set, in which case +Y is used as up_ref.
     */
    CameraBasis basis_from_forward(const glm::vec3& forward_dir, bool guard_pole_alignment);

    /**
     * @brief Camera-to-world matrix with columns [right, up, forward, -center]
     *
     * The translation column holds the negated center as-is, it is not rotated
     * into camera space.
     */
    glm::mat4 camera_to_world(const CameraBasis& basis, const glm::vec3& center);

    // Closed-form inverse; singular input yields Inf/NaN instead of throwing
    glm::mat4 invert(const glm::mat4& matrix);

    glm::mat4 mat4_from_tensor(const torch::Tensor& matrix);
    torch::Tensor tensor_from_mat4(const glm::mat4& matrix);

    /**
     * @brief Invert every matrix of a [N, 4, 4] batch
     * @return float32 CPU tensor [N, 4, 4]
     */
    torch::Tensor invert_batched(const torch::Tensor& matrices);

    // Normalized K: [[fx, 0, cx], [0, fy, cy], [0, 0, 1]]
    torch::Tensor normalized_intrinsics(float fx, float fy, float cx, float cy);

    /**
     * @brief Horizontal and vertical field of view of normalized intrinsics
     * @param intrinsics [N, 3, 3]
     * @return [N, 2] (fov_x, fov_y) in degrees
     *
     * Angles are measured between the rays through the midpoints of opposite
     * edges of the unit image.
     */
    torch::Tensor field_of_view_degrees(const torch::Tensor& intrinsics);

    inline float focal2fov(float focal, float extent) {
        return 2.0f * std::atan(extent / (2.0f * focal));
    }

    inline float fov2focal(float fov, float extent) {
        return extent / (2.0f * std::tan(fov * 0.5f));
    }

} // namespace mva::geometry
