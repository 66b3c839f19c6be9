/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/camera_geometry.hpp"
#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_inverse.hpp>
#include <numbers>

namespace mva::geometry {

    CameraBasis basis_from_forward(const glm::vec3& forward_dir, bool guard_pole_alignment) {
        const glm::vec3 forward = glm::normalize(forward_dir);

        glm::vec3 up_ref(0.0f, 0.0f, 1.0f);
        if (guard_pole_alignment && std::abs(glm::dot(forward, up_ref)) > POLE_ALIGNMENT_THRESHOLD) {
            up_ref = glm::vec3(0.0f, 1.0f, 0.0f);
        }

        const glm::vec3 right = glm::normalize(glm::cross(forward, up_ref));
        const glm::vec3 up = glm::normalize(glm::cross(forward, right));
        return {right, up, forward};
    }

    glm::mat4 camera_to_world(const CameraBasis& basis, const glm::vec3& center) {
        // GLM is column-major: m[col] is a column
        glm::mat4 c2w(1.0f);
        c2w[0] = glm::vec4(basis.right, 0.0f);
        c2w[1] = glm::vec4(basis.up, 0.0f);
        c2w[2] = glm::vec4(basis.forward, 0.0f);
        c2w[3] = glm::vec4(-center, 1.0f);
        return c2w;
    }

    glm::mat4 invert(const glm::mat4& matrix) {
        return glm::inverse(matrix);
    }

    glm::mat4 mat4_from_tensor(const torch::Tensor& matrix) {
        TORCH_CHECK(matrix.dim() == 2 && matrix.size(0) == 4 && matrix.size(1) == 4,
                    "Expected a [4, 4] matrix, got ", matrix.sizes());
        auto cpu = matrix.to(torch::kCPU, torch::kFloat32).contiguous();
        const float* m = cpu.data_ptr<float>();

        glm::mat4 out;
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                out[j][i] = m[i * 4 + j];
            }
        }
        return out;
    }

    torch::Tensor tensor_from_mat4(const glm::mat4& matrix) {
        auto out = torch::empty({4, 4}, torch::kFloat32);
        float* m = out.data_ptr<float>();
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                m[i * 4 + j] = matrix[j][i];
            }
        }
        return out;
    }

    torch::Tensor invert_batched(const torch::Tensor& matrices) {
        TORCH_CHECK(matrices.dim() == 3 && matrices.size(1) == 4 && matrices.size(2) == 4,
                    "Expected [N, 4, 4] matrices, got ", matrices.sizes());
        const int64_t n = matrices.size(0);
        auto out = torch::empty({n, 4, 4}, torch::kFloat32);
        for (int64_t i = 0; i < n; ++i) {
            out[i].copy_(tensor_from_mat4(invert(mat4_from_tensor(matrices[i]))));
        }
        return out;
    }

    torch::Tensor normalized_intrinsics(float fx, float fy, float cx, float cy) {
        auto K = torch::eye(3, torch::kFloat32);
        auto k = K.accessor<float, 2>();
        k[0][0] = fx;
        k[1][1] = fy;
        k[0][2] = cx;
        k[1][2] = cy;
        return K;
    }

    torch::Tensor field_of_view_degrees(const torch::Tensor& intrinsics) {
        TORCH_CHECK(intrinsics.dim() == 3 && intrinsics.size(1) == 3 && intrinsics.size(2) == 3,
                    "Expected [N, 3, 3] intrinsics, got ", intrinsics.sizes());
        auto cpu = intrinsics.to(torch::kCPU, torch::kFloat32).contiguous();
        auto k = cpu.accessor<float, 3>();
        const int64_t n = cpu.size(0);

        auto fov = torch::empty({n, 2}, torch::kFloat32);
        auto f = fov.accessor<float, 2>();
        constexpr float RAD_TO_DEG = 180.0f / std::numbers::pi_v<float>;

        for (int64_t b = 0; b < n; ++b) {
            glm::mat3 K;
            for (int i = 0; i < 3; ++i) {
                for (int j = 0; j < 3; ++j) {
                    K[j][i] = k[b][i][j];
                }
            }
            const glm::mat3 K_inv = glm::inverse(K);
            auto ray = [&K_inv](float u, float v) {
                return glm::normalize(K_inv * glm::vec3(u, v, 1.0f));
            };

            const float cos_x = glm::dot(ray(0.0f, 0.5f), ray(1.0f, 0.5f));
            const float cos_y = glm::dot(ray(0.5f, 0.0f), ray(0.5f, 1.0f));
            f[b][0] = std::acos(std::clamp(cos_x, -1.0f, 1.0f)) * RAD_TO_DEG;
            f[b][1] = std::acos(std::clamp(cos_y, -1.0f, 1.0f)) * RAD_TO_DEG;
        }
        return fov;
    }

} // namespace mva::geometry
