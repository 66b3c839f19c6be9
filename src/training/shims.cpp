/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training/shims.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace mva::training {

    namespace F = torch::nn::functional;
    using torch::indexing::Slice;

    namespace {
        torch::Tensor reflect_extrinsics(const torch::Tensor& extrinsics) {
            auto reflect = torch::eye(4, extrinsics.options());
            reflect[0][0] = -1.0f;
            return reflect.matmul(extrinsics).matmul(reflect);
        }

        void flip_group(ViewGroup& group) {
            group.image = group.image.flip({-1});
            if (group.depth.defined()) {
                group.depth = group.depth.flip({-1});
            }
            if (group.position.defined()) {
                group.position = group.position.flip({-1});
            }
            group.extrinsics = reflect_extrinsics(group.extrinsics);
        }

        torch::Tensor resize(const torch::Tensor& tensor, int64_t h, int64_t w, bool smooth) {
            auto options = F::InterpolateFuncOptions().size(std::vector<int64_t>{h, w});
            if (smooth) {
                options.mode(torch::kBilinear).align_corners(false).antialias(true);
            } else {
                options.mode(torch::kNearest);
            }
            return F::interpolate(tensor, options);
        }

        torch::Tensor center_crop(const torch::Tensor& tensor, int64_t h_out, int64_t w_out) {
            const int64_t row = (tensor.size(-2) - h_out) / 2;
            const int64_t col = (tensor.size(-1) - w_out) / 2;
            return tensor.index({"...", Slice(row, row + h_out), Slice(col, col + w_out)}).contiguous();
        }

        void crop_group(ViewGroup& group, int64_t h_out, int64_t w_out) {
            const int64_t h_in = group.image.size(-2);
            const int64_t w_in = group.image.size(-1);
            if (h_out > h_in || w_out > w_in) {
                LOG_ERROR("Crop shape {}x{} exceeds input {}x{}", h_out, w_out, h_in, w_in);
                throw std::invalid_argument(
                    std::format("Crop shape {}x{} exceeds input {}x{}", h_out, w_out, h_in, w_in));
            }

            const double scale = std::max(static_cast<double>(h_out) / static_cast<double>(h_in),
                                          static_cast<double>(w_out) / static_cast<double>(w_in));
            const auto h_scaled = static_cast<int64_t>(std::lround(static_cast<double>(h_in) * scale));
            const auto w_scaled = static_cast<int64_t>(std::lround(static_cast<double>(w_in) * scale));

            const bool rescale = h_scaled != h_in || w_scaled != w_in;
            if (rescale) {
                group.image = resize(group.image, h_scaled, w_scaled, true).clamp(0.0, 1.0);
            }
            group.image = center_crop(group.image, h_out, w_out);
            if (group.depth.defined()) {
                group.depth = center_crop(rescale ? resize(group.depth, h_scaled, w_scaled, false) : group.depth,
                                          h_out, w_out);
            }
            if (group.position.defined()) {
                group.position = center_crop(
                    rescale ? resize(group.position, h_scaled, w_scaled, false) : group.position, h_out, w_out);
            }

            group.intrinsics = group.intrinsics.clone();
            group.intrinsics.index({Slice(), 0, 0}).mul_(static_cast<double>(w_scaled) / static_cast<double>(w_out));
            group.intrinsics.index({Slice(), 1, 1}).mul_(static_cast<double>(h_scaled) / static_cast<double>(h_out));
        }
    } // namespace

    void flip_example(Example& example) {
        flip_group(example.context);
        flip_group(example.target);
    }

    bool apply_augmentation_shim(Example& example, std::mt19937& gen) {
        std::bernoulli_distribution coin(0.5);
        if (!coin(gen)) {
            return false;
        }
        flip_example(example);
        return true;
    }

    void apply_crop_shim(Example& example, const std::array<int, 2>& shape) {
        crop_group(example.context, shape[0], shape[1]);
        crop_group(example.target, shape[0], shape[1]);
    }

} // namespace mva::training
