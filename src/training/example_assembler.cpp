/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training/example_assembler.hpp"
#include "core/image_io.hpp"
#include "core/logger.hpp"
#include <ATen/core/Dict.h>
#include <format>
#include <vector>

namespace mva::training {

    namespace {
        using IValueDict = c10::Dict<std::string, c10::IValue>;

        void insert_if_defined(IValueDict& dict, const std::string& name, const torch::Tensor& tensor) {
            if (tensor.defined()) {
                dict.insert(name, tensor);
            }
        }

        torch::Tensor select_or_undefined(const torch::Tensor& tensor, const torch::Tensor& indices) {
            return tensor.defined() ? tensor.index_select(0, indices) : torch::Tensor();
        }

        std::expected<ViewGroup, SceneSkip> gather_group(const std::string& scene,
                                                         const CanonicalFrames& frames,
                                                         const torch::Tensor& indices,
                                                         const param::ResolvedBounds& bounds,
                                                         float nf_divisor,
                                                         const AssemblyOptions& options) {
            auto image = gather_images(scene, frames, indices, options);
            if (!image) {
                return std::unexpected(std::move(image.error()));
            }

            const int64_t num_views = indices.numel();
            ViewGroup group;
            group.extrinsics = frames.extrinsics.index_select(0, indices);
            group.intrinsics = frames.intrinsics.index_select(0, indices);
            group.image = std::move(*image);
            group.depth = select_or_undefined(frames.depths, indices);
            group.position = select_or_undefined(frames.positions, indices);
            group.near = torch::full({num_views}, bounds.near / nf_divisor, torch::kFloat32);
            group.far = torch::full({num_views}, bounds.far / nf_divisor, torch::kFloat32);
            group.index = indices.to(torch::kInt64);
            return group;
        }
    } // namespace

    c10::IValue ViewGroup::to_ivalue() const {
        IValueDict dict;
        dict.insert("extrinsics", extrinsics);
        dict.insert("intrinsics", intrinsics);
        dict.insert("image", image);
        insert_if_defined(dict, "depth", depth);
        insert_if_defined(dict, "position", position);
        dict.insert("near", near);
        dict.insert("far", far);
        dict.insert("index", index);
        return dict;
    }

    c10::IValue Example::to_ivalue() const {
        IValueDict dict;
        dict.insert("context", context.to_ivalue());
        dict.insert("target", target.to_ivalue());
        dict.insert("scene", scene);
        return dict;
    }

    std::expected<torch::Tensor, SceneSkip> gather_images(const std::string& scene,
                                                          const CanonicalFrames& frames,
                                                          const torch::Tensor& indices,
                                                          const AssemblyOptions& options) {
        if (frames.has_dense_images()) {
            return frames.images.index_select(0, indices);
        }

        const auto idx = indices.to(torch::kInt64).contiguous();
        const int64_t* ids = idx.data_ptr<int64_t>();
        const auto [expected_h, expected_w] = options.expected_image_shape;

        std::vector<torch::Tensor> decoded;
        decoded.reserve(static_cast<size_t>(idx.numel()));
        for (int64_t i = 0; i < idx.numel(); ++i) {
            auto image = image_io::decode_image(frames.encoded_images.at(static_cast<size_t>(ids[i])));

            if (options.skip_bad_shape && (image.size(1) != expected_h || image.size(2) != expected_w)) {
                return std::unexpected(SceneSkip{
                    scene, SkipReason::BadImageShape,
                    std::format("frame {} is {}x{}, expected {}x{}", ids[i], image.size(1), image.size(2),
                                expected_h, expected_w)});
            }
            if (!decoded.empty() && image.sizes() != decoded.front().sizes()) {
                return std::unexpected(SceneSkip{
                    scene, SkipReason::BadImageShape,
                    std::format("frame {} is {}x{}, other frames are {}x{}", ids[i], image.size(1),
                                image.size(2), decoded.front().size(1), decoded.front().size(2))});
            }
            decoded.push_back(std::move(image));
        }
        return torch::stack(decoded);
    }

    std::expected<Example, SceneSkip> assemble_example(const std::string& scene,
                                                       const CanonicalFrames& frames,
                                                       const ViewSplit& split,
                                                       const param::ResolvedBounds& bounds,
                                                       float nf_divisor,
                                                       const AssemblyOptions& options) {
        auto context = gather_group(scene, frames, split.context, bounds, nf_divisor, options);
        if (!context) {
            return std::unexpected(std::move(context.error()));
        }
        auto target = gather_group(scene, frames, split.target, bounds, nf_divisor, options);
        if (!target) {
            return std::unexpected(std::move(target.error()));
        }

        LOG_TRACE("Assembled {} with {} context and {} target views", scene, context->size(), target->size());
        return Example{std::move(*context), std::move(*target), scene};
    }

} // namespace mva::training
