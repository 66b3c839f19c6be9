/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pose_vector.hpp"
#include "core/logger.hpp"
#include "loader/filesystem_utils.hpp"
#include "loader/torch_converter.hpp"
#include <format>
#include <torch/csrc/jit/serialization/pickle.h>

namespace mva::loader {

    namespace {

        PoseVectorScene scene_from_record(const c10::IValue& record, size_t record_index, const std::string& source) {
            const std::string where = std::format("{} record {}", source, record_index);
            const auto dict = internal::expect_dict(record, where);

            PoseVectorScene scene;
            scene.key = internal::expect_string(internal::require_entry(dict, "key", where), where + " [key]");

            auto cameras = internal::expect_tensor(internal::require_entry(dict, "cameras", where), where + " [cameras]");
            if (cameras.dim() != 2 || cameras.size(1) != POSE_VECTOR_SIZE) {
                LOG_ERROR("{} has cameras of shape {}", where, c10::str(cameras.sizes()));
                throw ChunkFormatError(std::format("{}: cameras must be [N, {}], got {}",
                                                   where, POSE_VECTOR_SIZE, c10::str(cameras.sizes())));
            }
            scene.cameras = cameras.to(torch::kCPU, torch::kFloat32).contiguous();

            scene.images = internal::expect_tensor_list(internal::require_entry(dict, "images", where),
                                                        where + " [images]");
            if (static_cast<int64_t>(scene.images.size()) != scene.num_frames()) {
                throw ChunkFormatError(std::format("{}: {} images for {} cameras",
                                                   where, scene.images.size(), scene.num_frames()));
            }
            for (auto& image : scene.images) {
                if (image.scalar_type() != torch::kUInt8) {
                    throw ChunkFormatError(std::format("{}: encoded images must be uint8, got {}",
                                                       where, c10::toString(image.scalar_type())));
                }
            }

            if (auto depths = internal::find_entry(dict, "depths"); depths && !depths->isNone()) {
                auto depth = internal::expect_tensor(*depths, where + " [depths]");
                if (depth.dim() == 0 || depth.size(0) != scene.num_frames()) {
                    throw ChunkFormatError(std::format("{}: depths do not match {} frames", where, scene.num_frames()));
                }
                scene.depths = depth.to(torch::kCPU, torch::kFloat32).contiguous();
            }
            return scene;
        }

    } // namespace

    std::vector<PoseVectorScene> pose_vector_scenes_from_ivalue(const c10::IValue& payload,
                                                                const std::string& source) {
        std::vector<PoseVectorScene> scenes;
        const auto records = internal::expect_sequence(payload, source);
        scenes.reserve(records.size());
        for (size_t i = 0; i < records.size(); ++i) {
            scenes.push_back(scene_from_record(records[i], i, source));
        }
        return scenes;
    }

    std::vector<PoseVectorScene> read_pose_vector_chunk(const std::filesystem::path& path) {
        LOG_TIMER_TRACE("Read pose-vector chunk");

        const std::vector<char> payload = read_binary_file(path);
        c10::IValue value;
        try {
            value = torch::jit::pickle_load(payload);
        } catch (const c10::Error& e) {
            throw ChunkFormatError(std::format("{}: cannot unpickle payload: {}", path.string(), e.what_without_backtrace()));
        }

        auto scenes = pose_vector_scenes_from_ivalue(value, path.string());
        LOG_DEBUG("Loaded {} scenes from {}", scenes.size(), path.filename().string());
        return scenes;
    }

} // namespace mva::loader
