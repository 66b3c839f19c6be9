/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "radiance.hpp"
#include "core/logger.hpp"
#include "loader/filesystem_utils.hpp"
#include "loader/torch_converter.hpp"
#include <format>
#include <torch/csrc/jit/serialization/pickle.h>

namespace mva::loader {

    namespace {

        torch::Tensor reshape_tiles(const c10::impl::GenericDict& arrays, const std::string& name,
                                    int64_t channels, const std::string& key) {
            const std::string what = std::format("{} [{}]", key, name);
            auto array = internal::expect_tensor(internal::require_entry(arrays, name, key), what);

            const int64_t frame_elements = TILE_SIZE * TILE_SIZE * channels;
            if (array.numel() == 0 || array.numel() % frame_elements != 0) {
                LOG_ERROR("{} has {} elements, not a multiple of {}x{}x{}",
                          what, array.numel(), TILE_SIZE, TILE_SIZE, channels);
                throw ChunkFormatError(std::format("{}: {} elements do not tile into {}x{}x{} frames",
                                                   what, array.numel(), TILE_SIZE, TILE_SIZE, channels));
            }
            return array.to(torch::kCPU, torch::kFloat32)
                .contiguous()
                .reshape({-1, TILE_SIZE, TILE_SIZE, channels});
        }

    } // namespace

    DirectionEncodedScene radiance_scene_from_ivalue(const c10::IValue& payload, const std::string& key) {
        const auto arrays = internal::expect_dict(payload, key);

        DirectionEncodedScene scene;
        scene.key = key;
        scene.radiance = reshape_tiles(arrays, "radiance", 3, key);
        scene.depth = reshape_tiles(arrays, "depth", 1, key);
        scene.position = reshape_tiles(arrays, "position", 3, key);
        scene.direction = reshape_tiles(arrays, "direction", 3, key);

        const int64_t n = scene.radiance.size(0);
        if (scene.depth.size(0) != n || scene.position.size(0) != n || scene.direction.size(0) != n) {
            throw ChunkFormatError(std::format(
                "{}: frame counts disagree (radiance {}, depth {}, position {}, direction {})",
                key, n, scene.depth.size(0), scene.position.size(0), scene.direction.size(0)));
        }
        return scene;
    }

    DirectionEncodedScene read_radiance_chunk(const std::filesystem::path& path) {
        LOG_TIMER_TRACE("Read radiance chunk");

        // Payload is a torch-pickled dict of flat tensors, not a numpy pickle
        const std::vector<char> payload = read_zstd_file(path);
        c10::IValue value;
        try {
            value = torch::jit::pickle_load(payload);
        } catch (const c10::Error& e) {
            throw ChunkFormatError(std::format("{}: cannot unpickle payload: {}", path.string(), e.what_without_backtrace()));
        }

        auto scene = radiance_scene_from_ivalue(value, strip_extension(path));
        LOG_DEBUG("Loaded radiance chunk {} with {} frames", path.filename().string(), scene.num_frames());
        return scene;
    }

} // namespace mva::loader
