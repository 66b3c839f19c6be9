/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <torch/torch.h>
#include <variant>
#include <vector>

namespace mva::loader {

    // Fixed tile resolution of compressed radiance chunks
    inline constexpr int64_t TILE_SIZE = 256;
    // fx, fy, cx, cy, two unused entries, then a row-major 3x4 matrix
    inline constexpr int64_t POSE_VECTOR_SIZE = 18;

    // A shard is corrupt or does not follow its declared layout
    class ChunkFormatError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Scene recorded as dense per-pixel arrays (compressed radiance chunks)
     *
     * All arrays are float32, HWC, with N frames of TILE_SIZE x TILE_SIZE.
     */
    struct DirectionEncodedScene {
        std::string key;
        torch::Tensor radiance;  // [N, 256, 256, 3]
        torch::Tensor depth;     // [N, 256, 256, 1]
        torch::Tensor position;  // [N, 256, 256, 3]
        torch::Tensor direction; // [N, 256, 256, 3]

        int64_t num_frames() const { return radiance.size(0); }
    };

    /**
     * @brief Scene recorded as encoded images plus flattened pose vectors
     */
    struct PoseVectorScene {
        std::string key;
        torch::Tensor cameras;             // [N, 18] float32
        std::vector<torch::Tensor> images; // N encoded images, 1-D uint8
        torch::Tensor depths;              // [N, ...] or undefined

        int64_t num_frames() const { return cameras.size(0); }
    };

    using RawScene = std::variant<DirectionEncodedScene, PoseVectorScene>;

    const std::string& scene_key(const RawScene& scene);

    enum class ChunkFormat {
        CompressedArrays, // .zst
        SceneContainer    // .torch
    };

    struct Chunk {
        std::filesystem::path path;
        ChunkFormat format = ChunkFormat::SceneContainer;
        std::vector<RawScene> scenes;
    };

} // namespace mva::loader
