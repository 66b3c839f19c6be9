/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loader/chunk.hpp"
#include <ATen/core/ivalue.h>
#include <filesystem>
#include <string>

namespace mva::loader {

    /**
     * @brief Read a zstd-compressed radiance chunk
     * @param path Path to a .zst file
     * @return The single scene stored in the chunk, keyed by the path without extension
     *
     * The decompressed payload is a torch pickle of a dictionary holding the
     * dense arrays "radiance", "depth", "position" and "direction". Each array
     * is reshaped to [N, 256, 256, C].
     * @throws ChunkFormatError if an array is missing or does not tile into
     *         256x256 frames of a common frame count
     */
    DirectionEncodedScene read_radiance_chunk(const std::filesystem::path& path);

    /**
     * @brief Build a scene from an already unpickled radiance dictionary
     */
    DirectionEncodedScene radiance_scene_from_ivalue(const c10::IValue& payload, const std::string& key);

} // namespace mva::loader
