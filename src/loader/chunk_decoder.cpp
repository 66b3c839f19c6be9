/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/chunk_decoder.hpp"
#include "core/logger.hpp"
#include "loader/formats/pose_vector.hpp"
#include "loader/formats/radiance.hpp"
#include <format>

namespace mva::loader {

    const std::string& scene_key(const RawScene& scene) {
        return std::visit([](const auto& s) -> const std::string& { return s.key; }, scene);
    }

    std::optional<ChunkFormat> chunk_format_from_path(const std::filesystem::path& path) {
        const auto ext = path.extension();
        if (ext == ".zst") {
            return ChunkFormat::CompressedArrays;
        }
        if (ext == ".torch") {
            return ChunkFormat::SceneContainer;
        }
        return std::nullopt;
    }

    Chunk decode_chunk(const std::filesystem::path& path) {
        const auto format = chunk_format_from_path(path);
        if (!format) {
            LOG_ERROR("Unsupported chunk extension: {}", path.string());
            throw ChunkFormatError(std::format("Unsupported chunk extension: {}", path.string()));
        }

        Chunk chunk;
        chunk.path = path;
        chunk.format = *format;

        switch (*format) {
        case ChunkFormat::CompressedArrays:
            chunk.scenes.emplace_back(read_radiance_chunk(path));
            break;
        case ChunkFormat::SceneContainer:
            for (auto& scene : read_pose_vector_chunk(path)) {
                chunk.scenes.emplace_back(std::move(scene));
            }
            break;
        }
        return chunk;
    }

} // namespace mva::loader
