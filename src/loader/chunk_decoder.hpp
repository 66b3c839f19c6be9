/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loader/chunk.hpp"
#include <filesystem>
#include <optional>

namespace mva::loader {

    // Format of a shard judged by its extension (.zst or .torch)
    std::optional<ChunkFormat> chunk_format_from_path(const std::filesystem::path& path);

    /**
     * @brief Load one shard into memory
     *
     * The input file is opened and released within this call on every path.
     * @throws ChunkFormatError for unknown extensions or corrupt content
     */
    Chunk decode_chunk(const std::filesystem::path& path);

} // namespace mva::loader
