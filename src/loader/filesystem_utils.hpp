/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mva::loader {

    /**
     * @brief Read a whole file into memory
     * @throws std::runtime_error if the file cannot be opened or read
     */
    std::vector<char> read_binary_file(const std::filesystem::path& path);

    /**
     * @brief Stream-decompress a zstd file into memory
     *
     * Input is consumed in ZSTD_DStreamInSize() blocks so the compressed file is
     * never held in memory as a whole.
     * @throws std::runtime_error if the file cannot be opened
     * @throws ChunkFormatError on corrupt or truncated frames
     */
    std::vector<char> read_zstd_file(const std::filesystem::path& path);

    // Path with its extension removed, used as the key of single-scene chunks
    std::string strip_extension(const std::filesystem::path& path);

} // namespace mva::loader
