/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loader/chunk.hpp"
#include <ATen/core/ivalue.h>
#include <filesystem>
#include <string>
#include <vector>

namespace mva::loader {

    /**
     * @brief Read a generic scene container (.torch)
     * @param path Path to a torch pickle holding a list of scene dictionaries
     * @return One scene per record, in file order
     *
     * Each record holds "key" (string), "cameras" ([N, 18] pose vectors),
     * "images" (N encoded images as uint8 tensors) and optionally "depths".
     * @throws ChunkFormatError on records that are not self-consistent
     */
    std::vector<PoseVectorScene> read_pose_vector_chunk(const std::filesystem::path& path);

    std::vector<PoseVectorScene> pose_vector_scenes_from_ivalue(const c10::IValue& payload,
                                                                const std::string& source);

} // namespace mva::loader
