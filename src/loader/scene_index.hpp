/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace mva::loader {

    // Scene key -> chunk file holding the scene
    using SceneIndex = std::map<std::string, std::filesystem::path>;

    /**
     * @brief Merge the index.json files of every root and stage
     *
     * Reads <root>/<stage>/index.json for each stage and root; chunk paths are
     * resolved against <root>/<stage>.
     * @throws std::runtime_error if an index file is missing or malformed, or if
     *         a scene key appears in more than one index
     */
    SceneIndex load_scene_index(const std::vector<std::filesystem::path>& roots,
                                const std::vector<std::string>& stages);

    /**
     * @brief List the chunk files (.torch, .zst) of every root for one stage
     *
     * Files are sorted per root; roots keep their configured order. A missing
     * stage directory throws std::runtime_error.
     */
    std::vector<std::filesystem::path> collect_chunks(const std::vector<std::filesystem::path>& roots,
                                                      const std::string& stage);

} // namespace mva::loader
