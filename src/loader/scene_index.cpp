/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/scene_index.hpp"
#include "core/logger.hpp"
#include "loader/chunk_decoder.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace mva::loader {

    namespace fs = std::filesystem;

    SceneIndex load_scene_index(const std::vector<fs::path>& roots, const std::vector<std::string>& stages) {
        SceneIndex merged;

        for (const auto& stage : stages) {
            for (const auto& root : roots) {
                const fs::path stage_dir = root / stage;
                const fs::path index_file = stage_dir / "index.json";
                if (!fs::is_regular_file(index_file)) {
                    LOG_ERROR("Index file not found: {}", index_file.string());
                    throw std::runtime_error(std::format("Index file not found: {}", index_file.string()));
                }

                std::ifstream file(index_file);
                nlohmann::json index;
                try {
                    index = nlohmann::json::parse(file);
                } catch (const nlohmann::json::exception& e) {
                    LOG_ERROR("Failed to parse {}: {}", index_file.string(), e.what());
                    throw std::runtime_error(std::format("Failed to parse {}: {}", index_file.string(), e.what()));
                }
                if (!index.is_object()) {
                    throw std::runtime_error(std::format("{} must map scene keys to chunk paths", index_file.string()));
                }

                // The constituent datasets must have unique keys
                for (const auto& [key, value] : index.items()) {
                    if (merged.contains(key)) {
                        LOG_ERROR("Duplicate scene key '{}' in {}", key, index_file.string());
                        throw std::runtime_error(std::format("Duplicate scene key '{}' in {} (already indexed from {})",
                                                             key, index_file.string(), merged.at(key).string()));
                    }
                    merged.emplace(key, stage_dir / value.get<std::string>());
                }
                LOG_DEBUG("Indexed {} scenes from {}", index.size(), index_file.string());
            }
        }
        return merged;
    }

    std::vector<fs::path> collect_chunks(const std::vector<fs::path>& roots, const std::string& stage) {
        std::vector<fs::path> chunks;
        for (const auto& root : roots) {
            const fs::path stage_dir = root / stage;
            if (!fs::is_directory(stage_dir)) {
                LOG_ERROR("Stage directory not found: {}", stage_dir.string());
                throw std::runtime_error(std::format("Stage directory not found: {}", stage_dir.string()));
            }

            std::vector<fs::path> root_chunks;
            for (const auto& entry : fs::directory_iterator(stage_dir)) {
                if (entry.is_regular_file() && chunk_format_from_path(entry.path())) {
                    root_chunks.push_back(entry.path());
                }
            }
            std::sort(root_chunks.begin(), root_chunks.end());
            chunks.insert(chunks.end(), root_chunks.begin(), root_chunks.end());
        }
        return chunks;
    }

} // namespace mva::loader
