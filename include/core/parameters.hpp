/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mva {

    enum class Stage {
        Train,
        Val,
        Test
    };

    const char* stage_name(Stage stage) noexcept;
    std::optional<Stage> parse_stage(const std::string& name);

    namespace param {

        // Sentinel for near/far meaning "use the built-in default"
        inline constexpr float USE_DEFAULT_BOUND = -1.0f;
        inline constexpr float DEFAULT_NEAR = 0.1f;
        inline constexpr float DEFAULT_FAR = 1000.0f;

        struct DatasetConfig {
            std::vector<std::filesystem::path> roots;
            float baseline_epsilon = 1e-3f;
            float max_fov = 100.0f; // degrees
            bool make_baseline_1 = true;
            bool augment = true;
            int test_len = -1;
            int test_chunk_interval = 1;
            int test_times_per_scene = 1;
            bool skip_bad_shape = true;
            float near = USE_DEFAULT_BOUND;
            float far = USE_DEFAULT_BOUND;
            bool baseline_scale_bounds = true;
            bool shuffle_val = true;
            std::optional<std::string> overfit_to_scene;

            // Output (height, width) of the crop shim
            std::array<int, 2> image_shape{256, 256};
            // Decoded (height, width) that pose-vector images must have when skip_bad_shape is set
            std::array<int, 2> expected_image_shape{360, 640};

            // Replaces the sampled context indices when set
            std::optional<std::vector<int64_t>> override_context_indices;
            // Switch the up reference away from +Z when the viewing axis is parallel to it
            bool guard_pole_alignment = false;
            // Seed for pass shuffles and augmentation; random when unset
            std::optional<uint64_t> seed;
        };

        struct ViewSamplerConfig {
            std::string name = "bounded";
            int num_context_views = 2;
            int num_target_views = 1;
            int min_distance_between_context_views = 2;
            int max_distance_between_context_views = 6;
            int min_distance_to_context_views = 0;

            // Only used by the "arbitrary" sampler
            std::vector<int64_t> context_indices;
            std::vector<int64_t> target_indices;
        };

        struct AssemblerParameters {
            DatasetConfig dataset;
            ViewSamplerConfig view_sampler;
        };

        // Near/far bounds resolved once per dataset
        struct ResolvedBounds {
            float near = DEFAULT_NEAR;
            float far = DEFAULT_FAR;
        };

        ResolvedBounds resolve_bounds(const DatasetConfig& config) noexcept;

        /**
         * @brief Read assembler parameters from a JSON file
         *
         * Keys that are absent keep the defaults declared above. Relative data
         * roots are resolved against the directory of the config file.
         */
        std::expected<AssemblerParameters, std::string> read_parameters(const std::filesystem::path& path);

        /**
         * @brief Parse assembler parameters from a JSON string
         * @param base_dir Directory that relative data roots are resolved against
         */
        std::expected<AssemblerParameters, std::string> parse_parameters(const std::string& json_text,
                                                                        const std::filesystem::path& base_dir = {});

    } // namespace param
} // namespace mva
