/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace mva {

    const char* stage_name(Stage stage) noexcept {
        switch (stage) {
        case Stage::Train: return "train";
        case Stage::Val: return "val";
        case Stage::Test: return "test";
        }
        return "train";
    }

    std::optional<Stage> parse_stage(const std::string& name) {
        if (name == "train") {
            return Stage::Train;
        }
        if (name == "val") {
            return Stage::Val;
        }
        if (name == "test") {
            return Stage::Test;
        }
        return std::nullopt;
    }

    namespace param {

        namespace {

            template <typename T>
            void read_if_present(const nlohmann::json& json, const char* key, T& out) {
                if (json.contains(key) && !json[key].is_null()) {
                    out = json[key].get<T>();
                }
            }

            std::array<int, 2> read_shape(const nlohmann::json& json, const char* key) {
                const auto& value = json[key];
                if (!value.is_array() || value.size() != 2) {
                    throw std::runtime_error(std::format("'{}' must be a [height, width] array", key));
                }
                return {value[0].get<int>(), value[1].get<int>()};
            }

            DatasetConfig parse_dataset(const nlohmann::json& json, const std::filesystem::path& base_dir) {
                DatasetConfig config;

                if (json.contains("roots")) {
                    for (const auto& root : json["roots"]) {
                        std::filesystem::path path = root.get<std::string>();
                        if (path.is_relative() && !base_dir.empty()) {
                            path = base_dir / path;
                        }
                        config.roots.push_back(path);
                    }
                }

                read_if_present(json, "baseline_epsilon", config.baseline_epsilon);
                read_if_present(json, "max_fov", config.max_fov);
                read_if_present(json, "make_baseline_1", config.make_baseline_1);
                read_if_present(json, "augment", config.augment);
                read_if_present(json, "test_len", config.test_len);
                read_if_present(json, "test_chunk_interval", config.test_chunk_interval);
                read_if_present(json, "test_times_per_scene", config.test_times_per_scene);
                read_if_present(json, "skip_bad_shape", config.skip_bad_shape);
                read_if_present(json, "near", config.near);
                read_if_present(json, "far", config.far);
                read_if_present(json, "baseline_scale_bounds", config.baseline_scale_bounds);
                read_if_present(json, "shuffle_val", config.shuffle_val);
                read_if_present(json, "guard_pole_alignment", config.guard_pole_alignment);

                if (json.contains("overfit_to_scene") && !json["overfit_to_scene"].is_null()) {
                    config.overfit_to_scene = json["overfit_to_scene"].get<std::string>();
                }
                if (json.contains("override_context_indices") && !json["override_context_indices"].is_null()) {
                    config.override_context_indices = json["override_context_indices"].get<std::vector<int64_t>>();
                }
                if (json.contains("seed") && !json["seed"].is_null()) {
                    config.seed = json["seed"].get<uint64_t>();
                }
                if (json.contains("image_shape")) {
                    config.image_shape = read_shape(json, "image_shape");
                }
                if (json.contains("expected_image_shape")) {
                    config.expected_image_shape = read_shape(json, "expected_image_shape");
                }
                return config;
            }

            ViewSamplerConfig parse_view_sampler(const nlohmann::json& json) {
                ViewSamplerConfig config;
                read_if_present(json, "name", config.name);
                read_if_present(json, "num_context_views", config.num_context_views);
                read_if_present(json, "num_target_views", config.num_target_views);
                read_if_present(json, "min_distance_between_context_views", config.min_distance_between_context_views);
                read_if_present(json, "max_distance_between_context_views", config.max_distance_between_context_views);
                read_if_present(json, "min_distance_to_context_views", config.min_distance_to_context_views);
                read_if_present(json, "context_indices", config.context_indices);
                read_if_present(json, "target_indices", config.target_indices);
                return config;
            }

            std::expected<void, std::string> validate(const AssemblerParameters& params) {
                const auto& dataset = params.dataset;
                if (dataset.roots.empty()) {
                    return std::unexpected("dataset.roots must name at least one data root");
                }
                if (dataset.test_chunk_interval < 1) {
                    return std::unexpected(std::format("dataset.test_chunk_interval must be >= 1, got {}",
                                                       dataset.test_chunk_interval));
                }
                if (dataset.test_times_per_scene < 1) {
                    return std::unexpected(std::format("dataset.test_times_per_scene must be >= 1, got {}",
                                                       dataset.test_times_per_scene));
                }
                if (dataset.image_shape[0] <= 0 || dataset.image_shape[1] <= 0) {
                    return std::unexpected("dataset.image_shape must be positive");
                }
                if (dataset.baseline_epsilon < 0.0f) {
                    return std::unexpected("dataset.baseline_epsilon must not be negative");
                }
                if (dataset.override_context_indices && dataset.override_context_indices->empty()) {
                    return std::unexpected("dataset.override_context_indices must not be empty");
                }
                const auto& sampler = params.view_sampler;
                if (sampler.name != "bounded" && sampler.name != "arbitrary") {
                    return std::unexpected(std::format("Unknown view sampler '{}'", sampler.name));
                }
                if (sampler.name == "bounded") {
                    if (sampler.num_context_views != 2) {
                        return std::unexpected("The bounded view sampler only supports two context views");
                    }
                    if (sampler.num_target_views < 1) {
                        return std::unexpected("view_sampler.num_target_views must be >= 1");
                    }
                }
                if (sampler.name == "arbitrary" &&
                    (sampler.context_indices.empty() || sampler.target_indices.empty())) {
                    return std::unexpected("The arbitrary view sampler needs context_indices and target_indices");
                }
                return {};
            }

        } // namespace

        ResolvedBounds resolve_bounds(const DatasetConfig& config) noexcept {
            ResolvedBounds bounds;
            if (config.near != USE_DEFAULT_BOUND) {
                bounds.near = config.near;
            }
            if (config.far != USE_DEFAULT_BOUND) {
                bounds.far = config.far;
            }
            return bounds;
        }

        std::expected<AssemblerParameters, std::string> parse_parameters(const std::string& json_text,
                                                                        const std::filesystem::path& base_dir) {
            AssemblerParameters params;
            try {
                const auto json = nlohmann::json::parse(json_text, nullptr, true, true);
                if (json.contains("dataset")) {
                    params.dataset = parse_dataset(json["dataset"], base_dir);
                }
                if (json.contains("view_sampler")) {
                    params.view_sampler = parse_view_sampler(json["view_sampler"]);
                }
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Invalid parameters: {}", e.what()));
            }

            if (auto valid = validate(params); !valid) {
                return std::unexpected(valid.error());
            }
            return params;
        }

        std::expected<AssemblerParameters, std::string> read_parameters(const std::filesystem::path& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                return std::unexpected(std::format("Could not open parameter file: {}", path.string()));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();

            LOG_DEBUG("Reading parameters from: {}", path.string());
            auto result = parse_parameters(buffer.str(), path.parent_path());
            if (!result) {
                return std::unexpected(std::format("{}: {}", path.string(), result.error()));
            }
            return result;
        }

    } // namespace param
} // namespace mva
