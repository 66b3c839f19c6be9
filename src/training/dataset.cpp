/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training/dataset.hpp"
#include "core/logger.hpp"
#include "loader/chunk_decoder.hpp"
#include "training/baseline.hpp"
#include "training/camera_builder.hpp"
#include "training/shims.hpp"
#include <algorithm>
#include <array>
#include <format>
#include <numeric>
#include <stdexcept>

namespace mva::training {

    namespace fs = std::filesystem;

    namespace {
        // Decorrelates the view sampler from the shuffle generator
        constexpr uint64_t SAMPLER_SEED_SALT = 0x9E3779B97F4A7C15ULL;

        uint64_t mix_seed(uint64_t base, size_t worker, uint64_t pass) {
            std::seed_seq seq{static_cast<uint32_t>(base), static_cast<uint32_t>(base >> 32),
                              static_cast<uint32_t>(worker), static_cast<uint32_t>(pass),
                              static_cast<uint32_t>(pass >> 32)};
            std::array<uint32_t, 2> out{};
            seq.generate(out.begin(), out.end());
            return (static_cast<uint64_t>(out[0]) << 32) | out[1];
        }
    } // namespace

    std::vector<fs::path> partition_chunks(const std::vector<fs::path>& chunks, const WorkerInfo& worker) {
        if (worker.num_workers == 0 || worker.id >= worker.num_workers) {
            throw std::invalid_argument(
                std::format("Invalid worker {} of {}", worker.id, worker.num_workers));
        }

        std::vector<fs::path> owned;
        owned.reserve(chunks.size() / worker.num_workers + 1);
        for (size_t i = worker.id; i < chunks.size(); i += worker.num_workers) {
            owned.push_back(chunks[i]);
        }
        return owned;
    }

    // ---------------------------------------------------------------------
    // ExampleStream
    // ---------------------------------------------------------------------

    ExampleStream::ExampleStream(param::AssemblerParameters params,
                                 Stage stage,
                                 param::ResolvedBounds bounds,
                                 std::vector<fs::path> chunks,
                                 uint64_t seed)
        : params_(std::move(params)),
          stage_(stage),
          bounds_(bounds),
          chunks_(std::move(chunks)),
          gen_(static_cast<std::mt19937::result_type>(seed)),
          selector_(make_view_sampler(params_.view_sampler, stage_, seed ^ SAMPLER_SEED_SALT),
                    ViewSelectorOptions{params_.dataset.max_fov, params_.dataset.override_context_indices}) {
        if (shuffles()) {
            std::shuffle(chunks_.begin(), chunks_.end(), gen_);
        }
    }

    bool ExampleStream::shuffles() const {
        return stage_ == Stage::Train || (stage_ == Stage::Val && params_.dataset.shuffle_val);
    }

    bool ExampleStream::load_next_chunk() {
        const auto& overfit = params_.dataset.overfit_to_scene;

        while (next_chunk_ < chunks_.size()) {
            const fs::path& path = chunks_[next_chunk_++];
            auto chunk = loader::decode_chunk(path);
            ++stats_.chunks_loaded;

            if (overfit && chunk.format == loader::ChunkFormat::SceneContainer) {
                auto matches = [&overfit](const loader::RawScene& s) { return loader::scene_key(s) == *overfit; };
                const auto count = std::ranges::count_if(chunk.scenes, matches);
                if (count != 1) {
                    LOG_ERROR("Overfit scene {} found {} times in {}", *overfit, count, path.string());
                    throw std::runtime_error(std::format("Overfit scene {} found {} times in {}",
                                                         *overfit, count, path.string()));
                }
                const loader::RawScene match = *std::ranges::find_if(chunk.scenes, matches);
                chunk.scenes.assign(chunk.scenes.size(), match);
            }

            if (chunk.scenes.empty()) {
                LOG_DEBUG("Chunk {} holds no scenes", path.string());
                continue;
            }

            scene_order_.resize(chunk.scenes.size());
            std::iota(scene_order_.begin(), scene_order_.end(), size_t{0});
            if (shuffles()) {
                std::shuffle(scene_order_.begin(), scene_order_.end(), gen_);
            }

            LOG_TRACE("Loaded chunk {} with {} scenes", path.string(), chunk.scenes.size());
            current_ = std::move(chunk);
            scene_pos_ = 0;
            repeat_ = 0;
            return true;
        }
        return false;
    }

    std::expected<Example, SceneSkip> ExampleStream::process_scene(const loader::RawScene& scene,
                                                                   const std::string& key) {
        const auto& cfg = params_.dataset;

        auto frames = build_canonical_frames(scene, CameraBuilderOptions{cfg.guard_pole_alignment});

        auto split = selector_.select(key, frames.extrinsics, frames.intrinsics);
        if (!split) {
            return std::unexpected(std::move(split.error()));
        }

        const BaselineOptions baseline{cfg.make_baseline_1, cfg.baseline_epsilon, cfg.baseline_scale_bounds};
        auto scale = normalize_baseline(key, frames.extrinsics, split->context, baseline);
        if (!scale) {
            return std::unexpected(std::move(scale.error()));
        }

        auto example = assemble_example(key, frames, *split, bounds_, bounds_divisor(*scale, baseline),
                                        AssemblyOptions{cfg.skip_bad_shape, cfg.expected_image_shape});
        if (!example) {
            return std::unexpected(std::move(example.error()));
        }

        if (stage_ == Stage::Train && cfg.augment) {
            apply_augmentation_shim(*example, gen_);
        }
        apply_crop_shim(*example, cfg.image_shape);
        return example;
    }

    std::optional<Example> ExampleStream::next() {
        const int times = std::max(1, params_.dataset.test_times_per_scene);

        while (true) {
            if (!current_ && !load_next_chunk()) {
                LOG_DEBUG("Stream finished: {} chunks, {} examples, {} skipped",
                          stats_.chunks_loaded, stats_.examples, stats_.skipped);
                return std::nullopt;
            }

            const loader::RawScene& raw = current_->scenes[scene_order_[scene_pos_]];
            std::string key = loader::scene_key(raw);
            if (times > 1) {
                key = std::format("{}_{:02d}", key, repeat_);
            }

            auto result = process_scene(raw, key);

            if (++repeat_ >= times) {
                repeat_ = 0;
                if (++scene_pos_ >= scene_order_.size()) {
                    current_.reset();
                }
            }

            if (result) {
                ++stats_.examples;
                return std::move(*result);
            }

            ++stats_.skipped;
            LOG_INFO("Skipped {} ({}): {}", result.error().scene, skip_reason_name(result.error().reason),
                     result.error().detail);
        }
    }

    // ---------------------------------------------------------------------
    // SceneDataset
    // ---------------------------------------------------------------------

    SceneDataset::SceneDataset(param::AssemblerParameters params, Stage stage)
        : _params(std::move(params)),
          _stage(stage),
          _bounds(param::resolve_bounds(_params.dataset)) {
        const auto& cfg = _params.dataset;

        _data_stage = (cfg.overfit_to_scene || _stage == Stage::Val) ? "test" : stage_name(_stage);

        std::vector<std::string> index_stages{_data_stage};
        if (cfg.overfit_to_scene) {
            index_stages = {"test", "train"};
        }
        _index = loader::load_scene_index(cfg.roots, index_stages);
        _chunks = loader::collect_chunks(cfg.roots, _data_stage);

        if (cfg.overfit_to_scene) {
            const auto it = _index.find(*cfg.overfit_to_scene);
            if (it == _index.end()) {
                LOG_ERROR("Overfit scene {} is not in the index", *cfg.overfit_to_scene);
                throw std::runtime_error(std::format("Overfit scene {} is not in the index", *cfg.overfit_to_scene));
            }
            _chunks.assign(_chunks.size(), it->second);
        }

        if (_stage == Stage::Test && cfg.test_chunk_interval > 1) {
            std::vector<fs::path> kept;
            for (size_t i = 0; i < _chunks.size(); i += static_cast<size_t>(cfg.test_chunk_interval)) {
                kept.push_back(_chunks[i]);
            }
            _chunks = std::move(kept);
        }

        _base_seed = cfg.seed ? *cfg.seed : std::random_device{}();

        LOG_INFO("Dataset created with {} scenes in {} chunks (stage: {}, data: {})",
                 _index.size(), _chunks.size(), stage_name(_stage), _data_stage);
    }

    size_t SceneDataset::size() const {
        const auto& cfg = _params.dataset;
        const size_t total = _index.size() * static_cast<size_t>(std::max(1, cfg.test_times_per_scene));
        if (_stage == Stage::Test && cfg.test_len > 0) {
            return std::min(total, static_cast<size_t>(cfg.test_len));
        }
        return total;
    }

    ExampleStream SceneDataset::stream(const WorkerInfo& worker, uint64_t pass) const {
        auto owned = partition_chunks(_chunks, worker);
        LOG_DEBUG("Worker {}/{} owns {} of {} chunks", worker.id, worker.num_workers, owned.size(), _chunks.size());
        return ExampleStream(_params, _stage, _bounds, std::move(owned), mix_seed(_base_seed, worker.id, pass));
    }

} // namespace mva::training
