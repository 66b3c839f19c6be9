/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "loader/chunk.hpp"
#include "loader/scene_index.hpp"
#include "training/example_assembler.hpp"
#include "training/scene_skip.hpp"
#include "training/view_selector.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace mva::training {

    // Position of one loader among the parallel streams of a pass
    struct WorkerInfo {
        size_t id = 0;
        size_t num_workers = 1;
    };

    /**
     * @brief Chunks owned by one worker: every chunk whose position modulo
     *        num_workers equals the worker id
     */
    std::vector<std::filesystem::path> partition_chunks(const std::vector<std::filesystem::path>& chunks,
                                                        const WorkerInfo& worker);

    // Counters of one stream, for progress logging
    struct StreamStats {
        size_t chunks_loaded = 0;
        size_t examples = 0;
        size_t skipped = 0;
    };

    /**
     * @brief Single-threaded, pull-based producer of examples for one worker
     *
     * Chunks are decoded lazily and released as soon as their last scene has
     * been processed. Scenes that fail a check are logged and skipped.
     */
    class ExampleStream {
    public:
        ExampleStream(param::AssemblerParameters params,
                      Stage stage,
                      param::ResolvedBounds bounds,
                      std::vector<std::filesystem::path> chunks,
                      uint64_t seed);

        // Move only
        ExampleStream(const ExampleStream&) = delete;
        ExampleStream& operator=(const ExampleStream&) = delete;
        ExampleStream(ExampleStream&&) noexcept = default;
        ExampleStream& operator=(ExampleStream&&) noexcept = default;

        /**
         * @brief Produce the next example of the pass
         * @return std::nullopt once every chunk of this worker is exhausted
         * @throws loader::ChunkFormatError for corrupt shards
         * @throws std::runtime_error when the overfit scene is not unique in a chunk
         */
        std::optional<Example> next();

        // Run the per-scene pipeline on one scene without touching the stream position
        std::expected<Example, SceneSkip> process_scene(const loader::RawScene& scene, const std::string& key);

        const std::vector<std::filesystem::path>& chunks() const { return chunks_; }
        const StreamStats& stats() const { return stats_; }

    private:
        bool load_next_chunk();
        bool shuffles() const;

        param::AssemblerParameters params_;
        Stage stage_;
        param::ResolvedBounds bounds_;
        std::vector<std::filesystem::path> chunks_;
        std::mt19937 gen_;
        ViewSelector selector_;

        size_t next_chunk_ = 0;
        std::optional<loader::Chunk> current_;
        std::vector<size_t> scene_order_;
        size_t scene_pos_ = 0;
        int repeat_ = 0;
        StreamStats stats_;
    };

    /**
     * @brief Scene-level dataset over one or more chunk roots
     *
     * The scene index is loaded eagerly and is immutable afterwards. Each call
     * to stream() starts an independent pass for one worker.
     */
    class SceneDataset {
    public:
        /**
         * @throws std::runtime_error on missing or duplicate index entries,
         *         an unknown overfit scene or missing stage directories
         */
        SceneDataset(param::AssemblerParameters params, Stage stage);

        /**
         * @brief Expected number of examples of a pass
         *
         * |index| * test_times_per_scene, capped at test_len in the test stage
         * when test_len is positive.
         */
        size_t size() const;

        /**
         * @brief Start a pass for one worker
         * @param pass Pass number, mixed into the seed so every pass differs
         */
        ExampleStream stream(const WorkerInfo& worker = {}, uint64_t pass = 0) const;

        Stage stage() const { return _stage; }
        const std::string& data_stage() const { return _data_stage; }
        const loader::SceneIndex& index() const { return _index; }
        const std::vector<std::filesystem::path>& chunks() const { return _chunks; }
        const param::ResolvedBounds& bounds() const { return _bounds; }

    private:
        param::AssemblerParameters _params;
        Stage _stage;
        std::string _data_stage;
        param::ResolvedBounds _bounds;
        loader::SceneIndex _index;
        std::vector<std::filesystem::path> _chunks;
        uint64_t _base_seed;
    };

} // namespace mva::training
