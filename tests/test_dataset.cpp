/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <set>
#include <torch/torch.h>

#include "training/dataset.hpp"
#include "test_helpers.hpp"

using namespace mva;
using namespace mva::training;
using torch::indexing::Slice;

namespace {

    std::vector<float> evenly_spaced(int n, float step) {
        std::vector<float> x(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            x[static_cast<size_t>(i)] = static_cast<float>(i) * step;
        }
        return x;
    }

    std::vector<Example> drain(ExampleStream& stream) {
        std::vector<Example> out;
        while (auto example = stream.next()) {
            out.push_back(std::move(*example));
        }
        return out;
    }

} // namespace

class SceneDatasetTest : public ::testing::Test {
protected:
    void SetUp() override {
        params.dataset.roots = {dir.path() / "root"};
        params.dataset.seed = 17;
        params.dataset.augment = false;
        params.view_sampler.num_target_views = 1;
    }

    std::filesystem::path stage_dir(const std::string& stage) const {
        return dir.path() / "root" / stage;
    }

    // Writes one .torch chunk per entry of `chunks`, each holding the named scenes
    void write_pose_dataset(const std::string& stage,
                            const std::vector<std::vector<std::string>>& chunks,
                            float spacing = 0.5f,
                            int height = 360,
                            int width = 640) {
        std::map<std::string, std::string> index;
        for (size_t c = 0; c < chunks.size(); ++c) {
            const auto name = std::format("{:06d}.torch", c);
            std::vector<c10::IValue> records;
            for (const auto& key : chunks[c]) {
                records.push_back(test::pose_record(key, test::pose_vectors(evenly_spaced(10, spacing)), height, width));
                index[key] = name;
            }
            test::write_pose_chunk(stage_dir(stage) / name, records);
        }
        test::write_index(stage_dir(stage), index);
    }

    test::TempDir dir;
    param::AssemblerParameters params;
};

TEST_F(SceneDatasetTest, StreamsOneExamplePerScene) {
    write_pose_dataset("train", {{"a", "b"}, {"c"}});
    SceneDataset dataset(params, Stage::Train);
    EXPECT_EQ(dataset.size(), 3u);
    EXPECT_EQ(dataset.data_stage(), "train");

    auto stream = dataset.stream();
    const auto examples = drain(stream);
    ASSERT_EQ(examples.size(), 3u);
    EXPECT_EQ(stream.stats().chunks_loaded, 2u);
    EXPECT_EQ(stream.stats().skipped, 0u);

    std::set<std::string> scenes;
    for (const auto& example : examples) {
        scenes.insert(example.scene);
        EXPECT_EQ(example.context.image.sizes().vec(), (std::vector<int64_t>{2, 3, 256, 256}));
        EXPECT_EQ(example.target.image.sizes().vec(), (std::vector<int64_t>{1, 3, 256, 256}));
        EXPECT_EQ(example.context.extrinsics.size(0), 2);
        EXPECT_EQ(example.target.near.size(0), 1);

        // Context cameras are one unit apart after normalization
        const auto t = example.context.extrinsics.index({Slice(), Slice(0, 3), 3});
        EXPECT_NEAR((t[0] - t[1]).norm().item<float>(), 1.0f, 1e-4f);

        // near/far follow the baseline scale
        const int64_t gap = (example.context.index[1] - example.context.index[0]).item<int64_t>();
        EXPECT_NEAR(example.context.near[0].item<float>(), 0.1f / (0.5f * static_cast<float>(gap)), 1e-5f);
    }
    EXPECT_EQ(scenes, (std::set<std::string>{"a", "b", "c"}));
}

TEST_F(SceneDatasetTest, NarrowBaselineYieldsNoExamples) {
    write_pose_dataset("train", {{"a", "b"}}, 0.0001f);
    params.dataset.baseline_epsilon = 0.01f;
    SceneDataset dataset(params, Stage::Train);

    auto stream = dataset.stream();
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(stream.stats().skipped, 2u);
    EXPECT_EQ(stream.stats().examples, 0u);
}

TEST_F(SceneDatasetTest, BadImageShapeIsSkipped) {
    write_pose_dataset("train", {{"small"}}, 0.5f, 64, 64);
    SceneDataset dataset(params, Stage::Train);

    auto stream = dataset.stream();
    EXPECT_TRUE(drain(stream).empty());
    EXPECT_EQ(stream.stats().skipped, 1u);
}

TEST_F(SceneDatasetTest, DuplicateKeysAcrossRootsAreFatal) {
    write_pose_dataset("train", {{"a"}});
    const auto second = dir.path() / "second";
    test::write_index(second / "train", {{"a", "000000.torch"}});
    params.dataset.roots.push_back(second);

    EXPECT_THROW(SceneDataset(params, Stage::Train), std::runtime_error);
}

TEST_F(SceneDatasetTest, PartitionCoversEveryChunkExactlyOnce) {
    std::vector<std::vector<std::string>> chunks;
    for (int c = 0; c < 7; ++c) {
        chunks.push_back({std::format("scene_{}", c)});
    }
    write_pose_dataset("train", chunks);
    SceneDataset dataset(params, Stage::Train);
    ASSERT_EQ(dataset.chunks().size(), 7u);

    for (size_t workers : {1u, 2u, 3u, 7u, 9u}) {
        std::multiset<std::string> seen;
        for (size_t id = 0; id < workers; ++id) {
            // Streams shuffle their own subset; ownership is fixed beforehand
            const auto stream = dataset.stream({id, workers});
            for (const auto& chunk : stream.chunks()) {
                seen.insert(chunk.string());
            }
        }
        std::multiset<std::string> expected;
        for (const auto& chunk : dataset.chunks()) {
            expected.insert(chunk.string());
        }
        EXPECT_EQ(seen, expected) << workers << " workers";
    }

    EXPECT_THROW(partition_chunks(dataset.chunks(), {3, 3}), std::invalid_argument);
}

TEST_F(SceneDatasetTest, SeededPassesAreReproducible) {
    write_pose_dataset("train", {{"a", "b", "c"}, {"d"}, {"e"}});
    SceneDataset dataset(params, Stage::Train);

    auto first = dataset.stream();
    auto second = dataset.stream();
    const auto a = drain(first);
    const auto b = drain(second);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].scene, b[i].scene);
        EXPECT_TRUE(torch::equal(a[i].context.index, b[i].context.index));
    }
}

TEST_F(SceneDatasetTest, TestStageRepeatsScenesAndHonorsLength) {
    write_pose_dataset("test", {{"a"}, {"b"}, {"c"}, {"d"}});
    params.dataset.test_times_per_scene = 2;
    params.dataset.test_len = 5;
    params.dataset.test_chunk_interval = 2;
    SceneDataset dataset(params, Stage::Test);

    EXPECT_EQ(dataset.size(), 5u);
    ASSERT_EQ(dataset.chunks().size(), 2u);

    auto stream = dataset.stream();
    const auto examples = drain(stream);
    ASSERT_EQ(examples.size(), 4u);
    EXPECT_EQ(examples[0].scene, "a_00");
    EXPECT_EQ(examples[1].scene, "a_01");
    EXPECT_EQ(examples[2].scene, "c_00");
    EXPECT_EQ(examples[3].scene, "c_01");
    for (const auto& example : examples) {
        EXPECT_EQ(example.context.index[0].item<int64_t>(), 0);
    }
}

TEST_F(SceneDatasetTest, ValidationReadsTestData) {
    write_pose_dataset("test", {{"a"}});
    SceneDataset dataset(params, Stage::Val);
    EXPECT_EQ(dataset.data_stage(), "test");

    auto stream = dataset.stream();
    EXPECT_EQ(drain(stream).size(), 1u);
}

TEST_F(SceneDatasetTest, OverfitRepeatsOneScene) {
    write_pose_dataset("test", {{"a", "b", "c"}});
    test::write_index(stage_dir("train"), {{"t0", "000000.torch"}});
    params.dataset.overfit_to_scene = "b";
    SceneDataset dataset(params, Stage::Train);

    EXPECT_EQ(dataset.data_stage(), "test");
    EXPECT_EQ(dataset.index().size(), 4u);

    auto stream = dataset.stream();
    const auto examples = drain(stream);
    ASSERT_EQ(examples.size(), 3u);
    for (const auto& example : examples) {
        EXPECT_EQ(example.scene, "b");
    }

    params.dataset.overfit_to_scene = "missing";
    EXPECT_THROW(SceneDataset(params, Stage::Train), std::runtime_error);
}

TEST_F(SceneDatasetTest, DirectionEncodedChunksStreamEndToEnd) {
    const int n = 10;
    auto dirs = torch::empty({n, 3});
    for (int i = 0; i < n; ++i) {
        // Centers sit on the viewing ray, so only the ray length separates the cameras
        const float angle = 0.3f * static_cast<float>(i);
        const float length = 1.0f + 0.25f * static_cast<float>(i);
        dirs[i][0] = std::cos(angle) * length;
        dirs[i][1] = std::sin(angle) * length;
        dirs[i][2] = 0.2f * length;
    }
    const auto chunk = stage_dir("train") / "scene.zst";
    test::write_direction_chunk(chunk, dirs);
    test::write_index(stage_dir("train"), {{"scene", "scene.zst"}});
    params.dataset.augment = true;

    SceneDataset dataset(params, Stage::Train);
    auto stream = dataset.stream();
    const auto examples = drain(stream);
    ASSERT_EQ(examples.size(), 1u);

    const auto& example = examples[0];
    EXPECT_EQ(example.scene, (stage_dir("train") / "scene").string());
    EXPECT_EQ(example.context.image.sizes().vec(), (std::vector<int64_t>{2, 3, 256, 256}));
    ASSERT_TRUE(example.context.depth.defined());
    ASSERT_TRUE(example.context.position.defined());
    EXPECT_EQ(example.target.position.sizes().vec(), (std::vector<int64_t>{1, 3, 256, 256}));
    EXPECT_LE(example.context.image.max().item<float>(), 1.0f);
    EXPECT_TRUE(torch::isfinite(example.context.extrinsics).all().item<bool>());
}
