/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "core/image_io.hpp"
#include "loader/chunk_decoder.hpp"
#include "loader/scene_index.hpp"
#include "test_helpers.hpp"

using namespace mva;

class ChunkDecoderTest : public ::testing::Test {
protected:
    test::TempDir dir;
};

TEST_F(ChunkDecoderTest, DecodesCompressedArrays) {
    const auto path = dir.path() / "scene_a.zst";
    test::write_direction_chunk(path, torch::tensor({{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}}));

    const auto chunk = loader::decode_chunk(path);
    EXPECT_EQ(chunk.format, loader::ChunkFormat::CompressedArrays);
    ASSERT_EQ(chunk.scenes.size(), 1u);

    const auto& scene = std::get<loader::DirectionEncodedScene>(chunk.scenes[0]);
    EXPECT_EQ(scene.key, (dir.path() / "scene_a").string());
    EXPECT_EQ(scene.num_frames(), 3);
    EXPECT_EQ(scene.radiance.sizes().vec(), (std::vector<int64_t>{3, 256, 256, 3}));
    EXPECT_EQ(scene.depth.sizes().vec(), (std::vector<int64_t>{3, 256, 256, 1}));
    EXPECT_FLOAT_EQ(scene.direction[2][127][127][2].item<float>(), 1.0f);
}

TEST_F(ChunkDecoderTest, RejectsArraysThatDoNotTile) {
    const auto path = dir.path() / "bad.zst";
    test::write_radiance_chunk(path, torch::rand({256 * 256 * 3 + 1}), torch::rand({256 * 256}),
                               torch::rand({256 * 256 * 3}), torch::rand({256 * 256 * 3}));
    EXPECT_THROW(loader::decode_chunk(path), loader::ChunkFormatError);
}

TEST_F(ChunkDecoderTest, RejectsDisagreeingFrameCounts) {
    const auto path = dir.path() / "mismatch.zst";
    test::write_radiance_chunk(path, torch::rand({2, 256, 256, 3}), torch::rand({1, 256, 256, 1}),
                               torch::rand({2, 256, 256, 3}), torch::rand({2, 256, 256, 3}));
    EXPECT_THROW(loader::decode_chunk(path), loader::ChunkFormatError);
}

TEST_F(ChunkDecoderTest, RejectsTruncatedCompressedStream) {
    const auto good = dir.path() / "good.zst";
    test::write_direction_chunk(good, torch::tensor({{1.0f, 0.0f, 0.0f}}));
    auto bytes = test::read_bytes(good);
    bytes.resize(bytes.size() / 2);
    const auto truncated = dir.path() / "truncated.zst";
    test::write_bytes(truncated, bytes);

    EXPECT_THROW(loader::decode_chunk(truncated), loader::ChunkFormatError);
}

TEST_F(ChunkDecoderTest, DecodesSceneContainer) {
    const auto path = dir.path() / "000000.torch";
    test::write_pose_chunk(path, {test::pose_record("a", test::pose_vectors({0.0f, 1.0f, 2.0f}), 8, 12),
                                  test::pose_record("b", test::pose_vectors({0.0f, 1.0f}), 8, 12)});

    const auto chunk = loader::decode_chunk(path);
    EXPECT_EQ(chunk.format, loader::ChunkFormat::SceneContainer);
    ASSERT_EQ(chunk.scenes.size(), 2u);
    EXPECT_EQ(loader::scene_key(chunk.scenes[0]), "a");
    EXPECT_EQ(loader::scene_key(chunk.scenes[1]), "b");

    const auto& a = std::get<loader::PoseVectorScene>(chunk.scenes[0]);
    EXPECT_EQ(a.num_frames(), 3);
    ASSERT_EQ(a.images.size(), 3u);

    const auto image = image_io::decode_image(a.images[1]);
    EXPECT_EQ(image.sizes().vec(), (std::vector<int64_t>{3, 8, 12}));
    EXPECT_NEAR(image.mean().item<float>(), 128.0f / 255.0f, 1e-3f);
}

TEST_F(ChunkDecoderTest, RejectsMalformedPoseVectors) {
    const auto path = dir.path() / "bad.torch";
    test::write_pose_chunk(path, {test::pose_record("a", torch::zeros({3, 17}), 8, 8)});
    EXPECT_THROW(loader::decode_chunk(path), loader::ChunkFormatError);
}

TEST_F(ChunkDecoderTest, RejectsImageCountMismatch) {
    auto record = test::pose_record("a", test::pose_vectors({0.0f, 1.0f}), 8, 8).toGenericDict();
    record.insert_or_assign("cameras", test::pose_vectors({0.0f, 1.0f, 2.0f}));
    const auto path = dir.path() / "mismatch.torch";
    test::write_pose_chunk(path, {record});
    EXPECT_THROW(loader::decode_chunk(path), loader::ChunkFormatError);
}

TEST_F(ChunkDecoderTest, RejectsUnknownExtensions) {
    const auto path = dir.path() / "scene.npz";
    test::write_bytes(path, {'x'});
    EXPECT_FALSE(loader::chunk_format_from_path(path).has_value());
    EXPECT_THROW(loader::decode_chunk(path), loader::ChunkFormatError);
}

TEST_F(ChunkDecoderTest, IndexMergesRootsAndRejectsDuplicates) {
    const auto root_a = dir.path() / "a";
    const auto root_b = dir.path() / "b";
    test::write_index(root_a / "train", {{"s0", "000000.torch"}, {"s1", "000001.torch"}});
    test::write_index(root_b / "train", {{"s2", "000000.torch"}});

    const auto index = loader::load_scene_index({root_a, root_b}, {"train"});
    ASSERT_EQ(index.size(), 3u);
    EXPECT_EQ(index.at("s2").string(), (root_b / "train" / "000000.torch").string());

    test::write_index(root_b / "train", {{"s1", "000000.torch"}});
    EXPECT_THROW(loader::load_scene_index({root_a, root_b}, {"train"}), std::runtime_error);
    EXPECT_THROW(loader::load_scene_index({root_a}, {"test"}), std::runtime_error);
}

TEST_F(ChunkDecoderTest, CollectsChunksInOrder) {
    const auto stage = dir.path() / "train";
    test::write_bytes(stage / "000001.torch", {'x'});
    test::write_bytes(stage / "000000.torch", {'x'});
    test::write_bytes(stage / "scene.zst", {'x'});
    test::write_bytes(stage / "index.json", {'{', '}'});

    const auto chunks = loader::collect_chunks({dir.path()}, "train");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].filename().string(), "000000.torch");
    EXPECT_EQ(chunks[1].filename().string(), "000001.torch");
    EXPECT_EQ(chunks[2].filename().string(), "scene.zst");
}
