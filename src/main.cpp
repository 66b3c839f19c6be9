/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "training/dataset.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <print>
#include <stdexcept>
#include <torch/csrc/jit/serialization/pickle.h>

namespace {

    void dump_example(const mva::training::Example& example, const std::filesystem::path& dir, size_t n) {
        const auto path = dir / std::format("{:06d}.torch", n);
        const auto bytes = torch::jit::pickle_save(example.to_ivalue());
        std::ofstream out(path, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw std::runtime_error(std::format("Failed to write {}", path.string()));
        }
    }

    int run(const mva::args::CommandLine& cli) {
        mva::training::SceneDataset dataset(cli.params, cli.stage);
        LOG_INFO("Expected examples per pass: {}", dataset.size());

        if (cli.dump_dir) {
            std::filesystem::create_directories(*cli.dump_dir);
        }

        auto stream = dataset.stream({cli.worker, cli.num_workers});
        size_t produced = 0;
        {
            LOG_TIMER("Example pass");
            while (!cli.limit || produced < *cli.limit) {
                auto example = stream.next();
                if (!example) {
                    break;
                }
                LOG_DEBUG("{}: context {} target {}", example->scene,
                          example->context.size(), example->target.size());
                if (cli.dump_dir) {
                    dump_example(*example, *cli.dump_dir, produced);
                }
                ++produced;
            }
        }

        const auto& stats = stream.stats();
        LOG_INFO("Produced {} examples from {} chunks, skipped {} scenes",
                 produced, stats.chunks_loaded, stats.skipped);
        std::println("{} examples", produced);
        return 0;
    }

} // namespace

int main(int argc, char* argv[]) {
    // Parse arguments (this initializes the logger from --log-level)
    auto cli_result = mva::args::parse_args_and_params(argc, argv);
    if (!cli_result) {
        LOG_ERROR("Failed to parse arguments: {}", cli_result.error());
        std::println(stderr, "Error: {}", cli_result.error());
        return -1;
    }
    if (cli_result->help) {
        return 0;
    }

    LOG_INFO("========================================");
    LOG_INFO("Multi-view example assembler");
    LOG_INFO("========================================");

    try {
        return run(*cli_result);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal: {}", e.what());
        std::println(stderr, "Error: {}", e.what());
        return 1;
    }
}
