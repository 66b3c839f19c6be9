/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include <cxxopts.hpp>
#include <format>
#include <print>

namespace mva::args {

    std::expected<CommandLine, std::string> parse_args_and_params(int argc, const char* const argv[]) {
        cxxopts::Options options("mva_assemble", "Assemble multi-view training examples from scene chunks");
        options.add_options()
            ("c,config", "JSON configuration file", cxxopts::value<std::string>())
            ("s,stage", "Stage: train, val or test", cxxopts::value<std::string>()->default_value("train"))
            ("n,limit", "Stop after this many examples", cxxopts::value<size_t>())
            ("worker", "Index of this worker", cxxopts::value<size_t>()->default_value("0"))
            ("num-workers", "Number of parallel workers", cxxopts::value<size_t>()->default_value("1"))
            ("dump", "Directory to write each example to as a torch pickle", cxxopts::value<std::string>())
            ("log-level", "trace, debug, info, warn, error, critical or off",
             cxxopts::value<std::string>()->default_value("info"))
            ("log-file", "Also write the log to this file", cxxopts::value<std::string>()->default_value(""))
            ("h,help", "Print usage");

        cxxopts::ParseResult result;
        try {
            result = options.parse(argc, argv);
        } catch (const cxxopts::exceptions::exception& e) {
            return std::unexpected(std::format("{}\n{}", e.what(), options.help()));
        }

        CommandLine cli;
        if (result.count("help")) {
            std::println("{}", options.help());
            cli.help = true;
            return cli;
        }

        const auto level_name = result["log-level"].as<std::string>();
        const auto level = core::parse_log_level(level_name);
        if (!level) {
            return std::unexpected(std::format("Unknown log level: {}", level_name));
        }
        core::Logger::get().init(*level, result["log-file"].as<std::string>());

        if (!result.count("config")) {
            return std::unexpected(std::format("--config is required\n{}", options.help()));
        }

        const auto stage_arg = result["stage"].as<std::string>();
        const auto stage = parse_stage(stage_arg);
        if (!stage) {
            return std::unexpected(std::format("Unknown stage: {}", stage_arg));
        }
        cli.stage = *stage;

        if (result.count("limit")) {
            cli.limit = result["limit"].as<size_t>();
        }
        cli.worker = result["worker"].as<size_t>();
        cli.num_workers = result["num-workers"].as<size_t>();
        if (cli.num_workers == 0 || cli.worker >= cli.num_workers) {
            return std::unexpected(std::format("Worker {} is out of range for {} workers", cli.worker, cli.num_workers));
        }
        if (result.count("dump")) {
            cli.dump_dir = std::filesystem::path(result["dump"].as<std::string>());
        }

        auto params = param::read_parameters(result["config"].as<std::string>());
        if (!params) {
            return std::unexpected(params.error());
        }
        cli.params = std::move(*params);
        return cli;
    }

} // namespace mva::args
