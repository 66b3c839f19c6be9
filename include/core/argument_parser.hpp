/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace mva::args {

    struct CommandLine {
        param::AssemblerParameters params;
        Stage stage = Stage::Train;
        std::optional<size_t> limit;
        size_t worker = 0;
        size_t num_workers = 1;
        std::optional<std::filesystem::path> dump_dir;
        bool help = false;
    };

    /**
     * @brief Parse the command line and load the configuration file it names
     *
     * Initializes the logger from --log-level (and --log-file) before the
     * configuration is read, so parse errors are already logged.
     */
    std::expected<CommandLine, std::string> parse_args_and_params(int argc, const char* const argv[]);

} // namespace mva::args
