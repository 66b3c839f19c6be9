/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/filesystem_utils.hpp"
#include "core/logger.hpp"
#include "loader/chunk.hpp"
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <zstd.h>

namespace mva::loader {

    namespace {

        struct DStreamDeleter {
            void operator()(ZSTD_DStream* stream) const noexcept {
                ZSTD_freeDStream(stream);
            }
        };

    } // namespace

    std::vector<char> read_binary_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            LOG_ERROR("Failed to open: {}", path.string());
            throw std::runtime_error(std::format("Failed to open {}", path.string()));
        }

        const auto size = static_cast<std::streamsize>(file.tellg());
        std::vector<char> data(static_cast<size_t>(size));
        file.seekg(0, std::ios::beg);
        if (!file.read(data.data(), size)) {
            throw std::runtime_error(std::format("Failed to read {}", path.string()));
        }
        return data;
    }

    std::vector<char> read_zstd_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            LOG_ERROR("Failed to open: {}", path.string());
            throw std::runtime_error(std::format("Failed to open {}", path.string()));
        }

        std::unique_ptr<ZSTD_DStream, DStreamDeleter> stream(ZSTD_createDStream());
        if (!stream) {
            throw std::bad_alloc();
        }
        const size_t init = ZSTD_initDStream(stream.get());
        if (ZSTD_isError(init)) {
            throw ChunkFormatError(std::format("{}: {}", path.string(), ZSTD_getErrorName(init)));
        }

        std::vector<char> in_buffer(ZSTD_DStreamInSize());
        std::vector<char> out_buffer(ZSTD_DStreamOutSize());
        std::vector<char> result;

        bool saw_input = false;
        size_t last_ret = 0;
        while (true) {
            file.read(in_buffer.data(), static_cast<std::streamsize>(in_buffer.size()));
            const auto read = static_cast<size_t>(file.gcount());
            if (read == 0) {
                break;
            }
            saw_input = true;

            ZSTD_inBuffer input{in_buffer.data(), read, 0};
            while (input.pos < input.size) {
                ZSTD_outBuffer output{out_buffer.data(), out_buffer.size(), 0};
                last_ret = ZSTD_decompressStream(stream.get(), &output, &input);
                if (ZSTD_isError(last_ret)) {
                    LOG_ERROR("zstd error in {}: {}", path.string(), ZSTD_getErrorName(last_ret));
                    throw ChunkFormatError(std::format("{}: {}", path.string(), ZSTD_getErrorName(last_ret)));
                }
                result.insert(result.end(), out_buffer.data(), out_buffer.data() + output.pos);
            }
        }

        // A non-zero return means the last frame was not completed
        if (!saw_input || last_ret != 0) {
            throw ChunkFormatError(std::format("{}: truncated or empty zstd stream", path.string()));
        }

        LOG_TRACE("Decompressed {} into {} bytes", path.filename().string(), result.size());
        return result;
    }

    std::string strip_extension(const std::filesystem::path& path) {
        return (path.parent_path() / path.stem()).string();
    }

} // namespace mva::loader
