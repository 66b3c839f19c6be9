/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/image_io.hpp"
#include "core/logger.hpp"

#include <OpenImageIO/filesystem.h>
#include <OpenImageIO/imageio.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

    // Run once: set global OIIO attributes (threading, etc.)
    std::once_flag g_oiio_once;
    inline void init_oiio() {
        std::call_once(g_oiio_once, [] {
            int n = (int)std::max(1u, std::thread::hardware_concurrency());
            OIIO::attribute("threads", n);
        });
    }

} // anonymous namespace

namespace mva {
    namespace image_io {

        std::string sniff_extension(const uint8_t* data, size_t size) {
            auto starts_with = [&](std::initializer_list<uint8_t> magic) {
                return size >= magic.size() && std::equal(magic.begin(), magic.end(), data);
            };

            if (starts_with({0xFF, 0xD8, 0xFF})) {
                return ".jpg";
            }
            if (starts_with({0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'})) {
                return ".png";
            }
            if (starts_with({'B', 'M'})) {
                return ".bmp";
            }
            if (size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WEBP", 4) == 0) {
                return ".webp";
            }
            return {};
        }

        torch::Tensor decode_image(const uint8_t* data, size_t size) {
            init_oiio();

            const std::string extension = sniff_extension(data, size);
            if (extension.empty()) {
                throw std::runtime_error("Unrecognized encoded image signature");
            }

            // OIIO picks the reader plugin from the extension; bytes come from the proxy
            OIIO::Filesystem::IOMemReader reader(data, size);
            auto in = OIIO::ImageInput::open("memory" + extension, nullptr, &reader);
            if (!in) {
                throw std::runtime_error("Decode failed: " + OIIO::geterror());
            }

            const OIIO::ImageSpec& spec = in->spec();
            const int w = spec.width;
            const int h = spec.height;
            const int file_c = spec.nchannels;
            const int read_c = std::min(3, std::max(1, file_c));

            std::vector<unsigned char> pixels((size_t)w * h * read_c);
            if (!in->read_image(/*subimage*/ 0, /*miplevel*/ 0,
                                /*chbegin*/ 0, /*chend*/ read_c,
                                OIIO::TypeDesc::UINT8, pixels.data())) {
                std::string e = in->geterror();
                in->close();
                throw std::runtime_error("Read failed" + (e.empty() ? std::string() : (": " + e)));
            }
            in->close();

            // HWC uint8 -> CHW float
            auto image = torch::from_blob(pixels.data(), {h, w, read_c}, torch::kUInt8)
                             .permute({2, 0, 1})
                             .to(torch::kFloat32)
                             .div_(255.0f);
            if (read_c == 1) {
                image = image.expand({3, h, w});
            } else if (read_c == 2) {
                // (R, G) -> (R, G, avg)
                image = torch::cat({image, image.mean(0, true)}, 0);
            }

            LOG_TRACE("Decoded {}x{} image with {} channels", w, h, file_c);
            return image.contiguous();
        }

        torch::Tensor decode_image(const torch::Tensor& encoded) {
            TORCH_CHECK(encoded.scalar_type() == torch::kUInt8,
                        "Encoded image must be a uint8 tensor, got ", encoded.scalar_type());
            auto bytes = encoded.to(torch::kCPU).contiguous().view({-1});
            return decode_image(bytes.data_ptr<uint8_t>(), static_cast<size_t>(bytes.numel()));
        }

    } // namespace image_io
} // namespace mva
