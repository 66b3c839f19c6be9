/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <torch/torch.h>

namespace mva {
    namespace image_io {

        /**
         * @brief Guess the container of an encoded image from its magic bytes
         * @return A file extension understood by OpenImageIO (".jpg", ".png", ...),
         *         or an empty string when the signature is unknown
         */
        std::string sniff_extension(const uint8_t* data, size_t size);

        /**
         * @brief Decode an encoded still image held in memory
         * @param data Encoded bytes (JPEG, PNG, ...)
         * @param size Number of bytes
         * @return float32 tensor [3, H, W] with values in [0, 1]
         *
         * Grayscale inputs are expanded to RGB, alpha is dropped.
         * Throws std::runtime_error when the bytes cannot be decoded.
         */
        torch::Tensor decode_image(const uint8_t* data, size_t size);

        /**
         * @brief Decode an encoded image stored as a 1-D uint8 tensor
         */
        torch::Tensor decode_image(const torch::Tensor& encoded);

    } // namespace image_io
} // namespace mva
