/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "training/example_assembler.hpp"
#include <array>
#include <random>

namespace mva::training {

    /**
     * @brief Mirror the whole example horizontally with probability 0.5
     * @return true when the example was flipped
     *
     * Images, depths and positions are flipped along the width axis and every
     * extrinsics matrix is conjugated by diag(-1, 1, 1, 1).
     */
    bool apply_augmentation_shim(Example& example, std::mt19937& gen);

    // Unconditional horizontal mirror used by the augmentation shim
    void flip_example(Example& example);

    /**
     * @brief Rescale and center-crop every view to shape (height, width)
     *
     * The scale factor is max(h_out / h_in, w_out / w_in) so the rescaled image
     * covers the output; intrinsics fx, fy are adjusted for the crop.
     * @throws std::invalid_argument when shape exceeds the input resolution
     */
    void apply_crop_shim(Example& example, const std::array<int, 2>& shape);

} // namespace mva::training
