/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <string>

namespace mva::training {

    enum class SkipReason {
        InsufficientFrames,
        FieldOfView,
        Baseline,
        BadImageShape
    };

    inline const char* skip_reason_name(SkipReason reason) noexcept {
        switch (reason) {
        case SkipReason::InsufficientFrames: return "insufficient frames";
        case SkipReason::FieldOfView: return "field of view";
        case SkipReason::Baseline: return "baseline";
        case SkipReason::BadImageShape: return "bad image shape";
        }
        return "unknown";
    }

    // A scene that cannot produce an example; the stream logs it and moves on
    struct SceneSkip {
        std::string scene;
        SkipReason reason;
        std::string detail;
    };

} // namespace mva::training
