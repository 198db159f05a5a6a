// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2026 Jussi Pakkanen

#pragma once

// The functionality in this header is neither ABI nor API stable.

#include <cstddef>
#include <cstdint>

namespace fontprobe {

enum class TrialResult {
    NotAFont,
    Probed,
};

// One fuzzing trial against the first font in the buffer.
TrialResult run_trial(const uint8_t *buf, size_t bufsize);

const char *trial_result_text(TrialResult r) noexcept;

} // namespace fontprobe
