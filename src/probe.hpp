// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2026 Jussi Pakkanen

#pragma once

#include <fontprobe.hpp>
#include <fontface.hpp>

#include <cstddef>
#include <span>

namespace fontprobe::internal {

// Loads the data as a font and, if that works, reads its names and throws them away.
// Failures inside FreeType are deliberately not intercepted here.
TrialResult run_trial(std::span<const std::byte> data, const FaceProperties &props = {});

} // namespace fontprobe::internal
