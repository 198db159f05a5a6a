// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2026 Jussi Pakkanen

#include <fontprobe.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *buf, size_t bufsize) {
    (void)fontprobe::run_trial(buf, bufsize);
    return 0;
}
