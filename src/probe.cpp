// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2026 Jussi Pakkanen

#include <probe.hpp>

namespace fontprobe {

namespace internal {

TrialResult run_trial(std::span<const std::byte> data, const FaceProperties &props) {
    auto face = FontFace::load(data, props);
    if(!face) {
        return TrialResult::NotAFont;
    }
    (void)face->family_name();
    (void)face->postscript_name();
    // Every record is visited even if an earlier one fails to load.
    const auto num_names = face->num_names();
    for(uint32_t i = 0; i < num_names; ++i) {
        (void)face->name_record(i);
    }
    return TrialResult::Probed;
}

} // namespace internal

TrialResult run_trial(const uint8_t *buf, size_t bufsize) {
    if(!buf) {
        bufsize = 0;
    }
    return internal::run_trial(std::span<const std::byte>((const std::byte *)buf, bufsize));
}

const char *trial_result_text(TrialResult r) noexcept {
    switch(r) {
    case TrialResult::NotAFont:
        return "not a font";
    case TrialResult::Probed:
        return "probed";
    }
    return "unknown";
}

} // namespace fontprobe
