// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2026 Jussi Pakkanen

#include <errorhandling.hpp>
#include <array>
#include <cstddef>

namespace fontprobe::internal {

// clang-format off

const std::array<const char *, (std::size_t)ErrorCode::NumErrors> error_texts{
"No error.",
"Required argument is NULL.",
"Index out of bounds.",
"Buffer is too big for the font library.",
"FreeType error.",
"Could not open file.",
"Failed to load data from file.",
"Could not memory map file.",
};

// clang-format on

const char *error_text(ErrorCode ec) noexcept {
    const int index = (int32_t)ec;
    if(index < 0 || (std::size_t)index >= error_texts.size()) {
        return "Invalid error code.";
    }
    return error_texts[index];
}

} // namespace fontprobe::internal
