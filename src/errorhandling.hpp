// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2026 Jussi Pakkanen

#pragma once

#include <cstdint>
#include <expected>

namespace fontprobe::internal {

enum class ErrorCode : int32_t {
    NoError,
    ArgIsNull,
    IndexOutOfBounds,
    InvalidBufsize,
    FreeTypeError,
    CouldNotOpenFile,
    FileReadError,
    MMapFail,
    // When you add an error code here, also add the string representation in the .cpp file.
    NumErrors,
};

const char *error_text(ErrorCode ec) noexcept;

// This error exists solely so you can put a breakpoint in it.
inline std::unexpected<ErrorCode> create_error(ErrorCode code) { return std::unexpected(code); }

#define RETERR(code) return create_error(ErrorCode::code)

// Return value or error.
template<typename T> using rvoe = std::expected<T, ErrorCode>;

#define ERC(varname, func)                                                                         \
    auto varname##_variant = func;                                                                 \
    if(!(varname##_variant)) {                                                                     \
        return std::unexpected(varname##_variant.error());                                         \
    }                                                                                              \
    auto &varname = varname##_variant.value();

} // namespace fontprobe::internal
