// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstddef>
#include <memory>
#include <span>

namespace fontprobe::internal {

class MMapperPrivate;

// Read-only view of a whole file. An empty file is a valid, empty view.
class MMapper {
public:
    MMapper() noexcept = default;
    explicit MMapper(MMapperPrivate *priv);
    MMapper(MMapper &&o) noexcept;
    MMapper(const MMapper &o) = delete;

    ~MMapper();

    std::span<const std::byte> span() const;

    MMapper &operator=(MMapper &&o) noexcept;
    MMapper &operator=(const MMapper &o) = delete;

private:
    std::unique_ptr<MMapperPrivate> d;
};

rvoe<MMapper> mmap_file(const char *fname);

} // namespace fontprobe::internal
