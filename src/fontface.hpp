// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2026 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

typedef struct FT_LibraryRec_ *FT_Library;
typedef struct FT_FaceRec_ *FT_Face;
typedef struct FT_MemoryRec_ *FT_Memory;
typedef int FT_Error;

namespace fontprobe::internal {

struct FontCloser {
    void operator()(FT_Face f) const;
};

struct FaceProperties {
    // Index into a font collection. Single font files only have index 0.
    uint16_t subfont = 0;
    // Allocator for all FreeType memory of the face. Null means FreeType's default.
    FT_Memory memory = nullptr;
};

struct NameRecord {
    uint16_t platform_id;
    uint16_t encoding_id;
    uint16_t language_id;
    uint16_t name_id;
    // Undecoded, as stored in the font. Owned by the face.
    std::span<const std::byte> string;
};

/* A font parsed by FreeType from an in-memory buffer.
 *
 * FreeType does not copy the buffer given to it, so
 * the data must stay alive as long as the FontFace does.
 */
class FontFace {
public:
    static rvoe<FontFace> load(std::span<const std::byte> data, const FaceProperties &props = {});

    FontFace(FontFace &&o) noexcept = default;
    FontFace &operator=(FontFace &&o) noexcept;

    std::optional<std::string_view> family_name() const;
    std::optional<std::string_view> postscript_name() const;
    std::optional<std::string_view> font_format() const;

    uint32_t num_names() const;
    rvoe<NameRecord> name_record(uint32_t index) const;
    rvoe<std::vector<NameRecord>> names() const;

    int64_t num_faces() const;

private:
    using LibraryPtr = std::unique_ptr<FT_LibraryRec_, FT_Error (*)(FT_Library)>;

    FontFace(LibraryPtr lib, FT_Face face);

    // The face must always be closed before its library, also when assigning.
    LibraryPtr ft;
    std::unique_ptr<FT_FaceRec_, FontCloser> face;
};

} // namespace fontprobe::internal
