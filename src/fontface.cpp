// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2026 Jussi Pakkanen

#include <fontface.hpp>

#include <cstdio>
#include <limits>
#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_FONT_FORMATS_H
#include FT_MODULE_H
#include FT_SFNT_NAMES_H

namespace fontprobe::internal {

void FontCloser::operator()(FT_Face f) const {
    if(f) {
        auto rc = FT_Done_Face(f);
        if(rc != 0) {
            fprintf(stderr, "Warning: closing Freetype font failed.\n");
        }
    }
}

namespace {

std::optional<std::string_view> optional_string(const char *str) {
    if(!str) {
        return {};
    }
    return std::string_view(str);
}

} // namespace

FontFace::FontFace(LibraryPtr lib, FT_Face face_) : ft{std::move(lib)}, face{face_} {}

FontFace &FontFace::operator=(FontFace &&o) noexcept {
    if(this != &o) {
        face.reset();
        ft = std::move(o.ft);
        face = std::move(o.face);
    }
    return *this;
}

rvoe<FontFace> FontFace::load(std::span<const std::byte> data, const FaceProperties &props) {
    if(data.size() > (size_t)std::numeric_limits<FT_Long>::max()) {
        RETERR(InvalidBufsize);
    }
    FT_Library ft_;
    FT_Error error;
    if(props.memory) {
        error = FT_New_Library(props.memory, &ft_);
    } else {
        error = FT_Init_FreeType(&ft_);
    }
    if(error) {
        RETERR(FreeTypeError);
    }
    // A library created on a caller supplied allocator must not free that allocator.
    LibraryPtr lib(ft_, props.memory ? FT_Done_Library : FT_Done_FreeType);
    if(props.memory) {
        FT_Add_Default_Modules(lib.get());
        FT_Set_Default_Properties(lib.get());
    }

    FT_Face face;
    error = FT_New_Memory_Face(
        lib.get(), (const FT_Byte *)data.data(), (FT_Long)data.size(), props.subfont, &face);
    if(error) {
        RETERR(FreeTypeError);
    }
    return FontFace(std::move(lib), face);
}

std::optional<std::string_view> FontFace::family_name() const {
    return optional_string(face->family_name);
}

std::optional<std::string_view> FontFace::postscript_name() const {
    return optional_string(FT_Get_Postscript_Name(face.get()));
}

std::optional<std::string_view> FontFace::font_format() const {
    return optional_string(FT_Get_Font_Format(face.get()));
}

uint32_t FontFace::num_names() const { return FT_Get_Sfnt_Name_Count(face.get()); }

rvoe<NameRecord> FontFace::name_record(uint32_t index) const {
    if(index >= num_names()) {
        RETERR(IndexOutOfBounds);
    }
    FT_SfntName sn;
    if(FT_Get_Sfnt_Name(face.get(), index, &sn) != 0) {
        RETERR(FreeTypeError);
    }
    return NameRecord{sn.platform_id,
                      sn.encoding_id,
                      sn.language_id,
                      sn.name_id,
                      std::span<const std::byte>((const std::byte *)sn.string, sn.string_len)};
}

rvoe<std::vector<NameRecord>> FontFace::names() const {
    std::vector<NameRecord> records;
    const auto count = num_names();
    records.reserve(count);
    for(uint32_t i = 0; i < count; ++i) {
        ERC(rec, name_record(i));
        records.push_back(rec);
    }
    return records;
}

int64_t FontFace::num_faces() const { return face->num_faces; }

} // namespace fontprobe::internal
